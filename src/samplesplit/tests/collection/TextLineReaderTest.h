#ifndef SAMPLESPLIT_TEST_TEXT_LINE_READER_TEST_H
#define SAMPLESPLIT_TEST_TEXT_LINE_READER_TEST_H

#include <string>
#include "gtest/gtest.h"

#include "core/constants.h"

class TextLineReaderTest : public ::testing::Test {
public:
  void SetUp();
  void TearDown();

protected:
  std::string inputDirectory;
  StringList files;
};

#endif // SAMPLESPLIT_TEST_TEXT_LINE_READER_TEST_H
