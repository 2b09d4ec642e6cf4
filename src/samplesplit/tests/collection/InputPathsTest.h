#ifndef SAMPLESPLIT_TEST_INPUT_PATHS_TEST_H
#define SAMPLESPLIT_TEST_INPUT_PATHS_TEST_H

#include <string>
#include "gtest/gtest.h"

class InputPathsTest : public ::testing::Test {
public:
  void SetUp();
  void TearDown();

protected:
  std::string inputDirectory;
};

#endif // SAMPLESPLIT_TEST_INPUT_PATHS_TEST_H
