#ifndef SAMPLESPLIT_TEST_UTILS_TEST_H
#define SAMPLESPLIT_TEST_UTILS_TEST_H

#include <string>
#include "gtest/gtest.h"

class UtilsTest : public ::testing::Test {
public:
  void SetUp();
  void TearDown();

protected:
  std::string jsonFilename;
};

#endif // SAMPLESPLIT_TEST_UTILS_TEST_H
