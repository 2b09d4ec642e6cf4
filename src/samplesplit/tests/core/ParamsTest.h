#ifndef SAMPLESPLIT_TEST_PARAMS_TEST_H
#define SAMPLESPLIT_TEST_PARAMS_TEST_H

#include <string>
#include "gtest/gtest.h"

class ParamsTest : public ::testing::Test {
public:
  void SetUp();
  void TearDown();

protected:
  std::string configFilename;
  std::string dumpFilename;
};

#endif // SAMPLESPLIT_TEST_PARAMS_TEST_H
