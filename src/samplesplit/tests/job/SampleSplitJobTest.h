#ifndef SAMPLESPLIT_TEST_SAMPLE_SPLIT_JOB_TEST_H
#define SAMPLESPLIT_TEST_SAMPLE_SPLIT_JOB_TEST_H

#include <set>
#include <stdint.h>
#include <string>
#include "gtest/gtest.h"

class Params;

class SampleSplitJobTest : public ::testing::Test {
public:
  void SetUp();
  void TearDown();

protected:
  /// Fill params with the job parameters every test shares
  void setJobParams(
    Params& params, const std::string& setSizes, uint64_t seed);

  /// Read every line written for a set, across all of its part files
  uint64_t readSetOutput(
    const std::string& setName, std::set<std::string>& lines);

  std::string testDirectory;
  std::string inputDirectory;
  std::string outputDirectory;
};

#endif // SAMPLESPLIT_TEST_SAMPLE_SPLIT_JOB_TEST_H
