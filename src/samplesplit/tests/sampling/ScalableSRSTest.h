#ifndef SAMPLESPLIT_TEST_SCALABLE_SRS_TEST_H
#define SAMPLESPLIT_TEST_SCALABLE_SRS_TEST_H

#include <stdint.h>
#include "gtest/gtest.h"

struct SamplingConfig;
struct SamplingResult;

class ScalableSRSTest : public ::testing::Test {
protected:
  /// Sample numRecords generated records split into numPartitions
  /// partitions, on a runner with the given threads and attempts
  void runSampling(
    const SamplingConfig& config, uint64_t numRecords, uint64_t numPartitions,
    uint64_t numThreads, uint64_t attemptsPerPartition,
    SamplingResult& result);

  /// Expect that no record was labeled twice
  void expectDisjoint(const SamplingResult& result);
};

#endif // SAMPLESPLIT_TEST_SCALABLE_SRS_TEST_H
