#include <sstream>
#include <stdexcept>

#include "collection/PartitionTaskRunner.h"
#include "collection/PartitionedCollection.h"
#include "core/Params.h"
#include "core/SampleSplitAssert.h"
#include "tests/TestUtils.h"
#include "tests/collection/PartitionedCollectionTest.h"

void TagWithPartitionFunction::map(
  uint64_t partitionIndex, const std::vector<std::string>& records,
  std::vector<std::string>& output) const {

  for (std::vector<std::string>::const_iterator iter = records.begin();
       iter != records.end(); iter++) {
    std::ostringstream oss;
    oss << partitionIndex << ':' << *iter;
    output.push_back(oss.str());
  }
}

void RecordLengthFunction::map(
  uint64_t partitionIndex, const std::vector<std::string>& records,
  std::vector<uint64_t>& output) const {

  for (std::vector<std::string>::const_iterator iter = records.begin();
       iter != records.end(); iter++) {
    output.push_back(iter->size());
  }
}

FailingFunction::FailingFunction(uint64_t _failingPartition)
  : failingPartition(_failingPartition) {
}

void FailingFunction::map(
  uint64_t partitionIndex, const std::vector<std::string>& records,
  std::vector<std::string>& output) const {

  if (partitionIndex == failingPartition) {
    throw std::runtime_error("simulated worker failure");
  }

  output.insert(output.end(), records.begin(), records.end());
}

static uint64_t addValues(const uint64_t& first, const uint64_t& second) {
  return first + second;
}

TEST_F(PartitionedCollectionTest, testCount) {
  PartitionedCollection<std::string> records;
  makeRecords(10, 3, records);

  EXPECT_EQ((uint64_t) 3, records.numPartitions());
  EXPECT_EQ((uint64_t) 10, records.count());
  EXPECT_EQ((uint64_t) 4, records.getPartition(0).size());
  EXPECT_EQ((uint64_t) 3, records.getPartition(1).size());
  EXPECT_EQ((uint64_t) 3, records.getPartition(2).size());

  ASSERT_THROW(records.getPartition(3), AssertionFailedException);
}

TEST_F(PartitionedCollectionTest, testMapPreservesPartitioning) {
  PartitionedCollection<std::string> records;
  makeRecords(100, 7, records);

  PartitionTaskRunner runner(4);
  TagWithPartitionFunction function;
  PartitionedCollection<std::string> tagged;

  records.mapPartitionsWithIndex(function, runner, tagged);

  ASSERT_EQ(records.numPartitions(), tagged.numPartitions());
  EXPECT_EQ((uint64_t) 100, tagged.count());

  for (uint64_t i = 0; i < records.numPartitions(); i++) {
    const std::vector<std::string>& input = records.getPartition(i);
    const std::vector<std::string>& output = tagged.getPartition(i);

    ASSERT_EQ(input.size(), output.size());

    for (uint64_t j = 0; j < input.size(); j++) {
      std::ostringstream oss;
      oss << i << ':' << input[j];
      EXPECT_EQ(oss.str(), output[j]);
    }
  }

  EXPECT_EQ((uint64_t) 7, runner.getNumAttemptsRun());
}

TEST_F(PartitionedCollectionTest, testRetriedPartitionsCommitOnce) {
  PartitionedCollection<std::string> records;
  makeRecords(250, 9, records);

  PartitionTaskRunner singleAttemptRunner(1);
  PartitionTaskRunner retryingRunner(3, 3);

  TagWithPartitionFunction function;
  PartitionedCollection<std::string> expected;
  PartitionedCollection<std::string> retried;

  records.mapPartitionsWithIndex(function, singleAttemptRunner, expected);
  records.mapPartitionsWithIndex(function, retryingRunner, retried);

  EXPECT_EQ((uint64_t) 27, retryingRunner.getNumAttemptsRun());
  ASSERT_EQ(expected.numPartitions(), retried.numPartitions());
  EXPECT_EQ((uint64_t) 250, retried.count());

  for (uint64_t i = 0; i < expected.numPartitions(); i++) {
    EXPECT_EQ(expected.getPartition(i), retried.getPartition(i));
  }
}

TEST_F(PartitionedCollectionTest, testEmptyPartitions) {
  PartitionedCollection<std::string> records(4);
  records.getPartition(2).push_back("only");

  PartitionTaskRunner runner(2);
  RecordLengthFunction function;
  PartitionedCollection<uint64_t> lengths;

  records.mapPartitionsWithIndex(function, runner, lengths);

  ASSERT_EQ((uint64_t) 4, lengths.numPartitions());
  EXPECT_TRUE(lengths.getPartition(0).empty());
  EXPECT_TRUE(lengths.getPartition(1).empty());
  ASSERT_EQ((uint64_t) 1, lengths.getPartition(2).size());
  EXPECT_EQ((uint64_t) 4, lengths.getPartition(2)[0]);
  EXPECT_TRUE(lengths.getPartition(3).empty());
}

TEST_F(PartitionedCollectionTest, testReduce) {
  PartitionedCollection<std::string> records;
  // record-0 .. record-9 are 8 characters, record-10 .. record-11 are 9.
  makeRecords(12, 5, records);

  PartitionTaskRunner runner(3);
  RecordLengthFunction function;
  PartitionedCollection<uint64_t> lengths;

  records.mapPartitionsWithIndex(function, runner, lengths);

  EXPECT_EQ((uint64_t) 98, lengths.reduce(&addValues));
}

TEST_F(PartitionedCollectionTest, testReduceEmptyCollection) {
  PartitionedCollection<uint64_t> empty(3);

  ASSERT_THROW(empty.reduce(&addValues), AssertionFailedException);
}

TEST_F(PartitionedCollectionTest, testCollect) {
  PartitionedCollection<std::string> records;
  makeRecords(5, 2, records);

  std::vector<std::string> collected;
  records.collect(collected);

  ASSERT_EQ((uint64_t) 5, collected.size());
  for (uint64_t i = 0; i < collected.size(); i++) {
    std::ostringstream oss;
    oss << "record-" << i;
    EXPECT_EQ(oss.str(), collected[i]);
  }
}

TEST_F(PartitionedCollectionTest, testFailureIsReported) {
  PartitionedCollection<std::string> records;
  makeRecords(50, 5, records);

  PartitionTaskRunner runner(3);
  FailingFunction function(2);
  PartitionedCollection<std::string> output;

  ASSERT_THROW(records.mapPartitionsWithIndex(function, runner, output),
               AssertionFailedException);

  // Every partition was still attempted.
  EXPECT_EQ((uint64_t) 5, runner.getNumAttemptsRun());

  // The runner can be used again after a failure.
  TagWithPartitionFunction tagFunction;
  records.mapPartitionsWithIndex(tagFunction, runner, output);
  EXPECT_EQ((uint64_t) 50, output.count());
}

TEST_F(PartitionedCollectionTest, testRunnerFromParams) {
  Params params;
  params.add<uint64_t>("NUM_THREADS", 3);
  params.add<uint64_t>("ATTEMPTS_PER_PARTITION", 2);

  PartitionTaskRunner runner(params);
  EXPECT_EQ((uint64_t) 3, runner.getNumThreads());
  EXPECT_EQ((uint64_t) 2, runner.getAttemptsPerPartition());

  Params defaults;
  PartitionTaskRunner defaultRunner(defaults);
  EXPECT_EQ((uint64_t) 1, defaultRunner.getNumThreads());
  EXPECT_EQ((uint64_t) 1, defaultRunner.getAttemptsPerPartition());

  ASSERT_THROW(PartitionTaskRunner(0), AssertionFailedException);
}
