#ifndef SAMPLESPLIT_PARTITION_CLASSIFIER_H
#define SAMPLESPLIT_PARTITION_CLASSIFIER_H

#include <string>

#include "collection/PartitionFunction.h"
#include "sampling/SamplingPlan.h"
#include "sampling/SetTally.h"

/**
   The first pass. For each partition, PartitionClassifier draws one key per
   record and sorts it into each set's accepted, waitlisted or rejected
   bucket, emitting a single TallyMap with an entry for every set.

   The tally depends only on the seed, the partition index, the number of
   records in the partition and the plan, so retried partitions produce
   identical tallies.
 */
class PartitionClassifier
  : public PartitionFunction<std::string, TallyMap> {
public:
  /// Constructor
  /**
     \param plan the sets and their first-pass thresholds

     \param seed the job's seed
   */
  PartitionClassifier(const SamplingPlan& plan, uint64_t seed);

  void map(
    uint64_t partitionIndex, const std::vector<std::string>& records,
    std::vector<TallyMap>& output) const;

  /**
     Classify a partition's keys.

     \param partitionIndex the index of the partition

     \param numRecords the number of records in the partition

     \param[out] tally holds a SetTally for every set once classification is
     done; any previous contents are replaced
   */
  void classify(
    uint64_t partitionIndex, uint64_t numRecords, TallyMap& tally) const;

private:
  const PlannedSetList sets;
  const uint64_t seed;
};

#endif // SAMPLESPLIT_PARTITION_CLASSIFIER_H
