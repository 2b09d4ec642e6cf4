#ifndef SAMPLESPLIT_PARTITION_MAPPER_H
#define SAMPLESPLIT_PARTITION_MAPPER_H

#include <string>

#include "collection/PartitionFunction.h"
#include "sampling/LabeledRecord.h"
#include "sampling/Threshold.h"

/**
   The second pass. PartitionMapper regenerates each partition's keys exactly
   as PartitionClassifier drew them and emits a LabeledRecord for every record
   whose key falls in a set's final range. Sets are checked in plan order and
   a record is emitted for the first set that claims it, at most once.
 */
class PartitionMapper
  : public PartitionFunction<std::string, LabeledRecord> {
public:
  /// Constructor
  /**
     \param finalThresholds every set's final range, in plan order

     \param seed the job's seed; must be the seed the classifier used
   */
  PartitionMapper(const FinalThresholdList& finalThresholds, uint64_t seed);

  void map(
    uint64_t partitionIndex, const std::vector<std::string>& records,
    std::vector<LabeledRecord>& output) const;

private:
  const FinalThresholdList finalThresholds;
  const uint64_t seed;
};

#endif // SAMPLESPLIT_PARTITION_MAPPER_H
