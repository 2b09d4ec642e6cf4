#include "sampling/PartitionMapper.h"
#include "sampling/RandomKeyGenerator.h"

PartitionMapper::PartitionMapper(
  const FinalThresholdList& _finalThresholds, uint64_t _seed)
  : finalThresholds(_finalThresholds),
    seed(_seed) {
}

void PartitionMapper::map(
  uint64_t partitionIndex, const std::vector<std::string>& records,
  std::vector<LabeledRecord>& output) const {

  RandomKeyGenerator keyGenerator(seed, partitionIndex);

  for (std::vector<std::string>::const_iterator recordIter = records.begin();
       recordIter != records.end(); recordIter++) {
    // Draw a key for every record, labeled or not, to stay in step with the
    // first pass.
    double key = keyGenerator.next();

    for (FinalThresholdList::const_iterator iter = finalThresholds.begin();
         iter != finalThresholds.end(); iter++) {
      if (iter->threshold.contains(key)) {
        output.push_back(LabeledRecord(iter->name, *recordIter));
        break;
      }
    }
  }
}
