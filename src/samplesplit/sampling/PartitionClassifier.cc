#include "sampling/PartitionClassifier.h"
#include "sampling/RandomKeyGenerator.h"

PartitionClassifier::PartitionClassifier(
  const SamplingPlan& plan, uint64_t _seed)
  : sets(plan.sets),
    seed(_seed) {
}

void PartitionClassifier::map(
  uint64_t partitionIndex, const std::vector<std::string>& records,
  std::vector<TallyMap>& output) const {

  output.push_back(TallyMap());
  classify(partitionIndex, records.size(), output.back());
}

void PartitionClassifier::classify(
  uint64_t partitionIndex, uint64_t numRecords, TallyMap& tally) const {

  tally.clear();

  // Look up each set's tally once rather than once per record.
  std::vector<SetTally*> setTallies;
  for (PlannedSetList::const_iterator iter = sets.begin(); iter != sets.end();
       iter++) {
    setTallies.push_back(&tally[iter->name]);
  }

  RandomKeyGenerator keyGenerator(seed, partitionIndex);

  for (uint64_t i = 0; i < numRecords; i++) {
    double key = keyGenerator.next();

    for (uint64_t setIndex = 0; setIndex < sets.size(); setIndex++) {
      const Threshold& threshold = sets[setIndex].threshold;

      if (key < threshold.low) {
        continue;
      }

      if (key < threshold.accept) {
        setTallies[setIndex]->acceptedCount++;
      } else if (key < threshold.waitlistCutoff) {
        setTallies[setIndex]->waitlistedKeys.push_back(key);
      }
    }
  }
}
