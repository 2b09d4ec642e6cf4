#include "sampling/CountAggregator.h"

TallyMap CountAggregator::merge(const TallyMap& first, const TallyMap& second) {
  TallyMap merged(first);

  for (TallyMap::const_iterator iter = second.begin(); iter != second.end();
       iter++) {
    SetTally& setTally = merged[iter->first];

    setTally.acceptedCount += iter->second.acceptedCount;
    setTally.waitlistedKeys.insert(
      setTally.waitlistedKeys.end(), iter->second.waitlistedKeys.begin(),
      iter->second.waitlistedKeys.end());
  }

  return merged;
}

void CountAggregator::aggregate(
  const PartitionedCollection<TallyMap>& tallies, TallyMap& globalTally) {

  if (tallies.count() == 0) {
    globalTally.clear();
    return;
  }

  globalTally = tallies.reduce(&CountAggregator::merge);
}
