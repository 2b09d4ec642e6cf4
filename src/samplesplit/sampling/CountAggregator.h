#ifndef SAMPLESPLIT_COUNT_AGGREGATOR_H
#define SAMPLESPLIT_COUNT_AGGREGATOR_H

#include "collection/PartitionedCollection.h"
#include "sampling/SetTally.h"

/**
   Combines per-partition tallies into a global tally. Merging adds accepted
   counts and concatenates waitlists set by set; it is associative and
   commutative up to the order of waitlisted keys.
 */
class CountAggregator {
public:
  /**
     \return a new tally holding the sum of the two tallies, with an entry for
     every set present in either
   */
  static TallyMap merge(const TallyMap& first, const TallyMap& second);

  /**
     Reduce a collection of partition tallies into a global tally.

     \param tallies the per-partition tallies

     \param[out] globalTally the sum of all tallies; empty if the collection
     holds none
   */
  static void aggregate(
    const PartitionedCollection<TallyMap>& tallies, TallyMap& globalTally);
};

#endif // SAMPLESPLIT_COUNT_AGGREGATOR_H
