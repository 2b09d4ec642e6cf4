#ifndef SAMPLESPLIT_SET_SIZE_NORMALIZER_H
#define SAMPLESPLIT_SET_SIZE_NORMALIZER_H

#include <stdint.h>

#include "sampling/TargetSetSpec.h"

/**
   SetSizeNormalizer turns requested set sizes into absolute record counts
   against a population.

   A size below 1.0 is a ratio and becomes round(size * population); a size
   of 1.0 or more is an absolute count (any fractional part is dropped). If
   the counts add up to more than the population, they are either scaled down
   by population / total, keeping their proportions, or rejected.
 */
class SetSizeNormalizer {
public:
  /// Constructor
  /**
     \param reproportion if true, oversubscribed sizes are scaled down to fit
     the population; if false, they are an error
   */
  SetSizeNormalizer(bool reproportion);

  /**
     Normalize a list of requested set sizes. Output sets are in the same
     order as the input sets.

     \throws InvalidConfigurationException if the list is empty, a name is
     repeated, a size is negative or not a number, the population is zero, or
     the sizes are oversubscribed and reproportioning is disabled

     \param specs the requested sets

     \param population the number of records being sampled from

     \param[out] sizes the absolute target size of each set; any previous
     contents are replaced
   */
  void normalize(
    const TargetSetSpecList& specs, uint64_t population,
    TargetSetSizeList& sizes) const;

private:
  void validate(const TargetSetSpecList& specs, uint64_t population) const;

  const bool reproportion;
};

#endif // SAMPLESPLIT_SET_SIZE_NORMALIZER_H
