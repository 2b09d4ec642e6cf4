#ifndef SAMPLESPLIT_THRESHOLD_CALCULATOR_H
#define SAMPLESPLIT_THRESHOLD_CALCULATOR_H

#include <stdint.h>

#include "sampling/SamplingPlan.h"
#include "sampling/TargetSetSpec.h"

/**
   ThresholdCalculator derives each target set's first-pass key ranges from
   its sampling ratio p = size / population and an error bound delta:

     gamma1 = -ln(delta) / N
     gamma2 = -2 ln(delta) / 3N
     acceptRatio   = max(0, p + gamma2 - sqrt(gamma2^2 + 3 gamma2 p))
     waitlistRatio = min(1, p + gamma1 + sqrt(gamma1^2 + 2 gamma1 p))

   With probability at least 1 - delta, no more than size keys fall below
   acceptRatio, and at least size keys fall below waitlistRatio.
 */
class ThresholdCalculator {
public:
  /// Constructor
  /**
     \throws InvalidConfigurationException unless 0 < delta < 1

     \param delta the probability that a set's bounds fail to bracket its
     target size

     \param layout how sets share the key space
   */
  ThresholdCalculator(double delta, KeyspaceLayout layout);

  /**
     Compute the acceptance and waitlist ratios for a single set.

     \param size the set's target size

     \param population the number of records being sampled

     \param[out] acceptRatio the width of the set's acceptance range

     \param[out] waitlistRatio the width of the set's acceptance and waitlist
     ranges together
   */
  void computeBounds(
    uint64_t size, uint64_t population, double& acceptRatio,
    double& waitlistRatio) const;

  /**
     Lay out every target set's thresholds in the key space.

     In the offset layout, each set's ranges start where the previous set's
     waitlist ends, so no key can be claimed by two sets.

     In the nested layout, every set's ranges start at 0 and are computed for
     the cumulative size of the sets up to and including it.

     The auto layout uses the offset layout if the sets' waitlist ratios add
     up to at most 1.0 and the nested layout otherwise. The plan records the
     layout actually used.

     \throws CapacityExceededException if the offset layout runs past 1.0

     \param sizes the normalized target sets, in order

     \param population the number of records being sampled

     \param[out] plan the sampling plan to fill in
   */
  void computePlan(
    const TargetSetSizeList& sizes, uint64_t population,
    SamplingPlan& plan) const;

private:
  KeyspaceLayout resolveLayout(
    const TargetSetSizeList& sizes, uint64_t population) const;

  const double delta;
  const KeyspaceLayout layout;
};

#endif // SAMPLESPLIT_THRESHOLD_CALCULATOR_H
