#include <algorithm>
#include <math.h>
#include <sstream>

#include "core/SampleSplitAssert.h"
#include "core/StatusPrinter.h"
#include "sampling/SamplingErrors.h"
#include "sampling/ThresholdCalculator.h"

ThresholdCalculator::ThresholdCalculator(
  double _delta, KeyspaceLayout _layout)
  : delta(_delta),
    layout(_layout) {
  if (!(delta > 0.0 && delta < 1.0)) {
    std::ostringstream oss;
    oss << "Error bound delta must be strictly between 0 and 1; got " << delta;
    throw InvalidConfigurationException(oss.str());
  }
}

void ThresholdCalculator::computeBounds(
  uint64_t size, uint64_t population, double& acceptRatio,
  double& waitlistRatio) const {

  ABORT_IF(population == 0, "Can't compute thresholds for an empty "
           "population");

  double n = static_cast<double>(population);
  double p = static_cast<double>(size) / n;

  double gamma1 = -log(delta) / n;
  double gamma2 = -(2 * log(delta)) / (3 * n);

  acceptRatio = std::max(
    0.0, p + gamma2 - sqrt(gamma2 * gamma2 + 3 * gamma2 * p));
  waitlistRatio = std::min(
    1.0, p + gamma1 + sqrt(gamma1 * gamma1 + 2 * gamma1 * p));
}

void ThresholdCalculator::computePlan(
  const TargetSetSizeList& sizes, uint64_t population,
  SamplingPlan& plan) const {

  plan.layout = resolveLayout(sizes, population);
  plan.population = population;
  plan.delta = delta;
  plan.sets.clear();

  double offset = 0.0;
  uint64_t cumulativeSize = 0;

  for (TargetSetSizeList::const_iterator iter = sizes.begin();
       iter != sizes.end(); iter++) {
    double acceptRatio = 0.0;
    double waitlistRatio = 0.0;

    if (plan.layout == NESTED_LAYOUT) {
      cumulativeSize += iter->size;
      computeBounds(cumulativeSize, population, acceptRatio, waitlistRatio);

      plan.sets.push_back(
        PlannedSet(iter->name, iter->size, cumulativeSize,
                   Threshold(0.0, acceptRatio, waitlistRatio)));
    } else {
      computeBounds(iter->size, population, acceptRatio, waitlistRatio);

      if (offset + waitlistRatio > 1.0) {
        std::ostringstream oss;
        oss << "Target set '" << iter->name << "' needs key range ["
            << offset << ", " << offset + waitlistRatio << "), which runs "
            << "past 1.0; the requested sets are too large to sample "
            << "disjointly from a single key space";
        throw CapacityExceededException(oss.str());
      }

      plan.sets.push_back(
        PlannedSet(iter->name, iter->size, iter->size,
                   Threshold(offset, offset + acceptRatio,
                             offset + waitlistRatio)));

      offset += waitlistRatio;
    }

    const Threshold& threshold = plan.sets.back().threshold;
    StatusPrinter::add(
      StatusPrinter::CH_STATISTIC, "Set %s target %llu: low %.9f accept %.9f "
      "waitlist cutoff %.9f", iter->name.c_str(), iter->size, threshold.low,
      threshold.accept, threshold.waitlistCutoff);
  }
}

KeyspaceLayout ThresholdCalculator::resolveLayout(
  const TargetSetSizeList& sizes, uint64_t population) const {

  if (layout != AUTO_LAYOUT) {
    return layout;
  }

  double totalWaitlistRatio = 0.0;

  for (TargetSetSizeList::const_iterator iter = sizes.begin();
       iter != sizes.end(); iter++) {
    double acceptRatio = 0.0;
    double waitlistRatio = 0.0;
    computeBounds(iter->size, population, acceptRatio, waitlistRatio);

    totalWaitlistRatio += waitlistRatio;
  }

  KeyspaceLayout resolved =
    (totalWaitlistRatio <= 1.0) ? OFFSET_LAYOUT : NESTED_LAYOUT;

  StatusPrinter::add(
    "Waitlist ratios add up to %.9f; using the %s layout",
    totalWaitlistRatio, keyspaceLayoutName(resolved));

  return resolved;
}
