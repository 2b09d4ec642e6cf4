#include <algorithm>
#include <queue>
#include <sstream>

#include "core/SampleSplitAssert.h"
#include "core/StatusPrinter.h"
#include "sampling/ThresholdRefiner.h"

const char* RefinementAdvisory::kindName() const {
  switch (kind) {
  case WAITLIST_SHORT:
    return "WAITLIST_SHORT";
  case TARGET_EXCEEDED:
    return "TARGET_EXCEEDED";
  default:
    return "UNKNOWN";
  }
}

std::string RefinementAdvisory::describe() const {
  std::ostringstream oss;
  oss << kindName() << ": set '" << setName << "' ";

  if (kind == WAITLIST_SHORT) {
    oss << "needs " << target - acceptedCount << " waitlisted records to "
        << "reach " << target << " but only " << waitlistLength
        << " were waitlisted";
  } else {
    oss << "accepted " << acceptedCount << " records in the first pass, "
        << "more than its target of " << target;
  }

  return oss.str();
}

void ThresholdRefiner::refine(
  const SamplingPlan& plan, const TallyMap& globalTally,
  FinalThresholdList& finalThresholds, AdvisoryList& advisories) const {

  finalThresholds.clear();

  double previousCutoff = 0.0;

  for (PlannedSetList::const_iterator iter = plan.sets.begin();
       iter != plan.sets.end(); iter++) {
    TallyMap::const_iterator tallyIter = globalTally.find(iter->name);

    // A set with no tally entry saw no records at all.
    SetTally emptyTally;
    const SetTally& tally =
      (tallyIter == globalTally.end()) ? emptyTally : tallyIter->second;

    uint64_t numAdvisories = advisories.size();

    double cutoff = refineCutoff(
      iter->name, iter->threshold, iter->refinementTarget, tally, advisories);

    for (uint64_t i = numAdvisories; i < advisories.size(); i++) {
      StatusPrinter::add(
        StatusPrinter::CH_ADVISORY, advisories[i].describe());
    }

    if (plan.layout == NESTED_LAYOUT) {
      double low = previousCutoff;
      double high = std::max(cutoff, previousCutoff);

      finalThresholds.push_back(
        FinalSetThreshold(iter->name, FinalThreshold(low, high)));
      previousCutoff = high;
    } else {
      finalThresholds.push_back(
        FinalSetThreshold(
          iter->name, FinalThreshold(iter->threshold.low, cutoff)));
    }

    const FinalThreshold& finalThreshold = finalThresholds.back().threshold;
    StatusPrinter::add(
      StatusPrinter::CH_STATISTIC, "Set %s accepted %llu waitlisted %llu; "
      "final range [%.9f, %.9f)", iter->name.c_str(), tally.acceptedCount,
      tally.waitlistedKeys.size(), finalThreshold.low,
      finalThreshold.high);
  }
}

double ThresholdRefiner::refineCutoff(
  const std::string& setName, const Threshold& threshold, uint64_t target,
  const SetTally& tally, AdvisoryList& advisories) {

  uint64_t waitlistLength = tally.waitlistedKeys.size();

  if (tally.acceptedCount >= target) {
    if (tally.acceptedCount > target) {
      advisories.push_back(
        RefinementAdvisory(
          RefinementAdvisory::TARGET_EXCEEDED, setName, target,
          tally.acceptedCount, waitlistLength));
    }

    return threshold.accept;
  }

  uint64_t required = target - tally.acceptedCount;

  if (required >= waitlistLength) {
    if (required > waitlistLength) {
      advisories.push_back(
        RefinementAdvisory(
          RefinementAdvisory::WAITLIST_SHORT, setName, target,
          tally.acceptedCount, waitlistLength));
    }

    return threshold.waitlistCutoff;
  }

  // Strict < in the mapper excludes the selected key itself, leaving exactly
  // required waitlisted keys below the cutoff.
  return selectOrderStatistic(tally.waitlistedKeys, required + 1);
}

double ThresholdRefiner::selectOrderStatistic(
  const KeyVector& keys, uint64_t rank) {

  ABORT_IF(rank == 0 || rank > keys.size(), "Can't select rank %llu from %llu "
           "keys", rank, keys.size());

  std::priority_queue<double> smallestKeys;

  for (KeyVector::const_iterator iter = keys.begin(); iter != keys.end();
       iter++) {
    if (smallestKeys.size() < rank) {
      smallestKeys.push(*iter);
    } else if (*iter < smallestKeys.top()) {
      smallestKeys.pop();
      smallestKeys.push(*iter);
    }
  }

  return smallestKeys.top();
}
