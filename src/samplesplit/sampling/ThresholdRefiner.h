#ifndef SAMPLESPLIT_THRESHOLD_REFINER_H
#define SAMPLESPLIT_THRESHOLD_REFINER_H

#include <stdint.h>
#include <string>
#include <vector>

#include "core/constants.h"
#include "sampling/SamplingPlan.h"
#include "sampling/SetTally.h"
#include "sampling/Threshold.h"

/**
   A non-fatal problem found while refining a set's threshold. The set is
   still sampled, but won't have exactly its target size.
 */
struct RefinementAdvisory {
  enum Kind {
    /// The waitlist holds fewer keys than needed to reach the target, so the
    /// set comes up short
    WAITLIST_SHORT,
    /// More keys than the target were accepted outright, so the set is
    /// oversized
    TARGET_EXCEEDED
  };

  Kind kind;
  std::string setName;
  uint64_t target;
  uint64_t acceptedCount;
  uint64_t waitlistLength;

  RefinementAdvisory(
    Kind _kind, const std::string& _setName, uint64_t _target,
    uint64_t _acceptedCount, uint64_t _waitlistLength)
    : kind(_kind),
      setName(_setName),
      target(_target),
      acceptedCount(_acceptedCount),
      waitlistLength(_waitlistLength) {}

  /// \return "WAITLIST_SHORT" or "TARGET_EXCEEDED"
  const char* kindName() const;

  /// \return a human-readable description of the advisory
  std::string describe() const;
};

typedef std::vector<RefinementAdvisory> AdvisoryList;

/**
   ThresholdRefiner turns each set's working threshold and global tally into
   an exact final key range.

   With required = target - acceptedCount:
   - required <= 0 keeps only the acceptance range, [low, accept)
   - required >= waitlist length keeps the whole waitlist, [low, cutoff)
   - otherwise the (required + 1)th smallest waitlisted key becomes the
     exclusive upper bound, so exactly required waitlisted keys fall below it

   Exactness assumes that no two waitlisted keys are equal. Keys are 48-bit
   uniform variates, so collisions are very unlikely but possible; a collision
   at the selected key would shift the set's size by one.
 */
class ThresholdRefiner {
public:
  /**
     Refine every set in the plan.

     In the nested layout, each set's cumulative cutoff is refined first and
     set i then owns the range between set i-1's cutoff and its own.

     Advisories are logged to the advisory channel as well as returned.

     \param plan the sampling plan

     \param globalTally the aggregated first-pass tally

     \param[out] finalThresholds each set's final range, in plan order; any
     previous contents are replaced

     \param[out] advisories the list to which advisories are appended
   */
  void refine(
    const SamplingPlan& plan, const TallyMap& globalTally,
    FinalThresholdList& finalThresholds, AdvisoryList& advisories) const;

  /**
     Compute the exclusive upper bound of a single set's final range.

     \param setName the set's name, for advisories

     \param threshold the set's working threshold

     \param target the number of keys that should fall in [low, cutoff)

     \param tally the set's global tally

     \param[out] advisories the list to which an advisory is appended if the
     target can't be met exactly

     \return the final range's upper bound
   */
  static double refineCutoff(
    const std::string& setName, const Threshold& threshold, uint64_t target,
    const SetTally& tally, AdvisoryList& advisories);

  /**
     Find the rank-th smallest key without sorting, keeping a bounded max-heap
     of the rank smallest keys seen so far.

     \param keys the keys to select from

     \param rank the 1-based rank to select; must be between 1 and the number
     of keys

     \return the rank-th smallest key
   */
  static double selectOrderStatistic(const KeyVector& keys, uint64_t rank);
};

#endif // SAMPLESPLIT_THRESHOLD_REFINER_H
