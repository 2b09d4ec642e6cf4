#ifndef SAMPLESPLIT_SAMPLING_PLAN_H
#define SAMPLESPLIT_SAMPLING_PLAN_H

#include <stdint.h>
#include <string>
#include <vector>

#include "sampling/Threshold.h"

/** \enum KeyspaceLayout
   How target sets share the unit key space.
 */
enum KeyspaceLayout {
  /// Each set gets its own interval, placed after the previous set's
  /// waitlist cutoff
  OFFSET_LAYOUT,
  /// Set i is thresholded against the cumulative size of sets 1..i from 0,
  /// and owns the range between the previous set's final cutoff and its own
  NESTED_LAYOUT,
  /// Offset if every set's waitlist fits in the key space, nested otherwise;
  /// resolved by ThresholdCalculator, never stored in a plan
  AUTO_LAYOUT
};

/**
   Parse a layout name ("offset", "nested" or "auto").

   \throws InvalidConfigurationException if the name isn't a known layout
 */
KeyspaceLayout parseKeyspaceLayout(const std::string& name);

/// \return the name of the given layout
const char* keyspaceLayoutName(KeyspaceLayout layout);

/// One target set as planned for the first pass
struct PlannedSet {
  std::string name;

  /// The number of records the set should end up with
  uint64_t targetSize;

  /// The number of keys below the set's final cutoff that refinement aims
  /// for; equal to targetSize in the offset layout and to the cumulative
  /// target size in the nested layout
  uint64_t refinementTarget;

  Threshold threshold;

  PlannedSet(
    const std::string& _name, uint64_t _targetSize, uint64_t _refinementTarget,
    const Threshold& _threshold)
    : name(_name),
      targetSize(_targetSize),
      refinementTarget(_refinementTarget),
      threshold(_threshold) {}
};

typedef std::vector<PlannedSet> PlannedSetList;

/// Everything the first pass needs to know, in set order
struct SamplingPlan {
  KeyspaceLayout layout;
  uint64_t population;
  double delta;
  PlannedSetList sets;

  SamplingPlan()
    : layout(OFFSET_LAYOUT),
      population(0),
      delta(0.0) {}
};

#endif // SAMPLESPLIT_SAMPLING_PLAN_H
