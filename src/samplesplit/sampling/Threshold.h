#ifndef SAMPLESPLIT_THRESHOLD_H
#define SAMPLESPLIT_THRESHOLD_H

#include <string>
#include <vector>

/**
   The working first-pass key ranges of one target set. Keys in
   [low, accept) are accepted outright, keys in [accept, waitlistCutoff) are
   waitlisted and everything else is rejected.
 */
struct Threshold {
  double low;
  double accept;
  double waitlistCutoff;

  /// Constructor
  /**
     \warning Aborts unless 0 <= low <= accept <= waitlistCutoff <= 1
   */
  Threshold(double low, double accept, double waitlistCutoff);
};

/// The exact key range [low, high) of one target set after refinement
struct FinalThreshold {
  double low;
  double high;

  /// Constructor
  /**
     \warning Aborts unless 0 <= low <= high <= 1
   */
  FinalThreshold(double low, double high);

  /// \return true if key falls in [low, high)
  inline bool contains(double key) const {
    return low <= key && key < high;
  }
};

/// A target set's name paired with its final key range
struct FinalSetThreshold {
  std::string name;
  FinalThreshold threshold;

  FinalSetThreshold(const std::string& _name, const FinalThreshold& _threshold)
    : name(_name),
      threshold(_threshold) {}
};

typedef std::vector<FinalSetThreshold> FinalThresholdList;

#endif // SAMPLESPLIT_THRESHOLD_H
