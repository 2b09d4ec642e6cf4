#include "core/SampleSplitAssert.h"
#include "sampling/Threshold.h"

Threshold::Threshold(double _low, double _accept, double _waitlistCutoff)
  : low(_low),
    accept(_accept),
    waitlistCutoff(_waitlistCutoff) {
  ABORT_IF(!(0.0 <= low && low <= accept && accept <= waitlistCutoff &&
             waitlistCutoff <= 1.0), "Invalid threshold: expected "
           "0 <= low (%f) <= accept (%f) <= waitlist cutoff (%f) <= 1", low,
           accept, waitlistCutoff);
}

FinalThreshold::FinalThreshold(double _low, double _high)
  : low(_low),
    high(_high) {
  ABORT_IF(!(0.0 <= low && low <= high && high <= 1.0), "Invalid final "
           "threshold: expected 0 <= low (%f) <= high (%f) <= 1", low, high);
}
