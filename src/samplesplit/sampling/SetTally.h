#ifndef SAMPLESPLIT_SET_TALLY_H
#define SAMPLESPLIT_SET_TALLY_H

#include <map>
#include <stdint.h>
#include <string>

#include "core/constants.h"

/// First-pass results for one target set
struct SetTally {
  /// The number of keys that fell in the set's acceptance range
  uint64_t acceptedCount;

  /// Every key that fell in the set's waitlist range, in no particular order
  KeyVector waitlistedKeys;

  SetTally()
    : acceptedCount(0) {}
};

/// First-pass results for every target set, by set name
typedef std::map<std::string, SetTally> TallyMap;

#endif // SAMPLESPLIT_SET_TALLY_H
