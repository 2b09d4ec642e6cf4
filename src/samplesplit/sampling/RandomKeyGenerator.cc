#include <string.h>

#include "core/SampleSplitAssert.h"
#include "sampling/RandomKeyGenerator.h"

RandomKeyGenerator::RandomKeyGenerator(
  uint64_t seed, uint64_t partitionIndex) {
  uint64_t partitionSeed = seed + partitionIndex;

  // Fold all 64 bits of the seed into erand48's 48 bits of state.
  state[0] = 0x330E ^ static_cast<unsigned short>(partitionSeed >> 48);
  state[1] = static_cast<unsigned short>(partitionSeed & 0xFFFF);
  state[2] = static_cast<unsigned short>((partitionSeed >> 16) & 0xFFFF) ^
    static_cast<unsigned short>((partitionSeed >> 32) & 0xFFFF);

  // Zeroed data makes erand48_r use the standard drand48 multiplier and
  // addend.
  memset(&randData, 0, sizeof(randData));
}

double RandomKeyGenerator::next() {
  double key = 0.0;

  ABORT_IF(erand48_r(state, &randData, &key) != 0, "erand48_r() failed");

  return key;
}
