#ifndef SAMPLESPLIT_RANDOM_KEY_GENERATOR_H
#define SAMPLESPLIT_RANDOM_KEY_GENERATOR_H

#include <stdint.h>
#include <stdlib.h>

/**
   Generates the sequence of uniform keys in [0, 1) for the records of one
   partition, one key per record in record order.

   The sequence depends only on the job seed and the partition index: two
   generators built from the same pair produce identical sequences, whichever
   thread or attempt creates them. Generators don't share state, so any
   number can run concurrently.
 */
class RandomKeyGenerator {
public:
  /// Constructor
  /**
     \param seed the job's seed

     \param partitionIndex the partition whose keys will be generated
   */
  RandomKeyGenerator(uint64_t seed, uint64_t partitionIndex);

  /// \return the next key in the sequence
  double next();

private:
  unsigned short state[3];
  struct drand48_data randData;
};

#endif // SAMPLESPLIT_RANDOM_KEY_GENERATOR_H
