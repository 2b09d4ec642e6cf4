#ifndef SAMPLESPLIT_PARTITION_FUNCTION_H
#define SAMPLESPLIT_PARTITION_FUNCTION_H

#include <stdint.h>
#include <vector>

/**
   All functions run over a PartitionedCollection by
   PartitionedCollection::mapPartitionsWithIndex must extend this base class.

   A partition function takes the index of a partition and every record in
   that partition, in order, and emits zero or more output records. The output
   records become the partition with the same index in the output collection.

   The same function object is invoked concurrently for different partitions,
   and may be invoked more than once for the same partition, so map() must not
   modify shared state and must produce the same output each time it is called
   with the same arguments.
 */
template <typename In, typename Out> class PartitionFunction {
public:
  /// Destructor
  virtual ~PartitionFunction() {}

  /**
     Execute the function on a single partition.

     \param partitionIndex the index of the partition within its collection

     \param records the partition's records, in order

     \param[out] output the function emits records by appending them here
   */
  virtual void map(
    uint64_t partitionIndex, const std::vector<In>& records,
    std::vector<Out>& output) const = 0;
};

#endif // SAMPLESPLIT_PARTITION_FUNCTION_H
