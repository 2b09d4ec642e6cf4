#ifndef SAMPLESPLIT_PARTITIONED_COLLECTION_H
#define SAMPLESPLIT_PARTITIONED_COLLECTION_H

#include <boost/function.hpp>
#include <pthread.h>
#include <stdint.h>
#include <vector>

#include "collection/PartitionFunction.h"
#include "collection/PartitionTaskRunner.h"
#include "core/SampleSplitAssert.h"

/**
   An ordered collection of records split into a fixed sequence of
   partitions. Partitions are numbered from zero and records keep their order
   within a partition.

   Partition functions run over the collection with mapPartitionsWithIndex()
   produce a new collection with the same number of partitions, where output
   partition i holds the records emitted for input partition i.
 */
template <typename T> class PartitionedCollection {
public:
  typedef std::vector<T> Partition;
  typedef boost::function<T (const T&, const T&)> MergeFunction;

  /// Constructor
  /**
     \param numPartitions the number of (initially empty) partitions
   */
  explicit PartitionedCollection(uint64_t numPartitions = 0)
    : partitions(numPartitions) {
  }

  /// \return the number of partitions in the collection
  uint64_t numPartitions() const {
    return partitions.size();
  }

  /// \return the total number of records across all partitions
  uint64_t count() const {
    uint64_t total = 0;

    for (typename std::vector<Partition>::const_iterator iter =
           partitions.begin(); iter != partitions.end(); iter++) {
      total += iter->size();
    }

    return total;
  }

  /// Change the number of partitions, dropping any partitions past the end
  void resize(uint64_t numPartitions) {
    partitions.resize(numPartitions);
  }

  /// Append a copy of the given records as a new partition
  void addPartition(const Partition& records) {
    partitions.push_back(records);
  }

  /// Append an empty partition and return it
  Partition& addPartition() {
    partitions.push_back(Partition());
    return partitions.back();
  }

  const Partition& getPartition(uint64_t partitionIndex) const {
    ABORT_IF(partitionIndex >= partitions.size(), "Partition %llu out of "
             "range; collection has %llu partitions", partitionIndex,
             partitions.size());
    return partitions[partitionIndex];
  }

  Partition& getPartition(uint64_t partitionIndex) {
    ABORT_IF(partitionIndex >= partitions.size(), "Partition %llu out of "
             "range; collection has %llu partitions", partitionIndex,
             partitions.size());
    return partitions[partitionIndex];
  }

  /**
     Run a partition function over every partition of this collection.

     Partitions are processed concurrently by the runner's workers. If the
     runner attempts a partition more than once, the output of exactly one
     attempt is kept.

     \param function the function to run

     \param runner the task runner that schedules partitions

     \param[out] output the collection that will hold the function's output;
     any existing contents are replaced
   */
  template <typename Out> void mapPartitionsWithIndex(
    const PartitionFunction<T, Out>& function, PartitionTaskRunner& runner,
    PartitionedCollection<Out>& output) const {

    output.clear();
    output.resize(partitions.size());

    MapPartitionsTask<Out> task(*this, function, output);
    runner.run(task, partitions.size());
  }

  /**
     Combine every record in the collection with an associative merge
     function, in partition order.

     \warning Aborts if the collection has no records

     \param merge the merge function

     \return the merged value
   */
  T reduce(const MergeFunction& merge) const {
    ABORT_IF(count() == 0, "Can't reduce an empty collection");

    bool haveValue = false;
    T value = T();

    for (typename std::vector<Partition>::const_iterator partitionIter =
           partitions.begin(); partitionIter != partitions.end();
         partitionIter++) {
      for (typename Partition::const_iterator iter = partitionIter->begin();
           iter != partitionIter->end(); iter++) {
        if (haveValue) {
          value = merge(value, *iter);
        } else {
          value = *iter;
          haveValue = true;
        }
      }
    }

    return value;
  }

  /// Append every record to the given vector in partition order
  void collect(std::vector<T>& output) const {
    for (typename std::vector<Partition>::const_iterator iter =
           partitions.begin(); iter != partitions.end(); iter++) {
      output.insert(output.end(), iter->begin(), iter->end());
    }
  }

  /// Remove all partitions
  void clear() {
    partitions.clear();
  }

private:
  /**
     Runs a partition function on one partition per attempt. Each attempt
     builds its output privately; the first attempt to finish for a partition
     installs its output and later attempts are discarded.
   */
  template <typename Out> class MapPartitionsTask : public PartitionTask {
  public:
    MapPartitionsTask(
      const PartitionedCollection<T>& _input,
      const PartitionFunction<T, Out>& _function,
      PartitionedCollection<Out>& _output)
      : input(_input),
        function(_function),
        output(_output),
        committed(_input.numPartitions(), false) {
      pthread_mutex_init(&commitLock, NULL);
    }

    virtual ~MapPartitionsTask() {
      pthread_mutex_destroy(&commitLock);
    }

    void run(uint64_t partitionIndex) {
      std::vector<Out> attemptOutput;
      function.map(
        partitionIndex, input.getPartition(partitionIndex), attemptOutput);

      pthread_mutex_lock(&commitLock);
      if (!committed[partitionIndex]) {
        output.getPartition(partitionIndex).swap(attemptOutput);
        committed[partitionIndex] = true;
      }
      pthread_mutex_unlock(&commitLock);
    }

  private:
    const PartitionedCollection<T>& input;
    const PartitionFunction<T, Out>& function;
    PartitionedCollection<Out>& output;

    pthread_mutex_t commitLock;
    std::vector<bool> committed;
  };

  std::vector<Partition> partitions;
};

#endif // SAMPLESPLIT_PARTITIONED_COLLECTION_H
