#ifndef SAMPLESPLIT_PARTITION_TASK_RUNNER_H
#define SAMPLESPLIT_PARTITION_TASK_RUNNER_H

#include <pthread.h>
#include <queue>
#include <stdint.h>
#include <string>
#include <vector>

#include "core/Thread.h"
#include "core/constants.h"

class Params;

/**
   A unit of per-partition work. PartitionTaskRunner calls run() once per
   attempt; implementations are responsible for committing the output of
   exactly one attempt per partition.
 */
class PartitionTask {
public:
  /// Destructor
  virtual ~PartitionTask() {}

  /**
     Run one attempt at processing a partition.

     \param partitionIndex the partition to process
   */
  virtual void run(uint64_t partitionIndex) = 0;
};

/**
   PartitionTaskRunner runs a PartitionTask over every partition of a
   collection on a fixed pool of worker threads. Workers claim partition
   indices from a shared queue, so partitions complete in no particular order.

   Each partition can be attempted more than once (attemptsPerPartition),
   which models a scheduler that retries tasks after worker failures or
   launches speculative duplicates; tasks must tolerate this.

   If any attempt fails with an exception, the runner lets the remaining
   attempts finish, then aborts on the calling thread with the first failure's
   message.
 */
class PartitionTaskRunner {
public:
  /// Constructor
  /**
     \param numThreads the number of worker threads to run partitions on

     \param attemptsPerPartition the number of times each partition is run
   */
  PartitionTaskRunner(uint64_t numThreads, uint64_t attemptsPerPartition = 1);

  /// Construct from the NUM_THREADS and ATTEMPTS_PER_PARTITION parameters
  /**
     NUM_THREADS defaults to 1 and ATTEMPTS_PER_PARTITION defaults to 1.

     \param params the Params object holding the runner's configuration
   */
  PartitionTaskRunner(const Params& params);

  /// Destructor
  virtual ~PartitionTaskRunner();

  /**
     Run the task over partitions [0, numPartitions) and block until every
     attempt has finished.

     \param task the task to run

     \param numPartitions the number of partitions to run the task on
   */
  void run(PartitionTask& task, uint64_t numPartitions);

  /// \return the number of worker threads
  uint64_t getNumThreads() const;

  /// \return the number of times each partition is attempted
  uint64_t getAttemptsPerPartition() const;

  /// \return the total number of attempts started over the runner's lifetime
  uint64_t getNumAttemptsRun() const;

private:
  class Worker : public samplesplit::Thread {
  public:
    Worker(uint64_t workerID, PartitionTaskRunner& runner, PartitionTask& task);

  private:
    void* thread(void* args);

    PartitionTaskRunner& runner;
    PartitionTask& task;
  };

  bool nextAttempt(uint64_t& partitionIndex);
  void recordFailure(uint64_t partitionIndex, const std::string& message);

  const uint64_t numThreads;
  const uint64_t attemptsPerPartition;

  pthread_mutex_t lock;
  std::queue<uint64_t> pendingAttempts;
  uint64_t numAttemptsRun;

  bool failed;
  uint64_t failedPartition;
  std::string failureMessage;

  DISALLOW_COPY_AND_ASSIGN(PartitionTaskRunner);
};

#endif // SAMPLESPLIT_PARTITION_TASK_RUNNER_H
