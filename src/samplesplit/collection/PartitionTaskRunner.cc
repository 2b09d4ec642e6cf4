#include <exception>
#include <sstream>

#include "collection/PartitionTaskRunner.h"
#include "core/Params.h"
#include "core/SampleSplitAssert.h"
#include "core/StatusPrinter.h"

static std::string workerName(uint64_t workerID) {
  std::ostringstream oss;
  oss << "Partition" << workerID;
  return oss.str();
}

PartitionTaskRunner::PartitionTaskRunner(
  uint64_t _numThreads, uint64_t _attemptsPerPartition)
  : numThreads(_numThreads),
    attemptsPerPartition(_attemptsPerPartition),
    numAttemptsRun(0),
    failed(false),
    failedPartition(0) {
  ABORT_IF(numThreads == 0, "Need at least one worker thread");
  ABORT_IF(attemptsPerPartition == 0, "Need at least one attempt per "
           "partition");

  pthread_mutex_init(&lock, NULL);
}

PartitionTaskRunner::PartitionTaskRunner(const Params& params)
  : numThreads(params.get<uint64_t>("NUM_THREADS", 1)),
    attemptsPerPartition(params.get<uint64_t>("ATTEMPTS_PER_PARTITION", 1)),
    numAttemptsRun(0),
    failed(false),
    failedPartition(0) {
  ABORT_IF(numThreads == 0, "NUM_THREADS must be at least 1");
  ABORT_IF(attemptsPerPartition == 0, "ATTEMPTS_PER_PARTITION must be at "
           "least 1");

  pthread_mutex_init(&lock, NULL);
}

PartitionTaskRunner::~PartitionTaskRunner() {
  pthread_mutex_destroy(&lock);
}

void PartitionTaskRunner::run(PartitionTask& task, uint64_t numPartitions) {
  pthread_mutex_lock(&lock);
  bool busy = !pendingAttempts.empty();
  pthread_mutex_unlock(&lock);

  ABORT_IF(busy, "Runner is already running a task");

  pthread_mutex_lock(&lock);
  // Every partition gets its first attempt before any partition is retried.
  for (uint64_t attempt = 0; attempt < attemptsPerPartition; attempt++) {
    for (uint64_t i = 0; i < numPartitions; i++) {
      pendingAttempts.push(i);
    }
  }

  failed = false;
  failureMessage.clear();
  pthread_mutex_unlock(&lock);

  uint64_t workersToStart = numThreads;
  if (numPartitions * attemptsPerPartition < workersToStart) {
    workersToStart = numPartitions * attemptsPerPartition;
  }

  std::vector<Worker*> workers;

  for (uint64_t i = 0; i < workersToStart; i++) {
    Worker* worker = new Worker(i, *this, task);
    worker->startThread();
    workers.push_back(worker);
  }

  for (std::vector<Worker*>::iterator iter = workers.begin();
       iter != workers.end(); iter++) {
    (*iter)->stopThread();
    delete *iter;
  }

  workers.clear();

  ABORT_IF(failed, "Task failed on partition %llu: %s", failedPartition,
           failureMessage.c_str());
}

uint64_t PartitionTaskRunner::getNumThreads() const {
  return numThreads;
}

uint64_t PartitionTaskRunner::getAttemptsPerPartition() const {
  return attemptsPerPartition;
}

uint64_t PartitionTaskRunner::getNumAttemptsRun() const {
  return numAttemptsRun;
}

bool PartitionTaskRunner::nextAttempt(uint64_t& partitionIndex) {
  pthread_mutex_lock(&lock);

  bool gotAttempt = !pendingAttempts.empty();

  if (gotAttempt) {
    partitionIndex = pendingAttempts.front();
    pendingAttempts.pop();
    numAttemptsRun++;
  }

  pthread_mutex_unlock(&lock);

  return gotAttempt;
}

void PartitionTaskRunner::recordFailure(
  uint64_t partitionIndex, const std::string& message) {

  pthread_mutex_lock(&lock);

  StatusPrinter::add("Attempt on partition %llu failed: %s", partitionIndex,
                     message.c_str());

  if (!failed) {
    failed = true;
    failedPartition = partitionIndex;
    failureMessage.assign(message);
  }

  pthread_mutex_unlock(&lock);
}

PartitionTaskRunner::Worker::Worker(
  uint64_t workerID, PartitionTaskRunner& _runner, PartitionTask& _task)
  : samplesplit::Thread(workerName(workerID)),
    runner(_runner),
    task(_task) {
}

void* PartitionTaskRunner::Worker::thread(void* args) {
  uint64_t partitionIndex = 0;

  while (runner.nextAttempt(partitionIndex)) {
    try {
      task.run(partitionIndex);
    } catch (std::exception& exception) {
      runner.recordFailure(partitionIndex, exception.what());
    }
  }

  return NULL;
}
