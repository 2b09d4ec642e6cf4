#include <string.h>

#include "core/SampleSplitAssert.h"
#include "core/Thread.h"
#include "core/Utils.h"

namespace samplesplit {

Thread::Thread(const std::string& _threadName, void* (*_threadFunction) (void*))
  : threadID(0),
    stop(true),
    threadName(_threadName),
    threadFunction(_threadFunction),
    terminated(true) {
}

Thread::Thread(const std::string& _threadName)
  : threadID(0),
    stop(true),
    threadName(_threadName),
    threadFunction(NULL),
    terminated(true) {
}

Thread::~Thread() {
  ASSERT(stop, "We should have called stopThread() before destruction time.");
  ASSERT(terminated, "Thread should have terminated before destruction time.");
}

void Thread::startThread(void* args) {
  ABORT_IF(!terminated, "Thread '%s' is already running", threadName.c_str());

  // Set before the thread runs so its loop doesn't see a stale stop flag
  stop = false;
  terminated = false;

  int status = pthread_create(&threadID, NULL,
                              &Thread::pthreadFunction,
                              new PThreadArgs(this, args));
  ABORT_IF(status != 0, "pthread_create() returned status %d", status);
}

void* Thread::stopThread() {
  stop = true;

  void* result = NULL;
  int status = pthread_join(threadID, &result);

  ABORT_IF(status != 0, "pthread_join() failed with error %d: %s",
           status, strerror(status));

  terminated = true;

  return result;
}

bool Thread::isRunning() const {
  return !terminated;
}

void* Thread::pthreadFunction(void* args) {
  PThreadArgs* pthreadArgs = static_cast<PThreadArgs*>(args);
  Thread* This = pthreadArgs->This;
  void* threadArgs = pthreadArgs->args;

  delete pthreadArgs;

  setThreadName(This->threadName);

  return This->thread(threadArgs);
}

void* Thread::thread(void* args) {
  if (threadFunction != NULL) {
    return threadFunction(args);
  }

  return NULL;
}

} // namespace samplesplit
