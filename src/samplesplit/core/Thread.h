#ifndef SAMPLESPLIT_THREAD_H
#define SAMPLESPLIT_THREAD_H

#include <pthread.h>
#include <string>

namespace samplesplit {

/**
   Thread encapsulates pthreads into a more C++-friendly interface. Threads can
   be used to run standalone functions, or can serve as the base-class for
   threaded objects. To run a standalone function:

   void* func(void* args);
   Thread threadedFunction("thread name", &func);

   threadedFunction.startThread(args);
   ...
   void* result = threadedFunction.stopThread();

   To derive from this class, override the thread() function and use the
   single-argument constructor in your derived class's initialization list.

   Derived classes can check Thread::stop to know when stopThread() has been
   called.
 */
class Thread {
public:
  /// Constructor
  /**
     Create a thread object that runs a standalone function.

     \param threadName the name that will appear to the OS (truncated to 15
     characters)

     \param threadFunction the function to run
   */
  Thread(const std::string& threadName, void* (*threadFunction) (void*));

  /// Constructor
  /**
     Create a thread object without a function. The thread will do nothing
     unless you override the thread() member function.

     \param threadName the name that will appear to the OS
   */
  Thread(const std::string& threadName);

  /// Destructor
  virtual ~Thread();

  /**
     Start the thread.

     \param args the arguments to pass to the thread's function
   */
  void startThread(void* args = NULL);

  /**
     Wait for the thread to stop.

     \return the return value of the function
   */
  void* stopThread();

  /// \return true if the thread has been started and not yet joined
  bool isRunning() const;

protected:
  pthread_t threadID;

  /// Flag to signal the thread to stop. Derived classes can check this value in
  /// their thread() functions to know when to stop.
  volatile bool stop;

private:
  /// Structure for passing arguments to pthreads, since they can only take a
  /// single void* argument.
  struct PThreadArgs {
    Thread* This;
    void* args;
    PThreadArgs(Thread* thread, void* threadArgs)
      : This(thread),
        args(threadArgs) {}
  };

  /**
     The function actually run by pthread_create. Wraps a Thread object and
     calls its thread() member function.

     \param args a PThreadArgs structure

     \return the return value of the threaded function
   */
  static void* pthreadFunction(void* args);

  /**
     This is the threaded member function run by a Thread object. By default it
     calls the function passed into the Thread constructor.

     \param args whatever arguments your function takes

     \return whatever your function returns
   */
  virtual void* thread(void* args);

  const std::string threadName;
  void* (*threadFunction) (void*);

  bool terminated;
};

} // namespace samplesplit

#endif // SAMPLESPLIT_THREAD_H
