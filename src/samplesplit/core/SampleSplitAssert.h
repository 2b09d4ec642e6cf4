#ifndef _SAMPLESPLIT_ASSERT_H
#define _SAMPLESPLIT_ASSERT_H

#include <execinfo.h>
#include <iostream>
#include <sstream>
#include <stdarg.h>
#include <stdio.h>
#include <string>
#include <stdint.h>
#include <stdlib.h>

#include "config.h"

/// Exception thrown if an assertion fails while in test mode
class AssertionFailedException : public std::exception {
public:
  /// Constructor
  AssertionFailedException() {}

  /// Constructor
  /**
     \param msg a message describing the assertion that failed
   */
  AssertionFailedException(const std::string& msg) : message(msg) {}

  /// Destructor
  virtual ~AssertionFailedException() throw() {}

  /// Return description of the assertion that failed
  /**
     \return string description of failed assertion
   */
  const char* what() const throw();
private:
  std::string message;
};

/// \cond PRIVATE
class SampleSplitAssertions {
public:
  static std::string _getAssertionMessage(const char* file, int line,
                                          const std::string& message);

  static void _ABORT(const char* file, int line, const char* format, ...);

  static void _ABORT_IF(const char* file, int line, bool condition,
                        const char* format, ...);

  static void _ASSERT(const char* file, int line, bool condition);
  static void _ASSERT(const char* file, int line, bool condition,
                      const char* format ...);

  /// Print a backtrace of the calling thread to stderr
  static void dumpStack(int signal=0);

  /**
     After this call, failed assertions throw AssertionFailedException instead
     of aborting the process. Used by the unit tests.
   */
  static void useTestModeAssertions();

private:
  static bool testMode;

  static std::string formatMessage(const char* format, va_list& ap);
  static void fail(const char* file, int line, const std::string& message,
                   bool printAbortPrefix);
};
/// \endcond

#define ABORT(...)   SampleSplitAssertions::_ABORT(__FILE__, __LINE__, __VA_ARGS__)
#define ABORT_IF(...)   SampleSplitAssertions::_ABORT_IF(__FILE__, __LINE__, __VA_ARGS__)

#ifdef SAMPLESPLIT_ASSERTS
# define ASSERT(...) SampleSplitAssertions::_ASSERT(__FILE__, __LINE__, __VA_ARGS__)
#else
# define ASSERT(...)
#endif

#endif //_SAMPLESPLIT_ASSERT_H
