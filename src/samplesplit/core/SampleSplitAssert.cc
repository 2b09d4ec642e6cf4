#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "config.h"
#include "core/SampleSplitAssert.h"

bool SampleSplitAssertions::testMode = false;

const char* AssertionFailedException::what()
  const throw() {
  return message.c_str();
}

std::string SampleSplitAssertions::_getAssertionMessage(
  const char* file, int line, const std::string& message) {

  std::ostringstream oss;
  oss << "Assertion in file '" << file << "' line " << line << " failed: "
      << std::endl;
  oss << message << std::endl;
  return oss.str();
}

std::string SampleSplitAssertions::formatMessage(
  const char* format, va_list& ap) {

  char buffer[500];
  vsnprintf(buffer, 500, format, ap);

  return std::string(buffer);
}

void SampleSplitAssertions::fail(
  const char* file, int line, const std::string& message,
  bool printAbortPrefix) {

  std::string assertMessage = _getAssertionMessage(file, line, message);

  if (testMode) {
    throw AssertionFailedException(assertMessage);
  }

  if (printAbortPrefix) {
    std::cerr << "ABORT: ";
  }
  std::cerr << assertMessage << std::endl;
  dumpStack();
  abort();
}

void SampleSplitAssertions::_ABORT(
  const char* file, int line, const char* format ...) {

  va_list ap;
  va_start(ap, format);
  std::string message = formatMessage(format, ap);
  va_end(ap);

  fail(file, line, message, true);
}

void SampleSplitAssertions::_ABORT_IF(const char* file, int line,
                                      bool condition, const char* format ...) {
  if (condition) {
    va_list ap;
    va_start(ap, format);
    std::string message = formatMessage(format, ap);
    va_end(ap);

    fail(file, line, message, true);
  }
}

void SampleSplitAssertions::_ASSERT(
  const char* file, int line, bool condition) {

  if (!condition) {
    fail(file, line, std::string(), false);
  }
}

void SampleSplitAssertions::_ASSERT(
  const char* file, int line, bool condition, const char* format ...) {

  if (!condition) {
    va_list ap;
    va_start(ap, format);
    std::string message = formatMessage(format, ap);
    va_end(ap);

    fail(file, line, message, false);
  }
}

void SampleSplitAssertions::dumpStack(int signal) {
  void* frames[64];
  int numFrames = backtrace(frames, 64);

  if (signal != 0) {
    std::cerr << "Caught signal " << signal << "; backtrace follows"
              << std::endl;
  }

  backtrace_symbols_fd(frames, numFrames, STDERR_FILENO);
}

void SampleSplitAssertions::useTestModeAssertions() {
  testMode = true;
}
