#ifndef SAMPLESPLIT_SAMPLING_ERRORS_H
#define SAMPLESPLIT_SAMPLING_ERRORS_H

#include <exception>
#include <string>

/**
   Base class for errors in a sampling job's configuration that the caller is
   expected to report and recover from. Internal invariant violations abort
   instead.
 */
class SamplingException : public std::exception {
public:
  /// Constructor
  /**
     \param msg a message describing the error
   */
  SamplingException(const std::string& msg) : message(msg) {}

  /// Destructor
  virtual ~SamplingException() throw() {}

  /// \return a description of the error
  const char* what() const throw();

  /// \return the name of the error's kind, for reports
  virtual const char* kind() const throw();

private:
  std::string message;
};

/// Thrown when the requested set sizes, population or delta are unusable
class InvalidConfigurationException : public SamplingException {
public:
  InvalidConfigurationException(const std::string& msg)
    : SamplingException(msg) {}

  const char* kind() const throw();
};

/// Thrown when the sets' key ranges don't fit in the unit interval
class CapacityExceededException : public SamplingException {
public:
  CapacityExceededException(const std::string& msg)
    : SamplingException(msg) {}

  const char* kind() const throw();
};

#endif // SAMPLESPLIT_SAMPLING_ERRORS_H
