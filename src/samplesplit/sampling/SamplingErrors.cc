#include "sampling/SamplingErrors.h"

const char* SamplingException::what() const throw() {
  return message.c_str();
}

const char* SamplingException::kind() const throw() {
  return "SamplingError";
}

const char* InvalidConfigurationException::kind() const throw() {
  return "InvalidConfiguration";
}

const char* CapacityExceededException::kind() const throw() {
  return "CapacityExceeded";
}
