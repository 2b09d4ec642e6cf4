#include "sampling/SamplingErrors.h"
#include "sampling/SamplingPlan.h"

KeyspaceLayout parseKeyspaceLayout(const std::string& name) {
  if (name == "offset") {
    return OFFSET_LAYOUT;
  } else if (name == "nested") {
    return NESTED_LAYOUT;
  } else if (name == "auto") {
    return AUTO_LAYOUT;
  }

  throw InvalidConfigurationException(
    "Unknown key space layout '" + name + "'; expected 'offset', 'nested' "
    "or 'auto'");
}

const char* keyspaceLayoutName(KeyspaceLayout layout) {
  switch (layout) {
  case OFFSET_LAYOUT:
    return "offset";
  case NESTED_LAYOUT:
    return "nested";
  case AUTO_LAYOUT:
    return "auto";
  default:
    return "unknown";
  }
}
