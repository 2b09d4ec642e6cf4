#include <boost/lexical_cast.hpp>
#include <set>

#include "core/Utils.h"
#include "sampling/SamplingErrors.h"
#include "sampling/TargetSetSpec.h"

void parseTargetSetSpecs(const std::string& str, TargetSetSpecList& specs) {
  specs.clear();

  StringList entries;
  parseCommaDelimitedList<std::string, StringList>(entries, str);

  std::set<std::string> names;

  for (StringList::iterator iter = entries.begin(); iter != entries.end();
       iter++) {
    size_t separator = iter->find_last_of(':');

    if (separator == std::string::npos) {
      throw InvalidConfigurationException(
        "Set size entry '" + *iter + "' is not of the form name:size");
    }

    std::string name(iter->substr(0, separator));
    std::string sizeString(iter->substr(separator + 1));
    strip(name);
    strip(sizeString);

    if (name.empty()) {
      throw InvalidConfigurationException(
        "Set size entry '" + *iter + "' has an empty name");
    }

    if (!names.insert(name).second) {
      throw InvalidConfigurationException(
        "Set '" + name + "' is listed more than once");
    }

    double size = 0.0;
    try {
      size = boost::lexical_cast<double>(sizeString);
    } catch (boost::bad_lexical_cast& exception) {
      throw InvalidConfigurationException(
        "Size '" + sizeString + "' for set '" + name + "' is not a number");
    }

    specs.push_back(TargetSetSpec(name, size));
  }
}

uint64_t totalSize(const TargetSetSizeList& sizes) {
  uint64_t total = 0;

  for (TargetSetSizeList::const_iterator iter = sizes.begin();
       iter != sizes.end(); iter++) {
    total += iter->size;
  }

  return total;
}
