#include <math.h>
#include <set>
#include <sstream>
#include <vector>

#include "core/SampleSplitAssert.h"
#include "core/StatusPrinter.h"
#include "sampling/SamplingErrors.h"
#include "sampling/SetSizeNormalizer.h"

SetSizeNormalizer::SetSizeNormalizer(bool _reproportion)
  : reproportion(_reproportion) {
}

void SetSizeNormalizer::normalize(
  const TargetSetSpecList& specs, uint64_t population,
  TargetSetSizeList& sizes) const {

  validate(specs, population);

  sizes.clear();

  // Requested sizes are totalled before conversion, so counts too large for
  // a uint64_t can't wrap around the oversubscription check.
  std::vector<long double> requestedSizes;
  long double requestedTotal = 0.0;

  for (TargetSetSpecList::const_iterator iter = specs.begin();
       iter != specs.end(); iter++) {
    long double size = 0.0;

    if (iter->size < 1.0) {
      size = floorl(static_cast<long double>(iter->size) * population + 0.5);
    } else {
      size = floorl(iter->size);
    }

    requestedSizes.push_back(size);
    requestedTotal += size;
  }

  if (requestedTotal > population) {
    if (!reproportion) {
      std::ostringstream oss;
      oss << "Requested set sizes add up to " << requestedTotal
          << " records, which exceeds the population of " << population
          << " records";
      throw InvalidConfigurationException(oss.str());
    }

    StatusPrinter::add(
      "Set sizes add up to %Lg records but population is %llu; scaling sizes "
      "down proportionally", requestedTotal, population);

    for (uint64_t i = 0; i < requestedSizes.size(); i++) {
      requestedSizes[i] = floorl(
        requestedSizes[i] * population / requestedTotal);
    }
  }

  for (uint64_t i = 0; i < specs.size(); i++) {
    sizes.push_back(
      TargetSetSize(specs[i].name,
                    static_cast<uint64_t>(requestedSizes[i])));
  }

  ABORT_IF(totalSize(sizes) > population, "Normalized sizes add up to %llu, "
           "which exceeds population %llu", totalSize(sizes), population);
}

void SetSizeNormalizer::validate(
  const TargetSetSpecList& specs, uint64_t population) const {

  if (specs.empty()) {
    throw InvalidConfigurationException("No target sets were requested");
  }

  if (population == 0) {
    throw InvalidConfigurationException(
      "Can't sample target sets from an empty population");
  }

  std::set<std::string> names;

  for (TargetSetSpecList::const_iterator iter = specs.begin();
       iter != specs.end(); iter++) {
    if (iter->name.empty()) {
      throw InvalidConfigurationException("Target set names can't be empty");
    }

    if (!names.insert(iter->name).second) {
      throw InvalidConfigurationException(
        "Target set '" + iter->name + "' is listed more than once");
    }

    if (isnan(iter->size) || isinf(iter->size) || iter->size < 0.0) {
      std::ostringstream oss;
      oss << "Target set '" << iter->name << "' has invalid size "
          << iter->size;
      throw InvalidConfigurationException(oss.str());
    }
  }
}
