#ifndef SAMPLESPLIT_SAMPLING_REPORT_H
#define SAMPLESPLIT_SAMPLING_REPORT_H

#include <json/json.h>
#include <string>

struct SamplingResult;

/**
   Summarize a sampling run as JSON: the run's seed, population, delta and
   layout, and for each set its target size, working and final thresholds,
   first-pass tally, labeled record count and any advisories.

   Waitlisted keys themselves are not included, only their number.

   \param result the run to summarize

   \param[out] report the JSON object to fill in
 */
void buildSamplingReport(const SamplingResult& result, Json::Value& report);

/// Write the JSON summary of a run to a file
void writeSamplingReport(
  const SamplingResult& result, const std::string& filename);

#endif // SAMPLESPLIT_SAMPLING_REPORT_H
