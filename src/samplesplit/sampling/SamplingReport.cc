#include <map>

#include "core/Utils.h"
#include "sampling/SamplingReport.h"
#include "sampling/ScalableSRS.h"

void buildSamplingReport(const SamplingResult& result, Json::Value& report) {
  report = Json::Value(Json::objectValue);

  report["seed"] = Json::UInt64(result.seed);
  report["population"] = Json::UInt64(result.population);
  report["delta"] = result.plan.delta;
  report["layout"] = keyspaceLayoutName(result.plan.layout);

  std::map<std::string, uint64_t> labelCounts;
  result.countLabels(labelCounts);

  Json::Value& sets = report["sets"];
  sets = Json::Value(Json::arrayValue);

  for (uint64_t i = 0; i < result.plan.sets.size(); i++) {
    const PlannedSet& plannedSet = result.plan.sets[i];

    Json::Value set(Json::objectValue);
    set["name"] = plannedSet.name;
    set["target"] = Json::UInt64(plannedSet.targetSize);
    set["refinement_target"] = Json::UInt64(plannedSet.refinementTarget);

    Json::Value& threshold = set["threshold"];
    threshold["low"] = plannedSet.threshold.low;
    threshold["accept"] = plannedSet.threshold.accept;
    threshold["waitlist_cutoff"] = plannedSet.threshold.waitlistCutoff;

    TallyMap::const_iterator tallyIter =
      result.globalTally.find(plannedSet.name);
    if (tallyIter != result.globalTally.end()) {
      set["accepted"] = Json::UInt64(tallyIter->second.acceptedCount);
      set["waitlisted"] =
        Json::UInt64(tallyIter->second.waitlistedKeys.size());
    } else {
      set["accepted"] = Json::UInt64(0);
      set["waitlisted"] = Json::UInt64(0);
    }

    if (i < result.finalThresholds.size()) {
      Json::Value& finalThreshold = set["final_threshold"];
      finalThreshold["low"] = result.finalThresholds[i].threshold.low;
      finalThreshold["high"] = result.finalThresholds[i].threshold.high;
    }

    set["labeled"] = Json::UInt64(labelCounts[plannedSet.name]);

    sets.append(set);
  }

  Json::Value& advisories = report["advisories"];
  advisories = Json::Value(Json::arrayValue);

  for (AdvisoryList::const_iterator iter = result.advisories.begin();
       iter != result.advisories.end(); iter++) {
    Json::Value advisory(Json::objectValue);
    advisory["kind"] = iter->kindName();
    advisory["set"] = iter->setName;
    advisory["target"] = Json::UInt64(iter->target);
    advisory["accepted"] = Json::UInt64(iter->acceptedCount);
    advisory["waitlisted"] = Json::UInt64(iter->waitlistLength);
    advisory["message"] = iter->describe();

    advisories.append(advisory);
  }
}

void writeSamplingReport(
  const SamplingResult& result, const std::string& filename) {

  Json::Value report;
  buildSamplingReport(result, report);
  writeJsonFile(filename, report);
}
