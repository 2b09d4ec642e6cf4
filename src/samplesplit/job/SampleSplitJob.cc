#include <boost/filesystem.hpp>
#include <map>

#include "collection/InputPaths.h"
#include "collection/TextLineReader.h"
#include "core/File.h"
#include "core/Params.h"
#include "core/StatusPrinter.h"
#include "core/Timer.h"
#include "core/Utils.h"
#include "job/SampleSplitJob.h"
#include "job/SetPartitionWriter.h"
#include "sampling/SamplingErrors.h"
#include "sampling/SamplingReport.h"

SampleSplitJob::SampleSplitJob(const Params& params)
  : config(SamplingConfig::fromParams(params)),
    runner(params),
    outputDirectory(params.get<std::string>("OUTPUT_DIR")),
    cacheInput(params.get<bool>("CACHE_INPUT", true)),
    recordsPerPartition(params.get<uint64_t>("RECORDS_PER_PARTITION", 0)) {

  for (TargetSetSpecList::const_iterator iter = config.setSizes.begin();
       iter != config.setSizes.end(); iter++) {
    if (iter->name == "." || iter->name == ".." ||
        iter->name.find('/') != std::string::npos) {
      throw InvalidConfigurationException(
        "Set name '" + iter->name + "' can't be used as a directory name");
    }

    setNames.push_back(iter->name);
  }

  if (params.contains("SUMMARY_FILE")) {
    summaryFile.assign(params.get<std::string>("SUMMARY_FILE"));
  }

  StringList inputPaths;
  parseCommaDelimitedList<std::string, StringList>(
    inputPaths, params.get<std::string>("INPUT_PATHS"));
  expandInputPaths(inputPaths, inputFiles);
}

SampleSplitJob::~SampleSplitJob() {
}

void SampleSplitJob::run(SamplingResult& result) {
  checkOutputDirectory();

  ScalableSRS srs(config, runner);
  PartitionedCollection<std::string> records;

  readInput(records);

  srs.plan(records, result);

  // Nothing is written until the set sizes and thresholds are known to be
  // valid, so a rejected configuration can be retried as-is.
  createOutputDirectories();

  srs.classify(records, result);
  srs.refine(result);

  if (!cacheInput) {
    records.clear();
    readInput(records);
  }

  srs.label(records, result);

  writeOutput(result);

  if (!summaryFile.empty()) {
    writeSamplingReport(result, summaryFile);
  }

  std::map<std::string, uint64_t> labelCounts;
  result.countLabels(labelCounts);

  for (std::map<std::string, uint64_t>::iterator iter = labelCounts.begin();
       iter != labelCounts.end(); iter++) {
    StatusPrinter::add(
      StatusPrinter::CH_STATISTIC, "Set %s: %llu records", iter->first.c_str(),
      iter->second);
  }
}

const StringList& SampleSplitJob::getInputFiles() const {
  return inputFiles;
}

void SampleSplitJob::readInput(PartitionedCollection<std::string>& records) {
  Timer timer;
  timer.start();

  TextLineReader::readFiles(inputFiles, recordsPerPartition, runner, records);

  timer.stop();
  StatusPrinter::add(
    StatusPrinter::CH_STATISTIC, "Read %llu records from %llu files into %llu "
    "partitions in %llu us", records.count(), inputFiles.size(),
    records.numPartitions(), timer.getElapsed());
}

void SampleSplitJob::checkOutputDirectory() const {
  if (boost::filesystem::exists(boost::filesystem::path(outputDirectory))) {
    throw InvalidConfigurationException(
      "Output directory '" + outputDirectory + "' already exists");
  }
}

void SampleSplitJob::createOutputDirectories() const {
  boost::filesystem::path outputPath(outputDirectory);

  for (StringVector::const_iterator iter = setNames.begin();
       iter != setNames.end(); iter++) {
    boost::filesystem::create_directories(outputPath / *iter);
  }
}

void SampleSplitJob::writeOutput(const SamplingResult& result) {
  Timer timer;
  timer.start();

  SetPartitionWriter writer(outputDirectory, setNames);
  PartitionedCollection<uint64_t> recordsWritten;
  result.output.mapPartitionsWithIndex(writer, runner, recordsWritten);

  // Mark the output complete.
  File successFile(outputDirectory + "/_SUCCESS");
  successFile.open(File::WRITE, true);
  successFile.close();

  timer.stop();
  StatusPrinter::add(
    StatusPrinter::CH_STATISTIC, "Wrote %llu partitions to %s in %llu us",
    recordsWritten.numPartitions(), outputDirectory.c_str(),
    timer.getElapsed());
}
