#ifndef SAMPLESPLIT_SAMPLE_SPLIT_JOB_H
#define SAMPLESPLIT_SAMPLE_SPLIT_JOB_H

#include <stdint.h>
#include <string>

#include "collection/PartitionTaskRunner.h"
#include "collection/PartitionedCollection.h"
#include "core/constants.h"
#include "sampling/ScalableSRS.h"

class Params;

/**
   SampleSplitJob samples newline-delimited records from files on disk into
   one output directory per target set.

   Input comes from INPUT_PATHS, a comma-delimited list of files, directories
   or glob patterns. Each input file becomes a partition, or is cut into
   partitions of RECORDS_PER_PARTITION lines if that parameter is non-zero.

   Set S is written to OUTPUT_DIR/S/part-NNNNN, with one file per input
   partition. OUTPUT_DIR must not exist yet. If SUMMARY_FILE is set, a JSON
   summary of the run is written there.

   With CACHE_INPUT set (the default), input is read once and kept in memory
   for both passes. Otherwise it is read again for the second pass.
 */
class SampleSplitJob {
public:
  /// Constructor
  /**
     \throws InvalidConfigurationException if the sampling parameters are
     malformed or a set name can't be used as a directory name

     \param params the job's parameters
   */
  SampleSplitJob(const Params& params);

  /// Destructor
  virtual ~SampleSplitJob();

  /**
     Run the job.

     \throws SamplingException if sampling fails or OUTPUT_DIR already exists

     \param[out] result the results of sampling
   */
  void run(SamplingResult& result);

  /// \return the input files, in partition order
  const StringList& getInputFiles() const;

private:
  void readInput(PartitionedCollection<std::string>& records);
  void checkOutputDirectory() const;
  void createOutputDirectories() const;
  void writeOutput(const SamplingResult& result);

  const SamplingConfig config;
  PartitionTaskRunner runner;

  StringList inputFiles;
  StringVector setNames;

  const std::string outputDirectory;
  const bool cacheInput;
  const uint64_t recordsPerPartition;
  std::string summaryFile;

  DISALLOW_COPY_AND_ASSIGN(SampleSplitJob);
};

#endif // SAMPLESPLIT_SAMPLE_SPLIT_JOB_H
