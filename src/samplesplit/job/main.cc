#include <boost/filesystem.hpp>
#include <iostream>
#include <map>
#include <signal.h>
#include <stdlib.h>
#include <string.h>

#include "common/MainUtils.h"
#include "core/Params.h"
#include "core/SampleSplitAssert.h"
#include "core/StatusPrinter.h"
#include "core/Utils.h"
#include "job/SampleSplitJob.h"
#include "sampling/SamplingErrors.h"

int main(int argc, char** argv) {
  signal(SIGSEGV, sigsegvHandler);
  signal(SIGBUS, SampleSplitAssertions::dumpStack);

  if (argc == 1 ||
      (argc == 2 && (!strcmp(argv[1], "-h") ||
                     !strcmp(argv[1], "-help") ||
                     !strcmp(argv[1], "--help")))) {
    std::cerr << "Usage: " << argv[0]
              << " -CONFIG config.yaml -param1 val1 -param2 val2 ..."
              << std::endl << std::endl
              << "Required parameters:" << std::endl
              << "SET_SIZES = comma-delimited name:size pairs; sizes below 1 "
              << "are ratios, others are record counts" << std::endl
              << "INPUT_PATHS = comma-delimited input files, directories or "
              << "glob patterns" << std::endl
              << "OUTPUT_DIR = directory to create for the sampled sets"
              << std::endl << std::endl
              << "Optional parameters:" << std::endl
              << "COUNT = population size; counted from the input if absent"
              << std::endl
              << "DELTA = error bound (default 5e-5)" << std::endl
              << "SEED = random seed; taken from the clock if absent"
              << std::endl
              << "REPROPORTION = scale oversubscribed sizes down (default "
              << "false)" << std::endl
              << "KEYSPACE_LAYOUT = offset, nested or auto (default auto)"
              << std::endl
              << "NUM_THREADS = worker threads (default 1)" << std::endl
              << "ATTEMPTS_PER_PARTITION = times each partition is run "
              << "(default 1)" << std::endl
              << "CACHE_INPUT = keep input in memory between passes (default "
              << "true)" << std::endl
              << "RECORDS_PER_PARTITION = split files into partitions of this "
              << "many lines (default 0, one partition per file)" << std::endl
              << "SUMMARY_FILE = write a JSON summary of the run here"
              << std::endl
              << "LOG_DIR = path to log directory (default .)" << std::endl;
    exit(1);
  }

  Params params;
  params.parseCommandLine(argc, argv);
  setDefaultLogDir(params);

  StatusPrinter::init(&params);
  StatusPrinter::spawn();

  logStartTime();

  int status = 0;

  try {
    SampleSplitJob job(params);
    SamplingResult result;
    job.run(result);

    std::map<std::string, uint64_t> labelCounts;
    result.countLabels(labelCounts);

    std::cout << "seed " << result.seed << std::endl;
    for (PlannedSetList::const_iterator iter = result.plan.sets.begin();
         iter != result.plan.sets.end(); iter++) {
      std::cout << iter->name << '\t' << labelCounts[iter->name] << std::endl;
    }

    for (AdvisoryList::const_iterator iter = result.advisories.begin();
         iter != result.advisories.end(); iter++) {
      std::cerr << "warning: " << iter->describe() << std::endl;
    }
  } catch (SamplingException& exception) {
    std::cerr << argv[0] << ": " << exception.kind() << ": "
              << exception.what() << std::endl;
    StatusPrinter::add("%s: %s", exception.kind(), exception.what());
    status = 1;
  } catch (boost::filesystem::filesystem_error& exception) {
    std::cerr << argv[0] << ": " << exception.what() << std::endl;
    StatusPrinter::add("Filesystem error: %s", exception.what());
    status = 1;
  }

  dumpParams(params);

  StatusPrinter::flush();
  StatusPrinter::teardown();

  return status;
}
