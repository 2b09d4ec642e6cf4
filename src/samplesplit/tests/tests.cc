#include <boost/filesystem.hpp>
#include <iostream>
#include <signal.h>
#include <stdlib.h>
#include <string>
#include "gtest/gtest.h"

#include "common/MainUtils.h"
#include "config.h"
#include "core/Params.h"
#include "core/SampleSplitAssert.h"
#include "core/StatusPrinter.h"

const char* TEST_WRITE_ROOT;

int main(int argc, char** argv) {
  signal(SIGSEGV, sigsegvHandler);

  SampleSplitAssertions::useTestModeAssertions();

#ifndef SAMPLESPLIT_ASSERTS
  std::cerr << std::endl << "WARNING: Assertions disabled. Some tests "
    "will not run." << std::endl << std::endl;
#endif //SAMPLESPLIT_ASSERTS

  // Strips gtest's own flags from argv.
  ::testing::InitGoogleTest(&argc, argv);

  Params params;
  params.parseCommandLine(argc, argv);

  static std::string writeRoot(
    params.get<std::string>("TEST_WRITE_ROOT", "/tmp/samplesplit_tests"));
  TEST_WRITE_ROOT = writeRoot.c_str();

  boost::filesystem::create_directories(writeRoot);

  params.add<std::string>("LOG_FILE", writeRoot + "/tests.log");
  StatusPrinter::init(&params);
  StatusPrinter::spawn();

  int status = RUN_ALL_TESTS();

  StatusPrinter::teardown();

  return status;
}
