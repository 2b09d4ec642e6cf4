#include <iostream>
#include <signal.h>
#include <string>
#include <time.h>

#include "common/MainUtils.h"
#include "core/Params.h"
#include "core/SampleSplitAssert.h"
#include "core/StatusPrinter.h"

void logStartTime() {
  time_t rawTime;
  char timeString[80];

  time(&rawTime);
  struct tm* timeInfo = localtime(&rawTime);
  strftime(timeString, 80, "%c", timeInfo);

  StatusPrinter::add("Started %s", timeString);
}

void setDefaultLogDir(Params& params) {
  if (!params.contains("LOG_DIR")) {
    params.add<std::string>("LOG_DIR", ".");
  }
}

void sigsegvHandler(int signal_) {
  std::cerr << "Caught SIGSEGV. Segmentation Fault." << std::endl;
  SampleSplitAssertions::dumpStack(signal_);
  // Reset the SIGSEGV handler so we can generate a core dump.
  signal(SIGSEGV, SIG_DFL);
}
