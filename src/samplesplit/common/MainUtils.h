#ifndef SAMPLESPLIT_MAIN_UTILS_H
#define SAMPLESPLIT_MAIN_UTILS_H

// Utility functions used by the samplesplit and test main.cc files

class Params;

// Log the time that the run started
void logStartTime();

// Default LOG_DIR to the working directory if it isn't set, so that the
// status printer always has somewhere to write
void setDefaultLogDir(Params& params);

// Print segfault, reset the handler and let the fault generate a core dump
void sigsegvHandler(int signal=0);

#endif // SAMPLESPLIT_MAIN_UTILS_H
