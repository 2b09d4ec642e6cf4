#include <errno.h>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "core/Params.h"
#include "core/StatusPrinter.h"
#include "core/SampleSplitAssert.h"
#include "core/Timer.h"
#include "core/Utils.h"

std::queue<std::string> StatusPrinter::messages;
std::queue<StatusPrinter::Channel> StatusPrinter::channelsForMessages;
pthread_mutex_t StatusPrinter::statusPrintMutex = PTHREAD_MUTEX_INITIALIZER;
pthread_cond_t StatusPrinter::messageQueueNotEmpty = PTHREAD_COND_INITIALIZER;
bool StatusPrinter::stop = false;
samplesplit::Thread StatusPrinter::thread(
  "StatusPrinter", &StatusPrinter::run);
std::map<StatusPrinter::Channel, std::string> StatusPrinter::channelHeaders;
std::ostream* StatusPrinter::outputStream = NULL;

std::string StatusPrinter::getHostLogName(Params* params) {
  const std::string& logDirName = params->get<std::string>("LOG_DIR");

  std::string hostname;
  getHostname(hostname);

  std::ostringstream oss;
  oss << logDirName << '/' << hostname << ".log";

  return oss.str();
}

void StatusPrinter::init(Params* params) {
  pthread_mutex_lock(&statusPrintMutex);
  stop = false;

  if (!params->contains("LOG_FILE")) {
    params->add<std::string>("LOG_FILE", getHostLogName(params));
  }

  const std::string& logFilePath = params->get<std::string>("LOG_FILE");
  const char* logFilePathCStr = logFilePath.c_str();

  int fp = creat(logFilePathCStr, 00644);
  ABORT_IF(fp == -1, "Creating log file '%s' failed with error %d: %s",
           logFilePathCStr, errno, strerror(errno));
  close(fp);

  if (outputStream != NULL) {
    delete outputStream;
  }
  outputStream = new std::ofstream(logFilePathCStr);

  channelHeaders[CH_STATUS] = params->get<std::string>(
    "CHANNEL_STATUS_HEADER", "STATUS");
  channelHeaders[CH_STATISTIC] = params->get<std::string>(
    "CHANNEL_STATISTIC_HEADER", "STAT");
  channelHeaders[CH_PARAM] = params->get<std::string>(
    "CHANNEL_PARAM_HEADER", "PARAM");
  channelHeaders[CH_ADVISORY] = params->get<std::string>(
    "CHANNEL_ADVISORY_HEADER", "ADVISORY");
  pthread_mutex_unlock(&statusPrintMutex);
}

void StatusPrinter::teardown() {
  pthread_mutex_lock(&statusPrintMutex);
  stop = true;
  pthread_cond_signal(&messageQueueNotEmpty);
  pthread_mutex_unlock(&statusPrintMutex);

  if (thread.isRunning()) {
    thread.stopThread();
  }

  pthread_mutex_lock(&statusPrintMutex);
  if (outputStream != NULL) {
    outputStream->flush();
    delete outputStream;
    outputStream = NULL;
  }
  pthread_mutex_unlock(&statusPrintMutex);
}

void StatusPrinter::add(
  const StatusPrinter::Channel& channel, const std::string& message) {

  std::ostringstream oss;
  oss << message << " (" << Timer::posixTimeInMicros() << ")";

  pthread_mutex_lock(&statusPrintMutex);
  channelsForMessages.push(channel);
  messages.push(oss.str());
  pthread_cond_signal(&messageQueueNotEmpty);
  pthread_mutex_unlock(&statusPrintMutex);
}

void StatusPrinter::add(
  const StatusPrinter::Channel& channel, const char* messageFormat ...) {
  va_list ap;
  va_start(ap, messageFormat);
  add(channel, messageFormat, ap);
  va_end(ap);
}

void StatusPrinter::add(
  const StatusPrinter::Channel& channel, const char* messageFormat,
  va_list& ap) {
  char buffer[500];
  vsnprintf(buffer, 500, messageFormat, ap);

  std::string message(buffer);
  add(channel, message);
}

void StatusPrinter::add(const std::string& message) {
  add(CH_STATUS, message);
}

void StatusPrinter::add(const char* messageFormat ...) {
  va_list ap;
  va_start(ap, messageFormat);
  add(CH_STATUS, messageFormat, ap);
  va_end(ap);
}

void StatusPrinter::printNextMessage() {
  StatusPrinter::Channel myChannel = channelsForMessages.front();

  if (outputStream != NULL) {
    (*outputStream) << channelHeaders[myChannel] << ' ' << messages.front()
                    << std::endl;
  }

  channelsForMessages.pop();
  messages.pop();
}

void StatusPrinter::flush() {
  pthread_mutex_lock(&statusPrintMutex);
  if (outputStream != NULL) {
    outputStream->flush();
  }
  pthread_mutex_unlock(&statusPrintMutex);
}

void* StatusPrinter::run(void* arg) {
  pthread_mutex_lock(&statusPrintMutex);

  while (!stop) {
    while (messages.empty() && !stop) {
      pthread_cond_wait(&messageQueueNotEmpty, &statusPrintMutex);
    }

    if (!messages.empty()) {
      printNextMessage();
    }
  }

  while (!messages.empty()) {
    printNextMessage();
  }

  pthread_mutex_unlock(&statusPrintMutex);

  return NULL;
}

void StatusPrinter::spawn() {
  thread.startThread();
}
