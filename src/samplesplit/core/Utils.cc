#include <algorithm>
#include <errno.h>
#include <limits.h>
#include <sstream>
#include <string.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "core/File.h"
#include "core/Params.h"
#include "core/SampleSplitAssert.h"
#include "core/Utils.h"

bool fileExists(const char* fileName) {
  struct stat statbuf;
  int status = stat(fileName, &statbuf);

  return status == 0;
}

bool fileExists(const std::string& fileName) {
  return fileExists(fileName.c_str());
}

void setThreadName(const std::string& name) {
  char threadName[17];
  memset(threadName, 0, 17);

  memcpy(threadName, name.c_str(), std::min<uint64_t>(name.size(), 16));

  if (prctl(PR_SET_NAME, threadName) == -1) {
    ABORT("prctl() returned status %d: %s", errno, strerror(errno));
  }
}

void strip(std::string& str) {
  if (str.empty()) {
    return;
  }
  const char* whitespaceChars = " \t";
  size_t startIndex = str.find_first_not_of(whitespaceChars);
  size_t endIndex = str.find_last_not_of(whitespaceChars);

  if (startIndex == std::string::npos || endIndex == std::string::npos) {
    // String is all whitespace
    str = std::string();
    return;
  }

  std::string tmp(str);

  str = tmp.substr(startIndex, endIndex - startIndex + 1);
}

void blockingWrite(
  int fd, const uint8_t* buffer, uint64_t size, uint64_t maxWriteSize,
  const char* description) {

  uint64_t bytesTransferred = 0;
  ssize_t bytesWritten;

  while (bytesTransferred < size) {
    uint64_t writeSize = size - bytesTransferred;
    if (maxWriteSize > 0) {
      writeSize = std::min<uint64_t>(writeSize, maxWriteSize);
    }

    bytesWritten = write(fd, buffer + bytesTransferred, writeSize);

    if (bytesWritten < 0 && errno == EINTR) {
      continue;
    }

    ABORT_IF(bytesWritten == 0,
             "write() of size %llu to %s (descriptor %d) returned 0 bytes",
             writeSize, description, fd);
    ABORT_IF(bytesWritten < 0,
             "write() of size %llu to %s (descriptor %d) failed with error %d: "
             "%s", writeSize, description, fd, errno, strerror(errno));

    bytesTransferred += bytesWritten;
  }
}

uint64_t blockingRead(
  int fd, uint8_t* buffer, uint64_t size, uint64_t maxReadSize,
  const char* description) {

  uint64_t bytesTransferred = 0;
  ssize_t bytesRead;

  while (bytesTransferred < size) {
    uint64_t readSize = size - bytesTransferred;
    if (maxReadSize > 0) {
      readSize = std::min<uint64_t>(readSize, maxReadSize);
    }

    bytesRead = read(fd, buffer + bytesTransferred, readSize);

    if (bytesRead < 0 && errno == EINTR) {
      continue;
    }

    ABORT_IF(bytesRead < 0,
             "read() of %llu bytes on %s (descriptor %d) returned error "
             "code %d: %s", readSize, description, fd, errno, strerror(errno));

    if (bytesRead == 0) {
      // Hit EOF before reading size bytes.
      break;
    }

    bytesTransferred += bytesRead;
  }
  return bytesTransferred;
}

void getHostname(std::string& hostnameOutStr) {
  char hostname[HOST_NAME_MAX + 1];
  hostname[HOST_NAME_MAX] = 0;

  if (gethostname(hostname, HOST_NAME_MAX)) {
    ABORT("gethostname() failed with error %d: %s", errno, strerror(errno));
  }

  hostnameOutStr.assign(hostname);
}

void dumpParams(const Params& params) {
  const std::string& logDirName = params.get<std::string>("LOG_DIR");

  std::string hostname;
  getHostname(hostname);

  std::ostringstream oss;
  oss << logDirName << '/' << hostname << "_params.log";
  params.dump(oss.str());
}

void loadJsonFile(const std::string& filename, Json::Value& jsonValue) {
  File jsonFile(filename);
  jsonFile.open(File::READ);

  std::string contents;
  jsonFile.readAll(contents);
  jsonFile.close();

  loadJsonString(contents.c_str(), contents.size(), jsonValue);
}

void loadJsonString(
  const char* str, uint32_t strLength, Json::Value& jsonValue) {

  Json::Reader reader;

  bool parseSuccessful = reader.parse(str, str + strLength, jsonValue);

  ABORT_IF(!parseSuccessful, "Failed to parse: %s",
           reader.getFormattedErrorMessages().c_str());
}

void writeJsonFile(const std::string& filename, const Json::Value& value) {
  Json::StyledWriter writer;
  std::string jsonString = writer.write(value);

  File jsonFile(filename);
  jsonFile.open(File::WRITE, true);
  jsonFile.write(jsonString);
  jsonFile.close();
}
