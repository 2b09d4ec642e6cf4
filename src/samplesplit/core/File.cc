#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "core/File.h"
#include "core/SampleSplitAssert.h"
#include "core/Utils.h"

File::File(const std::string& _filename)
  : filename(_filename),
    currentMode(CLOSED),
    fileDescriptor(-1) {
}

File::~File() {
  ASSERT(fileDescriptor == -1, "File '%s' destroyed while still open",
         filename.c_str());
}

void File::open(AccessMode mode, bool create) {
  int flags = 0;

  switch (mode) {
  case READ:
    flags = O_RDONLY;
    break;
  case WRITE:
    flags = O_WRONLY;
    break;
  case APPEND:
    flags = O_WRONLY | O_APPEND;
    break;
  case READ_WRITE:
    flags = O_RDWR;
    break;
  default:
    ABORT("Opening in mode %d unsupported", mode);
    break;
  }

  if (create) {
    if (mode != APPEND) {
      flags = flags | O_TRUNC;
    }
    flags = flags | O_CREAT;

    fileDescriptor = ::open(filename.c_str(), flags, 00644);
  } else {
    fileDescriptor = ::open(filename.c_str(), flags);
  }

  ABORT_IF(fileDescriptor == -1, "open('%s') failed with error %d: %s",
           filename.c_str(), errno, strerror(errno));

  currentMode = mode;
}

void File::sync() const {
  if (currentMode == WRITE || currentMode == APPEND ||
      currentMode == READ_WRITE) {
    int status = fsync(fileDescriptor);

    ABORT_IF(status == -1, "fsync(%s) failed with error %d: %s",
             filename.c_str(), errno, strerror(errno));
  }
}

void File::readAll(std::string& contents) {
  ABORT_IF(fileDescriptor == -1, "Can't read from the file "
           "(%s) if it hasn't been opened yet", filename.c_str());

  contents.clear();

  uint8_t buffer[65536];
  uint64_t bytesRead = 0;

  do {
    bytesRead = blockingRead(
      fileDescriptor, buffer, sizeof(buffer), 0, filename.c_str());
    contents.append(reinterpret_cast<const char*>(buffer), bytesRead);
  } while (bytesRead == sizeof(buffer));
}

void File::write(
  const uint8_t* buffer, uint64_t size, uint64_t maxWriteSize) {
  ABORT_IF(fileDescriptor == -1, "Can't write to the file (%s) if it hasn't "
           "been opened yet", filename.c_str());
  ASSERT(currentMode == WRITE || currentMode == APPEND ||
         currentMode == READ_WRITE, "File not open for writing.");

  blockingWrite(fileDescriptor, buffer, size, maxWriteSize, filename.c_str());
}

void File::write(const std::string& str) {
  write(reinterpret_cast<const uint8_t*>(str.c_str()), str.size(), 0);
}

void File::close() {
  ABORT_IF(fileDescriptor == -1, "Can't close the file (%s) because it isn't "
           "open", filename.c_str());

  // Make sure any dirty pages get flushed to disk.
  sync();

  int status = ::close(fileDescriptor);

  ABORT_IF(status == -1, "close(%s) failed with error %d: %s",
           filename.c_str(), errno, strerror(errno));
  fileDescriptor = -1;
  currentMode = CLOSED;
}
