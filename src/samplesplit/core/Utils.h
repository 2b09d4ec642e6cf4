#ifndef _SAMPLESPLIT_UTILS_H
#define _SAMPLESPLIT_UTILS_H

#include <boost/lexical_cast.hpp>
#include <json/json.h>
#include <list>
#include <string>
#include <vector>

#include "core/constants.h"

class Params;

bool fileExists(const char* fileName);
bool fileExists(const std::string& fileName);

void setThreadName(const std::string& name);

/// Remove leading and trailing spaces and tabs in place
void strip(std::string& str);

/**
   Split a comma-delimited string into tokens, strip each token and convert it
   to type T with boost::lexical_cast. Empty tokens are skipped.

   \param[out] list the container to which converted tokens are appended

   \param str the string to split
 */
template <typename T, typename Container> void parseCommaDelimitedList(
  Container& list, const std::string& str) {

  uint64_t currToken = 0;

  while (currToken != std::string::npos) {
    uint64_t tokenEnd = str.find_first_of(',', currToken);
    uint64_t tokenLength;

    if (tokenEnd != std::string::npos) {
      tokenLength = tokenEnd - currToken;
    } else {
      tokenLength = std::string::npos;
    }

    std::string token = str.substr(currToken, tokenLength);
    strip(token);

    if (token.size() > 0) {
      T convertedToken = boost::lexical_cast<T>(token);
      list.push_back(convertedToken);
    }

    if (tokenEnd != std::string::npos) {
      currToken = tokenEnd + 1;
    } else {
      currToken = std::string::npos;
    }
  }
}

/**
   Write data to a file in a blocking fashion.

   \param fd the file to write to

   \param buffer a buffer containing bytes to write

   \param size the number of bytes to write

   \param maxWriteSize the largest size of a single write() call, or 0 for no
   limit

   \param description a string describing the file to be used in printed error
   messages
 */
void blockingWrite(
  int fd, const uint8_t* buffer, uint64_t size, uint64_t maxWriteSize,
  const char* description);

/**
   Read data from a file in a blocking fashion.

   \param fd the file to read from

   \param buffer a buffer where read bytes will be stored

   \param size the number of bytes to read

   \param maxReadSize the largest size of a single read() call, or 0 for no
   limit

   \param description a string describing the file to be used in printed error
   messages

   \return the number of bytes read, which is less than size only at EOF
 */
uint64_t blockingRead(
  int fd, uint8_t* buffer, uint64_t size, uint64_t maxReadSize,
  const char* description);

void getHostname(std::string& hostnameOutStr);

/// Dump params to LOG_DIR/<hostname>_params.log
void dumpParams(const Params& params);

void loadJsonFile(const std::string& filename, Json::Value& value);
void loadJsonString(const char* str, uint32_t strLength, Json::Value& value);

/// Write a JSON value to the given file in human-readable form
void writeJsonFile(const std::string& filename, const Json::Value& value);

#endif //_SAMPLESPLIT_UTILS_H
