#include <errno.h>
#include <map>
#include <pthread.h>
#include <sstream>
#include <stdio.h>
#include <string.h>

#include "core/File.h"
#include "core/SampleSplitAssert.h"
#include "job/SetPartitionWriter.h"

SetPartitionWriter::SetPartitionWriter(
  const std::string& _outputDirectory, const StringVector& _setNames)
  : outputDirectory(_outputDirectory),
    setNames(_setNames) {
}

void SetPartitionWriter::map(
  uint64_t partitionIndex, const std::vector<LabeledRecord>& records,
  std::vector<uint64_t>& output) const {

  std::map<std::string, std::string> setContents;
  for (StringVector::const_iterator iter = setNames.begin();
       iter != setNames.end(); iter++) {
    setContents[*iter];
  }

  for (std::vector<LabeledRecord>::const_iterator iter = records.begin();
       iter != records.end(); iter++) {
    std::map<std::string, std::string>::iterator contentsIter =
      setContents.find(iter->setName);
    ABORT_IF(contentsIter == setContents.end(), "Record labeled with unknown "
             "set '%s'", iter->setName.c_str());

    contentsIter->second.append(iter->record);
    contentsIter->second.push_back('\n');
  }

  for (std::map<std::string, std::string>::iterator iter =
         setContents.begin(); iter != setContents.end(); iter++) {
    std::string filename(partitionFilename(iter->first, partitionIndex));

    std::ostringstream oss;
    oss << outputDirectory << '/' << iter->first << "/." << partitionIndex
        << '.' << pthread_self() << ".tmp";
    std::string temporaryFilename(oss.str());

    File file(temporaryFilename);
    file.open(File::WRITE, true);
    file.write(iter->second);
    file.close();

    ABORT_IF(rename(temporaryFilename.c_str(), filename.c_str()) == -1,
             "rename(%s, %s) failed with error %d: %s",
             temporaryFilename.c_str(), filename.c_str(), errno,
             strerror(errno));
  }

  output.push_back(records.size());
}

std::string SetPartitionWriter::partitionFilename(
  const std::string& setName, uint64_t partitionIndex) const {

  char partName[32];
  snprintf(partName, sizeof(partName), "part-%05llu",
           static_cast<unsigned long long>(partitionIndex));

  return outputDirectory + '/' + setName + '/' + partName;
}
