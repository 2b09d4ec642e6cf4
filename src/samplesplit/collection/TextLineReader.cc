#include "collection/TextLineReader.h"
#include "core/File.h"

void TextLineReader::map(
  uint64_t partitionIndex, const std::vector<std::string>& filenames,
  std::vector<std::string>& lines) const {

  for (std::vector<std::string>::const_iterator iter = filenames.begin();
       iter != filenames.end(); iter++) {
    File file(*iter);
    file.open(File::READ);

    std::string contents;
    file.readAll(contents);
    file.close();

    splitLines(contents, lines);
  }
}

void TextLineReader::splitLines(
  const std::string& contents, std::vector<std::string>& lines) {

  uint64_t lineStart = 0;

  while (lineStart < contents.size()) {
    uint64_t lineEnd = contents.find('\n', lineStart);
    if (lineEnd == std::string::npos) {
      // Last line has no trailing newline.
      lineEnd = contents.size();
    }

    uint64_t length = lineEnd - lineStart;
    if (length > 0 && contents[lineStart + length - 1] == '\r') {
      length--;
    }

    if (length > 0) {
      lines.push_back(contents.substr(lineStart, length));
    }

    lineStart = lineEnd + 1;
  }
}

void TextLineReader::readFiles(
  const StringList& files, uint64_t recordsPerPartition,
  PartitionTaskRunner& runner, PartitionedCollection<std::string>& records) {

  PartitionedCollection<std::string> filenames;
  for (StringList::const_iterator iter = files.begin(); iter != files.end();
       iter++) {
    filenames.addPartition().push_back(*iter);
  }

  TextLineReader reader;

  if (recordsPerPartition == 0) {
    filenames.mapPartitionsWithIndex(reader, runner, records);
    return;
  }

  PartitionedCollection<std::string> fileLines;
  filenames.mapPartitionsWithIndex(reader, runner, fileLines);

  records.clear();

  for (uint64_t i = 0; i < fileLines.numPartitions(); i++) {
    const std::vector<std::string>& lines = fileLines.getPartition(i);

    if (lines.empty()) {
      records.addPartition();
      continue;
    }

    for (uint64_t chunkStart = 0; chunkStart < lines.size();
         chunkStart += recordsPerPartition) {
      uint64_t chunkEnd = chunkStart + recordsPerPartition;
      if (chunkEnd > lines.size()) {
        chunkEnd = lines.size();
      }

      std::vector<std::string>& partition = records.addPartition();
      partition.assign(lines.begin() + chunkStart, lines.begin() + chunkEnd);
    }
  }
}
