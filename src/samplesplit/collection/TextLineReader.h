#ifndef SAMPLESPLIT_TEXT_LINE_READER_H
#define SAMPLESPLIT_TEXT_LINE_READER_H

#include <string>

#include "collection/PartitionFunction.h"
#include "collection/PartitionedCollection.h"
#include "core/constants.h"

class PartitionTaskRunner;

/**
   A partition function whose input records are file names and whose output
   records are the lines of those files, in order.

   Lines are delimited by '\n'; a trailing '\r' is stripped so that files with
   Windows line endings read the same way. Empty lines are skipped.
 */
class TextLineReader
  : public PartitionFunction<std::string, std::string> {
public:
  void map(
    uint64_t partitionIndex, const std::vector<std::string>& filenames,
    std::vector<std::string>& lines) const;

  /**
     Split the contents of a text file into lines.

     \param contents the file's contents

     \param[out] lines the vector to which lines are appended
   */
  static void splitLines(
    const std::string& contents, std::vector<std::string>& lines);

  /**
     Read a list of files into a collection of lines.

     Each file becomes one partition when recordsPerPartition is 0. Otherwise
     each file's lines are split into consecutive partitions of at most
     recordsPerPartition lines, and a file with no lines still contributes an
     empty partition.

     \param files the files to read

     \param recordsPerPartition the largest number of lines in a partition, or
     0 for one partition per file

     \param runner the runner on which files are read in parallel

     \param[out] records the collection that will hold the lines
   */
  static void readFiles(
    const StringList& files, uint64_t recordsPerPartition,
    PartitionTaskRunner& runner, PartitionedCollection<std::string>& records);
};

#endif // SAMPLESPLIT_TEXT_LINE_READER_H
