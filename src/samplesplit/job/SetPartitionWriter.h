#ifndef SAMPLESPLIT_SET_PARTITION_WRITER_H
#define SAMPLESPLIT_SET_PARTITION_WRITER_H

#include <string>

#include "collection/PartitionFunction.h"
#include "core/constants.h"
#include "sampling/LabeledRecord.h"

/**
   Writes one labeled partition to disk. Partition i of set S is written, one
   record per line, to <output directory>/S/part-NNNNN where NNNNN is i padded
   to five digits. Every set gets a file for every partition, even if empty.

   Each attempt writes to a private temporary file and renames it into place,
   so repeated attempts on a partition leave one complete file behind.

   The function emits the number of records it wrote.
 */
class SetPartitionWriter : public PartitionFunction<LabeledRecord, uint64_t> {
public:
  /// Constructor
  /**
     \param outputDirectory the directory holding one subdirectory per set;
     the subdirectories must already exist

     \param setNames the names of every set
   */
  SetPartitionWriter(
    const std::string& outputDirectory, const StringVector& setNames);

  void map(
    uint64_t partitionIndex, const std::vector<LabeledRecord>& records,
    std::vector<uint64_t>& output) const;

  /// \return the path of the file holding a set's records for a partition
  std::string partitionFilename(
    const std::string& setName, uint64_t partitionIndex) const;

private:
  const std::string outputDirectory;
  const StringVector setNames;
};

#endif // SAMPLESPLIT_SET_PARTITION_WRITER_H
