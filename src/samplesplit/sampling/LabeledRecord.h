#ifndef SAMPLESPLIT_LABELED_RECORD_H
#define SAMPLESPLIT_LABELED_RECORD_H

#include <string>

/// A sampled record and the name of the target set it was sampled into
struct LabeledRecord {
  std::string setName;
  std::string record;

  LabeledRecord() {}

  LabeledRecord(const std::string& _setName, const std::string& _record)
    : setName(_setName),
      record(_record) {}
};

#endif // SAMPLESPLIT_LABELED_RECORD_H
