#ifndef SAMPLESPLIT_TARGET_SET_SPEC_H
#define SAMPLESPLIT_TARGET_SET_SPEC_H

#include <stdint.h>
#include <string>
#include <vector>

/**
   A named subset to be sampled, as requested by the user. A size below 1.0
   is a ratio of the population; a size of 1.0 or more is an absolute record
   count.
 */
struct TargetSetSpec {
  std::string name;
  double size;

  TargetSetSpec(const std::string& _name, double _size)
    : name(_name),
      size(_size) {}
};

typedef std::vector<TargetSetSpec> TargetSetSpecList;

/// A named subset with an absolute target size
struct TargetSetSize {
  std::string name;
  uint64_t size;

  TargetSetSize(const std::string& _name, uint64_t _size)
    : name(_name),
      size(_size) {}
};

typedef std::vector<TargetSetSize> TargetSetSizeList;

/**
   Parse a set size list of the form "name:size,name:size". Sets keep the
   order in which they appear.

   \throws InvalidConfigurationException if an entry is malformed or a name is
   repeated

   \param str the string to parse

   \param[out] specs the parsed sets; any previous contents are replaced
 */
void parseTargetSetSpecs(const std::string& str, TargetSetSpecList& specs);

/// \return the sum of the sizes in the list
uint64_t totalSize(const TargetSetSizeList& sizes);

#endif // SAMPLESPLIT_TARGET_SET_SPEC_H
