#ifndef _SAMPLESPLIT_CONSTANTS_H
#define _SAMPLESPLIT_CONSTANTS_H

#include <stdint.h>
#include <string>
#include <list>
#include <map>
#include <vector>

typedef std::vector<std::string> StringVector;
typedef std::list<std::string> StringList;
typedef std::map<std::string, std::string> StringMap;

typedef std::vector<double> KeyVector;

// Place in the private section of a class to prevent copying
#define DISALLOW_COPY_AND_ASSIGN(TypeName) \
  TypeName(const TypeName&);               \
  void operator=(const TypeName&)

#endif //_SAMPLESPLIT_CONSTANTS_H
