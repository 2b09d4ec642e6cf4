#include <algorithm>
#include <boost/filesystem.hpp>
#include <errno.h>
#include <glob.h>
#include <string.h>

#include "collection/InputPaths.h"
#include "core/SampleSplitAssert.h"

static void listDirectory(
  const boost::filesystem::path& directory, StringList& files) {

  StringVector directoryFiles;

  for (boost::filesystem::directory_iterator iter(directory), end;
       iter != end; iter++) {
    std::string name = iter->path().filename().string();

    // Hidden files and job markers like _SUCCESS aren't input.
    if (name.empty() || name[0] == '.' || name[0] == '_') {
      continue;
    }

    if (boost::filesystem::is_regular_file(iter->status())) {
      directoryFiles.push_back(iter->path().string());
    }
  }

  std::sort(directoryFiles.begin(), directoryFiles.end());
  files.insert(files.end(), directoryFiles.begin(), directoryFiles.end());
}

void expandInputPaths(const StringList& paths, StringList& files) {
  for (StringList::const_iterator iter = paths.begin(); iter != paths.end();
       iter++) {
    glob_t globBuf;
    int status = glob(iter->c_str(), 0, NULL, &globBuf);

    ABORT_IF(status == GLOB_NOMATCH, "Input path '%s' matches no files",
             iter->c_str());
    ABORT_IF(status != 0, "glob('%s') failed with error %d: %s",
             iter->c_str(), errno, strerror(errno));

    // glob() returns matches in sorted order.
    StringVector matches(globBuf.gl_pathv, globBuf.gl_pathv + globBuf.gl_pathc);
    globfree(&globBuf);

    for (StringVector::iterator matchIter = matches.begin();
         matchIter != matches.end(); matchIter++) {
      boost::filesystem::path matchPath(*matchIter);

      if (boost::filesystem::is_directory(matchPath)) {
        listDirectory(matchPath, files);
      } else if (boost::filesystem::is_regular_file(matchPath)) {
        files.push_back(*matchIter);
      }
    }
  }
}
