#ifndef SAMPLESPLIT_INPUT_PATHS_H
#define SAMPLESPLIT_INPUT_PATHS_H

#include <string>

#include "core/constants.h"

/**
   Expand a list of input paths into the regular files they name.

   Each path may be a glob(3) pattern. A path naming a directory expands to the
   regular files directly inside it, skipping names that begin with '.' or
   '_'. Files from each path are appended in sorted order, and paths are
   processed in the order given.

   \warning Aborts if a path matches nothing

   \param paths the paths or patterns to expand

   \param[out] files the list to which matching files are appended
 */
void expandInputPaths(const StringList& paths, StringList& files);

#endif // SAMPLESPLIT_INPUT_PATHS_H
