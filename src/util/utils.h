#ifndef __UTILS
#define __UTILS

#include "types.h"
#include <string>
#include <vector>

bool IsDirectory(const std::string &path);

bool IsFile(const std::string &path);

std::string JoinPath(const std::string &dir, const std::string &name);

/*!
 * Entries of `dir` whose name matches `*<infix>*<suffix>`, as full paths in
 * directory enumeration order (no sorting). Dot-prefixed names match like any
 * other; subdirectories are left out, broken links are not.
 * Throws MissingResource if `dir` cannot be opened.
 */
std::vector<std::string> ListFiles(const std::string &dir,
                                   const std::string &infix,
                                   const std::string &suffix);

// Whole file as a byte string, throws MissingResource on failure
std::string ReadFile(const std::string &path);

#endif
