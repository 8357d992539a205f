#include "stx_temp_file.h"
#include "stx_exceptions.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>
#include <unistd.h>

stx_temp_file::stx_temp_file(const stx_string& dir, const stx_string& prefix, const stx_string& suffix)
  : owned(false)
{
  stx_string base = dir.empty() ? stx_string(".") : dir;
  if (!base.ends_with("/")) {
    base += "/";
  }
  stx_string pattern = base + prefix + "XXXXXX" + suffix;

  std::vector<char> name(pattern.c_str(), pattern.c_str() + pattern.size() + 1);
  int fd = mkstemps(name.data(), static_cast<int>(suffix.size()));
  if (fd < 0) {
    throw stx_document_error(stx_string("Cannot create temporary file (") + strerror(errno) + ")", pattern);
  }
  close(fd);
  path = stx_string(name.data());
  owned = true;
}

stx_temp_file::~stx_temp_file() {
  if (owned) {
    unlink(path.c_str());
  }
}

bool stx_temp_file::commit(const stx_string& target) {
  if (!owned) {
    return false;
  }
  if (std::rename(path.c_str(), target.c_str()) != 0) {
    std::cerr << "Error: Cannot move " << path.c_str() << " to " << target.c_str()
              << ": " << strerror(errno) << std::endl;
    return false;
  }
  owned = false;
  return true;
}
