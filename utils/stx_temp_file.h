#ifndef STX_TEMP_FILE_H
#define STX_TEMP_FILE_H

#include "stx_string.h"

// Uniquely named file created with mkstemps, removed again on destruction
// unless it was released. Concurrent conversions never share a path.
class stx_temp_file
{
  stx_string path;
  bool owned;
public:
  // <dir>/<prefix>XXXXXX<suffix>; throws stx_document_error on failure
  stx_temp_file(const stx_string& dir, const stx_string& prefix, const stx_string& suffix);
  ~stx_temp_file();

  stx_temp_file(const stx_temp_file&) = delete;
  stx_temp_file& operator=(const stx_temp_file&) = delete;

  const stx_string& get_path() const { return path; }

  // Moves the file to target (same file system) and gives up ownership
  bool commit(const stx_string& target);
};

#endif // STX_TEMP_FILE_H
