#ifndef STX_ARTIFACT_INSPECTOR_H
#define STX_ARTIFACT_INSPECTOR_H

#include "stx_renderer.h"

namespace stx::render {
  /**
   * @brief Opens a rendered background and reads its size.
   * PDF files are loaded with PoDoFo (page count, first page size in bp),
   * PNG files with OpenCV (pixel size), EPS files only have to be non-empty.
   * @return false when the file is missing or cannot be decoded.
   */
  bool inspect_artifact(const stx_string& path, artifact_format format, artifact_info& info);
} // namespace stx::render

#endif // STX_ARTIFACT_INSPECTOR_H
