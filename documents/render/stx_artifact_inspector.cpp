#include "stx_artifact_inspector.h"
#include <podofo/podofo.h>
#include <opencv2/opencv.hpp>
#include <filesystem>
#include <iostream>

using namespace PoDoFo;

namespace stx::render {
  stx_string format_extension(artifact_format format) {
    switch (format) {
      case artifact_format::PDF: return "pdf";
      case artifact_format::EPS: return "eps";
      case artifact_format::PNG: return "png";
    }
    return "";
  }

  static bool inspect_pdf(const stx_string& path, artifact_info& info) {
    try {
      PdfMemDocument pdf;
      pdf.Load(path.to_std_const());
      info.pages = pdf.GetPages().GetCount();
      if (info.pages == 0) {
        std::cerr << "Error: Rendered PDF has no pages: " << path.c_str() << std::endl;
        return false;
      }
      Rect rect = pdf.GetPages().GetPageAt(0).GetRect();
      info.width = rect.Width;
      info.height = rect.Height;
    } catch (const PdfError& e) {
      std::cerr << "Error: Cannot read rendered PDF " << path.c_str() << ": " << e.what() << std::endl;
      return false;
    } catch (const std::exception& e) {
      std::cerr << "Error: Cannot read rendered PDF " << path.c_str() << ": " << e.what() << std::endl;
      return false;
    }
    return true;
  }

  static bool inspect_png(const stx_string& path, artifact_info& info) {
    cv::Mat image = cv::imread(path.c_str(), cv::IMREAD_UNCHANGED);
    if (image.empty()) {
      std::cerr << "Error: Cannot read rendered PNG " << path.c_str() << std::endl;
      return false;
    }
    info.pages = 1;
    info.width = image.cols;
    info.height = image.rows;
    return true;
  }

  bool inspect_artifact(const stx_string& path, artifact_format format, artifact_info& info) {
    info = artifact_info();
    info.format = format;
    info.path = path;

    std::error_code ec;
    std::uintmax_t file_size = std::filesystem::file_size(path.to_std_const(), ec);
    if (ec || file_size == 0) {
      std::cerr << "Error: Renderer produced no output at " << path.c_str() << std::endl;
      return false;
    }

    switch (format) {
      case artifact_format::PDF:
        return inspect_pdf(path, info);
      case artifact_format::PNG:
        return inspect_png(path, info);
      case artifact_format::EPS:
        info.pages = 1;
        return true;
    }
    return false;
  }
} // namespace stx::render
