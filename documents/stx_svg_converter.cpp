#include "stx_svg_converter.h"
#include "stx_bbox_reconciler.h"
#include "stx_layout_to_latex.h"
#include "svg/stx_svg_document.h"
#include "svg/stx_svg_text_extractor.h"
#include "../utils/stx_exceptions.h"
#include "../utils/stx_temp_file.h"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace {

  stx_string parent_directory(const stx_string& path) {
    std::filesystem::path parent = std::filesystem::path(path.to_std_const()).parent_path();
    if (parent.empty()) {
      return ".";
    }
    return stx_string(parent.string());
  }

  stx_string file_name(const stx_string& path) {
    return stx_string(std::filesystem::path(path.to_std_const()).filename().string());
  }

  void write_text_file(const stx_string& path, const stx_string& contents) {
    std::fstream f;
    f.open(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
      throw stx_document_error("Cannot write output file", path);
    }
    f.write(contents.c_str(), static_cast<std::streamsize>(contents.size()));
    f.close();
    if (f.fail()) {
      throw stx_document_error("Cannot write output file", path);
    }
  }

}

stx_svg_converter::stx_svg_converter(const stx_config& config, stx::render::i_renderer& renderer)
  : config(config), renderer(renderer)
{
}

stx_conversion_output stx_svg_converter::convert(const stx_string& svg_path, const stx_string& output_stem,
                                                 stx_output_kind kind) {
  require_input(svg_path);

  stx::render::artifact_format format = output_artifact_format(kind);
  stx_string extension = stx::render::format_extension(format);

  stx_conversion_output output;
  output.artifact_path = output_stem + "." + extension;

  // Final names are only touched after every step succeeded
  stx_string out_dir = parent_directory(output_stem);
  stx_string stem_name = file_name(output_stem);
  stx_temp_file artifact_tmp(out_dir, stx_string(".") + stem_name + ".", stx_string(".") + extension);

  if (!has_overlay(kind)) {
    warnings.clear();
    std::cout << "Rendering " << svg_path.c_str() << " as " << output_kind_name(kind).c_str() << std::endl;
    renderer.render(svg_path, artifact_tmp.get_path(), format);
    if (!artifact_tmp.commit(output.artifact_path)) {
      throw stx_document_error("Cannot move rendered file into place", output.artifact_path);
    }
    return output;
  }

  output.overlay_path = output.artifact_path + "_tex";
  stx_string picture = convert_to_latex(svg_path, artifact_tmp.get_path(), file_name(output.artifact_path), format);
  output.label_count = label_count;

  stx_temp_file overlay_tmp(out_dir, stx_string(".") + stem_name + ".", stx_string(".") + extension + "_tex");
  write_text_file(overlay_tmp.get_path(), picture);

  if (!artifact_tmp.commit(output.artifact_path)) {
    throw stx_document_error("Cannot move background into place", output.artifact_path);
  }
  if (!overlay_tmp.commit(output.overlay_path)) {
    throw stx_document_error("Cannot move overlay into place", output.overlay_path);
  }
  std::cout << "Wrote " << output.artifact_path.c_str() << " and " << output.overlay_path.c_str() << std::endl;
  return output;
}

stx_string stx_svg_converter::convert_to_latex(const stx_string& svg_path,
                                               const stx_string& background_path,
                                               const stx_string& background_name,
                                               stx::render::artifact_format format) {
  warnings.clear();
  label_count = 0;
  require_input(svg_path);

  stx_svg_document document;
  if (!document.read(svg_path)) {
    throw stx_document_error("Cannot parse SVG document", svg_path);
  }
  double width = 0.0;
  double height = 0.0;
  if (!document.size_in_user_units(config.dpi, width, height)) {
    throw stx_document_error("Root <svg> needs a valid width and height", svg_path);
  }
  document.log_size(config.dpi);

  // Step 1: labels and geometry-only copy
  stx_svg_text_extractor extractor(config.tables, config.dpi);
  stx_extraction_result extraction = extractor.extract(document);
  warnings = extraction.warnings;
  label_count = extraction.labels.size();
  std::cout << "Extracted " << extraction.labels.size() << " labels ("
            << extraction.residual->consumed_ids.size() << " consumed ids, "
            << extraction.residual->ignored_ids.size() << " ignored ids)" << std::endl;

  stx_temp_file stripped_svg(config.tmpdir, "svgtex-", ".svg");
  if (!extraction.residual->write(stripped_svg.get_path())) {
    throw stx_document_error("Cannot write stripped SVG", stripped_svg.get_path());
  }

  // Step 2: renderer runs
  stx_box_map original_boxes = renderer.query_boxes(svg_path);
  stx_box_map stripped_boxes = renderer.query_boxes(stripped_svg.get_path());
  renderer.render(stripped_svg.get_path(), background_path, format);

  // Step 3: canonical frame
  stx_bbox_reconciler reconciler;
  stx_reconciliation frame = reconciler.reconcile(original_boxes, stripped_boxes, document.root_id(),
                                                  extraction.residual->consumed_ids,
                                                  extraction.residual->ignored_ids,
                                                  extraction.labels);

  // Step 4: overlay
  stx_layout_to_latex emitter(config.dpi);
  return emitter.convert_to_picture(frame.frame, frame.pdf_box, background_name, extraction.labels);
}

stx_string stx_svg_converter::default_output_stem(const stx_string& svg_path) {
  std::filesystem::path path(svg_path.to_std_const());
  if (path.extension() == ".svg") {
    path.replace_extension();
  }
  return stx_string(path.string());
}

stx_string stx_svg_converter::error_message(const stx_string& svg_path, const std::exception& e) {
  return stx_string("Error: ") + svg_path + ": " + e.what();
}

void stx_svg_converter::require_input(const stx_string& svg_path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(svg_path.to_std_const(), ec)) {
    throw stx_missing_input_file(svg_path);
  }
}
