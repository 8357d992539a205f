#include "stx_inkscape_renderer.h"
#include "stx_artifact_inspector.h"
#include "../../utils/stx_process.h"
#include "../../utils/stx_exceptions.h"
#include "../../utils/stx_number_format.h"
#include <iostream>

namespace stx::render {
  inkscape_renderer::inkscape_renderer(const stx_string& executable, bool legacy, double dpi)
    : executable(executable), legacy(legacy), dpi(dpi)
  {
  }

  std::vector<stx_string> inkscape_renderer::query_command(const stx_string& svg_path) const {
    std::vector<stx_string> argv;
    argv.push_back(executable);
    if (legacy) {
      argv.push_back("--without-gui");
    }
    argv.push_back("--query-all");
    argv.push_back(svg_path);
    return argv;
  }

  std::vector<stx_string> inkscape_renderer::export_command(const stx_string& svg_path, const stx_string& out_path,
                                                            artifact_format format) const {
    std::vector<stx_string> argv;
    argv.push_back(executable);
    if (legacy) {
      argv.push_back("--without-gui");
    }
    argv.push_back("--export-area-drawing");
    argv.push_back("--export-ignore-filters");
    argv.push_back(stx_string("--export-dpi=") + stx_format_number(dpi, 3));
    if (legacy) {
      argv.push_back(stx_string("--export-") + format_extension(format) + "=" + out_path);
    } else {
      argv.push_back(stx_string("--export-type=") + format_extension(format));
      argv.push_back(stx_string("--export-filename=") + out_path);
    }
    argv.push_back(svg_path);
    return argv;
  }

  stx_box_map inkscape_renderer::query_boxes(const stx_string& svg_path) {
    std::vector<stx_string> argv = query_command(svg_path);
    stx_process_result result = stx_run_process(argv, true);
    if (!result.started) {
      throw stx_renderer_failure("Cannot start renderer", stx_command_line(argv), -1);
    }
    if (result.exit_status != 0) {
      throw stx_renderer_failure("Renderer query failed", stx_command_line(argv), result.exit_status);
    }
    return parse_query_output(result.captured_stdout);
  }

  artifact_info inkscape_renderer::render(const stx_string& svg_path, const stx_string& out_path, artifact_format format) {
    std::vector<stx_string> argv = export_command(svg_path, out_path, format);
    std::cout << "Rendering " << svg_path.c_str() << " -> " << out_path.c_str() << std::endl;
    stx_process_result result = stx_run_process(argv, false);
    if (!result.started) {
      throw stx_renderer_failure("Cannot start renderer", stx_command_line(argv), -1);
    }
    if (result.exit_status != 0) {
      throw stx_renderer_failure("Renderer export failed", stx_command_line(argv), result.exit_status);
    }

    artifact_info info;
    if (!inspect_artifact(out_path, format, info)) {
      throw stx_renderer_failure("Renderer output is unreadable", stx_command_line(argv), result.exit_status);
    }
    std::cout << "Background " << format_extension(format).c_str() << ": "
              << info.width << " x " << info.height << std::endl;
    return info;
  }

  stx_box_map inkscape_renderer::parse_query_output(const stx_string& output) {
    stx_box_map boxes;
    for (const auto& raw_line : output.split("\n")) {
      stx_string line = raw_line.trim();
      if (line.empty()) {
        continue;
      }
      std::vector<stx_string> fields = line.split(",");
      double values[4] = {0.0, 0.0, 0.0, 0.0};
      bool valid = fields.size() == 5 && !fields[0].trim().empty();
      for (size_t i = 1; valid && i < fields.size(); ++i) {
        valid = fields[i].parse_double(values[i - 1]);
      }
      if (!valid) {
        std::cerr << "Warning: Skipping malformed query line '" << line.c_str() << "'" << std::endl;
        continue;
      }
      boxes.insert(fields[0].trim(), stx_layout_bounds(values[0], values[1], values[2], values[3]));
    }
    return boxes;
  }
} // namespace stx::render
