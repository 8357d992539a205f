#include "documents/stx_svg_converter.h"
#include "documents/render/stx_inkscape_renderer.h"
#include "utils/stx_exceptions.h"
#include <iostream>

static void print_usage(const char* program)
{
  std::cout << "Usage: " << program << " [-m|--method KIND] [-o|--output STEM] file.svg" << std::endl
            << std::endl
            << "Converts an SVG drawing into a background image and a LaTeX picture overlay." << std::endl
            << std::endl
            << "  -m, --method KIND   latex-pdf (default), latex-eps, latex-png, pdf, eps, png" << std::endl
            << "  -o, --output STEM   output path without extension (default: input without .svg)" << std::endl
            << "  -h, --help          show this help" << std::endl
            << std::endl
            << "Environment: STX_INKSCAPE, STX_INKSCAPE_LEGACY, STX_DPI, STX_TMPDIR," << std::endl
            << "             STX_FONT_FAMILIES, STX_FONT_SIZES" << std::endl;
}

int main(int argc, char *argv[])
{
  stx_string method = "latex-pdf";
  stx_string output;
  stx_string input;

  for (int i = 1; i < argc; i++)
  {
    stx_string arg = argv[i];
    if (arg == "-h" || arg == "--help")
    {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "-m" || arg == "--method" || arg == "-o" || arg == "--output")
    {
      if (i + 1 >= argc)
      {
        std::cerr << "Error: " << arg.c_str() << " needs a value" << std::endl;
        print_usage(argv[0]);
        return 2;
      }
      if (arg == "-m" || arg == "--method") method = argv[++i];
      else output = argv[++i];
      continue;
    }
    if (arg.starts_with("-"))
    {
      std::cerr << "Error: Unknown option " << arg.c_str() << std::endl;
      print_usage(argv[0]);
      return 2;
    }
    if (!input.empty())
    {
      std::cerr << "Error: Only one input file is accepted" << std::endl;
      return 2;
    }
    input = arg;
  }

  if (input.empty())
  {
    print_usage(argv[0]);
    return 2;
  }

  stx_output_kind kind;
  if (!parse_output_kind(method, kind))
  {
    std::cerr << "Error: Unknown method '" << method.c_str() << "'" << std::endl;
    return 2;
  }
  if (output.empty())
  {
    output = stx_svg_converter::default_output_stem(input);
  }

  stx_config::load_settings_file(".env");
  stx_config config = stx_config::from_environment();

  try
  {
    stx::render::inkscape_renderer renderer(config.inkscape, config.inkscape_legacy, config.dpi);
    stx_svg_converter converter(config, renderer);
    converter.convert(input, output, kind);
    if (!converter.get_warnings().empty())
    {
      std::cerr << converter.get_warnings().size() << " style value(s) could not be mapped" << std::endl;
    }
  }
  catch (const stx_exception& e)
  {
    std::cerr << stx_svg_converter::error_message(input, e).c_str() << std::endl;
    return 1;
  }
  catch (const std::exception& e)
  {
    std::cerr << stx_svg_converter::error_message(input, e).c_str() << std::endl;
    return 1;
  }
  return 0;
}
