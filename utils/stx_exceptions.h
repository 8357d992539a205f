#ifndef STX_EXCEPTIONS_H
#define STX_EXCEPTIONS_H

#include "stx_string.h"
#include <exception>
#include <stdexcept>

// ============================================================================
// CONVERSION EXCEPTION HIERARCHY
// ============================================================================
//
// Every exception below aborts the conversion of the current document.
// Unmapped font families / sizes are not exceptions, they are reported as
// stx_style_warning records (see stx_svg_style.h).
//
// stx_exception (base)
// ├── stx_parse_error
// ├── stx_unsupported_color_format
// ├── stx_invalid_weight
// ├── stx_renderer_failure
// ├── stx_missing_input_file
// ├── stx_document_error
// └── stx_reconciliation_error
//
// ============================================================================

class stx_exception : public std::exception {
protected:
  stx_string message_;

public:
  explicit stx_exception(const stx_string& message)
    : message_(message) {}

  virtual ~stx_exception() noexcept = default;

  virtual const char* what() const noexcept override {
    return message_.c_str();
  }
};

// ============================================================================
// ATTRIBUTE / VALUE ERRORS
// ============================================================================

// Malformed transform attribute or unsupported transform function
class stx_parse_error : public stx_exception {
private:
  stx_string attribute_;

public:
  stx_parse_error(const stx_string& message, const stx_string& attribute)
    : stx_exception(message + " (" + attribute + ")"),
      attribute_(attribute) {}

  const stx_string& get_attribute() const { return attribute_; }
};

// fill value that is not a #rrggbb triplet
class stx_unsupported_color_format : public stx_exception {
private:
  stx_string value_;

public:
  explicit stx_unsupported_color_format(const stx_string& value)
    : stx_exception(stx_string("Only hash-code colors (#rrggbb) are supported, got '") + value + "'"),
      value_(value) {}

  const stx_string& get_value() const { return value_; }
};

// font-weight that is neither bold, normal nor an integer
class stx_invalid_weight : public stx_exception {
private:
  stx_string value_;

public:
  explicit stx_invalid_weight(const stx_string& value)
    : stx_exception(stx_string("Invalid font-weight '") + value + "'"),
      value_(value) {}

  const stx_string& get_value() const { return value_; }
};

// ============================================================================
// COLLABORATOR / IO ERRORS
// ============================================================================

class stx_renderer_failure : public stx_exception {
private:
  stx_string command_;
  int exit_status_;

public:
  stx_renderer_failure(const stx_string& message, const stx_string& command, int exit_status)
    : stx_exception(message + " [" + command + "] exit status " + stx_string(static_cast<long>(exit_status))),
      command_(command), exit_status_(exit_status) {}

  const stx_string& get_command() const { return command_; }
  // -1 when the executable could not be started at all
  int get_exit_status() const { return exit_status_; }
};

class stx_missing_input_file : public stx_exception {
private:
  stx_string path_;

public:
  explicit stx_missing_input_file(const stx_string& path)
    : stx_exception(stx_string("No SVG file \"") + path + "\""),
      path_(path) {}

  const stx_string& get_path() const { return path_; }
};

class stx_document_error : public stx_exception {
private:
  stx_string path_;

public:
  stx_document_error(const stx_string& message, const stx_string& path)
    : stx_exception(message + ": " + path),
      path_(path) {}

  const stx_string& get_path() const { return path_; }
};

// Internal arithmetic or renderer output that cannot yield a valid frame
class stx_reconciliation_error : public stx_exception {
public:
  using stx_exception::stx_exception;
};

#endif // STX_EXCEPTIONS_H
