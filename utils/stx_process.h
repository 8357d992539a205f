#ifndef STX_PROCESS_H
#define STX_PROCESS_H

#include "stx_string.h"
#include <vector>

// Result of a blocking child process run
struct stx_process_result {
  int exit_status = -1;      // -1: could not be started / killed by a signal
  bool started = false;      // false when fork or exec failed
  stx_string captured_stdout;
};

// Runs argv[0] (looked up in PATH) with the given arguments and waits for it.
// stdout is captured when capture_stdout is set, otherwise inherited.
// stderr is always inherited.
stx_process_result stx_run_process(const std::vector<stx_string>& argv, bool capture_stdout);

// Joins argv for log and error messages
stx_string stx_command_line(const std::vector<stx_string>& argv);

#endif // STX_PROCESS_H
