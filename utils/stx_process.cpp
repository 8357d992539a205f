#include "stx_process.h"
#include <iostream>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace {

  // exec failure is reported back through a close-on-exec pipe
  const int exec_failed_status = 127;

  void close_fd(int& fd) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }

}

stx_process_result stx_run_process(const std::vector<stx_string>& argv, bool capture_stdout) {
  stx_process_result result;
  if (argv.empty()) {
    std::cerr << "Error: stx_run_process called without a command." << std::endl;
    return result;
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (capture_stdout && pipe(out_pipe) != 0) {
    std::cerr << "Error: pipe() failed: " << std::strerror(errno) << std::endl;
    return result;
  }
  if (pipe(err_pipe) != 0) {
    std::cerr << "Error: pipe() failed: " << std::strerror(errno) << std::endl;
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    return result;
  }
  // closes automatically when exec succeeds
  fcntl(err_pipe[1], F_SETFD, fcntl(err_pipe[1], F_GETFD) | FD_CLOEXEC);

  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid == 0) {
    // Child process
    if (capture_stdout) {
      dup2(out_pipe[1], STDOUT_FILENO);
      close(out_pipe[0]);
      close(out_pipe[1]);
    }
    close(err_pipe[0]);
    execvp(c_argv[0], c_argv.data());
    int exec_errno = errno;
    ssize_t ignored = write(err_pipe[1], &exec_errno, sizeof(exec_errno));
    (void)ignored;
    _exit(exec_failed_status);
  }

  close_fd(err_pipe[1]);
  if (pid < 0) {
    std::cerr << "Error: fork() failed: " << std::strerror(errno) << std::endl;
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    return result;
  }

  // Parent process
  if (capture_stdout) {
    close_fd(out_pipe[1]);
    char buffer[4096];
    ssize_t n;
    while ((n = read(out_pipe[0], buffer, sizeof(buffer))) != 0) {
      if (n < 0) {
        if (errno == EINTR) continue;
        break;
      }
      result.captured_stdout.append(buffer, static_cast<size_t>(n));
    }
    close_fd(out_pipe[0]);
  }

  int exec_errno = 0;
  ssize_t got = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
  close_fd(err_pipe[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      std::cerr << "Error: waitpid() failed: " << std::strerror(errno) << std::endl;
      return result;
    }
  }

  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    std::cerr << "Error: cannot execute '" << argv[0].c_str() << "': "
              << std::strerror(exec_errno) << std::endl;
    return result;
  }

  result.started = true;
  if (WIFEXITED(status)) {
    result.exit_status = WEXITSTATUS(status);
  }
  return result;
}

stx_string stx_command_line(const std::vector<stx_string>& argv) {
  return stx_string(" ").join(argv);
}
