#pragma once

#include <string>
#include <vector>

namespace eryzaa::process {

struct CommandResult {
  int         exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;

  bool Succeeded() const {
    return exit_code == 0;
  }
};

/*
  Runs an external program to completion.

  argv[0] is looked up on PATH. No shell is involved, so arguments are passed
  through verbatim.
*/
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  virtual CommandResult Run(const std::vector<std::string>& argv, const std::string& stdin_data = {}) = 0;
};

/*
  fork/exec implementation. Exit code 127 means the program could not be
  executed; a signal-terminated child reports 128 + signal number. Throws
  CommandFailure only when the child cannot be started at all.
*/
class PosixCommandRunner final : public CommandRunner {
 public:
  CommandResult Run(const std::vector<std::string>& argv, const std::string& stdin_data = {}) override;
};

// "useradd -m alice" style rendering for logs and error messages.
std::string FormatCommand(const std::vector<std::string>& argv);

} // namespace eryzaa::process
