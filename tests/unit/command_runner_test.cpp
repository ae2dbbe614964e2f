#include "internal/process/command_runner.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using eryzaa::process::PosixCommandRunner;

void TestCapturesOutputAndExitCode() {
  PosixCommandRunner runner;
  const auto         result = runner.Run({"sh", "-c", "printf out; printf err >&2; exit 3"});

  assert(result.exit_code == 3);
  assert(!result.Succeeded());
  assert(result.stdout_text == "out");
  assert(result.stderr_text == "err");
}

void TestArgumentsAreNotShellExpanded() {
  PosixCommandRunner runner;
  const auto         result = runner.Run({"printf", "%s", "$HOME; rm -rf /"});

  assert(result.Succeeded());
  assert(result.stdout_text == "$HOME; rm -rf /");
}

void TestFeedsStdin() {
  PosixCommandRunner runner;
  const auto         result = runner.Run({"cat"}, "eryzaa_job_0a1b2c3d:s3cr3t!\n");

  assert(result.Succeeded());
  assert(result.stdout_text == "eryzaa_job_0a1b2c3d:s3cr3t!\n");
}

void TestLargeStreamsDoNotDeadlock() {
  PosixCommandRunner runner;

  const std::string input(300000, 'x');
  const auto        echoed = runner.Run({"cat"}, input);
  assert(echoed.Succeeded());
  assert(echoed.stdout_text == input);

  const auto both = runner.Run({"sh", "-c", "head -c 200000 /dev/zero; head -c 100000 /dev/zero >&2"});
  assert(both.Succeeded());
  assert(both.stdout_text.size() == 200000);
  assert(both.stderr_text.size() == 100000);
}

void TestChildIgnoringStdinStillCompletes() {
  PosixCommandRunner runner;
  const auto         result = runner.Run({"true"}, std::string(500000, 'y'));
  assert(result.Succeeded());
}

void TestMissingProgramReports127() {
  PosixCommandRunner runner;
  const auto         result = runner.Run({"eryzaa-no-such-program-xyz"});
  assert(result.exit_code == 127);
}

void TestSignalledChild() {
  PosixCommandRunner runner;
  const auto         result = runner.Run({"sh", "-c", "kill -9 $$"});
  assert(result.exit_code == 128 + 9);
}

void TestEmptyCommandThrows() {
  PosixCommandRunner runner;
  bool               threw = false;
  try {
    (void)runner.Run({});
  } catch (const eryzaa::util::CommandFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestFormatCommand() {
  assert(eryzaa::process::FormatCommand({"sudo", "userdel", "-r", "eryzaa_job_x"}) == "sudo userdel -r eryzaa_job_x");
  assert(eryzaa::process::FormatCommand({}).empty());
}

} // namespace

int main() {
  TestCapturesOutputAndExitCode();
  TestArgumentsAreNotShellExpanded();
  TestFeedsStdin();
  TestLargeStreamsDoNotDeadlock();
  TestChildIgnoringStdinStillCompletes();
  TestMissingProgramReports127();
  TestSignalledChild();
  TestEmptyCommandThrows();
  TestFormatCommand();

  std::cout << "eryzaa_unit_command_runner: pass\n";
  return 0;
}
