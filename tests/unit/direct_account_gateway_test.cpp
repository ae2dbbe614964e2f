#include "internal/access/direct_account_gateway.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using eryzaa::access::DirectAccountGateway;
using eryzaa::access::DirectGatewayOptions;
using eryzaa::process::CommandResult;
using eryzaa::util::CommandFailure;

// Answers by program name (argv[0], or argv[1] after sudo); unknown programs succeed.
class ScriptedRunner final : public eryzaa::process::CommandRunner {
 public:
  struct Call {
    std::vector<std::string> argv;
    std::string              stdin_data;
  };

  CommandResult Run(const std::vector<std::string>& argv, const std::string& stdin_data) override {
    calls.push_back({argv, stdin_data});
    const auto& program = argv[0] == "sudo" ? argv[1] : argv[0];
    if (auto it = results.find(program); it != results.end()) return it->second;
    return CommandResult{0, "", ""};
  }

  void Fail(const std::string& program, int exit_code, const std::string& stderr_text) {
    results[program] = CommandResult{exit_code, "", stderr_text};
  }

  std::vector<Call>                    calls;
  std::map<std::string, CommandResult> results;
};

DirectGatewayOptions Options(bool use_sudo, std::string group = "docker") {
  DirectGatewayOptions options;
  options.use_sudo         = use_sudo;
  options.login_shell      = "/bin/bash";
  options.privileged_group = std::move(group);
  return options;
}

using Argv = std::vector<std::string>;

void TestCreateRunsAllStepsWithSudo() {
  auto                 runner = std::make_shared<ScriptedRunner>();
  DirectAccountGateway gateway(runner, Options(true));

  gateway.CreateAccount("eryzaa_job_0a1b2c3d", "S3cret!x");

  assert(runner->calls.size() == 3);
  assert(runner->calls[0].argv == (Argv{"sudo", "useradd", "-m", "-s", "/bin/bash", "eryzaa_job_0a1b2c3d"}));
  assert(runner->calls[1].argv == (Argv{"sudo", "chpasswd"}));
  assert(runner->calls[1].stdin_data == "eryzaa_job_0a1b2c3d:S3cret!x\n");
  assert(runner->calls[2].argv == (Argv{"sudo", "usermod", "-aG", "docker", "eryzaa_job_0a1b2c3d"}));
}

void TestCreateWithoutSudoOrGroup() {
  auto                 runner = std::make_shared<ScriptedRunner>();
  DirectAccountGateway gateway(runner, Options(false, ""));

  gateway.CreateAccount("eryzaa_job_0a1b2c3d", "pw");

  assert(runner->calls.size() == 2);
  assert(runner->calls[0].argv.front() == "useradd");
  assert(runner->calls[1].argv == (Argv{"chpasswd"}));
}

void TestUseraddFailureSurfacesDiagnostics() {
  auto runner = std::make_shared<ScriptedRunner>();
  runner->Fail("useradd", 9, "useradd: user 'eryzaa_job_0a1b2c3d' already exists");
  DirectAccountGateway gateway(runner, Options(true));

  bool threw = false;
  try {
    gateway.CreateAccount("eryzaa_job_0a1b2c3d", "pw");
  } catch (const CommandFailure& e) {
    threw = true;
    assert(e.exit_code() == 9);
    assert(e.diagnostics() == "useradd: user 'eryzaa_job_0a1b2c3d' already exists");
    assert(std::string(e.what()).find("already exists") != std::string::npos);
  }
  assert(threw);
  // nothing was created, nothing to roll back
  assert(runner->calls.size() == 1);
}

void TestLaterFailureRollsBackAccount() {
  auto runner = std::make_shared<ScriptedRunner>();
  runner->Fail("usermod", 6, "usermod: group 'docker' does not exist");
  DirectAccountGateway gateway(runner, Options(true));

  bool threw = false;
  try {
    gateway.CreateAccount("eryzaa_job_0a1b2c3d", "pw");
  } catch (const CommandFailure& e) {
    threw = true;
    assert(e.exit_code() == 6);
  }
  assert(threw);
  assert(runner->calls.size() == 4);
  assert(runner->calls[3].argv == (Argv{"sudo", "userdel", "-r", "eryzaa_job_0a1b2c3d"}));
}

void TestDeleteKillsProcessesThenRemoves() {
  auto runner = std::make_shared<ScriptedRunner>();
  // no processes to kill
  runner->Fail("pkill", 1, "");
  DirectAccountGateway gateway(runner, Options(true));

  gateway.DeleteAccount("eryzaa_job_0a1b2c3d");

  assert(runner->calls.size() == 2);
  assert(runner->calls[0].argv == (Argv{"sudo", "pkill", "-u", "eryzaa_job_0a1b2c3d"}));
  assert(runner->calls[1].argv == (Argv{"sudo", "userdel", "-r", "eryzaa_job_0a1b2c3d"}));
}

void TestDeleteOfUnknownUser() {
  auto runner = std::make_shared<ScriptedRunner>();
  runner->Fail("userdel", 6, "userdel: user 'eryzaa_job_0a1b2c3d' does not exist");
  DirectAccountGateway gateway(runner, Options(false));

  bool threw = false;
  try {
    gateway.DeleteAccount("eryzaa_job_0a1b2c3d");
  } catch (const eryzaa::util::UserNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestDeleteFailure() {
  auto runner = std::make_shared<ScriptedRunner>();
  runner->Fail("userdel", 8, "userdel: user eryzaa_job_0a1b2c3d is currently used by process 4242");
  DirectAccountGateway gateway(runner, Options(false));

  bool threw = false;
  try {
    gateway.DeleteAccount("eryzaa_job_0a1b2c3d");
  } catch (const CommandFailure& e) {
    threw = true;
    assert(e.exit_code() == 8);
    assert(e.diagnostics().find("currently used") != std::string::npos);
  }
  assert(threw);
}

} // namespace

int main() {
  TestCreateRunsAllStepsWithSudo();
  TestCreateWithoutSudoOrGroup();
  TestUseraddFailureSurfacesDiagnostics();
  TestLaterFailureRollsBackAccount();
  TestDeleteKillsProcessesThenRemoves();
  TestDeleteOfUnknownUser();
  TestDeleteFailure();

  std::cout << "eryzaa_unit_direct_account_gateway: pass\n";
  return 0;
}
