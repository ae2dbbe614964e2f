#include "internal/access/direct_account_gateway.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace eryzaa::access {

using eryzaa::observability::IntField;
using eryzaa::observability::StringField;
using eryzaa::process::CommandResult;
using eryzaa::process::FormatCommand;
using eryzaa::util::CommandFailure;

namespace {

// userdel: "specified user doesn't exist"
constexpr int kUserdelNoSuchUser = 6;
// pkill: "no processes matched"
constexpr int kPkillNoMatch = 1;

std::string Diagnostics(const CommandResult& result) {
  return result.stderr_text.empty() ? result.stdout_text : result.stderr_text;
}

} // namespace

DirectAccountGateway::DirectAccountGateway(std::shared_ptr<eryzaa::process::CommandRunner> runner, DirectGatewayOptions options)
    : runner_(std::move(runner)), options_(std::move(options)) {
}

std::vector<std::string> DirectAccountGateway::Command(std::vector<std::string> argv) const {
  if (options_.use_sudo) argv.insert(argv.begin(), "sudo");
  return argv;
}

CommandResult DirectAccountGateway::Execute(const std::vector<std::string>& argv, const std::string& stdin_data) {
  auto result = runner_->Run(argv, stdin_data);
  ERYZAA_LOG_DEBUG("account command finished", {StringField("command", FormatCommand(argv)), IntField("exit_code", result.exit_code)});
  return result;
}

void DirectAccountGateway::Require(const std::vector<std::string>& argv, const std::string& stdin_data) {
  const auto result = Execute(argv, stdin_data);
  if (!result.Succeeded()) {
    const auto diagnostics = Diagnostics(result);
    throw CommandFailure(FormatCommand(argv) + " exited with " + std::to_string(result.exit_code) + ": " + diagnostics,
                         result.exit_code, diagnostics);
  }
}

void DirectAccountGateway::Rollback(const std::string& username) {
  try {
    const auto result = Execute(Command({"userdel", "-r", username}));
    if (!result.Succeeded()) {
      ERYZAA_LOG_ERROR("rollback of partially created account failed",
                       {StringField("username", username), IntField("exit_code", result.exit_code),
                        StringField("stderr", Diagnostics(result))});
    }
  } catch (const CommandFailure& e) {
    ERYZAA_LOG_ERROR("rollback of partially created account failed", {StringField("username", username), StringField("error", e.what())});
  }
}

void DirectAccountGateway::CreateAccount(const std::string& username, const std::string& secret) {
  Require(Command({"useradd", "-m", "-s", options_.login_shell, username}));

  try {
    Require(Command({"chpasswd"}), username + ":" + secret + "\n");
    if (!options_.privileged_group.empty()) {
      Require(Command({"usermod", "-aG", options_.privileged_group, username}));
    }
  } catch (const CommandFailure&) {
    Rollback(username);
    throw;
  }

  ERYZAA_LOG_INFO("account created", {StringField("username", username)});
}

void DirectAccountGateway::DeleteAccount(const std::string& username) {
  const auto killed = Execute(Command({"pkill", "-u", username}));
  if (!killed.Succeeded() && killed.exit_code != kPkillNoMatch) {
    ERYZAA_LOG_WARN("terminating account processes failed",
                    {StringField("username", username), IntField("exit_code", killed.exit_code), StringField("stderr", Diagnostics(killed))});
  }

  const auto argv    = Command({"userdel", "-r", username});
  const auto removed = Execute(argv);
  if (removed.exit_code == kUserdelNoSuchUser) {
    throw eryzaa::util::UserNotFound("no such account: " + username);
  }
  if (!removed.Succeeded()) {
    const auto diagnostics = Diagnostics(removed);
    throw CommandFailure(FormatCommand(argv) + " exited with " + std::to_string(removed.exit_code) + ": " + diagnostics,
                         removed.exit_code, diagnostics);
  }

  ERYZAA_LOG_INFO("account deleted", {StringField("username", username)});
}

} // namespace eryzaa::access
