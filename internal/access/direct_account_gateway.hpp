#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/access/account_gateway.hpp"
#include "internal/process/command_runner.hpp"

namespace eryzaa::access {

struct DirectGatewayOptions {
  bool        use_sudo    = true;
  std::string login_shell = "/bin/bash";
  // empty skips the group membership step
  std::string privileged_group = "docker";
};

/*
  Runs the host account tools directly:

      create  useradd -m -s <shell> <user>
              chpasswd            (stdin "<user>:<secret>")
              usermod -aG <group> <user>
      delete  pkill -u <user>
              userdel -r <user>

  A create that fails after useradd removes the account again.
*/
class DirectAccountGateway final : public AccountGateway {
 public:
  DirectAccountGateway(std::shared_ptr<eryzaa::process::CommandRunner> runner, DirectGatewayOptions options);

  void CreateAccount(const std::string& username, const std::string& secret) override;
  void DeleteAccount(const std::string& username) override;

 private:
  std::vector<std::string>       Command(std::vector<std::string> argv) const;
  eryzaa::process::CommandResult Execute(const std::vector<std::string>& argv, const std::string& stdin_data = {});
  void                           Require(const std::vector<std::string>& argv, const std::string& stdin_data = {});
  void                           Rollback(const std::string& username);

  std::shared_ptr<eryzaa::process::CommandRunner> runner_;
  DirectGatewayOptions                            options_;
};

} // namespace eryzaa::access
