#include "internal/access/probing_account_gateway.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace eryzaa::access {

using eryzaa::observability::StringField;

ProbingAccountGateway::ProbingAccountGateway(std::shared_ptr<AccountGateway> helper, std::shared_ptr<AccountGateway> direct)
    : helper_(std::move(helper)), direct_(std::move(direct)) {
  if (!direct_) {
    throw eryzaa::util::InvalidArgument("probing gateway requires a direct gateway");
  }
}

template <typename Call>
void ProbingAccountGateway::Dispatch(const char* operation, const std::string& username, Call&& call) {
  if (helper_ && helper_->Available()) {
    try {
      call(*helper_);
      return;
    } catch (const eryzaa::util::ServiceUnavailable& e) {
      ERYZAA_LOG_WARN("helper unavailable, using direct execution",
                      {StringField("operation", operation), StringField("username", username), StringField("error", e.what())});
    }
  }
  call(*direct_);
}

void ProbingAccountGateway::CreateAccount(const std::string& username, const std::string& secret) {
  Dispatch("create", username, [&](AccountGateway& gateway) { gateway.CreateAccount(username, secret); });
}

void ProbingAccountGateway::DeleteAccount(const std::string& username) {
  Dispatch("delete", username, [&](AccountGateway& gateway) { gateway.DeleteAccount(username); });
}

} // namespace eryzaa::access
