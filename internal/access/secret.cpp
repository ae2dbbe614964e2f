#include "internal/access/secret.hpp"

#include <random>
#include <regex>

#include "internal/util/uuid.hpp"

namespace eryzaa::access {

std::string GenerateSecret(std::size_t length) {
  std::random_device                         device;
  std::uniform_int_distribution<std::size_t> pick(0, kSecretCharset.size() - 1);

  std::string secret;
  secret.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    secret.push_back(kSecretCharset[pick(device)]);
  }
  return secret;
}

std::string GenerateUsername() {
  const auto hex = eryzaa::util::ToHex(eryzaa::util::GenerateUUID());
  return std::string(kUsernamePrefix) + hex.substr(0, 8);
}

bool IsJobUsername(std::string_view username) {
  static const std::regex pattern("^eryzaa_job_[A-Za-z0-9_]{8}$");
  return std::regex_match(username.begin(), username.end(), pattern);
}

} // namespace eryzaa::access
