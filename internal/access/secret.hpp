#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace eryzaa::access {

inline constexpr std::string_view kSecretCharset =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789"
    "!@#$%^&*";

inline constexpr std::size_t      kSecretLength   = 16;
inline constexpr std::string_view kUsernamePrefix = "eryzaa_job_";

std::string GenerateSecret(std::size_t length = kSecretLength);

// eryzaa_job_ + 8 hex characters
std::string GenerateUsername();

// The prefix followed by exactly 8 of [A-Za-z0-9_].
bool IsJobUsername(std::string_view username);

} // namespace eryzaa::access
