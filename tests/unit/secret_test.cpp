#include "internal/access/secret.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

namespace {

using eryzaa::access::GenerateSecret;
using eryzaa::access::GenerateUsername;
using eryzaa::access::IsJobUsername;
using eryzaa::access::kSecretCharset;

void TestSecretShape() {
  assert(kSecretCharset.size() == 70);

  for (int i = 0; i < 100; ++i) {
    const auto secret = GenerateSecret();
    assert(secret.size() == 16);
    for (char c : secret) {
      assert(kSecretCharset.find(c) != std::string_view::npos);
    }
  }

  assert(GenerateSecret(32).size() == 32);
}

void TestSecretsDiffer() {
  std::set<std::string> seen;
  for (int i = 0; i < 50; ++i) seen.insert(GenerateSecret());
  assert(seen.size() == 50);
}

void TestUsernameShape() {
  const auto username = GenerateUsername();
  assert(username.size() == 19);
  assert(username.rfind("eryzaa_job_", 0) == 0);
  for (char c : username.substr(11)) {
    assert((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
  }
  assert(IsJobUsername(username));
  assert(GenerateUsername() != username);
}

void TestUsernameValidation() {
  assert(IsJobUsername("eryzaa_job_abcd1234"));
  assert(IsJobUsername("eryzaa_job_AB_d1234"));
  assert(!IsJobUsername("root"));
  assert(!IsJobUsername("eryzaa_job_abc"));
  assert(!IsJobUsername("eryzaa_job_abcd12345"));
  assert(!IsJobUsername("eryzaa_job_abcd-234"));
  assert(!IsJobUsername("xeryzaa_job_abcd1234"));
  assert(!IsJobUsername("eryzaa_job_abcd1234\n"));
}

} // namespace

int main() {
  TestSecretShape();
  TestSecretsDiffer();
  TestUsernameShape();
  TestUsernameValidation();

  std::cout << "eryzaa_unit_secret: pass\n";
  return 0;
}
