#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace eryzaa::runtime::config {
class RuntimeConfig;
}

namespace eryzaa::observability {

bool InitializeMetrics(const eryzaa::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide instruments. Every call is a no-op unless the build enables
  OpenTelemetry and the config turns metrics on.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordAdvertisementSent(std::string_view target, bool success);
  // outcome: accepted | self | stale | out_of_order | malformed | probe
  void RecordDatagram(std::string_view outcome);
  void SetPeerCount(std::int64_t count);
  // op: grant | revoke; outcome: ok | occupied | failed | not_found
  void RecordLease(std::string_view op, std::string_view outcome);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const eryzaa::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordAdvertisementSent(std::string_view, bool) {
}

inline void Metrics::RecordDatagram(std::string_view) {
}

inline void Metrics::SetPeerCount(std::int64_t) {
}

inline void Metrics::RecordLease(std::string_view, std::string_view) {
}
#endif

} // namespace eryzaa::observability
