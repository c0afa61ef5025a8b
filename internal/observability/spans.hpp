#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace muse::runtime::config {
class RuntimeConfig;
}

namespace muse::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"muse-autonomous"};
  std::string   endpoint{};
  std::string   service_instance{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  double        sample_ratio{1.0};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const muse::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const muse::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Metrics

  Owned by the runtime context and passed to the components that
  record into it. Without ENABLE_OTEL every method is a no-op.
*/
class Metrics {
 public:
  Metrics();
  ~Metrics();

  Metrics(const Metrics&)            = delete;
  Metrics& operator=(const Metrics&) = delete;

  void RecordOperation(std::string_view content_type, std::string_view status);
  void ObserveOperationDurationMs(std::string_view content_type, double duration_ms);
  void ObserveBatchFlushDurationMs(std::string_view writer, double duration_ms);
  void SetQueueDepth(std::string_view queue, std::uint64_t depth);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const muse::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const muse::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics::~Metrics() {
}

inline void Metrics::RecordOperation(std::string_view, std::string_view) {
}

inline void Metrics::ObserveOperationDurationMs(std::string_view, double) {
}

inline void Metrics::ObserveBatchFlushDurationMs(std::string_view, double) {
}

inline void Metrics::SetQueueDepth(std::string_view, std::uint64_t) {
}
#endif

} // namespace muse::observability
