/*
 * 설명: 구조화 JSON 로그와 인증 흐름 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "otpgate/verify_outcome.hpp"

namespace otpgate {

enum class LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

// 알 수 없는 이름은 kInfo로 취급한다.
LogLevel ParseLogLevel(std::string_view name);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  LogLevel level{LogLevel::kInfo};
  long latency_ms{0};
  std::optional<std::string> principal;
  std::optional<std::string> outcome;
  std::optional<int> status;
  std::optional<std::string> detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t codes_issued{0};
  std::uint64_t verify_accepted{0};
  std::uint64_t verify_mismatched{0};
  std::uint64_t verify_malformed{0};
  std::uint64_t verify_replayed{0};
  std::uint64_t store_failures{0};
};

class Observability {
 public:
  Observability();
  Observability(LogLevel min_level, std::ostream& sink);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void RecordCodeIssued();
  void RecordVerifyOutcome(VerifyOutcome outcome);
  void RecordStoreFailure();
  MetricsSnapshot Snapshot() const;
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::ostream& sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> codes_issued_{0};
  std::atomic<std::uint64_t> verify_accepted_{0};
  std::atomic<std::uint64_t> verify_mismatched_{0};
  std::atomic<std::uint64_t> verify_malformed_{0};
  std::atomic<std::uint64_t> verify_replayed_{0};
  std::atomic<std::uint64_t> store_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace otpgate
