/*
 * 설명: 구조화 로그 출력과 인증 흐름 메트릭 카운터를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "otpgate/observability.hpp"

#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace otpgate {

LogLevel ParseLogLevel(std::string_view name) {
  std::string lowered;
  for (char c : name) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lowered == "debug") {
    return LogLevel::kDebug;
  }
  if (lowered == "warn" || lowered == "warning") {
    return LogLevel::kWarn;
  }
  if (lowered == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability() : Observability(LogLevel::kInfo, std::cout) {}

Observability::Observability(LogLevel min_level, std::ostream& sink) : min_level_(min_level), sink_(sink) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::RecordCodeIssued() { codes_issued_.fetch_add(1); }

void Observability::RecordVerifyOutcome(VerifyOutcome outcome) {
  switch (outcome) {
    case VerifyOutcome::kAccepted:
      verify_accepted_.fetch_add(1);
      break;
    case VerifyOutcome::kMismatch:
      verify_mismatched_.fetch_add(1);
      break;
    case VerifyOutcome::kMalformed:
      verify_malformed_.fetch_add(1);
      break;
    case VerifyOutcome::kReplayed:
      verify_replayed_.fetch_add(1);
      break;
  }
}

void Observability::RecordStoreFailure() { store_failures_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.codes_issued = codes_issued_.load();
  snapshot.verify_accepted = verify_accepted_.load();
  snapshot.verify_mismatched = verify_mismatched_.load();
  snapshot.verify_malformed = verify_malformed_.load();
  snapshot.verify_replayed = verify_replayed_.load();
  snapshot.store_failures = store_failures_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (ctx.level < min_level_) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.principal) {
    log_json["principal"] = *ctx.principal;
  }
  if (ctx.outcome) {
    log_json["outcome"] = *ctx.outcome;
  }
  if (ctx.status) {
    log_json["status"] = *ctx.status;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  auto line = log_json.dump();
  std::lock_guard<std::mutex> lock(sink_mutex_);
  sink_ << line << std::endl;
}

}  // namespace otpgate
