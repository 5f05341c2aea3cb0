/*
 * 설명: 요청 경계에서 만든 마감 시각과 추적 ID를 저장소 호출까지 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace otpgate {

struct RequestContext {
  std::string trace_id;
  std::optional<std::chrono::steady_clock::time_point> deadline;

  static RequestContext WithTimeout(std::string trace_id, std::chrono::milliseconds timeout) {
    return RequestContext{std::move(trace_id), std::chrono::steady_clock::now() + timeout};
  }

  bool Expired() const { return deadline && std::chrono::steady_clock::now() >= *deadline; }

  std::chrono::milliseconds Remaining() const {
    if (!deadline) {
      return std::chrono::milliseconds::max();
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
  }
};

}  // namespace otpgate
