/*
 * 설명: 이미 수락된 일회용 코드를 기록해 허용 창 안에서의 재사용을 거부한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/replay_guard_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "otpgate/kv_store.hpp"
#include "otpgate/otp.hpp"

namespace otpgate {

struct ReplayGuardConfig {
  std::string set_key{"blacklisted_otps"};
  // 없으면 소비된 코드가 영구히 남는다.
  std::optional<std::chrono::seconds> entry_ttl;
};

// 코드가 시간상 유효할 수 있는 최대 구간보다 한 주기 길다: period * (2 * window + 1) + period.
std::chrono::seconds DefaultReplayTtl(const TotpOptions& options);

class ReplayGuard {
 public:
  ReplayGuard(std::shared_ptr<KeyValueStore> store, ReplayGuardConfig config);

  bool CheckBlacklist(const RequestContext& ctx, const std::string& code);
  // 이미 있는 코드를 다시 넣어도 성공이다.
  void Blacklist(const RequestContext& ctx, const std::string& code);
  // 한 번의 원자적 insert-if-absent. 이번 호출이 처음 소비했으면 true, 재사용이면 false.
  bool TryConsume(const RequestContext& ctx, const std::string& code);

  const ReplayGuardConfig& GetConfig() const { return config_; }

 private:
  std::shared_ptr<KeyValueStore> store_;
  ReplayGuardConfig config_;
};

}  // namespace otpgate
