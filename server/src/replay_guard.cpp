/*
 * 설명: 키-값 저장소의 집합 연산으로 코드 소비 여부를 기록/조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/replay_guard_test.cpp
 */
#include "otpgate/replay_guard.hpp"

#include <utility>

namespace otpgate {

std::chrono::seconds DefaultReplayTtl(const TotpOptions& options) {
  return std::chrono::seconds(options.period * (2 * options.window + 1) + options.period);
}

ReplayGuard::ReplayGuard(std::shared_ptr<KeyValueStore> store, ReplayGuardConfig config)
    : store_(std::move(store)), config_(std::move(config)) {}

bool ReplayGuard::CheckBlacklist(const RequestContext& ctx, const std::string& code) {
  return store_->SetContains(ctx, config_.set_key, code);
}

void ReplayGuard::Blacklist(const RequestContext& ctx, const std::string& code) {
  store_->SetAddIfAbsent(ctx, config_.set_key, code, config_.entry_ttl);
}

bool ReplayGuard::TryConsume(const RequestContext& ctx, const std::string& code) {
  return store_->SetAddIfAbsent(ctx, config_.set_key, code, config_.entry_ttl);
}

}  // namespace otpgate
