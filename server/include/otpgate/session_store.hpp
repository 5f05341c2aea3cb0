/*
 * 설명: 불투명 세션 토큰과 주체 ID의 매핑을 저장소 TTL로 관리하고 전체 목록을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_store_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "otpgate/kv_store.hpp"

namespace otpgate {

struct SessionConfig {
  std::chrono::seconds ttl{std::chrono::minutes(15)};
  std::string key_prefix{"sess:"};
  std::size_t scan_page_size{10};
};

struct SessionEntry {
  std::string session_id;
  std::string principal_id;
};

inline bool operator==(const SessionEntry& lhs, const SessionEntry& rhs) {
  return lhs.session_id == rhs.session_id && lhs.principal_id == rhs.principal_id;
}

class SessionStore {
 public:
  SessionStore(std::shared_ptr<KeyValueStore> store, SessionConfig config);

  // CSPRNG 바이트를 base64url로 인코딩한다. 난수 원천이 실패하면 kRandomSourceFailure.
  static std::string GenerateSessionId(std::size_t byte_length);

  void Set(const RequestContext& ctx, const std::string& session_id, const std::string& principal_id);
  // 없거나 만료된 세션은 nullopt. 저장소 오류만 예외로 전달된다.
  std::optional<std::string> Get(const RequestContext& ctx, const std::string& session_id);
  // 스냅샷이 아니다. 한 키라도 조회에 실패하면 부분 결과 없이 예외를 던진다.
  std::vector<SessionEntry> All(const RequestContext& ctx);

  const SessionConfig& GetConfig() const { return config_; }

 private:
  std::string KeyFor(const std::string& session_id) const;

  std::shared_ptr<KeyValueStore> store_;
  SessionConfig config_;
};

}  // namespace otpgate
