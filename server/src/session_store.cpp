/*
 * 설명: 세션 토큰 발급, 저장, 조회, 커서 기반 전체 열거를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_store_test.cpp
 */
#include "otpgate/session_store.hpp"

#include <limits>
#include <unordered_set>

#include <openssl/err.h>
#include <openssl/rand.h>

#include "otpgate/errors.hpp"
#include "otpgate/secret_codec.hpp"

namespace otpgate {

SessionStore::SessionStore(std::shared_ptr<KeyValueStore> store, SessionConfig config)
    : store_(std::move(store)), config_(std::move(config)) {
  if (config_.scan_page_size == 0) {
    throw OtpException(ErrorKind::kInvalidArgument, "세션 스캔 페이지 크기는 1 이상이어야 합니다");
  }
}

std::string SessionStore::GenerateSessionId(std::size_t byte_length) {
  if (byte_length == 0 || byte_length > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw OtpException(ErrorKind::kInvalidArgument, "세션 ID 바이트 길이가 올바르지 않습니다");
  }
  Bytes buffer(byte_length);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    unsigned long code = ERR_get_error();
    throw OtpException(ErrorKind::kRandomSourceFailure,
                       "보안 난수 생성 실패 (openssl " + std::to_string(code) + ")");
  }
  return EncodeBase64Url(buffer);
}

std::string SessionStore::KeyFor(const std::string& session_id) const { return config_.key_prefix + session_id; }

void SessionStore::Set(const RequestContext& ctx, const std::string& session_id, const std::string& principal_id) {
  store_->SetWithTtl(ctx, KeyFor(session_id), principal_id, config_.ttl);
}

std::optional<std::string> SessionStore::Get(const RequestContext& ctx, const std::string& session_id) {
  return store_->Get(ctx, KeyFor(session_id));
}

std::vector<SessionEntry> SessionStore::All(const RequestContext& ctx) {
  std::vector<std::string> keys;
  std::unordered_set<std::string> seen;
  std::string cursor;
  while (true) {
    auto page = store_->Scan(ctx, config_.key_prefix, cursor, config_.scan_page_size);
    for (auto& key : page.keys) {
      if (seen.insert(key).second) {
        keys.push_back(std::move(key));
      }
    }
    if (page.complete) {
      break;
    }
    cursor = page.cursor;
  }

  std::vector<SessionEntry> entries;
  entries.reserve(keys.size());
  for (const auto& key : keys) {
    auto principal = store_->Get(ctx, key);
    // 스캔 이후 만료된 키는 실패가 아니라 이미 사라진 세션이다.
    if (!principal) {
      continue;
    }
    entries.push_back(SessionEntry{key.substr(config_.key_prefix.size()), *principal});
  }
  return entries;
}

}  // namespace otpgate
