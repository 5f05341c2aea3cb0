/*
 * 설명: 코어가 외부 키-값 저장소에 요구하는 다섯 가지 원시 연산을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_kv_store_test.cpp, server/tests/it/mariadb_kv_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "otpgate/request_context.hpp"

namespace otpgate {

struct ScanPage {
  std::vector<std::string> keys;
  // 다음 페이지를 요청할 때 넘기는 커서. complete이면 의미 없다.
  std::string cursor;
  bool complete{false};
};

// 모든 연산은 연결/전송 실패 시 kStoreUnavailable OtpException을 던진다.
// 구현은 여러 요청 핸들러에서 동시에 호출해도 안전해야 한다.
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  virtual std::optional<std::string> Get(const RequestContext& ctx, const std::string& key) = 0;
  virtual void SetWithTtl(const RequestContext& ctx, const std::string& key, const std::string& value,
                          std::chrono::seconds ttl) = 0;
  // 빈 커서로 시작해 complete가 될 때까지 반복한다. 만료된 키는 돌려주지 않는다.
  virtual ScanPage Scan(const RequestContext& ctx, const std::string& prefix, const std::string& cursor,
                        std::size_t count) = 0;
  // 원자적 insert-if-absent. 새로 추가했으면 true, 이미 있었으면 false.
  // ttl이 없으면 구성원은 만료되지 않는다.
  virtual bool SetAddIfAbsent(const RequestContext& ctx, const std::string& set, const std::string& member,
                              std::optional<std::chrono::seconds> ttl) = 0;
  virtual bool SetContains(const RequestContext& ctx, const std::string& set, const std::string& member) = 0;
};

}  // namespace otpgate
