/*
 * 설명: 프로세스 내부 맵으로 키-값 저장소를 모사한다. 만료는 주입 가능한 시계로 판단한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_kv_store_test.cpp, server/tests/unit/session_store_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "otpgate/kv_store.hpp"

namespace otpgate {

class InMemoryKeyValueStore : public KeyValueStore {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  InMemoryKeyValueStore();
  explicit InMemoryKeyValueStore(Clock clock);

  std::optional<std::string> Get(const RequestContext& ctx, const std::string& key) override;
  void SetWithTtl(const RequestContext& ctx, const std::string& key, const std::string& value,
                  std::chrono::seconds ttl) override;
  ScanPage Scan(const RequestContext& ctx, const std::string& prefix, const std::string& cursor,
                std::size_t count) override;
  bool SetAddIfAbsent(const RequestContext& ctx, const std::string& set, const std::string& member,
                      std::optional<std::chrono::seconds> ttl) override;
  bool SetContains(const RequestContext& ctx, const std::string& set, const std::string& member) override;

  // 연산 이름("get", "set", "scan", "sadd", "sismember")을 받아 true를 돌려주면
  // 해당 호출을 연결 실패로 취급한다.
  void SetFailureInjector(const std::function<bool(std::string_view)>& injector);

  std::size_t EntryCount() const;
  std::size_t SetMemberCount(const std::string& set) const;

 private:
  struct Entry {
    std::string value;
    std::chrono::system_clock::time_point expires_at;
  };
  struct Member {
    std::optional<std::chrono::system_clock::time_point> expires_at;
  };

  void BeginCall(const RequestContext& ctx, std::string_view op) const;
  void PurgeExpired(std::chrono::system_clock::time_point now);

  Clock clock_;
  std::function<bool(std::string_view)> failure_injector_;
  std::map<std::string, Entry> entries_;
  std::map<std::string, std::map<std::string, Member>> sets_;
  mutable std::mutex mutex_;
};

}  // namespace otpgate
