/*
 * 설명: MariaDB 테이블 두 개(kv_entries, kv_set_members)로 키-값 저장소 연산을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/schema.sql
 * 테스트: server/tests/it/mariadb_kv_store_it_test.cpp
 */
#pragma once

#include <memory>

#include "otpgate/db_client.hpp"
#include "otpgate/kv_store.hpp"

namespace otpgate {

class MariaDbKeyValueStore : public KeyValueStore {
 public:
  explicit MariaDbKeyValueStore(std::shared_ptr<MariaDbClient> db_client);

  std::optional<std::string> Get(const RequestContext& ctx, const std::string& key) override;
  void SetWithTtl(const RequestContext& ctx, const std::string& key, const std::string& value,
                  std::chrono::seconds ttl) override;
  ScanPage Scan(const RequestContext& ctx, const std::string& prefix, const std::string& cursor,
                std::size_t count) override;
  bool SetAddIfAbsent(const RequestContext& ctx, const std::string& set, const std::string& member,
                      std::optional<std::chrono::seconds> ttl) override;
  bool SetContains(const RequestContext& ctx, const std::string& set, const std::string& member) override;

  // 만료된 행을 지운다. 조회는 만료 행을 이미 걸러내므로 저장 공간 회수용이다.
  std::size_t PurgeExpired(const RequestContext& ctx);
  void ClearAll(const RequestContext& ctx);

 private:
  template <typename Fn>
  auto Translate(const char* op, Fn&& fn);

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace otpgate
