/*
 * 설명: MariaDB 연결 수명과 오류 분류를 캡슐화한다. 재시도는 호출자에게 맡긴다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_kv_store_it_test.cpp
 */
#pragma once

#include <functional>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

#include "otpgate/request_context.hpp"

namespace otpgate {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // 호출마다 연결을 열고 닫는다. 마감 시각이 남은 시간만큼 소켓 타임아웃을 줄인다.
  void WithConnection(const RequestContext& ctx, const std::function<void(MYSQL*)>& work) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;
  void Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const;

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect(const RequestContext& ctx) const;
  bool IsRetryable(unsigned int code) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
};

}  // namespace otpgate
