/*
 * 설명: MariaDB 연결, 트랜잭션 경계, 오류 분류를 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include "otpgate/db_client.hpp"

#include <algorithm>
#include <mutex>

#include <mariadb/errmsg.h>

namespace otpgate {
namespace {
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;

std::once_flag& LibraryInitFlag() {
  static std::once_flag flag;
  return flag;
}

unsigned int ClampTimeout(const RequestContext& ctx, unsigned int fallback_seconds) {
  if (!ctx.deadline) {
    return fallback_seconds;
  }
  auto remaining = static_cast<unsigned int>((ctx.Remaining().count() + 999) / 1000);
  return std::max(1u, std::min(fallback_seconds, remaining));
}

// mysql_close가 빠지지 않도록 연결을 소유한다.
class ConnectionGuard {
 public:
  explicit ConnectionGuard(MYSQL* conn) : conn_(conn) {}
  ~ConnectionGuard() {
    if (conn_) {
      mysql_close(conn_);
    }
  }
  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;

  MYSQL* get() const { return conn_; }

 private:
  MYSQL* conn_;
};
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {
  std::call_once(LibraryInitFlag(), [] {
    if (mysql_library_init(0, nullptr, nullptr) != 0) {
      throw DbException("MariaDB 라이브러리 초기화 실패", 0, false);
    }
  });
}

MYSQL* MariaDbClient::Connect(const RequestContext& ctx) const {
  if (ctx.Expired()) {
    throw DbException("요청 마감 시각 초과", CR_CONN_HOST_ERROR, true);
  }
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  unsigned int connect_timeout = ClampTimeout(ctx, connect_timeout_seconds_);
  unsigned int query_timeout = ClampTimeout(ctx, query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout);
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    ConnectionGuard guard(conn);
    RaiseError(conn, "연결 실패");
  }
  if (mysql_query(conn, "SET SESSION innodb_lock_wait_timeout=2;") != 0) {
    ConnectionGuard guard(conn);
    RaiseError(conn, "락 대기 타임아웃 설정 실패");
  }
  return conn;
}

void MariaDbClient::WithConnection(const RequestContext& ctx, const std::function<void(MYSQL*)>& work) const {
  ConnectionGuard guard(Connect(ctx));
  work(guard.get());
}

void MariaDbClient::Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
    RaiseError(conn, ctx);
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsRetryable(code);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, retryable);
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

}  // namespace otpgate
