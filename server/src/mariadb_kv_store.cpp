/*
 * 설명: MariaDB 기반 키-값 저장소 연산과 오류 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/schema.sql
 * 테스트: server/tests/it/mariadb_kv_store_it_test.cpp
 */
#include "otpgate/mariadb_kv_store.hpp"

#include <sstream>

#include "otpgate/errors.hpp"

namespace otpgate {
namespace {
// mysql_store_result 결과를 해제하기 위한 소유자.
struct ResultGuard {
  explicit ResultGuard(MYSQL_RES* res) : res(res) {}
  ~ResultGuard() {
    if (res) {
      mysql_free_result(res);
    }
  }
  ResultGuard(const ResultGuard&) = delete;
  ResultGuard& operator=(const ResultGuard&) = delete;
  MYSQL_RES* res;
};
}  // namespace

MariaDbKeyValueStore::MariaDbKeyValueStore(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

template <typename Fn>
auto MariaDbKeyValueStore::Translate(const char* op, Fn&& fn) {
  try {
    return fn();
  } catch (const DbException& ex) {
    throw OtpException(ErrorKind::kStoreUnavailable, std::string(op) + " 실패 (" + std::to_string(ex.code) +
                                                         "): " + ex.what());
  }
}

std::optional<std::string> MariaDbKeyValueStore::Get(const RequestContext& ctx, const std::string& key) {
  return Translate("get", [&] {
    std::optional<std::string> value;
    db_client_->WithConnection(ctx, [&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "SELECT v FROM kv_entries WHERE k='" << db_client_->Escape(conn, key)
          << "' AND expires_at > UTC_TIMESTAMP(6);";
      db_client_->Query(conn, oss.str(), "키 조회 실패");
      ResultGuard result(mysql_store_result(conn));
      if (!result.res) {
        db_client_->RaiseError(conn, "키 조회 결과 없음");
      }
      MYSQL_ROW row = mysql_fetch_row(result.res);
      if (row && row[0]) {
        unsigned long* lengths = mysql_fetch_lengths(result.res);
        value = std::string(row[0], lengths ? lengths[0] : std::char_traits<char>::length(row[0]));
      }
    });
    return value;
  });
}

void MariaDbKeyValueStore::SetWithTtl(const RequestContext& ctx, const std::string& key, const std::string& value,
                                      std::chrono::seconds ttl) {
  Translate("set", [&] {
    db_client_->WithConnection(ctx, [&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "INSERT INTO kv_entries(k, v, expires_at) VALUES('" << db_client_->Escape(conn, key) << "', '"
          << db_client_->Escape(conn, value) << "', UTC_TIMESTAMP(6) + INTERVAL " << ttl.count()
          << " SECOND) ON DUPLICATE KEY UPDATE v=VALUES(v), expires_at=VALUES(expires_at);";
      db_client_->Query(conn, oss.str(), "키 저장 실패");
    });
  });
}

ScanPage MariaDbKeyValueStore::Scan(const RequestContext& ctx, const std::string& prefix, const std::string& cursor,
                                    std::size_t count) {
  if (count == 0) {
    throw OtpException(ErrorKind::kInvalidArgument, "스캔 페이지 크기는 1 이상이어야 합니다");
  }
  return Translate("scan", [&] {
    ScanPage page;
    db_client_->WithConnection(ctx, [&](MYSQL* conn) {
      std::ostringstream oss;
      // 한 행을 더 읽어 다음 페이지가 있는지 판단한다.
      oss << "SELECT k FROM kv_entries WHERE LEFT(k, " << prefix.size() << ")='" << db_client_->Escape(conn, prefix)
          << "' AND k > '" << db_client_->Escape(conn, cursor) << "' AND expires_at > UTC_TIMESTAMP(6) ORDER BY k LIMIT "
          << (count + 1) << ";";
      db_client_->Query(conn, oss.str(), "키 스캔 실패");
      ResultGuard result(mysql_store_result(conn));
      if (!result.res) {
        db_client_->RaiseError(conn, "키 스캔 결과 없음");
      }
      MYSQL_ROW row;
      while ((row = mysql_fetch_row(result.res)) != nullptr) {
        if (row[0]) {
          page.keys.emplace_back(row[0]);
        }
      }
    });
    if (page.keys.size() > count) {
      page.keys.resize(count);
      page.cursor = page.keys.back();
    } else {
      page.complete = true;
    }
    return page;
  });
}

bool MariaDbKeyValueStore::SetAddIfAbsent(const RequestContext& ctx, const std::string& set,
                                          const std::string& member, std::optional<std::chrono::seconds> ttl) {
  return Translate("sadd", [&] {
    bool inserted = false;
    db_client_->WithConnection(ctx, [&](MYSQL* conn) {
      std::ostringstream oss;
      // 한 문장으로 끝낸다. 만료된 구성원만 새 만료 시각으로 덮어쓰고 살아 있는 구성원은 건드리지 않는다.
      // 영향받은 행 수: 1 = 새로 추가, 2 = 만료 구성원 교체, 0 = 이미 있음.
      oss << "INSERT INTO kv_set_members(set_name, member, expires_at) VALUES('" << db_client_->Escape(conn, set)
          << "', '" << db_client_->Escape(conn, member) << "', ";
      if (ttl) {
        oss << "UTC_TIMESTAMP(6) + INTERVAL " << ttl->count() << " SECOND";
      } else {
        oss << "NULL";
      }
      oss << ") ON DUPLICATE KEY UPDATE expires_at = IF(expires_at IS NOT NULL AND expires_at <= UTC_TIMESTAMP(6), "
             "VALUES(expires_at), expires_at);";
      db_client_->Query(conn, oss.str(), "구성원 추가 실패");
      auto affected = mysql_affected_rows(conn);
      if (affected == static_cast<my_ulonglong>(-1)) {
        db_client_->RaiseError(conn, "구성원 추가 결과 확인 실패");
      }
      inserted = affected > 0;
    });
    return inserted;
  });
}

bool MariaDbKeyValueStore::SetContains(const RequestContext& ctx, const std::string& set,
                                       const std::string& member) {
  return Translate("sismember", [&] {
    bool found = false;
    db_client_->WithConnection(ctx, [&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "SELECT 1 FROM kv_set_members WHERE set_name='" << db_client_->Escape(conn, set) << "' AND member='"
          << db_client_->Escape(conn, member) << "' AND (expires_at IS NULL OR expires_at > UTC_TIMESTAMP(6));";
      db_client_->Query(conn, oss.str(), "구성원 조회 실패");
      ResultGuard result(mysql_store_result(conn));
      if (!result.res) {
        db_client_->RaiseError(conn, "구성원 조회 결과 없음");
      }
      found = mysql_fetch_row(result.res) != nullptr;
    });
    return found;
  });
}

std::size_t MariaDbKeyValueStore::PurgeExpired(const RequestContext& ctx) {
  return Translate("purge", [&] {
    std::size_t removed = 0;
    db_client_->WithConnection(ctx, [&](MYSQL* conn) {
      db_client_->Query(conn, "DELETE FROM kv_entries WHERE expires_at <= UTC_TIMESTAMP(6);", "만료 키 정리 실패");
      removed += static_cast<std::size_t>(mysql_affected_rows(conn));
      db_client_->Query(conn,
                        "DELETE FROM kv_set_members WHERE expires_at IS NOT NULL AND expires_at <= UTC_TIMESTAMP(6);",
                        "만료 구성원 정리 실패");
      removed += static_cast<std::size_t>(mysql_affected_rows(conn));
    });
    return removed;
  });
}

void MariaDbKeyValueStore::ClearAll(const RequestContext& ctx) {
  Translate("clear", [&] {
    db_client_->WithConnection(ctx, [&](MYSQL* conn) {
      db_client_->Query(conn, "DELETE FROM kv_entries;", "키 전체 삭제 실패");
      db_client_->Query(conn, "DELETE FROM kv_set_members;", "구성원 전체 삭제 실패");
    });
  });
}

}  // namespace otpgate
