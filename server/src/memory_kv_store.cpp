/*
 * 설명: 정렬된 맵 기반 키-값 저장소와 키셋 커서 스캔을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_kv_store_test.cpp
 */
#include "otpgate/memory_kv_store.hpp"

#include <utility>

#include "otpgate/errors.hpp"

namespace otpgate {

InMemoryKeyValueStore::InMemoryKeyValueStore()
    : InMemoryKeyValueStore([] { return std::chrono::system_clock::now(); }) {}

InMemoryKeyValueStore::InMemoryKeyValueStore(Clock clock) : clock_(std::move(clock)) {}

void InMemoryKeyValueStore::BeginCall(const RequestContext& ctx, std::string_view op) const {
  if (ctx.Expired()) {
    throw OtpException(ErrorKind::kStoreUnavailable, "요청 마감 시각 초과: " + std::string(op));
  }
  if (failure_injector_ && failure_injector_(op)) {
    throw OtpException(ErrorKind::kStoreUnavailable, "주입된 저장소 오류: " + std::string(op));
  }
}

std::optional<std::string> InMemoryKeyValueStore::Get(const RequestContext& ctx, const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  BeginCall(ctx, "get");
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (clock_() >= it->second.expires_at) {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.value;
}

void InMemoryKeyValueStore::SetWithTtl(const RequestContext& ctx, const std::string& key, const std::string& value,
                                       std::chrono::seconds ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  BeginCall(ctx, "set");
  auto now = clock_();
  PurgeExpired(now);
  entries_[key] = Entry{value, now + ttl};
}

ScanPage InMemoryKeyValueStore::Scan(const RequestContext& ctx, const std::string& prefix, const std::string& cursor,
                                     std::size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  BeginCall(ctx, "scan");
  if (count == 0) {
    throw OtpException(ErrorKind::kInvalidArgument, "스캔 페이지 크기는 1 이상이어야 합니다");
  }
  auto now = clock_();
  ScanPage page;
  auto it = cursor.empty() ? entries_.lower_bound(prefix) : entries_.upper_bound(cursor);
  for (; it != entries_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) {
      break;
    }
    if (now >= it->second.expires_at) {
      continue;
    }
    if (page.keys.size() == count) {
      page.cursor = page.keys.back();
      return page;
    }
    page.keys.push_back(it->first);
  }
  page.complete = true;
  return page;
}

bool InMemoryKeyValueStore::SetAddIfAbsent(const RequestContext& ctx, const std::string& set,
                                           const std::string& member, std::optional<std::chrono::seconds> ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  BeginCall(ctx, "sadd");
  auto now = clock_();
  auto& members = sets_[set];
  auto it = members.find(member);
  if (it != members.end() && (!it->second.expires_at || now < *it->second.expires_at)) {
    return false;
  }
  Member record;
  if (ttl) {
    record.expires_at = now + *ttl;
  }
  members[member] = record;
  return true;
}

bool InMemoryKeyValueStore::SetContains(const RequestContext& ctx, const std::string& set,
                                        const std::string& member) {
  std::lock_guard<std::mutex> lock(mutex_);
  BeginCall(ctx, "sismember");
  auto set_it = sets_.find(set);
  if (set_it == sets_.end()) {
    return false;
  }
  auto it = set_it->second.find(member);
  if (it == set_it->second.end()) {
    return false;
  }
  if (it->second.expires_at && clock_() >= *it->second.expires_at) {
    set_it->second.erase(it);
    return false;
  }
  return true;
}

void InMemoryKeyValueStore::SetFailureInjector(const std::function<bool(std::string_view)>& injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_injector_ = injector;
}

std::size_t InMemoryKeyValueStore::EntryCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::size_t InMemoryKeyValueStore::SetMemberCount(const std::string& set) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sets_.find(set);
  return it == sets_.end() ? 0 : it->second.size();
}

void InMemoryKeyValueStore::PurgeExpired(std::chrono::system_clock::time_point now) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now >= it->second.expires_at) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  for (auto& set : sets_) {
    auto& members = set.second;
    for (auto it = members.begin(); it != members.end();) {
      if (it->second.expires_at && now >= *it->second.expires_at) {
        it = members.erase(it);
      } else {
        ++it;
      }
    }
  }
}

}  // namespace otpgate
