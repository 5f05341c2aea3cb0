#include <chrono>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "otpgate/errors.hpp"
#include "otpgate/memory_kv_store.hpp"

namespace {

using namespace std::chrono_literals;

struct FakeClock {
  std::shared_ptr<std::chrono::system_clock::time_point> now =
      std::make_shared<std::chrono::system_clock::time_point>(std::chrono::seconds(1700000000));

  otpgate::InMemoryKeyValueStore::Clock AsClock() const {
    auto shared = now;
    return [shared] { return *shared; };
  }
  void Advance(std::chrono::seconds delta) const { *now += delta; }
};

otpgate::RequestContext Ctx() { return otpgate::RequestContext{"trace-test", std::nullopt}; }

TEST(MemoryKeyValueStoreTest, GetReturnsValueUntilTtlElapses) {
  FakeClock clock;
  otpgate::InMemoryKeyValueStore store(clock.AsClock());
  store.SetWithTtl(Ctx(), "sess:a", "alice", 10s);
  EXPECT_EQ(store.Get(Ctx(), "sess:a"), std::optional<std::string>("alice"));
  clock.Advance(9s);
  EXPECT_TRUE(store.Get(Ctx(), "sess:a").has_value());
  clock.Advance(1s);
  EXPECT_FALSE(store.Get(Ctx(), "sess:a").has_value());
  EXPECT_FALSE(store.Get(Ctx(), "missing").has_value());
}

TEST(MemoryKeyValueStoreTest, SetOverwritesValueAndTtl) {
  FakeClock clock;
  otpgate::InMemoryKeyValueStore store(clock.AsClock());
  store.SetWithTtl(Ctx(), "k", "v1", 5s);
  clock.Advance(4s);
  store.SetWithTtl(Ctx(), "k", "v2", 5s);
  clock.Advance(4s);
  EXPECT_EQ(store.Get(Ctx(), "k"), std::optional<std::string>("v2"));
}

TEST(MemoryKeyValueStoreTest, ScanPagesThroughPrefixInKeyOrder) {
  otpgate::InMemoryKeyValueStore store;
  store.SetWithTtl(Ctx(), "sess:c", "3", 60s);
  store.SetWithTtl(Ctx(), "sess:a", "1", 60s);
  store.SetWithTtl(Ctx(), "sess:b", "2", 60s);
  store.SetWithTtl(Ctx(), "other:x", "x", 60s);
  store.SetWithTtl(Ctx(), "sest", "y", 60s);

  auto first = store.Scan(Ctx(), "sess:", "", 2);
  ASSERT_EQ(first.keys.size(), 2u);
  EXPECT_EQ(first.keys[0], "sess:a");
  EXPECT_EQ(first.keys[1], "sess:b");
  EXPECT_FALSE(first.complete);

  auto second = store.Scan(Ctx(), "sess:", first.cursor, 2);
  ASSERT_EQ(second.keys.size(), 1u);
  EXPECT_EQ(second.keys[0], "sess:c");
  EXPECT_TRUE(second.complete);
}

TEST(MemoryKeyValueStoreTest, ScanOnExactPageBoundaryEndsWithEmptyPage) {
  otpgate::InMemoryKeyValueStore store;
  store.SetWithTtl(Ctx(), "p:1", "1", 60s);
  store.SetWithTtl(Ctx(), "p:2", "2", 60s);
  auto first = store.Scan(Ctx(), "p:", "", 2);
  EXPECT_EQ(first.keys.size(), 2u);
  EXPECT_TRUE(first.complete);

  auto empty = store.Scan(Ctx(), "none:", "", 2);
  EXPECT_TRUE(empty.keys.empty());
  EXPECT_TRUE(empty.complete);
}

TEST(MemoryKeyValueStoreTest, ScanSkipsExpiredKeysAndRejectsZeroCount) {
  FakeClock clock;
  otpgate::InMemoryKeyValueStore store(clock.AsClock());
  store.SetWithTtl(Ctx(), "p:short", "1", 1s);
  store.SetWithTtl(Ctx(), "p:long", "2", 60s);
  clock.Advance(2s);
  auto page = store.Scan(Ctx(), "p:", "", 10);
  ASSERT_EQ(page.keys.size(), 1u);
  EXPECT_EQ(page.keys[0], "p:long");

  try {
    store.Scan(Ctx(), "p:", "", 0);
    FAIL() << "count 0은 거부되어야 합니다";
  } catch (const otpgate::OtpException& ex) {
    EXPECT_EQ(ex.kind(), otpgate::ErrorKind::kInvalidArgument);
  }
}

TEST(MemoryKeyValueStoreTest, SetAddIfAbsentIsInsertOnce) {
  otpgate::InMemoryKeyValueStore store;
  EXPECT_FALSE(store.SetContains(Ctx(), "used", "123456"));
  EXPECT_TRUE(store.SetAddIfAbsent(Ctx(), "used", "123456", std::nullopt));
  EXPECT_FALSE(store.SetAddIfAbsent(Ctx(), "used", "123456", std::nullopt));
  EXPECT_TRUE(store.SetContains(Ctx(), "used", "123456"));
  EXPECT_TRUE(store.SetAddIfAbsent(Ctx(), "other", "123456", std::nullopt));
  EXPECT_EQ(store.SetMemberCount("used"), 1u);
}

TEST(MemoryKeyValueStoreTest, SetMemberTtlAllowsReinsertAfterExpiry) {
  FakeClock clock;
  otpgate::InMemoryKeyValueStore store(clock.AsClock());
  EXPECT_TRUE(store.SetAddIfAbsent(Ctx(), "used", "654321", 120s));
  clock.Advance(119s);
  EXPECT_TRUE(store.SetContains(Ctx(), "used", "654321"));
  clock.Advance(1s);
  EXPECT_FALSE(store.SetContains(Ctx(), "used", "654321"));
  EXPECT_TRUE(store.SetAddIfAbsent(Ctx(), "used", "654321", 120s));
}

TEST(MemoryKeyValueStoreTest, InjectedFailureSurfacesAsStoreUnavailable) {
  otpgate::InMemoryKeyValueStore store;
  store.SetFailureInjector([](std::string_view op) { return op == "get"; });
  store.SetWithTtl(Ctx(), "k", "v", 60s);
  try {
    store.Get(Ctx(), "k");
    FAIL() << "주입된 오류가 전달되어야 합니다";
  } catch (const otpgate::OtpException& ex) {
    EXPECT_EQ(ex.kind(), otpgate::ErrorKind::kStoreUnavailable);
    EXPECT_TRUE(ex.retryable());
  }
  store.SetFailureInjector({});
  EXPECT_TRUE(store.Get(Ctx(), "k").has_value());
}

TEST(MemoryKeyValueStoreTest, ExpiredDeadlineFailsBeforeTouchingData) {
  otpgate::InMemoryKeyValueStore store;
  otpgate::RequestContext expired{"trace-late", std::chrono::steady_clock::now() - 1ms};
  EXPECT_THROW(store.SetWithTtl(expired, "k", "v", 60s), otpgate::OtpException);
  EXPECT_EQ(store.EntryCount(), 0u);
}

}  // namespace
