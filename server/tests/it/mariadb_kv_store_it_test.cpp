#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <mariadb/mysql.h>

#include "otpgate/errors.hpp"
#include "otpgate/mariadb_kv_store.hpp"
#include "otpgate/replay_guard.hpp"
#include "otpgate/session_store.hpp"

namespace {

using namespace std::chrono_literals;

otpgate::DbConfig TestDbConfig() {
  otpgate::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "app_db";
  return cfg;
}

otpgate::RequestContext Ctx() { return otpgate::RequestContext::WithTimeout("trace-it", 5s); }

class MariaDbKeyValueStoreItTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<otpgate::MariaDbKeyValueStore>(std::make_shared<otpgate::MariaDbClient>(TestDbConfig()));
    store_->ClearAll(Ctx());
  }

  std::shared_ptr<otpgate::MariaDbKeyValueStore> store_;
};

TEST_F(MariaDbKeyValueStoreItTest, SetGetAndExpiry) {
  store_->SetWithTtl(Ctx(), "sess:it-1", "alice", 10s);
  EXPECT_EQ(store_->Get(Ctx(), "sess:it-1"), std::optional<std::string>("alice"));
  store_->SetWithTtl(Ctx(), "sess:it-1", "bob", 60s);
  EXPECT_EQ(store_->Get(Ctx(), "sess:it-1"), std::optional<std::string>("bob"));

  store_->SetWithTtl(Ctx(), "sess:it-short", "carol", 1s);
  std::this_thread::sleep_for(1500ms);
  EXPECT_FALSE(store_->Get(Ctx(), "sess:it-short").has_value());
  EXPECT_FALSE(store_->Get(Ctx(), "sess:missing").has_value());
}

TEST_F(MariaDbKeyValueStoreItTest, ScanPagesWithoutDuplicates) {
  for (int i = 0; i < 7; ++i) {
    store_->SetWithTtl(Ctx(), "sess:k" + std::to_string(i), "u", 60s);
  }
  store_->SetWithTtl(Ctx(), "other:k", "u", 60s);

  std::vector<std::string> keys;
  std::string cursor;
  int pages = 0;
  while (true) {
    auto page = store_->Scan(Ctx(), "sess:", cursor, 3);
    keys.insert(keys.end(), page.keys.begin(), page.keys.end());
    ++pages;
    if (page.complete) {
      break;
    }
    cursor = page.cursor;
  }
  EXPECT_EQ(pages, 3);
  ASSERT_EQ(keys.size(), 7u);
  EXPECT_EQ(keys.front(), "sess:k0");
  EXPECT_EQ(keys.back(), "sess:k6");
}

TEST_F(MariaDbKeyValueStoreItTest, SetAddIfAbsentHasSingleWinner) {
  std::atomic<int> winners{0};
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      try {
        if (store_->SetAddIfAbsent(Ctx(), "blacklisted_otps", "0582933009", 120s)) {
          winners.fetch_add(1);
        }
      } catch (const otpgate::OtpException&) {
        failures.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  // 동시 소비는 교착 없이 정확히 하나만 성공하고 나머지는 '이미 있음'으로 끝나야 한다.
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(winners.load(), 1);
  EXPECT_TRUE(store_->SetContains(Ctx(), "blacklisted_otps", "0582933009"));
  EXPECT_FALSE(store_->SetContains(Ctx(), "blacklisted_otps", "1796746380"));
}

TEST_F(MariaDbKeyValueStoreItTest, ConcurrentReinsertOfExpiredMemberHasSingleWinner) {
  ASSERT_TRUE(store_->SetAddIfAbsent(Ctx(), "blacklisted_otps", "181011", 1s));
  std::this_thread::sleep_for(1500ms);
  std::atomic<int> winners{0};
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      try {
        if (store_->SetAddIfAbsent(Ctx(), "blacklisted_otps", "181011", 120s)) {
          winners.fetch_add(1);
        }
      } catch (const otpgate::OtpException&) {
        failures.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(winners.load(), 1);
  EXPECT_TRUE(store_->SetContains(Ctx(), "blacklisted_otps", "181011"));
}

TEST_F(MariaDbKeyValueStoreItTest, ExpiredMemberCanBeReinserted) {
  EXPECT_TRUE(store_->SetAddIfAbsent(Ctx(), "blacklisted_otps", "934368", 1s));
  std::this_thread::sleep_for(1500ms);
  EXPECT_FALSE(store_->SetContains(Ctx(), "blacklisted_otps", "934368"));
  EXPECT_TRUE(store_->SetAddIfAbsent(Ctx(), "blacklisted_otps", "934368", std::nullopt));
  EXPECT_FALSE(store_->SetAddIfAbsent(Ctx(), "blacklisted_otps", "934368", std::nullopt));
}

TEST_F(MariaDbKeyValueStoreItTest, SessionStoreEnumeratesAcrossPages) {
  otpgate::SessionStore sessions(store_, otpgate::SessionConfig{60s, "sess:", 2});
  sessions.Set(Ctx(), "a", "alice");
  sessions.Set(Ctx(), "b", "bob");
  sessions.Set(Ctx(), "c", "carol");
  auto entries = sessions.All(Ctx());
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0], (otpgate::SessionEntry{"a", "alice"}));
  EXPECT_EQ(entries[2], (otpgate::SessionEntry{"c", "carol"}));
}

TEST(MariaDbKeyValueStoreUnavailableTest, UnreachableServerIsStoreUnavailable) {
  auto cfg = TestDbConfig();
  cfg.host = "127.0.0.1";
  cfg.port = 1;
  auto store = std::make_shared<otpgate::MariaDbKeyValueStore>(std::make_shared<otpgate::MariaDbClient>(cfg));
  otpgate::ReplayGuard guard(store, otpgate::ReplayGuardConfig{});
  try {
    guard.TryConsume(Ctx(), "123456");
    FAIL() << "연결 실패는 저장소 오류여야 합니다";
  } catch (const otpgate::OtpException& ex) {
    EXPECT_EQ(ex.kind(), otpgate::ErrorKind::kStoreUnavailable);
    EXPECT_TRUE(ex.retryable());
  }
}

}  // namespace
