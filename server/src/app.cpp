/*
 * 설명: 서버 수명주기와 리스닝 스레드, 만료 정리 타이머를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "otpgate/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>

#include "otpgate/db_client.hpp"
#include "otpgate/errors.hpp"
#include "otpgate/http_session.hpp"
#include "otpgate/memory_kv_store.hpp"
#include "otpgate/replay_guard.hpp"
#include "otpgate/secret_registry.hpp"
#include "otpgate/session_store.hpp"

namespace otpgate {

namespace {
constexpr auto kPurgeInterval = std::chrono::seconds(60);
}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<ApiHandler> handler, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), handler_(std::move(handler)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->handler_, self->observability_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<ApiHandler> handler_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)),
      strand_(boost::asio::make_strand(ioc_)), signals_(strand_, SIGINT, SIGTERM), purge_timer_(strand_) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level), std::cout);
  if (config.store_backend == "mariadb") {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    mariadb_store_ = std::make_shared<MariaDbKeyValueStore>(std::make_shared<MariaDbClient>(db_config));
    store_ = mariadb_store_;
  } else {
    store_ = std::make_shared<InMemoryKeyValueStore>();
  }

  auto secrets = std::make_shared<SecretRegistry>(SecretRegistry::Parse(config.otp_secrets));
  auto replay_guard = std::make_shared<ReplayGuard>(store_, ToReplayGuardConfig(config));
  auto sessions = std::make_shared<SessionStore>(store_, ToSessionConfig(config));
  auth_service_ = std::make_shared<OtpAuthService>(ToOtpAuthConfig(config), secrets, replay_guard, sessions,
                                                   observability_);
  handler_ = std::make_shared<ApiHandler>(config, auth_service_, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, handler_, observability_);
    listener_->Run();
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->Log(LogContext{"", "server.signal", LogLevel::kInfo, 0, std::nullopt, std::nullopt,
                                     std::nullopt, "signal " + std::to_string(signal_number) + " 수신, 종료합니다"});
      work_guard_.reset();
      if (listener_) {
        listener_->Stop();
      }
      purge_timer_.cancel();
      ioc_.stop();
    });
    if (mariadb_store_) {
      boost::asio::post(strand_, [this] { SchedulePurge(); });
    }
    observability_->Log(LogContext{"", "server.start", LogLevel::kInfo, 0, std::nullopt, std::nullopt, std::nullopt,
                                   "포트 " + std::to_string(config_.port) + ", 저장소 " + config_.store_backend});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{"", "server.error", LogLevel::kError, 0, std::nullopt, std::nullopt,
                                   std::nullopt, std::string("서버 실행 중 예외: ") + ex.what()});
    throw;
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::SchedulePurge() {
  purge_timer_.expires_after(kPurgeInterval);
  purge_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    auto ctx = RequestContext::WithTimeout(observability_->NextTraceId(),
                                           std::chrono::milliseconds(config_.request_timeout_ms));
    try {
      auto removed = mariadb_store_->PurgeExpired(ctx);
      observability_->Log(LogContext{ctx.trace_id, "store.purge", LogLevel::kDebug, 0, std::nullopt, std::nullopt,
                                     std::nullopt, "removed " + std::to_string(removed)});
    } catch (const OtpException& ex) {
      observability_->RecordStoreFailure();
      observability_->Log(LogContext{ctx.trace_id, "store.purge", LogLevel::kWarn, 0, std::nullopt,
                                     std::string(ErrorKindName(ex.kind())), std::nullopt, std::string(ex.what())});
    }
    SchedulePurge();
  });
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

}  // namespace otpgate
