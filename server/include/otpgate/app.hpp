/*
 * 설명: 저장소 백엔드 선택부터 리스너, 워커 스레드, 종료 신호까지 서버 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "otpgate/api_handler.hpp"
#include "otpgate/config.hpp"
#include "otpgate/kv_store.hpp"
#include "otpgate/mariadb_kv_store.hpp"
#include "otpgate/observability.hpp"
#include "otpgate/otp_auth_service.hpp"

namespace otpgate {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<OtpAuthService> GetAuthService() { return auth_service_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void SchedulePurge();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  // 종료 신호와 정리 타이머 핸들러는 이 strand에서만 실행된다.
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::signal_set signals_;
  boost::asio::steady_timer purge_timer_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<KeyValueStore> store_;
  std::shared_ptr<MariaDbKeyValueStore> mariadb_store_;
  std::shared_ptr<OtpAuthService> auth_service_;
  std::shared_ptr<ApiHandler> handler_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace otpgate
