/*
 * 설명: 서버 환경설정 로딩, 기본값, 시작 시점 검증을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "otpgate/otp.hpp"
#include "otpgate/otp_auth_service.hpp"
#include "otpgate/replay_guard.hpp"
#include "otpgate/session_store.hpp"

namespace otpgate {

struct AppConfig {
  unsigned short port;
  std::string store_backend;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::int64_t otp_period_seconds;
  int otp_digits;
  HashAlgorithm otp_algorithm;
  std::int64_t otp_window;
  // 음수면 주기와 허용 창에서 유도한다. 0이면 만료 없음.
  std::int64_t otp_replay_ttl_seconds;
  std::string otp_secrets;
  bool otp_expose_codes;
  std::size_t session_ttl_seconds;
  std::size_t session_id_bytes;
  std::size_t session_scan_page_size;
  std::size_t request_timeout_ms;
};

using EnvLookup = std::function<const char*(const char*)>;

// 잘못된 숫자나 지원하지 않는 알고리즘은 OtpException으로 시작을 중단시킨다.
AppConfig LoadConfigFromEnv();
AppConfig LoadConfig(const EnvLookup& lookup);
void ValidateConfig(const AppConfig& config);

TotpOptions ToTotpOptions(const AppConfig& config);
OtpAuthConfig ToOtpAuthConfig(const AppConfig& config);
ReplayGuardConfig ToReplayGuardConfig(const AppConfig& config);
SessionConfig ToSessionConfig(const AppConfig& config);

}  // namespace otpgate
