/*
 * 설명: 환경변수에서 설정을 읽고 시작 전에 조합을 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "otpgate/config.hpp"

#include <cctype>
#include <cstdlib>
#include <stdexcept>

#include "otpgate/errors.hpp"
#include "otpgate/secret_registry.hpp"

namespace otpgate {
namespace {
std::int64_t ParseInteger(const char* key, const std::string& value) {
  try {
    std::size_t idx = 0;
    auto parsed = std::stoll(value, &idx);
    if (idx != value.size()) {
      throw std::invalid_argument("trailing");
    }
    return parsed;
  } catch (const std::exception&) {
    throw OtpException(ErrorKind::kInvalidArgument, std::string(key) + " 값이 정수가 아닙니다: " + value);
  }
}

std::size_t ParseUnsigned(const char* key, const std::string& value) {
  auto parsed = ParseInteger(key, value);
  if (parsed < 0) {
    throw OtpException(ErrorKind::kInvalidArgument, std::string(key) + " 값은 음수일 수 없습니다: " + value);
  }
  return static_cast<std::size_t>(parsed);
}

bool ParseBool(const std::string& value) {
  std::string lowered;
  for (char c : value) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  return LoadConfig([](const char* key) { return std::getenv(key); });
}

AppConfig LoadConfig(const EnvLookup& lookup) {
  auto get_env = [&](const char* key, const char* def) -> std::string {
    const char* val = lookup(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  auto port = ParseUnsigned("SERVER_PORT", get_env("SERVER_PORT", "8080"));
  auto db_port = ParseUnsigned("DB_PORT", get_env("DB_PORT", "3306"));
  if (port > 65535 || db_port > 65535) {
    throw OtpException(ErrorKind::kInvalidArgument, "포트 범위를 벗어났습니다");
  }
  cfg.port = static_cast<unsigned short>(port);
  cfg.store_backend = get_env("STORE_BACKEND", "memory");
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(db_port);
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.otp_period_seconds = ParseInteger("OTP_PERIOD_SECONDS", get_env("OTP_PERIOD_SECONDS", "30"));
  cfg.otp_digits = static_cast<int>(ParseInteger("OTP_DIGITS", get_env("OTP_DIGITS", "10")));
  cfg.otp_algorithm = ParseHashAlgorithm(get_env("OTP_ALGORITHM", "SHA512"));
  cfg.otp_window = ParseInteger("OTP_WINDOW", get_env("OTP_WINDOW", "1"));
  cfg.otp_replay_ttl_seconds = ParseInteger("OTP_REPLAY_TTL_SECONDS", get_env("OTP_REPLAY_TTL_SECONDS", "-1"));
  cfg.otp_secrets = get_env("OTP_SECRETS", "");
  cfg.otp_expose_codes = ParseBool(get_env("OTP_EXPOSE_CODES", "false"));
  cfg.session_ttl_seconds = ParseUnsigned("SESSION_TTL_SECONDS", get_env("SESSION_TTL_SECONDS", "900"));
  cfg.session_id_bytes = ParseUnsigned("SESSION_ID_BYTES", get_env("SESSION_ID_BYTES", "32"));
  cfg.session_scan_page_size = ParseUnsigned("SESSION_SCAN_PAGE_SIZE", get_env("SESSION_SCAN_PAGE_SIZE", "10"));
  cfg.request_timeout_ms = ParseUnsigned("REQUEST_TIMEOUT_MS", get_env("REQUEST_TIMEOUT_MS", "2000"));
  ValidateConfig(cfg);
  return cfg;
}

void ValidateConfig(const AppConfig& config) {
  if (config.store_backend != "memory" && config.store_backend != "mariadb") {
    throw OtpException(ErrorKind::kInvalidArgument, "STORE_BACKEND는 memory 또는 mariadb여야 합니다");
  }
  if (config.otp_period_seconds <= 0) {
    throw OtpException(ErrorKind::kInvalidPeriod, "OTP_PERIOD_SECONDS는 양수여야 합니다");
  }
  if (config.otp_digits < 1 || config.otp_digits > kMaxDigits) {
    throw OtpException(ErrorKind::kInvalidDigits, "OTP_DIGITS는 1~10 사이여야 합니다");
  }
  if (config.otp_window < 0) {
    throw OtpException(ErrorKind::kInvalidArgument, "OTP_WINDOW는 음수일 수 없습니다");
  }
  if (config.session_ttl_seconds == 0 || config.session_id_bytes == 0 || config.session_scan_page_size == 0) {
    throw OtpException(ErrorKind::kInvalidArgument, "세션 설정 값은 1 이상이어야 합니다");
  }
  if (config.request_timeout_ms == 0) {
    throw OtpException(ErrorKind::kInvalidArgument, "REQUEST_TIMEOUT_MS는 1 이상이어야 합니다");
  }
  SecretRegistry::Parse(config.otp_secrets);
}

TotpOptions ToTotpOptions(const AppConfig& config) {
  return TotpOptions{config.otp_period_seconds, config.otp_digits, config.otp_algorithm, config.otp_window};
}

OtpAuthConfig ToOtpAuthConfig(const AppConfig& config) {
  OtpAuthConfig auth_config;
  auth_config.totp = ToTotpOptions(config);
  auth_config.session_id_bytes = config.session_id_bytes;
  return auth_config;
}

ReplayGuardConfig ToReplayGuardConfig(const AppConfig& config) {
  ReplayGuardConfig guard_config;
  if (config.otp_replay_ttl_seconds < 0) {
    guard_config.entry_ttl = DefaultReplayTtl(ToTotpOptions(config));
  } else if (config.otp_replay_ttl_seconds > 0) {
    guard_config.entry_ttl = std::chrono::seconds(config.otp_replay_ttl_seconds);
  }
  return guard_config;
}

SessionConfig ToSessionConfig(const AppConfig& config) {
  SessionConfig session_config;
  session_config.ttl = std::chrono::seconds(config.session_ttl_seconds);
  session_config.scan_page_size = config.session_scan_page_size;
  return session_config;
}

}  // namespace otpgate
