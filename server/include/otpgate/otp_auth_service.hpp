/*
 * 설명: TOTP 발급과 2단계 검증 흐름(창 검증, 재사용 차단, 세션 발급)을 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/otp_auth_service_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "otpgate/observability.hpp"
#include "otpgate/otp.hpp"
#include "otpgate/replay_guard.hpp"
#include "otpgate/secret_registry.hpp"
#include "otpgate/session_store.hpp"
#include "otpgate/verify_outcome.hpp"

namespace otpgate {

struct OtpAuthConfig {
  TotpOptions totp{30, 10, HashAlgorithm::kSha512, 1};
  std::size_t session_id_bytes{32};
};

struct IssuedCode {
  std::string principal;
  std::string code;
  // false면 code는 고정 더미 비밀로 만든 값이라 어떤 검증도 통과하지 못한다.
  bool registered;
  std::int64_t issued_at;
  // 이 시각 이후로는 어떤 허용 창으로도 받아들여지지 않는다.
  std::int64_t valid_until;
};

struct VerificationResult {
  VerifyOutcome outcome;
  std::optional<std::string> session_id;

  bool valid() const { return outcome == VerifyOutcome::kAccepted; }
};

class OtpAuthService {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  OtpAuthService(OtpAuthConfig config, std::shared_ptr<SecretRegistry> secrets,
                 std::shared_ptr<ReplayGuard> replay_guard, std::shared_ptr<SessionStore> sessions,
                 std::shared_ptr<Observability> observability, Clock clock = {});

  // 등록되지 않은 주체에도 같은 모양의 결과를 돌려준다. 코드 전달 경로는 호출자가 정한다.
  IssuedCode IssueCode(const RequestContext& ctx, const std::string& principal);

  // 입력 오류는 kMalformed로 돌려준다. 저장소/난수 실패는 OtpException으로 전파한다.
  // 코드를 소비한 뒤 세션 발급이 실패하면 그 코드는 다시 쓸 수 없다.
  VerificationResult Verify(const RequestContext& ctx, const std::string& principal, const std::string& candidate);

  std::optional<std::string> Authenticate(const RequestContext& ctx, const std::string& session_id);
  std::vector<SessionEntry> ListSessions(const RequestContext& ctx);

  const OtpAuthConfig& GetConfig() const { return config_; }

 private:
  std::int64_t NowSeconds() const;
  VerificationResult Finish(const RequestContext& ctx, const std::string& principal, VerifyOutcome outcome,
                            std::optional<std::string> session_id = std::nullopt);

  OtpAuthConfig config_;
  std::shared_ptr<SecretRegistry> secrets_;
  std::shared_ptr<ReplayGuard> replay_guard_;
  std::shared_ptr<SessionStore> sessions_;
  std::shared_ptr<Observability> observability_;
  Clock clock_;
};

}  // namespace otpgate
