/*
 * 설명: TOTP 발급, 창 검증, 원자적 소비, 세션 발급 순서를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/otp_auth_service_test.cpp
 */
#include "otpgate/otp_auth_service.hpp"

#include <algorithm>
#include <cctype>

#include "otpgate/errors.hpp"
#include "otpgate/secret_codec.hpp"

namespace otpgate {
namespace {
constexpr const char* kUnknownPrincipalSecret = "AAAAAAAA";

// 소비 기록은 주체별로 나눈다. 같은 숫자열이 다른 주체의 코드로 쓰일 수 있다.
std::string ConsumedMember(const std::string& principal, const std::string& passcode) {
  return principal + ":" + passcode;
}

bool AllDigits(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}
}  // namespace

OtpAuthService::OtpAuthService(OtpAuthConfig config, std::shared_ptr<SecretRegistry> secrets,
                               std::shared_ptr<ReplayGuard> replay_guard, std::shared_ptr<SessionStore> sessions,
                               std::shared_ptr<Observability> observability, Clock clock)
    : config_(config), secrets_(std::move(secrets)), replay_guard_(std::move(replay_guard)),
      sessions_(std::move(sessions)), observability_(std::move(observability)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

std::int64_t OtpAuthService::NowSeconds() const {
  return std::chrono::duration_cast<std::chrono::seconds>(clock_().time_since_epoch()).count();
}

IssuedCode OtpAuthService::IssueCode(const RequestContext& ctx, const std::string& principal) {
  auto secret = secrets_->Find(principal);
  const auto& totp = config_.totp;
  auto now = NowSeconds();
  IssuedCode issued;
  issued.principal = principal;
  issued.registered = secret.has_value();
  // 등록 여부와 무관하게 같은 HMAC 계산을 거친다.
  issued.code = GenerateTotp(secret ? *secret : std::string(kUnknownPrincipalSecret), now, totp);
  issued.issued_at = now;
  issued.valid_until = (CounterFromTimestamp(now, totp.period) + totp.window + 1) * totp.period;
  if (observability_) {
    if (issued.registered) {
      observability_->RecordCodeIssued();
    }
    observability_->Log(LogContext{ctx.trace_id, issued.registered ? "otp.issued" : "otp.issue_unknown",
                                   LogLevel::kInfo, 0, principal, std::nullopt, std::nullopt, std::nullopt});
  }
  return issued;
}

VerificationResult OtpAuthService::Verify(const RequestContext& ctx, const std::string& principal,
                                          const std::string& candidate) {
  const auto& totp = config_.totp;
  auto passcode = std::string(TrimWhitespace(candidate));
  if (!AllDigits(passcode)) {
    return Finish(ctx, principal, VerifyOutcome::kMalformed);
  }

  auto secret = secrets_->Find(principal);
  bool matched = false;
  try {
    // 알 수 없는 주체도 길이 검사는 똑같이 거친다.
    matched = VerifyTotp(passcode, secret ? *secret : std::string(kUnknownPrincipalSecret), totp.period, NowSeconds(),
                         totp.digits, totp.algorithm, totp.window) &&
              secret.has_value();
  } catch (const OtpException& ex) {
    if (ex.kind() != ErrorKind::kCodeLengthMismatch) {
      throw;
    }
    return Finish(ctx, principal, VerifyOutcome::kMalformed);
  }
  if (!matched) {
    return Finish(ctx, principal, VerifyOutcome::kMismatch);
  }

  try {
    if (!replay_guard_->TryConsume(ctx, ConsumedMember(principal, passcode))) {
      return Finish(ctx, principal, VerifyOutcome::kReplayed);
    }
    auto session_id = SessionStore::GenerateSessionId(config_.session_id_bytes);
    sessions_->Set(ctx, session_id, principal);
    return Finish(ctx, principal, VerifyOutcome::kAccepted, session_id);
  } catch (const OtpException& ex) {
    if (observability_) {
      if (ex.kind() == ErrorKind::kStoreUnavailable) {
        observability_->RecordStoreFailure();
      }
      observability_->Log(LogContext{ctx.trace_id, "otp.verify_failed", LogLevel::kError, 0, principal,
                                     std::string(ErrorKindName(ex.kind())), std::nullopt, std::string(ex.what())});
    }
    throw;
  }
}

VerificationResult OtpAuthService::Finish(const RequestContext& ctx, const std::string& principal,
                                          VerifyOutcome outcome, std::optional<std::string> session_id) {
  if (observability_) {
    observability_->RecordVerifyOutcome(outcome);
    // 시간상 유효한 코드의 재사용은 공격 신호로 본다.
    LogLevel level = outcome == VerifyOutcome::kReplayed ? LogLevel::kWarn : LogLevel::kInfo;
    observability_->Log(LogContext{ctx.trace_id, "otp.verify", level, 0, principal,
                                   std::string(VerifyOutcomeName(outcome)), std::nullopt, std::nullopt});
  }
  return VerificationResult{outcome, std::move(session_id)};
}

std::optional<std::string> OtpAuthService::Authenticate(const RequestContext& ctx, const std::string& session_id) {
  if (session_id.empty()) {
    return std::nullopt;
  }
  return sessions_->Get(ctx, session_id);
}

std::vector<SessionEntry> OtpAuthService::ListSessions(const RequestContext& ctx) { return sessions_->All(ctx); }

}  // namespace otpgate
