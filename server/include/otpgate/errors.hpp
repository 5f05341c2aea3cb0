/*
 * 설명: 코어 오류 종류와 재시도 가능 여부를 담는 예외 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/otp_test.cpp, server/tests/unit/replay_guard_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace otpgate {

enum class ErrorKind {
  kInvalidSecretEncoding,
  kInvalidCounter,
  kInvalidDigits,
  kInvalidPeriod,
  kInvalidArgument,
  kCodeLengthMismatch,
  kUnsupportedAlgorithm,
  kHashComputationFailure,
  kStoreUnavailable,
  kRandomSourceFailure,
};

std::string_view ErrorKindName(ErrorKind kind);

// 입력 형태 오류는 재시도하지 않는다. 저장소 오류만 호출자가 재시도할 수 있다.
bool IsRetryable(ErrorKind kind);

class OtpException : public std::runtime_error {
 public:
  OtpException(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind), retryable_(IsRetryable(kind)) {}

  ErrorKind kind() const { return kind_; }
  bool retryable() const { return retryable_; }

 private:
  ErrorKind kind_;
  bool retryable_;
};

}  // namespace otpgate
