/*
 * 설명: 오류 종류의 이름과 재시도 정책을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "otpgate/errors.hpp"

namespace otpgate {

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidSecretEncoding:
      return "invalid_secret_encoding";
    case ErrorKind::kInvalidCounter:
      return "invalid_counter";
    case ErrorKind::kInvalidDigits:
      return "invalid_digits";
    case ErrorKind::kInvalidPeriod:
      return "invalid_period";
    case ErrorKind::kInvalidArgument:
      return "invalid_argument";
    case ErrorKind::kCodeLengthMismatch:
      return "code_length_mismatch";
    case ErrorKind::kUnsupportedAlgorithm:
      return "unsupported_algorithm";
    case ErrorKind::kHashComputationFailure:
      return "hash_computation_failure";
    case ErrorKind::kStoreUnavailable:
      return "store_unavailable";
    case ErrorKind::kRandomSourceFailure:
      return "random_source_failure";
  }
  return "unknown";
}

bool IsRetryable(ErrorKind kind) { return kind == ErrorKind::kStoreUnavailable; }

}  // namespace otpgate
