/*
 * 설명: 검증 흐름이 경계 계층에 구분해 알려야 하는 네 가지 결과를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <string_view>

namespace otpgate {

enum class VerifyOutcome {
  kMalformed,  // 길이 또는 형식 오류
  kMismatch,   // 허용 창 안의 어떤 카운터와도 불일치 (틀렸거나 만료)
  kReplayed,   // 시간상 유효하지만 이미 소비됨
  kAccepted,
};

inline std::string_view VerifyOutcomeName(VerifyOutcome outcome) {
  switch (outcome) {
    case VerifyOutcome::kMalformed:
      return "malformed";
    case VerifyOutcome::kMismatch:
      return "mismatch";
    case VerifyOutcome::kReplayed:
      return "replayed";
    case VerifyOutcome::kAccepted:
      return "accepted";
  }
  return "unknown";
}

}  // namespace otpgate
