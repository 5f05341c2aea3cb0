/*
 * 설명: HOTP(RFC 4226) 코드 생성과 TOTP(RFC 6238) 생성/허용 창 검증을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/otp_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace otpgate {

// 지원하는 HMAC 계열은 닫힌 집합이다. 설정 단계에서 이름을 해석해 고정한다.
enum class HashAlgorithm {
  kSha1,
  kSha256,
  kSha512,
};

// "SHA1", "sha-256", "SHA512" 등을 받는다. 그 외는 kUnsupportedAlgorithm.
HashAlgorithm ParseHashAlgorithm(std::string_view name);
std::string_view HashAlgorithmName(HashAlgorithm algorithm);

// 31비트 절단 값이 항상 표현되는 최대 자릿수.
constexpr int kMaxDigits = 10;

struct TotpOptions {
  std::int64_t period{30};
  int digits{6};
  HashAlgorithm algorithm{HashAlgorithm::kSha1};
  std::int64_t window{1};
};

// floor(timestamp / period). period <= 0이면 kInvalidPeriod.
std::int64_t CounterFromTimestamp(std::int64_t timestamp, std::int64_t period);

// 음수 카운터는 kInvalidCounter, 잘못된 base32는 kInvalidSecretEncoding,
// 1..kMaxDigits 밖의 자릿수는 kInvalidDigits.
std::string GenerateHotp(std::int64_t counter, int digits, std::string_view secret, HashAlgorithm algorithm);

std::string GenerateTotp(std::string_view secret, std::int64_t period, std::int64_t timestamp, int digits,
                         HashAlgorithm algorithm);
std::string GenerateTotp(std::string_view secret, std::int64_t timestamp, const TotpOptions& options);

// counter - window부터 counter + window까지 오름차순으로 비교하며 첫 일치에서 true.
// 후보 길이가 digits와 다르면 kCodeLengthMismatch. 생성 단계 오류는 즉시 전파된다.
bool VerifyTotp(std::string_view candidate, std::string_view secret, std::int64_t period, std::int64_t timestamp,
                int digits, HashAlgorithm algorithm, std::int64_t window);
bool VerifyTotp(std::string_view candidate, std::string_view secret, std::int64_t timestamp,
                const TotpOptions& options);

}  // namespace otpgate
