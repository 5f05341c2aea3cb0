/*
 * 설명: HMAC 동적 절단으로 HOTP 코드를 만들고 TOTP 허용 창 검증을 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/otp_test.cpp
 */
#include "otpgate/otp.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "otpgate/errors.hpp"
#include "otpgate/secret_codec.hpp"

namespace otpgate {
namespace {
constexpr std::array<std::uint64_t, kMaxDigits + 1> kPowersOfTen{
    1ULL,      10ULL,      100ULL,      1000ULL,      10000ULL,      100000ULL,
    1000000ULL, 10000000ULL, 100000000ULL, 1000000000ULL, 10000000000ULL};

const EVP_MD* ToEvp(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::kSha1:
      return EVP_sha1();
    case HashAlgorithm::kSha256:
      return EVP_sha256();
    case HashAlgorithm::kSha512:
      return EVP_sha512();
  }
  return nullptr;
}

void CheckDigits(int digits) {
  if (digits < 1 || digits > kMaxDigits) {
    throw OtpException(ErrorKind::kInvalidDigits,
                       "자릿수는 1~" + std::to_string(kMaxDigits) + " 사이여야 합니다: " + std::to_string(digits));
  }
}

std::string ComputeHotp(std::int64_t counter, int digits, const Bytes& key, HashAlgorithm algorithm) {
  if (counter < 0) {
    throw OtpException(ErrorKind::kInvalidCounter, "카운터는 음수일 수 없습니다: " + std::to_string(counter));
  }
  const EVP_MD* md = ToEvp(algorithm);
  if (!md) {
    throw OtpException(ErrorKind::kHashComputationFailure, "해시 알고리즘을 찾을 수 없습니다");
  }

  std::array<unsigned char, 8> message{};
  auto value = static_cast<std::uint64_t>(counter);
  for (int i = 7; i >= 0; --i) {
    message[static_cast<std::size_t>(i)] = static_cast<unsigned char>(value & 0xFF);
    value >>= 8;
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (!HMAC(md, key.data(), static_cast<int>(key.size()), message.data(), message.size(), digest.data(),
            &digest_len) ||
      digest_len < 20) {
    throw OtpException(ErrorKind::kHashComputationFailure, "HMAC 계산 실패");
  }

  std::size_t offset = digest[digest_len - 1] & 0x0F;
  std::uint32_t binary = (static_cast<std::uint32_t>(digest[offset] & 0x7F) << 24) |
                         (static_cast<std::uint32_t>(digest[offset + 1]) << 16) |
                         (static_cast<std::uint32_t>(digest[offset + 2]) << 8) |
                         static_cast<std::uint32_t>(digest[offset + 3]);
  std::uint64_t code = binary % kPowersOfTen[static_cast<std::size_t>(digits)];

  std::string text = std::to_string(code);
  if (text.size() < static_cast<std::size_t>(digits)) {
    text.insert(0, static_cast<std::size_t>(digits) - text.size(), '0');
  }
  return text;
}
}  // namespace

HashAlgorithm ParseHashAlgorithm(std::string_view name) {
  std::string normalized;
  for (char c : TrimWhitespace(name)) {
    if (c == '-' || c == '_') {
      continue;
    }
    normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  if (normalized == "SHA1") {
    return HashAlgorithm::kSha1;
  }
  if (normalized == "SHA256") {
    return HashAlgorithm::kSha256;
  }
  if (normalized == "SHA512") {
    return HashAlgorithm::kSha512;
  }
  throw OtpException(ErrorKind::kUnsupportedAlgorithm, "지원하지 않는 해시 알고리즘: " + std::string(name));
}

std::string_view HashAlgorithmName(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::kSha1:
      return "SHA1";
    case HashAlgorithm::kSha256:
      return "SHA256";
    case HashAlgorithm::kSha512:
      return "SHA512";
  }
  return "UNKNOWN";
}

std::int64_t CounterFromTimestamp(std::int64_t timestamp, std::int64_t period) {
  if (period <= 0) {
    throw OtpException(ErrorKind::kInvalidPeriod, "주기는 양수여야 합니다: " + std::to_string(period));
  }
  std::int64_t counter = timestamp / period;
  // 음수 타임스탬프는 0으로 잘리지 않고 내림되어 음수 카운터가 된다.
  if (timestamp % period != 0 && timestamp < 0) {
    --counter;
  }
  return counter;
}

std::string GenerateHotp(std::int64_t counter, int digits, std::string_view secret, HashAlgorithm algorithm) {
  if (counter < 0) {
    throw OtpException(ErrorKind::kInvalidCounter, "카운터는 음수일 수 없습니다: " + std::to_string(counter));
  }
  Bytes key = DecodeBase32(secret);
  CheckDigits(digits);
  return ComputeHotp(counter, digits, key, algorithm);
}

std::string GenerateTotp(std::string_view secret, std::int64_t period, std::int64_t timestamp, int digits,
                         HashAlgorithm algorithm) {
  return GenerateHotp(CounterFromTimestamp(timestamp, period), digits, secret, algorithm);
}

std::string GenerateTotp(std::string_view secret, std::int64_t timestamp, const TotpOptions& options) {
  return GenerateTotp(secret, options.period, timestamp, options.digits, options.algorithm);
}

bool VerifyTotp(std::string_view candidate, std::string_view secret, std::int64_t period, std::int64_t timestamp,
                int digits, HashAlgorithm algorithm, std::int64_t window) {
  CheckDigits(digits);
  if (window < 0) {
    throw OtpException(ErrorKind::kInvalidArgument, "허용 창은 음수일 수 없습니다: " + std::to_string(window));
  }
  auto passcode = TrimWhitespace(candidate);
  if (passcode.size() != static_cast<std::size_t>(digits)) {
    throw OtpException(ErrorKind::kCodeLengthMismatch, "코드 길이가 자릿수와 다릅니다: " +
                                                           std::to_string(passcode.size()) + " != " +
                                                           std::to_string(digits));
  }

  std::int64_t counter = CounterFromTimestamp(timestamp, period);
  Bytes key = DecodeBase32(secret);

  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  std::int64_t first = counter < kMin + window ? kMin : counter - window;
  std::int64_t last = counter > kMax - window ? kMax : counter + window;
  for (std::int64_t i = first;; ++i) {
    auto expected = ComputeHotp(i, digits, key, algorithm);
    if (CRYPTO_memcmp(expected.data(), passcode.data(), expected.size()) == 0) {
      return true;
    }
    if (i == last) {
      break;
    }
  }
  return false;
}

bool VerifyTotp(std::string_view candidate, std::string_view secret, std::int64_t timestamp,
                const TotpOptions& options) {
  return VerifyTotp(candidate, secret, options.period, timestamp, options.digits, options.algorithm,
                    options.window);
}

}  // namespace otpgate
