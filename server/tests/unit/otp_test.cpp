#include <string>

#include <gtest/gtest.h>

#include "otpgate/errors.hpp"
#include "otpgate/otp.hpp"

namespace {

using otpgate::ErrorKind;
using otpgate::HashAlgorithm;

// base32("The quick brown fox jumps over the lazy dog.")
constexpr const char* kFoxSecret = "KRUGKIDROVUWG2ZAMJZG653OEBTG66BANJ2W24DTEBXXMZLSEB2GQZJANRQXU6JAMRXWOLQ=";
// RFC 4226 / RFC 6238 부록의 ASCII 시드
constexpr const char* kRfcSha1Secret = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ";
constexpr const char* kRfcSha256Secret = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZA====";
constexpr const char* kRfcSha512Secret =
    "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZDGNA=";

constexpr std::int64_t kBaseTime = 1700000000;  // 카운터 56666666, 주기 안 20초 지점

template <typename Fn>
void ExpectOtpError(Fn&& fn, ErrorKind kind) {
  try {
    fn();
    FAIL() << "OtpException이 발생해야 합니다";
  } catch (const otpgate::OtpException& ex) {
    EXPECT_EQ(ex.kind(), kind) << ex.what();
    EXPECT_FALSE(ex.retryable());
  }
}

TEST(HotpTest, ReferenceVectors) {
  EXPECT_EQ(otpgate::GenerateHotp(54324343, 10, kFoxSecret, HashAlgorithm::kSha512), "0582933009");
  EXPECT_EQ(otpgate::GenerateHotp(54324351, 6, kFoxSecret, HashAlgorithm::kSha512), "934368");
  EXPECT_EQ(otpgate::GenerateHotp(54324354, 6, kFoxSecret, HashAlgorithm::kSha256), "181011");
  EXPECT_EQ(otpgate::GenerateHotp(27162206, 10, kFoxSecret, HashAlgorithm::kSha512), "1796746380");
}

TEST(HotpTest, Rfc4226AppendixD) {
  const char* expected[] = {"755224", "287082", "359152", "969429", "338314",
                            "254676", "287922", "162583", "399871", "520489"};
  for (int counter = 0; counter < 10; ++counter) {
    EXPECT_EQ(otpgate::GenerateHotp(counter, 6, kRfcSha1Secret, HashAlgorithm::kSha1), expected[counter])
        << "counter=" << counter;
  }
}

TEST(HotpTest, LeftPadsWithZeroes) {
  auto code = otpgate::GenerateHotp(4, 6, kFoxSecret, HashAlgorithm::kSha1);
  EXPECT_EQ(code, "038604");
  for (int digits = 1; digits <= otpgate::kMaxDigits; ++digits) {
    auto value = otpgate::GenerateHotp(54324343, digits, kFoxSecret, HashAlgorithm::kSha512);
    EXPECT_EQ(value.size(), static_cast<std::size_t>(digits));
    EXPECT_EQ(value.find_first_not_of("0123456789"), std::string::npos);
  }
}

TEST(HotpTest, DeterministicForIdenticalInputs) {
  auto first = otpgate::GenerateHotp(123456, 8, kFoxSecret, HashAlgorithm::kSha256);
  auto second = otpgate::GenerateHotp(123456, 8, kFoxSecret, HashAlgorithm::kSha256);
  EXPECT_EQ(first, second);
}

TEST(HotpTest, NegativeCounterRejectedRegardlessOfOtherInputs) {
  ExpectOtpError([] { otpgate::GenerateHotp(-1, 6, kFoxSecret, HashAlgorithm::kSha512); },
                 ErrorKind::kInvalidCounter);
  ExpectOtpError([] { otpgate::GenerateHotp(-42, 10, "not_base32", HashAlgorithm::kSha1); },
                 ErrorKind::kInvalidCounter);
  ExpectOtpError([] { otpgate::GenerateHotp(-7, 0, kFoxSecret, HashAlgorithm::kSha256); },
                 ErrorKind::kInvalidCounter);
}

TEST(HotpTest, InvalidSecretRejectedRegardlessOfCounterAndDigits) {
  ExpectOtpError([] { otpgate::GenerateHotp(123, 6, "invalid_base32", HashAlgorithm::kSha512); },
                 ErrorKind::kInvalidSecretEncoding);
  ExpectOtpError([] { otpgate::GenerateHotp(0, 42, "invalid_base32", HashAlgorithm::kSha1); },
                 ErrorKind::kInvalidSecretEncoding);
}

TEST(HotpTest, UnsupportedDigitCountRejected) {
  ExpectOtpError([] { otpgate::GenerateHotp(1, 0, kFoxSecret, HashAlgorithm::kSha1); }, ErrorKind::kInvalidDigits);
  ExpectOtpError([] { otpgate::GenerateHotp(1, 11, kFoxSecret, HashAlgorithm::kSha1); }, ErrorKind::kInvalidDigits);
}

TEST(TotpTest, Rfc6238AppendixB) {
  EXPECT_EQ(otpgate::GenerateTotp(kRfcSha1Secret, 30, 59, 8, HashAlgorithm::kSha1), "94287082");
  EXPECT_EQ(otpgate::GenerateTotp(kRfcSha256Secret, 30, 59, 8, HashAlgorithm::kSha256), "46119246");
  EXPECT_EQ(otpgate::GenerateTotp(kRfcSha512Secret, 30, 59, 8, HashAlgorithm::kSha512), "90693936");
  EXPECT_EQ(otpgate::GenerateTotp(kRfcSha1Secret, 30, 1111111109, 8, HashAlgorithm::kSha1), "07081804");
  EXPECT_EQ(otpgate::GenerateTotp(kRfcSha512Secret, 30, 20000000000, 8, HashAlgorithm::kSha512), "47863826");
}

TEST(TotpTest, CounterIsFloorOfTimestampOverPeriod) {
  EXPECT_EQ(otpgate::CounterFromTimestamp(0, 30), 0);
  EXPECT_EQ(otpgate::CounterFromTimestamp(59, 30), 1);
  EXPECT_EQ(otpgate::CounterFromTimestamp(60, 30), 2);
  EXPECT_EQ(otpgate::CounterFromTimestamp(-1, 30), -1);
  EXPECT_EQ(otpgate::CounterFromTimestamp(-30, 30), -1);
  EXPECT_EQ(otpgate::CounterFromTimestamp(-31, 30), -2);
  ExpectOtpError([] { otpgate::CounterFromTimestamp(100, 0); }, ErrorKind::kInvalidPeriod);
}

TEST(TotpTest, NegativeTimestampIsInvalidCounter) {
  ExpectOtpError([] { otpgate::GenerateTotp(kFoxSecret, 30, -5, 6, HashAlgorithm::kSha1); },
                 ErrorKind::kInvalidCounter);
}

TEST(TotpTest, GenerateMatchesHotpAtDerivedCounter) {
  otpgate::TotpOptions options{30, 6, HashAlgorithm::kSha1, 1};
  EXPECT_EQ(otpgate::GenerateTotp(kFoxSecret, kBaseTime, options), "024373");
  EXPECT_EQ(otpgate::GenerateTotp(kFoxSecret, kBaseTime, options),
            otpgate::GenerateHotp(56666666, 6, kFoxSecret, HashAlgorithm::kSha1));
}

TEST(TotpVerifyTest, AcceptsWithinSamePeriodAndAdjacentCounters) {
  auto code = otpgate::GenerateTotp(kFoxSecret, 30, kBaseTime, 6, HashAlgorithm::kSha1);
  EXPECT_TRUE(otpgate::VerifyTotp(code, kFoxSecret, 30, kBaseTime + 5, 6, HashAlgorithm::kSha1, 1));
  EXPECT_TRUE(otpgate::VerifyTotp(code, kFoxSecret, 30, kBaseTime + 30, 6, HashAlgorithm::kSha1, 1));
  EXPECT_TRUE(otpgate::VerifyTotp(code, kFoxSecret, 30, kBaseTime - 30, 6, HashAlgorithm::kSha1, 1));
}

TEST(TotpVerifyTest, RejectsOutsideWindowWithoutError) {
  auto code = otpgate::GenerateTotp(kFoxSecret, 30, kBaseTime, 6, HashAlgorithm::kSha1);
  EXPECT_FALSE(otpgate::VerifyTotp(code, kFoxSecret, 30, kBaseTime + 60, 6, HashAlgorithm::kSha1, 1));
  EXPECT_FALSE(otpgate::VerifyTotp(code, kFoxSecret, 30, kBaseTime - 60, 6, HashAlgorithm::kSha1, 1));
  EXPECT_FALSE(otpgate::VerifyTotp(code, kFoxSecret, 30, kBaseTime + 30, 6, HashAlgorithm::kSha1, 0));
  EXPECT_TRUE(otpgate::VerifyTotp(code, kFoxSecret, 30, kBaseTime + 60, 6, HashAlgorithm::kSha1, 2));
}

TEST(TotpVerifyTest, TrimsCandidateWhitespace) {
  EXPECT_TRUE(otpgate::VerifyTotp(" 024373\t", kFoxSecret, 30, kBaseTime, 6, HashAlgorithm::kSha1, 1));
}

TEST(TotpVerifyTest, WrongCodeIsFalse) {
  EXPECT_FALSE(otpgate::VerifyTotp("000000", kFoxSecret, 30, kBaseTime, 6, HashAlgorithm::kSha1, 1));
  EXPECT_FALSE(otpgate::VerifyTotp("02437a", kFoxSecret, 30, kBaseTime, 6, HashAlgorithm::kSha1, 1));
}

TEST(TotpVerifyTest, LengthMismatchIsError) {
  ExpectOtpError([] { otpgate::VerifyTotp("02437", kFoxSecret, 30, kBaseTime, 6, HashAlgorithm::kSha1, 1); },
                 ErrorKind::kCodeLengthMismatch);
  ExpectOtpError([] { otpgate::VerifyTotp("", kFoxSecret, 30, kBaseTime, 6, HashAlgorithm::kSha1, 1); },
                 ErrorKind::kCodeLengthMismatch);
}

TEST(TotpVerifyTest, GeneratorErrorsAbortScan) {
  ExpectOtpError([] { otpgate::VerifyTotp("024373", "not_base32", 30, kBaseTime, 6, HashAlgorithm::kSha1, 1); },
                 ErrorKind::kInvalidSecretEncoding);
  // 첫 주기에서는 counter - window가 음수이므로 오름차순 스캔의 첫 계산이 실패한다.
  ExpectOtpError([] { otpgate::VerifyTotp("123456", kFoxSecret, 30, 10, 6, HashAlgorithm::kSha1, 1); },
                 ErrorKind::kInvalidCounter);
}

TEST(HashAlgorithmTest, ParsesSupportedNames) {
  EXPECT_EQ(otpgate::ParseHashAlgorithm("SHA1"), HashAlgorithm::kSha1);
  EXPECT_EQ(otpgate::ParseHashAlgorithm("sha-256"), HashAlgorithm::kSha256);
  EXPECT_EQ(otpgate::ParseHashAlgorithm(" Sha512 "), HashAlgorithm::kSha512);
  EXPECT_EQ(otpgate::HashAlgorithmName(HashAlgorithm::kSha256), "SHA256");
}

TEST(HashAlgorithmTest, RejectsUnsupportedNames) {
  ExpectOtpError([] { otpgate::ParseHashAlgorithm("MD5"); }, ErrorKind::kUnsupportedAlgorithm);
  ExpectOtpError([] { otpgate::ParseHashAlgorithm(""); }, ErrorKind::kUnsupportedAlgorithm);
}

}  // namespace
