#include <gtest/gtest.h>

#include "otpgate/errors.hpp"
#include "otpgate/secret_registry.hpp"

namespace {

TEST(SecretRegistryTest, ParsesCommaSeparatedPairs) {
  auto registry = otpgate::SecretRegistry::Parse(
      "alice=MFWGSY3FFVZWKY3SMV2C223FPE======, bob = MJXWELLTMVRXEZLUFVVWK6JBEE======,");
  EXPECT_EQ(registry.Size(), 2u);
  EXPECT_EQ(registry.Find("alice"), std::optional<std::string>("MFWGSY3FFVZWKY3SMV2C223FPE======"));
  EXPECT_EQ(registry.Find("bob"), std::optional<std::string>("MJXWELLTMVRXEZLUFVVWK6JBEE======"));
  EXPECT_FALSE(registry.Find("carol").has_value());
}

TEST(SecretRegistryTest, EmptyTextGivesEmptyRegistry) {
  EXPECT_EQ(otpgate::SecretRegistry::Parse("").Size(), 0u);
  EXPECT_EQ(otpgate::SecretRegistry::Parse(" , ").Size(), 0u);
}

TEST(SecretRegistryTest, RejectsMalformedItems) {
  try {
    otpgate::SecretRegistry::Parse("alice");
    FAIL() << "'=' 없는 항목은 거부되어야 합니다";
  } catch (const otpgate::OtpException& ex) {
    EXPECT_EQ(ex.kind(), otpgate::ErrorKind::kInvalidArgument);
  }
  try {
    otpgate::SecretRegistry::Parse("=MZXW6===");
    FAIL() << "주체 없는 항목은 거부되어야 합니다";
  } catch (const otpgate::OtpException& ex) {
    EXPECT_EQ(ex.kind(), otpgate::ErrorKind::kInvalidArgument);
  }
}

TEST(SecretRegistryTest, RejectsUndecodableSecretsAtLoad) {
  try {
    otpgate::SecretRegistry::Parse("alice=not_base32");
    FAIL() << "잘못된 비밀은 시작 시 거부되어야 합니다";
  } catch (const otpgate::OtpException& ex) {
    EXPECT_EQ(ex.kind(), otpgate::ErrorKind::kInvalidSecretEncoding);
  }
}

TEST(SecretRegistryTest, AddReplacesExistingSecret) {
  otpgate::SecretRegistry registry;
  registry.Add("alice", "MZXW6===");
  registry.Add("alice", "MZXW6YTB");
  EXPECT_EQ(registry.Size(), 1u);
  EXPECT_EQ(registry.Find("alice"), std::optional<std::string>("MZXW6YTB"));
  EXPECT_THROW(registry.Add("", "MZXW6==="), otpgate::OtpException);
}

}  // namespace
