/*
 * 설명: 주체-비밀 목록을 해석하고 비밀 형식을 미리 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/secret_registry_test.cpp
 */
#include "otpgate/secret_registry.hpp"

#include "otpgate/errors.hpp"
#include "otpgate/secret_codec.hpp"

namespace otpgate {

SecretRegistry SecretRegistry::Parse(std::string_view text) {
  SecretRegistry registry;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    auto comma = text.find(',', pos);
    auto item = TrimWhitespace(text.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos));
    if (!item.empty()) {
      auto eq = item.find('=');
      if (eq == std::string_view::npos || eq == 0) {
        throw OtpException(ErrorKind::kInvalidArgument, "비밀 항목은 principal=secret 형식이어야 합니다");
      }
      registry.Add(std::string(TrimWhitespace(item.substr(0, eq))), std::string(item.substr(eq + 1)));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    pos = comma + 1;
  }
  return registry;
}

void SecretRegistry::Add(const std::string& principal, const std::string& secret) {
  if (principal.empty()) {
    throw OtpException(ErrorKind::kInvalidArgument, "주체 ID가 비어 있습니다");
  }
  DecodeBase32(secret);
  secrets_[principal] = std::string(TrimWhitespace(secret));
}

std::optional<std::string> SecretRegistry::Find(const std::string& principal) const {
  auto it = secrets_.find(principal);
  if (it == secrets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace otpgate
