/*
 * 설명: 주체별 base32 공유 비밀을 설정에서 읽어 보관한다. 시작 시 한 번 채우고 이후 읽기만 한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/secret_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace otpgate {

class SecretRegistry {
 public:
  // "alice=JBSWY3DP,bob=KRUGK===" 형식. 잘못된 항목은 kInvalidArgument,
  // 디코딩할 수 없는 비밀은 kInvalidSecretEncoding.
  static SecretRegistry Parse(std::string_view text);

  void Add(const std::string& principal, const std::string& secret);
  std::optional<std::string> Find(const std::string& principal) const;
  std::size_t Size() const { return secrets_.size(); }

 private:
  std::unordered_map<std::string, std::string> secrets_;
};

}  // namespace otpgate
