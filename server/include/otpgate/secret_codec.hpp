/*
 * 설명: 공유 비밀의 base32 표기와 세션 토큰용 base64url 표기를 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/secret_codec_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace otpgate {

using Bytes = std::vector<std::uint8_t>;

// RFC 4648 표준 알파벳. 대소문자를 구분하지 않고 앞뒤 공백은 무시한다.
// 패딩('=')은 생략할 수 있지만 쓰였다면 길이와 개수가 맞아야 한다.
// 형식이 잘못되었거나 비어 있으면 kInvalidSecretEncoding을 던진다.
Bytes DecodeBase32(std::string_view text);

std::string EncodeBase32(const Bytes& data);

std::string EncodeBase64(const Bytes& data);

// 패딩 없는 URL-safe base64 (RFC 4648 §5).
std::string EncodeBase64Url(const Bytes& data);

// 표준 알파벳 base64. Authorization: Basic 헤더 해석용이며 잘못된 입력은 nullopt.
std::optional<std::string> DecodeBase64(std::string_view text);

std::string_view TrimWhitespace(std::string_view text);

}  // namespace otpgate
