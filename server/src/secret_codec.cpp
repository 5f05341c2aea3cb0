/*
 * 설명: base32 디코딩/인코딩과 base64url 인코딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/secret_codec_test.cpp
 */
#include "otpgate/secret_codec.hpp"

#include <vector>

#include <openssl/evp.h>

#include "otpgate/errors.hpp"

namespace otpgate {
namespace {
constexpr char kBase32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

int Base32Value(char c) {
  if (c >= 'a' && c <= 'z') {
    return c - 'a';
  }
  if (c >= 'A' && c <= 'Z') {
    return c - 'A';
  }
  if (c >= '2' && c <= '7') {
    return c - '2' + 26;
  }
  return -1;
}

bool IsWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[noreturn]] void RaiseInvalid(const std::string& reason) {
  throw OtpException(ErrorKind::kInvalidSecretEncoding, "base32 비밀 형식 오류: " + reason);
}
}  // namespace

std::string_view TrimWhitespace(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && IsWhitespace(text[begin])) {
    ++begin;
  }
  while (end > begin && IsWhitespace(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

Bytes DecodeBase32(std::string_view text) {
  auto trimmed = TrimWhitespace(text);
  if (trimmed.empty()) {
    RaiseInvalid("비어 있음");
  }

  std::size_t data_len = trimmed.size();
  while (data_len > 0 && trimmed[data_len - 1] == '=') {
    --data_len;
  }
  std::size_t padding = trimmed.size() - data_len;
  if (padding > 0 && trimmed.size() % 8 != 0) {
    RaiseInvalid("패딩 길이가 8의 배수가 아님");
  }
  if (data_len == 0) {
    RaiseInvalid("데이터 없음");
  }
  // 마지막 블록에 남을 수 있는 문자 수는 2, 4, 5, 7뿐이다.
  switch (data_len % 8) {
    case 1:
    case 3:
    case 6:
      RaiseInvalid("잘못된 블록 길이");
    default:
      break;
  }

  Bytes out;
  out.reserve(data_len * 5 / 8);
  std::uint32_t buffer = 0;
  int bits = 0;
  for (std::size_t i = 0; i < data_len; ++i) {
    int value = Base32Value(trimmed[i]);
    if (value < 0) {
      RaiseInvalid("허용되지 않는 문자 위치 " + std::to_string(i));
    }
    buffer = (buffer << 5) | static_cast<std::uint32_t>(value);
    bits += 5;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFF));
    }
  }
  return out;
}

std::string EncodeBase32(const Bytes& data) {
  std::string out;
  out.reserve((data.size() + 4) / 5 * 8);
  std::uint32_t buffer = 0;
  int bits = 0;
  for (std::uint8_t byte : data) {
    buffer = (buffer << 8) | byte;
    bits += 8;
    while (bits >= 5) {
      bits -= 5;
      out.push_back(kBase32Alphabet[(buffer >> bits) & 0x1F]);
    }
  }
  if (bits > 0) {
    out.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1F]);
  }
  while (out.size() % 8 != 0) {
    out.push_back('=');
  }
  return out;
}

std::string EncodeBase64(const Bytes& data) {
  if (data.empty()) {
    return {};
  }
  std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
  int written = EVP_EncodeBlock(out.data(), data.data(), static_cast<int>(data.size()));
  return std::string(out.begin(), out.begin() + written);
}

std::string EncodeBase64Url(const Bytes& data) {
  std::string out = EncodeBase64(data);
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  for (auto& c : out) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return out;
}

std::optional<std::string> DecodeBase64(std::string_view text) {
  auto trimmed = TrimWhitespace(text);
  if (trimmed.empty() || trimmed.size() % 4 != 0) {
    return std::nullopt;
  }
  std::vector<unsigned char> in(trimmed.begin(), trimmed.end());
  std::vector<unsigned char> out(in.size() / 4 * 3);
  int written = EVP_DecodeBlock(out.data(), in.data(), static_cast<int>(in.size()));
  if (written < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock은 패딩 자리도 0 바이트로 채워 길이에 포함한다.
  std::size_t padding = 0;
  if (trimmed[trimmed.size() - 1] == '=') {
    ++padding;
    if (trimmed[trimmed.size() - 2] == '=') {
      ++padding;
    }
  }
  return std::string(out.begin(), out.begin() + (written - static_cast<int>(padding)));
}

}  // namespace otpgate
