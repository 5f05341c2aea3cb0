/*
 * 설명: REST 응답 엔벨로프 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace otpgate {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data, std::string_view message,
                                   std::string_view trace_id = {});
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, std::string_view trace_id = {},
                                 const std::optional<std::string>& detail = std::nullopt);

}  // namespace otpgate
