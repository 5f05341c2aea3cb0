/*
 * 설명: JSON 응답 엔벨로프를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "otpgate/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace otpgate {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}

nlohmann::json MakeMeta(std::string_view trace_id) {
  nlohmann::json meta{{"timestamp", CurrentTimestamp()}};
  if (!trace_id.empty()) {
    meta["traceId"] = trace_id;
  }
  return meta;
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data, std::string_view message, std::string_view trace_id) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["message"] = message;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = MakeMeta(trace_id);
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, std::string_view trace_id,
                                 const std::optional<std::string>& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["message"] = message;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  if (detail) {
    envelope["error"]["detail"] = *detail;
  }
  envelope["meta"] = MakeMeta(trace_id);
  return envelope;
}

}  // namespace otpgate
