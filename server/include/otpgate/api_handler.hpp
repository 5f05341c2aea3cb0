/*
 * 설명: HTTP 요청을 인증 흐름 호출로 라우팅하고 결과를 응답 엔벨로프로 변환한다.
 *       소켓과 분리된 순수 함수라서 연결 없이 테스트할 수 있다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/api_handler_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "otpgate/config.hpp"
#include "otpgate/observability.hpp"
#include "otpgate/otp_auth_service.hpp"

namespace otpgate {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

struct BasicCredentials {
  std::string username;
  std::string password;
};

class ApiHandler {
 public:
  ApiHandler(const AppConfig& config, std::shared_ptr<OtpAuthService> auth_service,
             std::shared_ptr<Observability> observability);

  HttpResponse Handle(const HttpRequest& req, const std::string& trace_id);

  static std::optional<BasicCredentials> ParseBasicAuth(const std::string& header_value);
  static std::string ParseCookie(const std::string& header_value, const std::string& name);

 private:
  HttpResponse Route(const HttpRequest& req, const std::string& path, const RequestContext& ctx);
  HttpResponse HandleLogin(const HttpRequest& req, const RequestContext& ctx);
  HttpResponse HandleVerification(const HttpRequest& req, const RequestContext& ctx);
  HttpResponse HandleSessions(const HttpRequest& req, const RequestContext& ctx);
  HttpResponse HandleMetrics(const HttpRequest& req, const RequestContext& ctx);

  HttpResponse Success(const HttpRequest& req, boost::beast::http::status status, const nlohmann::json& data,
                       const std::string& message, const RequestContext& ctx) const;
  HttpResponse Failure(const HttpRequest& req, boost::beast::http::status status, const std::string& code,
                       const std::string& message, const RequestContext& ctx,
                       const std::optional<std::string>& detail = std::nullopt) const;
  std::string ExtractSessionToken(const HttpRequest& req) const;

  AppConfig config_;
  std::shared_ptr<OtpAuthService> auth_service_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace otpgate
