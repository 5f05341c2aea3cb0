/*
 * 설명: 로그인(코드 발급), 검증(세션 발급), 세션 목록, 상태 엔드포인트를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/api_handler_test.cpp
 */
#include "otpgate/api_handler.hpp"

#include <chrono>

#include "otpgate/api_response.hpp"
#include "otpgate/errors.hpp"
#include "otpgate/secret_codec.hpp"

namespace otpgate {
namespace http = boost::beast::http;

namespace {
constexpr std::size_t kMaxBodyBytes = 512;
constexpr const char* kServerName = "otpgate";
constexpr const char* kSessionCookie = "sess";

std::int64_t UnixNow() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool IsKnownPath(const std::string& path) {
  return path == "/api/health" || path == "/metrics" || path == "/api/v1" || path == "/api/v1/auth/login" ||
         path == "/api/v1/auth/verification" || path == "/api/v1/sessions";
}

bool IsJsonContentType(const HttpRequest& req) {
  auto it = req.find(http::field::content_type);
  if (it == req.end()) {
    return false;
  }
  std::string value(it->value());
  auto semicolon = value.find(';');
  return TrimWhitespace(value.substr(0, semicolon)) == "application/json";
}
}  // namespace

ApiHandler::ApiHandler(const AppConfig& config, std::shared_ptr<OtpAuthService> auth_service,
                       std::shared_ptr<Observability> observability)
    : config_(config), auth_service_(std::move(auth_service)), observability_(std::move(observability)) {}

HttpResponse ApiHandler::Handle(const HttpRequest& req, const std::string& trace_id) {
  auto ctx = RequestContext::WithTimeout(trace_id, std::chrono::milliseconds(config_.request_timeout_ms));
  std::string target(req.target());
  std::string path = target.substr(0, target.find('?'));
  if (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }

  try {
    return Route(req, path, ctx);
  } catch (const OtpException& ex) {
    if (observability_) {
      observability_->Log(LogContext{ctx.trace_id, path, LogLevel::kError, 0, std::nullopt,
                                     std::string(ErrorKindName(ex.kind())), std::nullopt, std::string(ex.what())});
    }
    if (ex.kind() == ErrorKind::kStoreUnavailable) {
      auto res = Failure(req, http::status::service_unavailable, "store_unavailable",
                         "저장소에 연결할 수 없습니다. 잠시 후 다시 시도하세요", ctx);
      res.set(http::field::retry_after, "1");
      return res;
    }
    return Failure(req, http::status::internal_server_error, std::string(ErrorKindName(ex.kind())),
                   "요청을 처리하지 못했습니다", ctx);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Log(LogContext{ctx.trace_id, path, LogLevel::kError, 0, std::nullopt, std::nullopt,
                                     std::nullopt, std::string(ex.what())});
    }
    return Failure(req, http::status::internal_server_error, "internal_error", "요청을 처리하지 못했습니다", ctx);
  }
}

HttpResponse ApiHandler::Route(const HttpRequest& req, const std::string& path, const RequestContext& ctx) {
  const auto method = req.method();
  if (method == http::verb::get && path == "/api/health") {
    return Success(req, http::status::ok, {{"status", "ok"}, {"version", "v1.0.0"}}, "정상", ctx);
  }
  if (method == http::verb::get && path == "/metrics") {
    return HandleMetrics(req, ctx);
  }
  if (method == http::verb::get && path == "/api/v1") {
    return Success(req, http::status::ok, nlohmann::json::object(), "otpgate API v1", ctx);
  }
  if (method == http::verb::post && path == "/api/v1/auth/login") {
    return HandleLogin(req, ctx);
  }
  if (method == http::verb::post && path == "/api/v1/auth/verification") {
    return HandleVerification(req, ctx);
  }
  if (method == http::verb::get && path == "/api/v1/sessions") {
    return HandleSessions(req, ctx);
  }
  if (IsKnownPath(path)) {
    return Failure(req, http::status::method_not_allowed, "method_not_allowed",
                   "이 경로는 '" + std::string(req.method_string()) + "' 메서드를 허용하지 않습니다", ctx);
  }
  return Failure(req, http::status::not_found, "not_found", "지원되지 않는 경로입니다: " + path, ctx, path);
}

HttpResponse ApiHandler::HandleLogin(const HttpRequest& req, const RequestContext& ctx) {
  if (!IsJsonContentType(req)) {
    return Failure(req, http::status::unsupported_media_type, "unsupported_media_type",
                   "Content-Type은 application/json이어야 합니다", ctx);
  }
  if (req.body().size() > kMaxBodyBytes) {
    return Failure(req, http::status::payload_too_large, "payload_too_large",
                   "요청 본문은 512바이트를 넘을 수 없습니다", ctx);
  }
  nlohmann::json body_json = nlohmann::json::parse(req.body(), nullptr, false);
  if (body_json.is_discarded() || !body_json.is_object()) {
    return Failure(req, http::status::bad_request, "bad_request", "JSON 본문이 올바르지 않습니다", ctx);
  }
  for (const auto& item : body_json.items()) {
    if (item.key() != "username") {
      return Failure(req, http::status::bad_request, "bad_request", "알 수 없는 필드입니다: " + item.key(), ctx,
                     item.key());
    }
  }
  if (!body_json.contains("username") || !body_json["username"].is_string() ||
      body_json["username"].get<std::string>().empty()) {
    return Failure(req, http::status::bad_request, "bad_request", "username이 필요합니다", ctx,
                   std::string("username"));
  }

  auto username = body_json["username"].get<std::string>();
  // 등록되지 않은 사용자도 같은 상태 코드와 모양으로 응답한다.
  auto issued = auth_service_->IssueCode(ctx, username);
  const auto& totp = auth_service_->GetConfig().totp;
  nlohmann::json data{{"user", issued.principal},
                      {"loginTime", issued.issued_at},
                      {"validUntil", issued.valid_until},
                      {"digits", totp.digits},
                      {"period", totp.period}};
  if (config_.otp_expose_codes && issued.registered) {
    data["otp"] = issued.code;
  }
  return Success(req, http::status::ok, data, "일회용 코드를 발급했습니다", ctx);
}

HttpResponse ApiHandler::HandleVerification(const HttpRequest& req, const RequestContext& ctx) {
  auto auth_it = req.find(http::field::authorization);
  std::optional<BasicCredentials> credentials;
  if (auth_it != req.end()) {
    credentials = ParseBasicAuth(std::string(auth_it->value()));
  }
  if (!credentials) {
    auto res = Failure(req, http::status::unauthorized, "unauthorized", "Authorization 헤더가 필요합니다", ctx);
    res.set(http::field::www_authenticate, "Basic realm=\"restricted\", charset=\"UTF-8\"");
    return res;
  }

  auto result = auth_service_->Verify(ctx, credentials->username, credentials->password);
  switch (result.outcome) {
    case VerifyOutcome::kMalformed:
      return Failure(req, http::status::bad_request, "otp_malformed", "코드 형식이 검증 서버 요구와 맞지 않습니다",
                     ctx);
    case VerifyOutcome::kMismatch:
      return Failure(req, http::status::unauthorized, "otp_invalid", "코드가 틀렸거나 만료되었습니다", ctx);
    case VerifyOutcome::kReplayed:
      return Failure(req, http::status::conflict, "otp_replayed", "이미 사용된 코드입니다", ctx);
    case VerifyOutcome::kAccepted:
      break;
  }

  const auto& session_id = *result.session_id;
  nlohmann::json data{{"user", credentials->username},
                      {"validOTP", true},
                      {"sessionKey", session_id},
                      {"verifyTime", UnixNow()},
                      {"expiresIn", config_.session_ttl_seconds}};
  auto res = Success(req, http::status::ok, data, "코드와 사용자를 확인했습니다", ctx);
  res.set(http::field::set_cookie, std::string(kSessionCookie) + "=" + session_id + "; Path=/; Max-Age=" +
                                       std::to_string(config_.session_ttl_seconds) + "; HttpOnly; SameSite=Strict");
  return res;
}

HttpResponse ApiHandler::HandleSessions(const HttpRequest& req, const RequestContext& ctx) {
  auto token = ExtractSessionToken(req);
  if (token.empty()) {
    return Failure(req, http::status::unauthorized, "unauthorized", "세션이 없습니다. 다시 로그인하세요", ctx);
  }
  auto principal = auth_service_->Authenticate(ctx, token);
  if (!principal) {
    return Failure(req, http::status::unauthorized, "unauthorized", "세션을 찾을 수 없습니다. 다시 로그인하세요", ctx);
  }

  nlohmann::json keys = nlohmann::json::array();
  for (const auto& entry : auth_service_->ListSessions(ctx)) {
    keys.push_back({{"sessionId", entry.session_id}, {"userId", entry.principal_id}});
  }
  nlohmann::json data{{"keys", keys}, {"user", *principal}};
  return Success(req, http::status::ok, data, "전체 세션 목록입니다", ctx);
}

HttpResponse ApiHandler::HandleMetrics(const HttpRequest& req, const RequestContext& ctx) {
  MetricsSnapshot snapshot = observability_ ? observability_->Snapshot() : MetricsSnapshot{};
  nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                      {"codes", {{"issued", snapshot.codes_issued}}},
                      {"verifications",
                       {{"accepted", snapshot.verify_accepted},
                        {"mismatched", snapshot.verify_mismatched},
                        {"malformed", snapshot.verify_malformed},
                        {"replayed", snapshot.verify_replayed}}},
                      {"store", {{"failures", snapshot.store_failures}}}};
  return Success(req, http::status::ok, data, "메트릭", ctx);
}

HttpResponse ApiHandler::Success(const HttpRequest& req, http::status status, const nlohmann::json& data,
                                 const std::string& message, const RequestContext& ctx) const {
  HttpResponse res;
  res.version(req.version());
  res.keep_alive(false);
  res.result(status);
  res.set(http::field::server, kServerName);
  res.set(http::field::content_type, "application/json; charset=utf-8");
  res.body() = MakeSuccessEnvelope(data, message, ctx.trace_id).dump();
  res.prepare_payload();
  return res;
}

HttpResponse ApiHandler::Failure(const HttpRequest& req, http::status status, const std::string& code,
                                 const std::string& message, const RequestContext& ctx,
                                 const std::optional<std::string>& detail) const {
  HttpResponse res;
  res.version(req.version());
  res.keep_alive(false);
  res.result(status);
  res.set(http::field::server, kServerName);
  res.set(http::field::content_type, "application/json; charset=utf-8");
  res.body() = MakeErrorEnvelope(code, message, ctx.trace_id, detail).dump();
  res.prepare_payload();
  return res;
}

std::string ApiHandler::ExtractSessionToken(const HttpRequest& req) const {
  auto cookie_it = req.find(http::field::cookie);
  if (cookie_it != req.end()) {
    auto token = ParseCookie(std::string(cookie_it->value()), kSessionCookie);
    if (!token.empty()) {
      return token;
    }
  }
  auto auth_it = req.find(http::field::authorization);
  if (auth_it == req.end()) {
    return "";
  }
  const std::string prefix = "Bearer ";
  std::string header_value(auth_it->value());
  if (header_value.size() <= prefix.size() || header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

std::optional<BasicCredentials> ApiHandler::ParseBasicAuth(const std::string& header_value) {
  const std::string prefix = "Basic ";
  if (header_value.size() <= prefix.size() || header_value.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }
  auto decoded = DecodeBase64(std::string_view(header_value).substr(prefix.size()));
  if (!decoded) {
    return std::nullopt;
  }
  auto colon = decoded->find(':');
  if (colon == std::string::npos) {
    return std::nullopt;
  }
  return BasicCredentials{decoded->substr(0, colon), decoded->substr(colon + 1)};
}

std::string ApiHandler::ParseCookie(const std::string& header_value, const std::string& name) {
  std::size_t pos = 0;
  while (pos < header_value.size()) {
    auto semicolon = header_value.find(';', pos);
    auto pair = TrimWhitespace(std::string_view(header_value)
                                   .substr(pos, semicolon == std::string::npos ? std::string::npos : semicolon - pos));
    auto eq = pair.find('=');
    if (eq != std::string_view::npos && pair.substr(0, eq) == name) {
      return std::string(pair.substr(eq + 1));
    }
    if (semicolon == std::string::npos) {
      break;
    }
    pos = semicolon + 1;
  }
  return "";
}

}  // namespace otpgate
