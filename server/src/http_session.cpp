/*
 * 설명: 비동기 HTTP 읽기/쓰기와 요청별 추적 ID, 지연 시간 로그를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "otpgate/http_session.hpp"

#include <optional>

namespace otpgate {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<ApiHandler> handler,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), handler_(std::move(handler)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();
  auto res = std::make_shared<HttpResponse>(handler_->Handle(req_, trace_id_));
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<HttpResponse> res) {
  auto self = shared_from_this();
  auto status = static_cast<int>(res->result_int());
  if (status >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability_->Log(LogContext{trace_id_, std::string(req_.method_string()) + " " + std::string(req_.target()),
                                 status >= 500 ? LogLevel::kError : LogLevel::kInfo, static_cast<long>(latency),
                                 std::nullopt, std::nullopt, status, std::nullopt});
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace otpgate
