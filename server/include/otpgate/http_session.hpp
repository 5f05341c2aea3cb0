/*
 * 설명: HTTP 연결 하나를 읽고 ApiHandler 응답을 돌려준 뒤 요청 로그를 남긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "otpgate/api_handler.hpp"
#include "otpgate/observability.hpp"

namespace otpgate {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<ApiHandler> handler,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendResponse(std::shared_ptr<HttpResponse> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  HttpRequest req_;
  std::shared_ptr<ApiHandler> handler_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace otpgate
