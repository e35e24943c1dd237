/*
 * 설명: HTTP 연결 하나를 읽고, 블로킹 DB 작업은 작업 풀에서 라우터로 처리한 뒤 응답을 쓴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/api_router_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "planner/api_router.hpp"
#include "planner/observability.hpp"

namespace planner {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<ApiRouter> router,
              boost::asio::thread_pool& blocking_pool, std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendResponse(std::shared_ptr<HttpResponse> res);
  std::string RemoteIp();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  HttpRequest req_;
  std::shared_ptr<ApiRouter> router_;
  boost::asio::thread_pool& blocking_pool_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace planner
