/*
 * 설명: HTTP 요청 읽기/쓰기와 요청 단위 로그. 경로 처리는 ApiRouter에 위임한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/api_router_test.cpp
 */
#include "planner/http_session.hpp"

#include <utility>

#include <boost/asio/post.hpp>

namespace planner {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<ApiRouter> router,
                         boost::asio::thread_pool& blocking_pool, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)),
      router_(std::move(router)),
      blocking_pool_(blocking_pool),
      observability_(std::move(observability)) {}

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
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  // DB 재시도 대기가 I/O 스레드를 막지 않도록 작업 풀에서 처리한다.
  stream_.expires_never();
  auto self = shared_from_this();
  auto remote_ip = RemoteIp();
  boost::asio::post(blocking_pool_, [self, remote_ip]() {
    auto res = std::make_shared<HttpResponse>(self->router_->Handle(self->req_, remote_ip));
    boost::asio::post(self->stream_.get_executor(), [self, res]() { self->SendResponse(res); });
  });
}

void HttpSession::SendResponse(std::shared_ptr<HttpResponse> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    LogContext ctx{trace_id_, "http.request", latency, std::nullopt, nullptr};
    ctx.detail = {{"method", std::string(req_.method_string())},
                  {"target", std::string(req_.target())},
                  {"status", res->result_int()}};
    observability_->Log(ctx);
  }
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

std::string HttpSession::RemoteIp() {
  boost::beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string();
}

}  // namespace planner
