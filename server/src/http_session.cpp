/*
 * 설명: HTTP 요청을 비동기로 읽고 응답을 기록한 뒤 연결을 닫는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/token_flow_test.cpp
 */
#include "roomkey/http_session.hpp"

#include "roomkey/api_response.hpp"

namespace roomkey {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const TokenService> service,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), service_(std::move(service)), observability_(std::move(observability)) {}

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

  std::shared_ptr<HttpResponse> res;
  try {
    res = std::make_shared<HttpResponse>(service_->Handle(req_));
  } catch (const std::exception& ex) {
    // 라우팅 단계에서 새어 나온 예외도 연결 단위로 격리한다.
    res = std::make_shared<HttpResponse>(boost::beast::http::status::internal_server_error, req_.version());
    res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    res->body() = SerializeJson(MakeErrorEnvelope("internal_error", ex.what()));
    res->content_length(res->body().size());
  }
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<HttpResponse> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{trace_id_, std::string(req_.target()), res->result_int(), latency});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace roomkey
