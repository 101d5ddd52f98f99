/*
 * 설명: 토큰 서버 수명주기와 리스닝 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/token_flow_test.cpp
 */
#include "roomkey/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "roomkey/http_session.hpp"
#include "roomkey/room_namer.hpp"

namespace roomkey {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<const TokenService> service, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), service_(std::move(service)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
    port_ = acceptor_.local_endpoint().port();
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short Port() const { return port_; }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->service_, self->observability_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const TokenService> service_;
  std::shared_ptr<Observability> observability_;
  unsigned short port_{0};
};

TokenServerApp::TokenServerApp(const AppConfig& config, RoomNameGenerator room_namer)
    : config_(config), ioc_(static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))),
      work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  CredentialConfig credential_config;
  credential_config.key = SigningKey{config.livekit_api_key, config.livekit_api_secret};
  credential_config.ttl = std::chrono::seconds(config.token_ttl_seconds);
  credential_config.default_identity = config.default_identity;
  issuer_ = std::make_shared<CredentialIssuer>(credential_config);
  service_ = std::make_shared<TokenService>(config_, issuer_, observability_,
                                                  room_namer ? std::move(room_namer) : RoomNameGenerator(NewRoomName));
}

TokenServerApp::~TokenServerApp() { Stop(); }

void TokenServerApp::Start(bool handle_signals) {
  if (running_.exchange(true)) {
    return;
  }
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::make_address(config_.address), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, service_, observability_);
  listener_->Run();
  if (handle_signals) {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
      if (ec) {
        return;
      }
      observability_->Event(LogLevel::kInfo, "app", "signal_received", {{"signal", signo}});
      work_guard_.reset();
      listener_->Stop();
      ioc_.stop();
    });
  }
  observability_->Event(LogLevel::kInfo, "app", "server_started",
                        {{"address", config_.address}, {"port", LocalPort()}});
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  RunWorkers(handle_signals ? thread_count - 1 : thread_count);
}

void TokenServerApp::Run() {
  Start(true);
  ioc_.run();
  Stop();
}

void TokenServerApp::RunWorkers(unsigned int count) {
  for (unsigned int i = 0; i < count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void TokenServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  boost::system::error_code ignored;
  signals_.cancel(ignored);
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
  workers_.clear();
  observability_->Event(LogLevel::kInfo, "app", "server_stopped");
}

unsigned short TokenServerApp::LocalPort() const { return listener_ ? listener_->Port() : 0; }

}  // namespace roomkey
