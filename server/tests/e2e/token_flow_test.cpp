#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "roomkey/app.hpp"
#include "roomkey/room_namer.hpp"

namespace {

struct SimpleHttpResponse {
  boost::beast::http::status status;
  std::string body;
  std::string allow_origin;
};

roomkey::AppConfig TestConfig() {
  roomkey::AppConfig cfg;
  cfg.address = "127.0.0.1";
  cfg.port = 0;
  cfg.livekit_api_key = "APIe2ekey";
  cfg.livekit_api_secret = "e2e-signing-secret";
  cfg.livekit_url = "wss://rtc.example.com";
  cfg.cors_allowed_origins = {"http://localhost:3000"};
  cfg.token_ttl_seconds = 600;
  cfg.default_identity = "my_identity";
  cfg.log_level = "error";
  return cfg;
}

class TokenServerFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    app_ = std::make_unique<roomkey::TokenServerApp>(TestConfig());
    app_->Start();
    port_ = app_->LocalPort();
    ASSERT_NE(port_, 0);
  }

  void TearDown() override { app_->Stop(); }

  SimpleHttpResponse Get(const std::string& target, const std::string& origin = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(port_));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{boost::beast::http::verb::get, target, 11};
    req.set(boost::beast::http::field::host, "127.0.0.1");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!origin.empty()) {
      req.set(boost::beast::http::field::origin, origin);
    }
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), res.body(),
                              std::string(res[boost::beast::http::field::access_control_allow_origin])};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  std::unique_ptr<roomkey::TokenServerApp> app_;
  unsigned short port_{0};
};

TEST_F(TokenServerFixture, HealthEndpointResponds) {
  auto res = Get("/health");
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  auto body = nlohmann::json::parse(res.body);
  EXPECT_TRUE(body["success"].get<bool>());
  EXPECT_EQ(body["data"]["service"], "roomkey");
}

TEST_F(TokenServerFixture, TokenOverHttpCarriesCorsAndValidGrant) {
  auto res = Get("/getToken?identity=candidate", "http://localhost:3000");
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  EXPECT_EQ(res.allow_origin, "http://localhost:3000");
  auto body = nlohmann::json::parse(res.body);
  auto verified = app_->GetIssuer()->Verify(body["accessToken"].get<std::string>());
  ASSERT_TRUE(verified.has_value());
  EXPECT_EQ(verified->identity, "candidate");
  EXPECT_EQ(verified->grant.room, body["roomName"].get<std::string>());
}

TEST_F(TokenServerFixture, FiftyConcurrentRequestsGetIndependentCredentials) {
  constexpr int kClients = 50;
  std::mutex mutex;
  std::vector<std::string> bodies;
  std::vector<std::string> failures;
  std::vector<std::thread> clients;
  clients.reserve(kClients);
  for (int i = 0; i < kClients; ++i) {
    clients.emplace_back([&]() {
      try {
        auto res = Get("/getToken");
        std::lock_guard<std::mutex> lock(mutex);
        if (res.status != boost::beast::http::status::ok) {
          failures.push_back("status " + std::to_string(static_cast<unsigned>(res.status)));
        } else {
          bodies.push_back(res.body);
        }
      } catch (const std::exception& ex) {
        std::lock_guard<std::mutex> lock(mutex);
        failures.push_back(ex.what());
      }
    });
  }
  for (auto& client : clients) {
    client.join();
  }

  ASSERT_TRUE(failures.empty()) << failures.front();
  ASSERT_EQ(bodies.size(), static_cast<std::size_t>(kClients));
  std::set<std::string> rooms;
  for (const auto& raw : bodies) {
    auto body = nlohmann::json::parse(raw);
    auto room = body["roomName"].get<std::string>();
    EXPECT_TRUE(roomkey::IsValidRoomName(room));
    auto verified = app_->GetIssuer()->Verify(body["accessToken"].get<std::string>());
    ASSERT_TRUE(verified.has_value());
    EXPECT_EQ(verified->grant.room, room);
    EXPECT_TRUE(verified->grant.room_join);
    rooms.insert(room);
  }
  EXPECT_EQ(rooms.size(), static_cast<std::size_t>(kClients));
  EXPECT_EQ(app_->GetObservability()->Snapshot().tokens_issued, static_cast<std::uint64_t>(kClients));
}

// 로그가 실제로 직렬화되도록 info 레벨로 띄우고, 방 이름 생성기를 주입할 수 있게 한다.
class TokenServerResilienceTest : public TokenServerFixture {
 protected:
  void SetUp() override {}

  void StartWith(roomkey::RoomNameGenerator namer) {
    auto cfg = TestConfig();
    cfg.log_level = "info";
    app_ = std::make_unique<roomkey::TokenServerApp>(cfg, std::move(namer));
    app_->Start();
    port_ = app_->LocalPort();
    ASSERT_NE(port_, 0);
  }

  std::string SendRaw(const std::string& raw) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::socket socket{ioc};
    socket.connect({boost::asio::ip::make_address("127.0.0.1"), port_});
    boost::asio::write(socket, boost::asio::buffer(raw));
    std::string response;
    boost::beast::error_code ec;
    boost::asio::read(socket, boost::asio::dynamic_buffer(response), ec);
    return response;
  }

  void TearDown() override {
    if (app_) {
      app_->Stop();
    }
  }
};

TEST_F(TokenServerResilienceTest, NonUtf8TargetDoesNotStopServer) {
  StartWith(roomkey::NewRoomName);
  auto response = SendRaw("GET /\xff HTTP/1.1\r\nHost: x\r\n\r\n");
  EXPECT_EQ(response.rfind("HTTP/1.1 404", 0), 0u) << response;

  response = SendRaw("GET /getToken?identity=\xfe\xff HTTP/1.1\r\nHost: x\r\n\r\n");
  EXPECT_EQ(response.rfind("HTTP/1.1 200", 0), 0u) << response;

  auto health = Get("/health");
  EXPECT_EQ(health.status, boost::beast::http::status::ok);
}

TEST_F(TokenServerResilienceTest, PercentEncodedInvalidUtf8IdentityGetsCredential) {
  StartWith(roomkey::NewRoomName);
  auto res = Get("/getToken?identity=%FF%FE");
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  auto body = nlohmann::json::parse(res.body);
  EXPECT_TRUE(app_->GetIssuer()->Verify(body["accessToken"].get<std::string>()).has_value());
  EXPECT_EQ(Get("/health").status, boost::beast::http::status::ok);
}

TEST_F(TokenServerResilienceTest, FailingRoomGeneratorYields500ThenRecovers) {
  std::atomic<bool> fail{true};
  StartWith([&fail]() -> std::string {
    if (fail.load()) {
      throw roomkey::TokenError(roomkey::TokenErrorCode::kRandomnessUnavailable, "난수 소스 고갈");
    }
    return roomkey::NewRoomName();
  });

  auto failed = Get("/getToken");
  ASSERT_EQ(failed.status, boost::beast::http::status::internal_server_error);
  EXPECT_EQ(nlohmann::json::parse(failed.body)["error"]["code"], "randomness_unavailable");

  fail.store(false);
  auto next = Get("/getToken");
  ASSERT_EQ(next.status, boost::beast::http::status::ok);
  auto body = nlohmann::json::parse(next.body);
  EXPECT_TRUE(roomkey::IsValidRoomName(body["roomName"].get<std::string>()));
  EXPECT_EQ(app_->GetObservability()->Snapshot().request_errors, 1u);
}

TEST_F(TokenServerResilienceTest, MalformedRequestLineIsDroppedQuietly) {
  StartWith(roomkey::NewRoomName);
  SendRaw("NOT AN HTTP REQUEST\r\n\r\n");
  EXPECT_EQ(Get("/health").status, boost::beast::http::status::ok);
}

TEST_F(TokenServerResilienceTest, PasswordGateOverHttp) {
  auto cfg = TestConfig();
  cfg.page_passwords = {"open-sesame"};
  app_ = std::make_unique<roomkey::TokenServerApp>(cfg);
  app_->Start();
  port_ = app_->LocalPort();
  ASSERT_NE(port_, 0);

  std::string body = R"({"password":"open-sesame"})";
  auto response = SendRaw("POST /verify-password HTTP/1.1\r\nHost: x\r\nContent-Type: application/json\r\n"
                          "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
  ASSERT_EQ(response.rfind("HTTP/1.1 200", 0), 0u) << response;
  auto cookie_pos = response.find("roomkey_session=");
  ASSERT_NE(cookie_pos, std::string::npos);
  auto token = response.substr(cookie_pos + 16, 64);

  response = SendRaw("GET /check-auth HTTP/1.1\r\nHost: x\r\nCookie: roomkey_session=" + token + "\r\n\r\n");
  EXPECT_EQ(response.rfind("HTTP/1.1 200", 0), 0u) << response;
  EXPECT_EQ(Get("/check-auth").status, boost::beast::http::status::unauthorized);
}

}  // namespace
