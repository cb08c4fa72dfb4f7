#include "../test_utils/TestFixtures.hpp"
#include "oscquery-server/compat/WinSock.hpp"
#include "oscquery-server/server/OscQueryHttpServer.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <sstream>
#include <string>

using namespace oscquery;
using namespace oscquery::test;

namespace {

struct RawResponse {
  int status{0};
  std::string headers;
  std::string body;
};

// Send a raw request and read until the server closes the connection
std::string send_raw(uint16_t port, const std::string &request) {
  int sockfd = static_cast<int>(socket(AF_INET, SOCK_STREAM, 0));
  if (sockfd < 0) {
    return "";
  }

  struct sockaddr_in serv_addr;
  std::memset(&serv_addr, 0, sizeof(serv_addr));
  serv_addr.sin_family = AF_INET;
  serv_addr.sin_port = htons(port);
  serv_addr.sin_addr.s_addr = inet_addr("127.0.0.1");

  if (connect(sockfd, (struct sockaddr *)&serv_addr, sizeof(serv_addr)) < 0) {
    compat::close_socket(sockfd);
    return "";
  }

  // Set recv timeout to avoid blocking forever
#ifdef _WIN32
  DWORD timeout = 2000;
  setsockopt(sockfd, SOL_SOCKET, SO_RCVTIMEO, (const char *)&timeout,
             sizeof(timeout));
#else
  struct timeval tv;
  tv.tv_sec = 2;
  tv.tv_usec = 0;
  setsockopt(sockfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif

  send(sockfd, request.c_str(), static_cast<int>(request.size()), 0);

  std::string response;
  char buffer[4096];
  int n;
  while ((n = static_cast<int>(recv(sockfd, buffer, sizeof(buffer), 0))) > 0) {
    response.append(buffer, static_cast<size_t>(n));
  }

  compat::close_socket(sockfd);
  return response;
}

RawResponse http_request(uint16_t port, const std::string &method,
                         const std::string &target) {
  std::ostringstream req;
  req << method << " " << target << " HTTP/1.0\r\n";
  req << "Host: 127.0.0.1\r\n";
  req << "\r\n";

  RawResponse out;
  std::string raw = send_raw(port, req.str());
  auto split = raw.find("\r\n\r\n");
  if (split == std::string::npos) {
    return out;
  }
  out.headers = raw.substr(0, split + 2);
  out.body = raw.substr(split + 4);

  std::istringstream status_line(out.headers);
  std::string proto;
  status_line >> proto >> out.status;
  return out;
}

} // namespace

class OscQueryHttpServerTest : public HttpServerTest {
protected:
  void SetUp() override {
    HttpServerTest::SetUp();
    server_ = std::make_unique<server::OscQueryHttpServer>(tree_);
    ASSERT_TRUE(server_->start("127.0.0.1", 0));
    ASSERT_NE(server_->port(), 0);
  }

  void TearDown() override { server_->stop(); }

  std::unique_ptr<server::OscQueryHttpServer> server_;
};

TEST_F(OscQueryHttpServerTest, RootReturnsWholeNamespace) {
  auto resp = http_request(server_->port(), "GET", "/");
  ASSERT_EQ(resp.status, 200);
  EXPECT_NE(resp.headers.find("Content-Type: application/json"),
            std::string::npos);
  EXPECT_NE(resp.headers.find("Access-Control-Allow-Origin: *"),
            std::string::npos);

  auto body = nlohmann::ordered_json::parse(resp.body);
  EXPECT_EQ(body["FULL_PATH"], "/");
  EXPECT_TRUE(body["CONTENTS"].contains("endpoint1"));
  EXPECT_TRUE(body["CONTENTS"].contains("endpoint2"));
  EXPECT_EQ(body["HOST_INFO"]["NAME"], "My OSC Server");
}

TEST_F(OscQueryHttpServerTest, AttributeQuery) {
  auto resp = http_request(server_->port(), "GET", "/endpoint1?RANGE");
  ASSERT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body, "{\"RANGE\":[{\"MIN\":0.0,\"MAX\":100.0}]}");

  auto value = http_request(server_->port(), "GET", "/endpoint2?VALUE");
  EXPECT_EQ(value.body, "{\"VALUE\":[0]}");
}

TEST_F(OscQueryHttpServerTest, HostInfoQuery) {
  auto resp = http_request(server_->port(), "GET", "/?HOST_INFO");
  ASSERT_EQ(resp.status, 200);
  auto body = nlohmann::ordered_json::parse(resp.body);
  EXPECT_EQ(body["OSC_PORT"], 9000);
  EXPECT_EQ(body["EXTENSIONS"].size(), EXTENSION_COUNT);
}

TEST_F(OscQueryHttpServerTest, UnknownPathIs404) {
  auto resp = http_request(server_->port(), "GET", "/does/not/exist");
  ASSERT_EQ(resp.status, 404);
  auto body = nlohmann::ordered_json::parse(resp.body);
  EXPECT_EQ(body["error"], "not found");
  EXPECT_EQ(body["path"], "/does/not/exist");
}

TEST_F(OscQueryHttpServerTest, OnlyGetAndHeadAreAllowed) {
  auto post = http_request(server_->port(), "POST", "/");
  EXPECT_EQ(post.status, 405);
  EXPECT_NE(post.headers.find("Allow: GET, HEAD"), std::string::npos);

  auto head = http_request(server_->port(), "HEAD", "/endpoint1");
  EXPECT_EQ(head.status, 200);
  EXPECT_TRUE(head.body.empty());
  EXPECT_NE(head.headers.find("Content-Length:"), std::string::npos);
}

TEST_F(OscQueryHttpServerTest, MalformedRequestLine) {
  std::string raw = send_raw(server_->port(), "GARBAGE\r\n\r\n");
  EXPECT_EQ(raw.rfind("HTTP/1.0 400", 0), 0u);
}

TEST_F(OscQueryHttpServerTest, ServesSequentialRequests) {
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(http_request(server_->port(), "GET", "/endpoint1").status, 200);
  }
}

TEST_F(OscQueryHttpServerTest, StopIsIdempotent) {
  EXPECT_TRUE(server_->is_running());
  server_->stop();
  EXPECT_FALSE(server_->is_running());
  EXPECT_EQ(server_->port(), 0);
  server_->stop();
}

TEST_F(HttpServerTest, HandleRequestWithoutSocket) {
  server::OscQueryHttpServer http(tree_);

  auto ok = http.handle_request("GET", "/endpoint2?ACCESS");
  EXPECT_EQ(ok.status, 200);
  EXPECT_EQ(ok.body, "{\"ACCESS\":1}");

  EXPECT_EQ(http.handle_request("GET", "/missing").status, 404);
  EXPECT_EQ(http.handle_request("PUT", "/").status, 405);
  EXPECT_EQ(http.handle_request("GET", "*").status, 400);
}

TEST_F(HttpServerTest, NonUtf8PathIsStillNotFound) {
  server::OscQueryHttpServer http(tree_);

  auto missing = http.handle_request("GET", "/%FF");
  EXPECT_EQ(missing.status, 404);
  auto body = nlohmann::ordered_json::parse(missing.body);
  EXPECT_EQ(body["error"], "not found");
  EXPECT_EQ(body["path"], "/\xEF\xBF\xBD");
}

TEST_F(HttpServerTest, StartFailsOnBadBindAddress) {
  server::OscQueryHttpServer http(tree_);
  EXPECT_FALSE(http.start("not-an-address", 0));
  EXPECT_FALSE(http.is_running());
}

TEST(OscQueryHttpServerCtorTest, RejectsNullTree) {
  EXPECT_THROW(server::OscQueryHttpServer(nullptr), std::invalid_argument);
}

TEST(HttpStatusTextTest, KnownCodes) {
  EXPECT_STREQ(server::status_text(200), "OK");
  EXPECT_STREQ(server::status_text(404), "Not Found");
  EXPECT_STREQ(server::status_text(405), "Method Not Allowed");
}
