#include "oscquery-server/server/OscQueryHttpServer.hpp"
#include "oscquery-server/Logger.hpp"
#include "oscquery-server/QueryResolver.hpp"
#include "oscquery-server/compat/WinSock.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace oscquery {
namespace server {

namespace {
constexpr int BACKLOG = 8;
constexpr size_t MAX_HEADER_READ = 64 * 1024; // 64 KB
constexpr int CLIENT_TIMEOUT_MS = 5000;

#ifdef MSG_NOSIGNAL
constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#else
constexpr int SEND_FLAGS = 0;
#endif

std::string last_socket_error() {
#ifdef _WIN32
  return std::to_string(WSAGetLastError());
#else
  return std::strerror(errno);
#endif
}

// Read until "\r\n\r\n" or until limit. Anything after the blank line is
// dropped: GET and HEAD carry no body.
bool read_http_headers(int fd, std::string &out_headers) {
  out_headers.clear();
  char buf[1024];
  while (out_headers.size() < MAX_HEADER_READ) {
    int r = static_cast<int>(recv(fd, buf, sizeof(buf), 0));
    if (r <= 0)
      return false;
    out_headers.append(buf, buf + r);
    auto pos = out_headers.find("\r\n\r\n");
    if (pos != std::string::npos) {
      out_headers.resize(pos + 4);
      return true;
    }
  }
  return false;
}

void set_client_timeout(int fd) {
#ifdef _WIN32
  DWORD timeout = CLIENT_TIMEOUT_MS;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, (const char *)&timeout,
             sizeof(timeout));
#else
  struct timeval tv;
  tv.tv_sec = CLIENT_TIMEOUT_MS / 1000;
  tv.tv_usec = (CLIENT_TIMEOUT_MS % 1000) * 1000;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif
}

void send_http_response(int fd, const HttpResponse &response,
                        bool include_body) {
  std::ostringstream resp;
  resp << "HTTP/1.0 " << response.status << " " << status_text(response.status)
       << "\r\n";
  resp << "Content-Type: application/json\r\n";
  resp << "Content-Length: " << response.body.size() << "\r\n";
  resp << "Access-Control-Allow-Origin: *\r\n";
  if (response.status == 405)
    resp << "Allow: GET, HEAD\r\n";
  resp << "Connection: close\r\n";
  resp << "\r\n";
  if (include_body)
    resp << response.body;

  std::string s = resp.str();
  size_t sent = 0;
  while (sent < s.size()) {
    int w = static_cast<int>(send(fd, s.data() + sent,
                                  static_cast<int>(s.size() - sent),
                                  SEND_FLAGS));
    if (w <= 0) {
      LOG_WARN("HTTP", "SEND", "send failed: {}", last_socket_error());
      break;
    }
    sent += static_cast<size_t>(w);
  }
}

HttpResponse error_response(int status, const std::string &message) {
  nlohmann::ordered_json body;
  body["error"] = message;
  return HttpResponse{status, dump_body(body)};
}

} // namespace

const char *status_text(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 500:
    return "Internal Server Error";
  default:
    return "";
  }
}

OscQueryHttpServer::OscQueryHttpServer(std::shared_ptr<const AddressTree> tree)
    : tree_(std::move(tree)) {
  if (!tree_)
    throw std::invalid_argument("OscQueryHttpServer needs an address tree");
}

OscQueryHttpServer::~OscQueryHttpServer() { stop(); }

HttpResponse OscQueryHttpServer::handle_request(const std::string &method,
                                                const std::string &target) const {
  if (method != "GET" && method != "HEAD") {
    return error_response(405, "method not allowed");
  }
  if (target.empty() || target.front() != '/') {
    return error_response(400, "bad request target");
  }

  try {
    auto result = resolve_query(*tree_, parse_request_target(target));
    int status = result.status == QueryStatus::Ok ? 200 : 404;
    return HttpResponse{status, dump_body(result.body)};
  } catch (const std::exception &e) {
    LOG_ERROR("HTTP", "RESOLVE", "Query '{}' failed: {}", target, e.what());
    return error_response(500, std::string("exception: ") + e.what());
  }
}

bool OscQueryHttpServer::start(const std::string &bind_address,
                               uint16_t port) {
  if (running_.exchange(true)) {
    // already running
    return true;
  }

#ifdef _WIN32
  WSADATA wsa_data;
  if (WSAStartup(MAKEWORD(2, 2), &wsa_data) != 0) {
    LOG_ERROR("HTTP", "WSASTART", "WSAStartup failed");
    running_ = false;
    return false;
  }
#endif

  auto fail = [this](int fd) {
    if (fd >= 0)
      compat::close_socket(fd);
#ifdef _WIN32
    WSACleanup();
#endif
    running_ = false;
    return false;
  };

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
    LOG_ERROR("HTTP", "BIND", "Invalid bind address '{}'", bind_address);
    return fail(-1);
  }

  int fd = static_cast<int>(socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
  if (fd < 0) {
    LOG_ERROR("HTTP", "SOCKET", "Failed to create socket: {}",
              last_socket_error());
    return fail(-1);
  }

  // Allow immediate reuse
  int opt = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, (const char *)&opt, sizeof(opt));

  if (bind(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0) {
    LOG_ERROR("HTTP", "BIND", "bind {}:{} failed: {}", bind_address, port,
              last_socket_error());
    return fail(fd);
  }

  if (listen(fd, BACKLOG) < 0) {
    LOG_ERROR("HTTP", "LISTEN", "listen failed: {}", last_socket_error());
    return fail(fd);
  }

  // If port was 0, query assigned port
  uint16_t bound = port;
  if (port == 0) {
    struct sockaddr_in sin;
    socklen_t len = sizeof(sin);
    if (getsockname(fd, reinterpret_cast<struct sockaddr *>(&sin), &len) != 0) {
      LOG_ERROR("HTTP", "BIND", "getsockname failed: {}", last_socket_error());
      return fail(fd);
    }
    bound = ntohs(sin.sin_port);
  }

  listen_fd_ = fd;
  bound_port_ = bound;
  LOG_INFO("HTTP", "START", "OSCQuery server listening on {}:{}", bind_address,
           bound);

  server_thread_ = std::thread(&OscQueryHttpServer::run_loop, this, fd);
  return true;
}

void OscQueryHttpServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // shutdown() wakes the blocked accept(); the descriptor is closed only
  // after the thread is gone
  if (listen_fd_ >= 0)
    compat::shutdown_socket(listen_fd_);

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  if (listen_fd_ >= 0) {
    compat::close_socket(listen_fd_);
    listen_fd_ = -1;
  }
  bound_port_ = 0;

#ifdef _WIN32
  WSACleanup();
#endif
  LOG_INFO("HTTP", "STOP", "OSCQuery server stopped");
}

void OscQueryHttpServer::run_loop(int listen_fd) {
  while (running_) {
    struct sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd = static_cast<int>(
        accept(listen_fd, reinterpret_cast<struct sockaddr *>(&client_addr),
               &client_len));
    if (client_fd < 0) {
      if (!running_)
        break;
      LOG_WARN("HTTP", "ACCEPT", "accept failed: {}", last_socket_error());
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }

    serve_client(client_fd);
    compat::close_socket(client_fd);
  }
}

void OscQueryHttpServer::serve_client(int client_fd) {
  set_client_timeout(client_fd);

  std::string headers;
  if (!read_http_headers(client_fd, headers)) {
    LOG_WARN("HTTP", "REQUEST", "Failed to read HTTP headers");
    return;
  }

  // Determine request line (first line)
  std::istringstream hs(headers);
  std::string request_line;
  std::getline(hs, request_line);
  if (!request_line.empty() && request_line.back() == '\r')
    request_line.pop_back();

  std::string method, target, proto;
  {
    std::istringstream rl(request_line);
    rl >> method >> target >> proto;
  }

  LOG_DEBUG("HTTP", "REQUEST", "Method: {}, Target: {}", method, target);

  if (method.empty() || target.empty()) {
    send_http_response(client_fd, error_response(400, "malformed request line"),
                       true);
    return;
  }

  auto response = handle_request(method, target);
  send_http_response(client_fd, response, method != "HEAD");
}

} // namespace server
} // namespace oscquery
