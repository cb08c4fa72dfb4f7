#pragma once
#include "oscquery-server/AddressTree.hpp"
#include "oscquery-server/export.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace oscquery {
namespace server {

struct HttpResponse {
  int status{200};
  std::string body;
};

/// Serves OSCQuery requests for one published address tree over HTTP/1.0.
/// Connections are handled one at a time on a background thread.
class OSCQUERY_SERVER_API OscQueryHttpServer {
public:
  explicit OscQueryHttpServer(std::shared_ptr<const AddressTree> tree);
  ~OscQueryHttpServer();

  OscQueryHttpServer(const OscQueryHttpServer &) = delete;
  OscQueryHttpServer &operator=(const OscQueryHttpServer &) = delete;

  // Bind and listen, then serve on a background thread. Port 0 picks an
  // ephemeral port. Returns false if the socket could not be set up.
  bool start(const std::string &bind_address, uint16_t port);

  // Stop server and join thread.
  void stop();

  // Bound port, 0 while not listening
  uint16_t port() const { return bound_port_; }

  bool is_running() const { return running_; }

  // Answer one request without going through a socket
  HttpResponse handle_request(const std::string &method,
                              const std::string &target) const;

private:
  void run_loop(int listen_fd);
  void serve_client(int client_fd);

  std::shared_ptr<const AddressTree> tree_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> bound_port_{0};
  std::thread server_thread_;
  int listen_fd_{-1};
};

OSCQUERY_SERVER_API const char *status_text(int status);

} // namespace server
} // namespace oscquery
