#ifndef WEBD_SERVER_HPP_
#define WEBD_SERVER_HPP_

#include "http.hpp"
#include "log.hpp"
#include "session.hpp"
#include "stream.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <functional>
#include <sockpp/tcp_acceptor.h>
#include <string>

namespace webd {

// ============================================================================
// Server Configuration
// ============================================================================

struct ServerConfig {
  std::string bind_addr;  // empty binds all interfaces
  uint16_t port = 8080;   // 0 picks an ephemeral port, see Server::port()
  int read_timeout_ms = 0;  // 0 blocks indefinitely
  size_t max_buffer_size = BufferedStream::kDefaultMaxCapacity;
  Logger::Level log_level = Logger::Level::kInfo;
  SessionConfig session;
};

// ============================================================================
// Server (synchronous accept loop)
// ============================================================================

// Receives each parsed request together with the stream it came from.
using App = std::function<Result<void>(Request, BufferedStream)>;

class Server {
 public:
  // Binds and listens. Throws std::runtime_error when the address cannot
  // be bound.
  Server(ServerConfig config, App app);

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Accept one connection and run it to completion.
  Result<void> serve_one();

  // Serve connections one at a time until stop().
  void run();

  void stop();

  uint16_t port() const { return port_; }
  const ServerConfig& config() const { return config_; }

  // Configuration
  Server& set_read_timeout_ms(int timeout) {
    config_.read_timeout_ms = timeout;
    return *this;
  }

  Server& set_max_message_size(size_t size) {
    config_.session.max_message_size = size;
    return *this;
  }

 private:
  ServerConfig config_;
  App app_;
  sockpp::tcp_acceptor acceptor_;
  uint16_t port_ = 0;
  std::atomic<bool> is_running_{false};
};

}  // namespace webd

#endif  // WEBD_SERVER_HPP_
