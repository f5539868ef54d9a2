#include "webd/server.hpp"

#include "webd/response.hpp"

#include <sockpp/inet_address.h>

#include <memory>
#include <stdexcept>
#include <utility>

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define WEBD_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define WEBD_THROW(ex)            \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

namespace webd {

Server::Server(ServerConfig config, App app) : config_(std::move(config)), app_(std::move(app)) {
  sockpp::initialize();
  Logger::set_level(config_.log_level);

  sockpp::inet_address addr = config_.bind_addr.empty() ? sockpp::inet_address(config_.port)
                                                        : sockpp::inet_address(config_.bind_addr, config_.port);
  acceptor_.open(addr);
  if (!acceptor_) {
    WEBD_THROW(std::runtime_error("Failed to bind " + addr.to_string() + ": " + acceptor_.last_error_str()));
  }

  port_ = sockpp::inet_address(acceptor_.address()).port();
  WEBD_LOG_INFO("Server listening on " + (config_.bind_addr.empty() ? std::string("*") : config_.bind_addr) + ":" +
                std::to_string(port_));
}

Result<void> Server::serve_one() {
  sockpp::inet_address peer;
  sockpp::tcp_socket sock = acceptor_.accept(&peer);
  if (!sock) {
    return Result<void>::error(make_error(ErrorCode::kSocketError, "accept: " + acceptor_.last_error_str()));
  }
  WEBD_LOG_INFO("Connection from " + peer.to_string());

  auto socket_stream = std::make_unique<SocketStream>(std::move(sock));
  if (config_.read_timeout_ms > 0 && !socket_stream->set_read_timeout_ms(config_.read_timeout_ms)) {
    WEBD_LOG_WARN("could not set read timeout for " + peer.to_string());
  }
  BufferedStream stream(std::move(socket_stream), config_.max_buffer_size);

  auto request = Request::parse(stream);
  if (!request) {
    const Error& err = request.get_error();
    if (err.is_io()) {
      stream.close();
      return Result<void>::error(err);
    }
    auto sent = send_str(stream, Status::kBadRequest, "text/plain", err.message + "\n", config_.session.server_name);
    stream.close();
    if (!sent) {
      return Result<void>::error(sent.get_error());
    }
    return Result<void>::error(err);
  }

  const Request& req = request.value();
  WEBD_LOG_INFO(req.version + " " + to_string(req.verb) + " " + req.path);
  return app_(std::move(request.value()), std::move(stream));
}

void Server::run() {
  is_running_ = true;
  WEBD_LOG_INFO("Server starting...");

  while (is_running_) {
    auto served = serve_one();
    if (!served && is_running_) {
      WEBD_LOG_ERROR(served.get_error().describe());
    }
  }

  WEBD_LOG_INFO("Server stopped");
}

void Server::stop() {
  is_running_ = false;
  // Unblocks a pending accept()
  acceptor_.shutdown();
}

}  // namespace webd
