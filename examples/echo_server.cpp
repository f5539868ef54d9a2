#include "webd/webd.hpp"
#include <iostream>
#include <string>
#include <utility>

namespace {

webd::Result<void> run_session(webd::Session& session) {
  while (true) {
    auto msg = session.next_message();
    if (!msg) {
      return webd::Result<void>::error(msg.get_error());
    }
    if (!msg.value()) {
      return webd::Result<void>::success();  // closed
    }

    const webd::Payload& payload = msg.value().value();
    webd::Result<size_t> sent = payload.is_text()
                                    ? session.send(payload.text())
                                    : session.send_binary(payload.binary().data(), payload.binary().size());
    if (!sent) {
      return webd::Result<void>::error(sent.get_error());
    }
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  webd::ServerConfig config;
  std::string root = ".";

  if (argc > 1) {
    config.port = static_cast<uint16_t>(std::stoi(argv[1]));
  }
  if (argc > 2) {
    root = argv[2];
  }

  try {
    webd::Server server(config, [&root, &config](webd::Request req, webd::BufferedStream stream) {
      auto up = webd::upgrade(std::move(req), std::move(stream), config.session);
      switch (up.outcome()) {
        case webd::UpgradeResult::Outcome::kUpgraded: {
          auto session = up.take_session();
          return run_session(*session);
        }
        case webd::UpgradeResult::Outcome::kError:
          return webd::Result<void>::error(up.error());
        case webd::UpgradeResult::Outcome::kNotApplicable:
          break;
      }

      webd::Request plain = up.take_request();
      webd::BufferedStream out = up.take_stream();
      webd::Result<size_t> sent = plain.path == "/"
                                      ? webd::send_file(out, webd::Status::kOk, "text/html", root + "/index.html",
                                                        config.session.server_name)
                                      : webd::send_str(out, webd::Status::kNotFound, "text/plain", "not found\n",
                                                       config.session.server_name);
      out.close();
      if (!sent) {
        return webd::Result<void>::error(sent.get_error());
      }
      return webd::Result<void>::success();
    });

    server.run();

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
