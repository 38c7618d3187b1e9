#include "sessnet.hpp"

#include <csignal>

#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <vector>

// Relays every message to all connected clients, as a fragmented text message
class RelayDispatcher : public sessnet::MessageDispatcher {
 public:
  void attach(sessnet::Server* server) { server_ = server; }

  void on_session_started(const sessnet::SessionPtr& session) override {
    std::cout << "Session " << session->to_string() << " joined. (" << server_->session_count() << " total)"
              << std::endl;
  }

  void on_session_data_received(const sessnet::SessionPtr& session, const std::vector<uint8_t>& buffer,
                                size_t offset, size_t count) override {
    std::string text(reinterpret_cast<const char*>(buffer.data()) + offset, count);

    // Prefix and body go out as a text frame plus one continuation frame
    sessnet::TextFragmentation message(
        sessnet::TextFragmentation::Fragments{"#" + std::to_string(session->id()) + ": ", text});
    server_->broadcast(message);
  }

  void on_session_closed(const sessnet::SessionPtr& session) override {
    std::cout << "Session " << session->key() << " left" << std::endl;
  }

 private:
  sessnet::Server* server_ = nullptr;
};

int main(int argc, char* argv[]) {
  uint16_t port = 8080;

  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }

  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  try {
    auto dispatcher = std::make_shared<RelayDispatcher>();

    sessnet::ServerConfig config;
    config.pending_connection_backlog = 64;
    config.tcp.so_keepalive = true;

    sessnet::Server server(port, dispatcher, config);
    dispatcher->attach(&server);
    server.start();
    std::cout << "Broadcast server listening on " << server.listened_endpoint() << std::endl;

    int sig = 0;
    if (sigwait(&signals, &sig) != 0) {
      std::cerr << "sigwait failed" << std::endl;
    }
    server.stop();

    const sessnet::ServerStats& stats = server.stats();
    std::cout << "Served " << stats.total_sessions.load() << " sessions, " << stats.broadcast_failures.load()
              << " failed deliveries" << std::endl;

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
