#include "sessnet.hpp"

#include <csignal>

#include <iostream>
#include <pthread.h>
#include <string>
#include <utility>
#include <vector>

// Echoes every received chunk back to its sender until SIGINT/SIGTERM
int main(int argc, char* argv[]) {
  uint16_t port = 8080;

  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }

  // Block termination signals before any thread starts; main waits for them
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  try {
    sessnet::SessionCallbacks callbacks;

    callbacks.on_started = [](const sessnet::SessionPtr& session) {
      std::cout << "Session " << session->to_string() << " started" << std::endl;
    };

    callbacks.on_data_received = [](const sessnet::SessionPtr& session, const std::vector<uint8_t>& buffer,
                                    size_t offset, size_t count) {
      session->send(buffer, offset, count);
    };

    callbacks.on_closed = [](const sessnet::SessionPtr& session) {
      std::cout << "Session " << session->key() << " closed" << std::endl;
    };

    sessnet::Server server(port, std::move(callbacks));
    server.start();
    std::cout << "Echo server listening on " << server.listened_endpoint() << std::endl;

    int sig = 0;
    if (sigwait(&signals, &sig) != 0) {
      std::cerr << "sigwait failed" << std::endl;
    }

    std::cout << "Shutting down (" << server.session_count() << " sessions)" << std::endl;
    server.stop();

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
