#include "sessnet.hpp"

#include <cerrno>
#include <cstring>

#include <algorithm>
#include <arpa/inet.h>
#include <atomic>
#include <catch2/catch.hpp>
#include <chrono>
#include <fcntl.h>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <netinet/in.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace sessnet;

// ============================================================================
// Minimal TCP test client (raw POSIX socket)
// ============================================================================

class TestClient {
 public:
  TestClient() = default;
  ~TestClient() { disconnect(); }

  bool connect(uint16_t port) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0)
      return false;

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
      ::close(fd_);
      fd_ = -1;
      return false;
    }

    struct timeval tv;
    tv.tv_sec = 2;
    tv.tv_usec = 0;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    return true;
  }

  bool send_raw(std::string_view data) {
    size_t sent = 0;
    while (sent < data.size()) {
      ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (n <= 0)
        return false;
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  // Reads exactly len bytes; returns what arrived before EOF/timeout otherwise
  std::string recv_exact(size_t len) {
    std::string out;
    char buf[1024];
    while (out.size() < len) {
      size_t want = std::min(sizeof(buf), len - out.size());
      ssize_t n = ::recv(fd_, buf, want, 0);
      if (n <= 0)
        break;
      out.append(buf, static_cast<size_t>(n));
    }
    return out;
  }

  // True once the server side has closed the connection
  bool wait_eof() {
    char c;
    ssize_t n = ::recv(fd_, &c, 1, 0);
    return n == 0 || (n < 0 && errno == ECONNRESET);
  }

  void disconnect() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_ = -1;
};

// ============================================================================
// Test helpers
// ============================================================================

static bool wait_until(const std::function<bool()>& pred, int timeout_ms = 2000) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

// Records sessions and traffic; optional hooks run inside the callbacks
class RecordingDispatcher : public MessageDispatcher {
 public:
  void on_session_started(const SessionPtr& session) override {
    std::lock_guard<std::mutex> lock(mutex_);
    started_keys_.push_back(session->key());
  }

  void on_session_data_received(const SessionPtr& session, const std::vector<uint8_t>& buffer, size_t offset,
                                size_t count) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      received_.append(reinterpret_cast<const char*>(buffer.data()) + offset, count);
    }
    if (on_data)
      on_data(session, std::string(reinterpret_cast<const char*>(buffer.data()) + offset, count));
  }

  void on_session_closed(const SessionPtr& session) override {
    if (on_closed)
      on_closed(session);
    closed.fetch_add(1);
  }

  std::vector<std::string> started_keys() {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_keys_;
  }

  std::string received() {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }

  std::function<void(const SessionPtr&, const std::string&)> on_data;
  std::function<void(const SessionPtr&)> on_closed;
  std::atomic<int> closed{0};

 private:
  std::mutex mutex_;
  std::vector<std::string> started_keys_;
  std::string received_;
};

struct ServerFixture {
  std::shared_ptr<RecordingDispatcher> dispatcher = std::make_shared<RecordingDispatcher>();
  Server server;

  explicit ServerFixture(const ServerConfig& config = ServerConfig())
      : server("127.0.0.1", 0, dispatcher, config) {}

  uint16_t port() const { return server.listened_port(); }

  // Connects and waits for the matching session to be registered
  std::string connect(TestClient& client) {
    size_t before = dispatcher->started_keys().size();
    REQUIRE(client.connect(port()));
    REQUIRE(wait_until([&]() { return dispatcher->started_keys().size() > before; }));
    return dispatcher->started_keys().back();
  }
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("Integration - start and stop", "[integration]") {
  ServerFixture fx;
  REQUIRE(!fx.server.active());
  REQUIRE(fx.server.session_count() == 0);

  fx.server.start();
  REQUIRE(fx.server.active());
  REQUIRE(fx.port() != 0);
  REQUIRE(fx.server.listened_endpoint() == "127.0.0.1:" + std::to_string(fx.port()));

  TestClient client;
  fx.connect(client);
  REQUIRE(wait_until([&]() { return fx.server.session_count() == 1; }));

  fx.server.stop();
  REQUIRE(!fx.server.active());
  REQUIRE(fx.server.session_count() == 0);
  REQUIRE(fx.dispatcher->closed.load() == 1);
  REQUIRE(client.wait_eof());

  // Listener is gone
  TestClient late;
  REQUIRE(!late.connect(fx.port()));
}

TEST_CASE("Integration - concurrent start succeeds once", "[integration]") {
  ServerFixture fx;
  std::atomic<int> succeeded{0};
  std::atomic<int> already_started{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      try {
        fx.server.start();
        succeeded.fetch_add(1);
      } catch (const Error& ex) {
        if (ex.code() == ErrorCode::kAlreadyStarted)
          already_started.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  REQUIRE(succeeded.load() == 1);
  REQUIRE(already_started.load() == 7);
  REQUIRE(fx.server.active());
}

TEST_CASE("Integration - start after stop is rejected", "[integration]") {
  ServerFixture fx;
  fx.server.start();
  fx.server.stop();
  fx.server.stop();  // no-op

  try {
    fx.server.start();
    FAIL("restart accepted");
  } catch (const Error& ex) {
    REQUIRE(ex.code() == ErrorCode::kDisposed);
  }
}

TEST_CASE("Integration - stop before start", "[integration]") {
  ServerFixture fx;
  fx.server.stop();
  REQUIRE(!fx.server.active());
  REQUIRE_THROWS_AS(fx.server.start(), Error);
}

TEST_CASE("Integration - pending requires an active server", "[integration]") {
  ServerFixture fx;
  try {
    (void)fx.server.pending();
    FAIL("pending on idle server");
  } catch (const Error& ex) {
    REQUIRE(ex.code() == ErrorCode::kInactive);
  }

  fx.server.start();
  REQUIRE_NOTHROW(fx.server.pending());

  fx.server.stop();
  REQUIRE_THROWS_AS(fx.server.pending(), Error);
}

TEST_CASE("Integration - null dispatcher rejected", "[integration]") {
  std::shared_ptr<MessageDispatcher> none;
  REQUIRE_THROWS_AS(Server(0, none), std::invalid_argument);
}

TEST_CASE("Integration - zero receive buffer rejected", "[integration]") {
  ServerConfig config;
  config.receive_buffer_size = 0;
  std::shared_ptr<MessageDispatcher> dispatcher = std::make_shared<RecordingDispatcher>();
  REQUIRE_THROWS_AS(Server(0, dispatcher, config), std::invalid_argument);
  REQUIRE_THROWS_AS(Server("127.0.0.1", 0, dispatcher, config), std::invalid_argument);
}

TEST_CASE("Integration - accept failure while listening is logged as error", "[integration]") {
  ServerFixture fx;
  fx.server.start();

  int client_fd = ::socket(AF_INET, SOCK_STREAM, 0);
  REQUIRE(client_fd >= 0);
  ScopeGuard close_client([client_fd]() { ::close(client_fd); });

  std::ostringstream captured;
  std::streambuf* original_cerr = std::cerr.rdbuf(captured.rdbuf());
  ScopeGuard restore_cerr([original_cerr]() { std::cerr.rdbuf(original_cerr); });

  // Every descriptor below the lowest free one is taken, so capping the
  // limit there makes the server's accept() fail with EMFILE
  rlimit original_limit;
  REQUIRE(::getrlimit(RLIMIT_NOFILE, &original_limit) == 0);
  int lowest_free = ::open("/dev/null", O_RDONLY);
  REQUIRE(lowest_free >= 0);
  ::close(lowest_free);
  rlimit lowered = original_limit;
  lowered.rlim_cur = static_cast<rlim_t>(lowest_free);
  REQUIRE(::setrlimit(RLIMIT_NOFILE, &lowered) == 0);
  bool limit_restored = false;
  auto restore_limit = [&]() {
    if (!limit_restored) {
      limit_restored = ::setrlimit(RLIMIT_NOFILE, &original_limit) == 0;
    }
  };
  ScopeGuard restore_limit_guard(restore_limit);

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(fx.port());
  addr.sin_addr.s_addr = inet_addr("127.0.0.1");
  REQUIRE(::connect(client_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

  REQUIRE(wait_until([&]() { return fx.server.stats().accept_errors.load() == 1; }));
  restore_limit();
  REQUIRE(limit_restored);
  REQUIRE(fx.server.active());

  // stop() joins the accept thread, so its log line is complete
  fx.server.stop();
  std::string log = captured.str();
  REQUIRE(log.find("[SESSNET ERROR] Accept loop stopped while listening") != std::string::npos);
}

// ============================================================================
// Routing
// ============================================================================

TEST_CASE("Integration - send_to delivers exact bytes", "[integration]") {
  ServerFixture fx;
  fx.server.start();

  TestClient client;
  std::string key = fx.connect(client);

  std::vector<uint8_t> payload = {0x00, 0x01, 0xFE, 0xFF, 'o', 'k'};
  fx.server.send_to(key, payload);
  std::string got = client.recv_exact(payload.size());
  REQUIRE(got == std::string(payload.begin(), payload.end()));

  fx.server.send_to(key, payload, 4, 2);
  REQUIRE(client.recv_exact(2) == "ok");

  fx.server.send_to(key, std::string_view("text"));
  REQUIRE(client.recv_exact(4) == "text");

  fx.server.stop();
  REQUIRE(client.wait_eof());
}

TEST_CASE("Integration - send_to session handle", "[integration]") {
  ServerFixture fx;
  fx.server.start();

  TestClient client;
  std::string key = fx.connect(client);
  SessionPtr session = fx.server.find_session(key);
  REQUIRE(session != nullptr);

  fx.server.send_to(*session, std::string_view("via handle"));
  REQUIRE(client.recv_exact(10) == "via handle");
}

TEST_CASE("Integration - unknown key is a soft miss", "[integration]") {
  ServerFixture fx;
  fx.server.start();

  REQUIRE_NOTHROW(fx.server.send_to("no-such-session", std::string_view("lost")));
  REQUIRE(fx.server.stats().routing_misses.load() == 1);
}

TEST_CASE("Integration - send_to closed session is a soft miss", "[integration]") {
  ServerFixture fx;
  fx.server.start();

  TestClient client;
  std::string key = fx.connect(client);
  SessionPtr session = fx.server.find_session(key);
  REQUIRE(session != nullptr);

  client.disconnect();
  REQUIRE(wait_until([&]() { return fx.server.session_count() == 0; }));

  REQUIRE_NOTHROW(fx.server.send_to(*session, std::string_view("gone")));
  REQUIRE_NOTHROW(fx.server.send_to(key, std::string_view("gone")));
  REQUIRE(fx.server.stats().routing_misses.load() == 2);
  REQUIRE(fx.dispatcher->closed.load() == 1);
}

TEST_CASE("Integration - send_to invalid range", "[integration]") {
  ServerFixture fx;
  fx.server.start();

  TestClient client;
  std::string key = fx.connect(client);

  std::vector<uint8_t> payload(3, 'x');
  REQUIRE_THROWS_AS(fx.server.send_to(key, payload, 2, 5), Error);
  REQUIRE_THROWS_AS(fx.server.broadcast(payload, 4, 0), Error);
}

TEST_CASE("Integration - echo from dispatcher", "[integration]") {
  ServerFixture fx;
  fx.dispatcher->on_data = [](const SessionPtr& session, const std::string& data) {
    session->send(std::string_view(data));
  };
  fx.server.start();

  TestClient client;
  fx.connect(client);
  REQUIRE(client.send_raw("hello, server"));
  REQUIRE(client.recv_exact(13) == "hello, server");
}

TEST_CASE("Integration - broadcast reaches every session", "[integration]") {
  ServerFixture fx;
  fx.server.start();

  TestClient clients[3];
  for (auto& client : clients) {
    fx.connect(client);
  }
  REQUIRE(fx.server.session_count() == 3);

  fx.server.broadcast(std::string_view("all hands"));
  for (auto& client : clients) {
    REQUIRE(client.recv_exact(9) == "all hands");
  }

  std::vector<uint8_t> payload = {'a', 'b', 'c', 'd'};
  fx.server.broadcast(payload, 1, 2);
  for (auto& client : clients) {
    REQUIRE(client.recv_exact(2) == "bc");
  }
  REQUIRE(fx.server.stats().broadcast_failures.load() == 0);
}

TEST_CASE("Integration - broadcast continues past a closing session", "[integration]") {
  std::atomic<bool> holding{false};
  std::atomic<bool> released{false};
  ServerFixture fx;
  // The first session to close stays registered, in kClosing, until released
  fx.dispatcher->on_closed = [&holding, &released](const SessionPtr&) {
    if (!holding.exchange(true)) {
      while (!released.load())
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  };
  ScopeGuard release_on_exit([&released]() { released = true; });
  fx.server.start();

  TestClient closing;
  std::string closing_key = fx.connect(closing);
  TestClient clients[2];
  for (auto& client : clients) {
    fx.connect(client);
  }

  closing.disconnect();
  REQUIRE(wait_until([&]() { return holding.load(); }));
  SessionPtr held = fx.server.find_session(closing_key);
  REQUIRE(held != nullptr);
  REQUIRE(!held->is_connected());
  REQUIRE(fx.server.session_count() == 3);

  fx.server.broadcast(std::string_view("still on"));
  for (auto& client : clients) {
    REQUIRE(client.recv_exact(8) == "still on");
  }
  REQUIRE(fx.server.stats().broadcast_failures.load() == 1);

  released = true;
  REQUIRE(wait_until([&]() { return fx.server.session_count() == 2; }));
  REQUIRE(fx.dispatcher->closed.load() == 1);
}

TEST_CASE("Integration - fragmented text message", "[integration]") {
  ServerFixture fx;
  fx.server.start();

  TestClient client;
  std::string key = fx.connect(client);

  TextFragmentation message(TextFragmentation::Fragments{"He", "llo"});
  fx.server.send_to(key, message);

  // text frame without FIN, then final continuation frame
  std::string wire = client.recv_exact(2 + 2 + 2 + 3);
  REQUIRE(wire.size() == 9);
  REQUIRE(static_cast<uint8_t>(wire[0]) == 0x01);
  REQUIRE(static_cast<uint8_t>(wire[1]) == 2);
  REQUIRE(wire.substr(2, 2) == "He");
  REQUIRE(static_cast<uint8_t>(wire[4]) == 0x80);
  REQUIRE(static_cast<uint8_t>(wire[5]) == 3);
  REQUIRE(wire.substr(6, 3) == "llo");

  fx.server.broadcast(TextFragmentation(TextFragmentation::Fragments{"Hi"}));
  std::string single = client.recv_exact(4);
  REQUIRE(single.size() == 4);
  REQUIRE(static_cast<uint8_t>(single[0]) == 0x81);
  REQUIRE(single.substr(2) == "Hi");
}

// ============================================================================
// Session lifecycle through the server
// ============================================================================

TEST_CASE("Integration - client disconnect deregisters session", "[integration]") {
  ServerFixture fx;
  fx.server.start();

  TestClient client;
  std::string key = fx.connect(client);
  REQUIRE(client.send_raw("payload"));
  REQUIRE(wait_until([&]() { return fx.dispatcher->received() == "payload"; }));

  client.disconnect();
  REQUIRE(wait_until([&]() { return fx.server.session_count() == 0; }));
  REQUIRE(fx.server.find_session(key) == nullptr);
  REQUIRE(fx.dispatcher->closed.load() == 1);
  REQUIRE(fx.server.stats().total_sessions.load() == 1);
}

TEST_CASE("Integration - receive timeout ends the session", "[integration]") {
  ServerConfig config;
  config.receive_timeout = std::chrono::milliseconds(100);
  ServerFixture fx(config);
  fx.server.start();

  TestClient client;
  fx.connect(client);
  REQUIRE(wait_until([&]() { return fx.server.stats().session_timeouts.load() == 1; }));
  REQUIRE(wait_until([&]() { return fx.server.session_count() == 0; }));
  REQUIRE(client.wait_eof());
  REQUIRE(fx.server.active());
}

TEST_CASE("Integration - faulting session is isolated", "[integration]") {
  ServerFixture fx;
  fx.dispatcher->on_data = [](const SessionPtr& session, const std::string& data) {
    if (data == "boom")
      throw std::runtime_error("dispatcher failure");
    session->send(std::string_view(data));
  };
  fx.server.start();

  TestClient healthy;
  fx.connect(healthy);
  TestClient faulty;
  fx.connect(faulty);

  REQUIRE(faulty.send_raw("boom"));
  REQUIRE(wait_until([&]() { return fx.server.stats().session_faults.load() == 1; }));
  REQUIRE(faulty.wait_eof());
  REQUIRE(wait_until([&]() { return fx.server.session_count() == 1; }));

  REQUIRE(healthy.send_raw("still here"));
  REQUIRE(healthy.recv_exact(10) == "still here");

  // Accept loop keeps running
  TestClient late;
  fx.connect(late);
  REQUIRE(fx.server.session_count() == 2);
}

TEST_CASE("Integration - stop from a dispatcher callback", "[integration]") {
  ServerFixture fx;
  fx.dispatcher->on_data = [](const SessionPtr& session, const std::string& data) {
    if (data == "quit")
      session->server()->stop();
  };
  fx.server.start();

  TestClient requester;
  fx.connect(requester);
  TestClient bystander;
  fx.connect(bystander);

  REQUIRE(requester.send_raw("quit"));
  REQUIRE(wait_until([&]() { return !fx.server.active(); }));
  REQUIRE(wait_until([&]() { return fx.server.session_count() == 0; }));
  REQUIRE(wait_until([&]() { return fx.dispatcher->closed.load() == 2; }));
  REQUIRE(requester.wait_eof());
  REQUIRE(bystander.wait_eof());
}

TEST_CASE("Integration - many concurrent clients", "[integration]") {
  ServerFixture fx;
  fx.dispatcher->on_data = [](const SessionPtr& session, const std::string& data) {
    session->send(std::string_view(data));
  };
  fx.server.start();

  constexpr int kClients = 16;
  std::atomic<int> echoed{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kClients; ++i) {
    threads.emplace_back([&fx, &echoed, i]() {
      TestClient client;
      if (!client.connect(fx.port()))
        return;
      std::string msg = "client-" + std::to_string(i);
      if (client.send_raw(msg) && client.recv_exact(msg.size()) == msg)
        echoed.fetch_add(1);
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  REQUIRE(echoed.load() == kClients);
  REQUIRE(wait_until([&]() { return fx.server.session_count() == 0; }));
  REQUIRE(fx.server.stats().total_sessions.load() == kClients);

  fx.server.stop();
  REQUIRE(fx.dispatcher->closed.load() == kClients);
}

TEST_CASE("Integration - client disconnects race with stop", "[integration]") {
  ServerFixture fx;
  fx.server.start();

  constexpr int kClients = 8;
  TestClient clients[kClients];
  for (auto& client : clients) {
    fx.connect(client);
  }
  REQUIRE(fx.server.session_count() == kClients);

  std::thread disconnector([&clients]() {
    for (auto& client : clients) {
      client.disconnect();
    }
  });
  fx.server.stop();
  disconnector.join();

  REQUIRE(!fx.server.active());
  REQUIRE(fx.server.session_count() == 0);
  REQUIRE(fx.dispatcher->closed.load() == kClients);
  REQUIRE(fx.server.stats().total_sessions.load() == kClients);
}
