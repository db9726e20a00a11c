// wschat command-line front end
//
//   wschat server [port] [bind_addr]       (default 127.0.0.1:8000)
//   wschat client <name> [host] [port]     (default 127.0.0.1:8000)
//
// WSCHAT_LOG_LEVEL=debug|info|warn|error sets the log threshold.

#include "wschat.hpp"

#include <csignal>
#include <cstdlib>

#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>
#include <unistd.h>

namespace {

constexpr uint16_t kDefaultPort = 8000;
constexpr const char* kDefaultHost = "127.0.0.1";

void print_usage(const char* prog) {
  std::cerr << "Usage:\n"
            << "  " << prog << " server [port] [bind_addr]\n"
            << "  " << prog << " client <name> [host] [port]\n";
}

bool parse_port(const char* text, uint16_t* port) {
  char* end = nullptr;
  long value = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || value < 0 || value > 65535) {
    return false;
  }
  *port = static_cast<uint16_t>(value);
  return true;
}

// SIGINT/SIGTERM are blocked in every thread and collected here instead.
// SIGUSR1 is the private "shut the watcher down" signal.
class SignalWatcher {
 public:
  SignalWatcher() {
    sigemptyset(&set_);
    sigaddset(&set_, SIGINT);
    sigaddset(&set_, SIGTERM);
    sigaddset(&set_, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &set_, nullptr);
  }

  ~SignalWatcher() { stop(); }

  template <typename F>
  void start(F on_signal) {
    thread_ = std::thread([this, on_signal] {
      int sig = 0;
      while (sigwait(&set_, &sig) == 0) {
        if (sig == SIGUSR1) {
          return;
        }
        WSCHAT_LOG_INFO(std::string("Caught ") + (sig == SIGINT ? "SIGINT" : "SIGTERM") + ", shutting down");
        on_signal();
      }
    });
  }

  void stop() {
    if (thread_.joinable()) {
      pthread_kill(thread_.native_handle(), SIGUSR1);
      thread_.join();
    }
  }

 private:
  sigset_t set_;
  std::thread thread_;
};

int run_server(int argc, char* argv[]) {
  uint16_t port = kDefaultPort;
  std::string bind_addr = kDefaultHost;
  if (argc > 2 && !parse_port(argv[2], &port)) {
    std::cerr << "Invalid port: " << argv[2] << std::endl;
    return 2;
  }
  if (argc > 3) {
    bind_addr = argv[3];
  }

  SignalWatcher signals;
  try {
    wschat::Server server(port, bind_addr);

    server.on_join = [](const wschat::Server::ConnPtr& conn, const std::string& name) {
      std::cout << name << " joined from " << conn->peer() << std::endl;
    };
    server.on_leave = [](const wschat::Server::ConnPtr& conn, const std::string& name) {
      std::cout << name << " (#" << conn->get_id() << ") left" << std::endl;
    };

    signals.start([&server] { server.stop(); });
    server.run();
    signals.stop();

    const auto& stats = server.stats();
    WSCHAT_LOG_INFO("Served " + std::to_string(stats.total_connections.load()) + " connections, " +
                    std::to_string(stats.messages_in.load()) + " messages");
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

int run_client(int argc, char* argv[]) {
  if (argc < 3) {
    print_usage(argv[0]);
    return 2;
  }
  std::string name = argv[2];
  std::string host = argc > 3 ? argv[3] : kDefaultHost;
  uint16_t port = kDefaultPort;
  if (argc > 4 && !parse_port(argv[4], &port)) {
    std::cerr << "Invalid port: " << argv[4] << std::endl;
    return 2;
  }

  SignalWatcher signals;
  wschat::ChatClient client;

  client.on_message = [](std::string_view msg) { std::cout << "\r" << msg << "\n> " << std::flush; };
  client.on_disconnect = [] { std::cout << "\rDisconnected." << std::endl; };

  auto connected = client.connect(host, port, name);
  if (!connected) {
    std::cerr << "Cannot join " << host << ":" << port << ": " << wschat::to_string(connected.get_error())
              << std::endl;
    return 1;
  }

  signals.start([&client] { client.close(); });
  std::cout << "Joined as " << name << ". Type /exit to leave.\n> " << std::flush;
  client.run(STDIN_FILENO);
  signals.stop();
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (const char* level = std::getenv("WSCHAT_LOG_LEVEL")) {
    if (!wschat::Logger::set_level(std::string_view(level))) {
      std::cerr << "Ignoring unknown WSCHAT_LOG_LEVEL '" << level << "'" << std::endl;
    }
  }

  if (argc < 2) {
    print_usage(argv[0]);
    return 2;
  }

  std::string mode = argv[1];
  if (mode == "server") {
    return run_server(argc, argv);
  }
  if (mode == "client") {
    return run_client(argc, argv);
  }
  print_usage(argv[0]);
  return 2;
}
