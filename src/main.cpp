#include "adapters/WebSocketStompEngine.hpp"
#include "stomp/Errors.hpp"
#include "stomp/StompSession.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

// Shapes this demo knows how to decode, tried in this order.

struct ChatMessage {
  std::string sender;
  std::string text;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ChatMessage, sender, text)

struct Ping {
  std::string kind;
};

void from_json(const nlohmann::json& j, Ping& p) {
  j.at("kind").get_to(p.kind);
  if (p.kind != "ping") {
    throw std::invalid_argument("not a ping");
  }
}

void to_json(nlohmann::json& j, const Ping& p) {
  j = nlohmann::json{{"kind", p.kind}};
}

static std::atomic<bool> shutdown_requested(false);
static std::atomic<bool> disconnected(false);

void signal_handler(int /*sig*/) {
  shutdown_requested = true;
}

static void print_usage() {
  std::cout << "Usage: stomp_client [--url <ws-url>] [--header key=value]... [--timeout <s>]\n"
            << "                    [--ping <s>] [--subscribe <dest>]... [--send <dest> <json>]...\n"
            << "                    [--duration <s>]\n";
}

int main(int argc, char* argv[]) {

#ifdef STOMP_DEBUG
  std::cout << "debug is on! let's go\n";
#endif

  stomp::SessionConfig config;
  config.endpoint = "ws://localhost:15674/ws";
  std::vector<std::string> subscriptions;
  std::vector<std::pair<std::string, nlohmann::json>> outgoing;
  int duration_s = 0;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--url" && i + 1 < argc) {
        config.endpoint = argv[++i];
      } else if (arg == "--header" && i + 1 < argc) {
        std::string kv = argv[++i];
        auto eq = kv.find('=');
        if (eq == std::string::npos) {
          std::cerr << "[Main] --header expects key=value, got '" << kv << "'\n";
          return 1;
        }
        config.connection_headers[kv.substr(0, eq)] = kv.substr(eq + 1);
      } else if (arg == "--timeout" && i + 1 < argc) {
        config.connection_timeout = std::chrono::seconds(std::stoi(argv[++i]));
      } else if (arg == "--ping" && i + 1 < argc) {
        config.auto_ping_interval = std::chrono::seconds(std::stoi(argv[++i]));
      } else if (arg == "--subscribe" && i + 1 < argc) {
        subscriptions.push_back(argv[++i]);
      } else if (arg == "--send" && i + 2 < argc) {
        std::string destination = argv[++i];
        outgoing.emplace_back(destination, nlohmann::json::parse(argv[++i]));
      } else if (arg == "--duration" && i + 1 < argc) {
        duration_s = std::stoi(argv[++i]);
      } else {
        print_usage();
        return 1;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "[Main] invalid arguments: " << e.what() << "\n";
    print_usage();
    return 1;
  }

  config.payload_types = {
    stomp::payload_type<Ping>("Ping"),
    stomp::payload_type<ChatMessage>("ChatMessage"),
  };

  // Handler runs on the engine's thread. Once connected, subscribe and flush
  // whatever --send asked for.
  config.event_handler = [subscriptions, outgoing](stomp::StompSession& session, const stomp::Event& ev) {
    switch (ev.type()) {
      case stomp::EventType::Connecting:
        std::cout << "[Main] connecting to " << session.config().endpoint << "\n";
        break;
      case stomp::EventType::Connected:
        std::cout << "[Main] connected\n";
        try {
          for (const auto& destination : subscriptions) {
            session.subscribe(destination);
          }
          for (const auto& [destination, body] : outgoing) {
            session.send(body, destination);
          }
        } catch (const stomp::StompSessionError& e) {
          std::cerr << "[Main] " << e.what() << "\n";
        }
        break;
      case stomp::EventType::Disconnected:
        std::cout << "[Main] disconnected\n";
        disconnected = true;
        shutdown_requested = true;
        break;
      case stomp::EventType::PayloadReceived:
        if (const auto* chat = ev.payload_as<ChatMessage>()) {
          std::cout << "[Main] " << ev.destination() << " <" << chat->sender << "> " << chat->text << "\n";
        } else if (ev.payload_as<Ping>()) {
          std::cout << "[Main] " << ev.destination() << " ping\n";
        } else {
          std::cout << "[Main] " << ev.destination() << " " << ev.payload_type() << "\n";
        }
        break;
      case stomp::EventType::ErrorReceived:
        std::cerr << "[Main] error: " << ev.description() << "\n";
        break;
    }
  };

  auto engine = std::make_unique<adapter::WebSocketStompEngine>(config.endpoint, config.connection_headers);
  stomp::StompSession session(std::move(engine), std::move(config));

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  try {
    session.connect();
  } catch (const stomp::StompSessionError& e) {
    std::cerr << "[Main] " << e.what() << "\n";
    return 1;
  }

  auto start = std::chrono::steady_clock::now();
  while (!shutdown_requested) {
    if (duration_s > 0 && std::chrono::steady_clock::now() - start >= std::chrono::seconds(duration_s)) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "[Main] shutting down\n";
  if (!disconnected) {
    // give the broker a chance to acknowledge DISCONNECT before tearing down
    session.disconnect();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!disconnected && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (!disconnected) {
      session.disconnect(true);
    }
  }

  std::cout << "[Main] Cleanup complete. Exiting.\n";
  return 0;
}
