// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "metrics/recorder.hpp"
#include "network/node_config.hpp"
#include "network/protocol.hpp"
#include "network/synthetic_node.hpp"
#include "scenario/ping_pong.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void PrintUsage(const char *program_name) {
  std::cout << "synthnet harness - P2P conformance and performance runs\n\n"
            << "Usage: " << program_name << " (--target=<ip:port> | --responder) [options]\n\n"
            << "Target:\n"
            << "  --target=<ip:port>     Node under test ([ipv6]:port for IPv6)\n"
            << "  --responder            Start an in-process PING responder and run against it\n"
            << "\n"
            << "Workload:\n"
            << "  --peers=<n,n,...>      Concurrent peer counts (default: 1,10,...,800)\n"
            << "  --pings=<n>            PINGs per peer (default: 1000)\n"
            << "  --timeout-ms=<n>       PONG timeout per PING (default: 5000)\n"
            << "  --threads=<n>          Worker threads (default: 8)\n"
            << "  --config=<file>        Synthetic peer configuration (JSON)\n"
            << "\n"
            << "Output:\n"
            << "  --loglevel=<level>     trace, debug, info, warn, error (default: info)\n"
            << "  --logfile=<path>       Log to file instead of stdout\n"
            << "  --metrics-json=<path>  Write results and the last round's metrics as JSON\n"
            << "  --help                 Show this help message\n"
            << std::endl;
}

std::optional<uint64_t> ParseNumber(const std::string &text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 19) {
    return std::nullopt;
  }
  return std::stoull(text);
}

std::optional<std::vector<uint32_t>> ParsePeerCounts(const std::string &text) {
  std::vector<uint32_t> counts;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto n = ParseNumber(item);
    if (!n || *n == 0 || *n > 100000) {
      return std::nullopt;
    }
    counts.push_back(static_cast<uint32_t>(*n));
  }
  if (counts.empty()) {
    return std::nullopt;
  }
  return counts;
}

bool WriteResults(const std::string &path, const synthnet::scenario::RequestsTable &table,
                  const synthnet::metrics::Recorder &recorder) {
  json j;
  j["rounds"] = json::parse(table.ToJson());
  j["last_round_metrics"] = json::parse(recorder.to_json());

  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }
  file << j.dump(2) << std::endl;
  return file.good();
}

// In-process PING responder on its own io_context and thread
class LocalResponder {
public:
  LocalResponder() : work_(asio::make_work_guard(io_context_)) {}
  ~LocalResponder() { Stop(); }

  bool Start(uint32_t network_magic) {
    auto config = synthnet::scenario::PingResponderConfig();
    config.network_magic = network_magic;
    node_ = synthnet::network::SyntheticNode::create(io_context_, config);
    if (!node_->start()) {
      return false;
    }
    thread_ = std::thread([this]() { io_context_.run(); });
    return true;
  }

  void Stop() {
    if (node_) {
      node_->shutdown();
    }
    work_.reset();
    io_context_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  asio::ip::tcp::endpoint endpoint() const {
    return asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), node_->listening_port());
  }

private:
  asio::io_context io_context_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::shared_ptr<synthnet::network::SyntheticNode> node_;
  std::thread thread_;
};

}  // namespace

int main(int argc, char *argv[]) {
  using namespace synthnet;

  try {
    if (argc < 2) {
      PrintUsage(argv[0]);
      return 1;
    }

    std::string target_text;
    bool use_responder = false;
    std::string config_path;
    std::string log_level = "info";
    std::string log_file;
    std::string metrics_json_path;
    scenario::PingPongOptions options;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg.starts_with("--target=")) {
        target_text = arg.substr(9);
      } else if (arg == "--responder") {
        use_responder = true;
      } else if (arg.starts_with("--config=")) {
        config_path = arg.substr(9);
      } else if (arg.starts_with("--peers=")) {
        auto counts = ParsePeerCounts(arg.substr(8));
        if (!counts) {
          std::cerr << "Error: --peers expects a comma-separated list of positive counts\n";
          return 1;
        }
        options.peer_counts = *counts;
      } else if (arg.starts_with("--pings=")) {
        auto n = ParseNumber(arg.substr(8));
        if (!n || *n == 0 || *n > 1000000) {
          std::cerr << "Error: --pings expects a positive number\n";
          return 1;
        }
        options.pings = static_cast<uint32_t>(*n);
      } else if (arg.starts_with("--timeout-ms=")) {
        auto n = ParseNumber(arg.substr(13));
        if (!n || *n == 0) {
          std::cerr << "Error: --timeout-ms expects a positive number\n";
          return 1;
        }
        options.reply_timeout = std::chrono::milliseconds(*n);
      } else if (arg.starts_with("--threads=")) {
        auto n = ParseNumber(arg.substr(10));
        if (!n || *n == 0 || *n > 1024) {
          std::cerr << "Error: --threads expects a number between 1 and 1024\n";
          return 1;
        }
        options.worker_threads = static_cast<size_t>(*n);
      } else if (arg.starts_with("--loglevel=")) {
        log_level = arg.substr(11);
      } else if (arg.starts_with("--logfile=")) {
        log_file = arg.substr(10);
        if (log_file.empty()) {
          std::cerr << "Error: --logfile requires a non-empty path\n";
          return 1;
        }
      } else if (arg.starts_with("--metrics-json=")) {
        metrics_json_path = arg.substr(15);
        if (metrics_json_path.empty()) {
          std::cerr << "Error: --metrics-json requires a non-empty path\n";
          return 1;
        }
      } else {
        std::cerr << "Error: unknown option " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }

    const bool has_target = !target_text.empty();
    if (has_target == use_responder) {
      std::cerr << "Error: specify exactly one of --target or --responder\n";
      return 1;
    }

    util::LogManager::Initialize(log_level, !log_file.empty(), log_file);
    std::signal(SIGPIPE, SIG_IGN);
    LOG_APP_INFO("synthnet harness starting at {}", util::FormatTime(util::GetTime()));

    if (!config_path.empty()) {
      network::SyntheticNodeConfig base;
      if (auto err = network::LoadNodeConfigFromFile(config_path, base)) {
        std::cerr << "Error: " << *err << "\n";
        return 1;
      }
      options.peer_config = scenario::PingPeerConfig(base);
    }

    LocalResponder responder;
    if (use_responder) {
      if (!responder.Start(options.peer_config.network_magic)) {
        std::cerr << "Error: failed to start responder\n";
        return 1;
      }
      options.target = responder.endpoint();
    } else {
      auto target = protocol::ParseEndpoint(target_text);
      if (!target) {
        std::cerr << "Error: invalid --target '" << target_text << "' (expected ip:port)\n";
        return 1;
      }
      options.target = *target;
    }

    metrics::Recorder &recorder = metrics::Recorder::install();
    scenario::PingPongScenario ping_pong(options, recorder);
    auto table = ping_pong.Run();

    responder.Stop();

    std::cout << table.ToString();

    if (!metrics_json_path.empty() && !WriteResults(metrics_json_path, table, recorder)) {
      std::cerr << "Error: failed to write " << metrics_json_path << "\n";
      return 1;
    }

    // A round where nothing completed means the target never answered
    bool all_rounds_answered = true;
    for (const auto &row : table.rows()) {
      if (row.samples() == 0) {
        all_rounds_answered = false;
      }
    }

    util::LogManager::Shutdown();
    return all_rounds_answered ? 0 : 2;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
