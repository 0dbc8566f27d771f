// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "metrics/recorder.hpp"
#include "network/connection_types.hpp"
#include "network/node_config.hpp"
#include "scenario/request_stats.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

#include <asio.hpp>

namespace synthnet {
namespace scenario {

inline constexpr uint32_t DEFAULT_PINGS = 1000;
inline constexpr std::chrono::milliseconds DEFAULT_PING_TIMEOUT{std::chrono::seconds(5)};
inline constexpr size_t DEFAULT_WORKER_THREADS = 8;

inline constexpr const char* METRIC_PING_LATENCY = "ping_perf_latency";
inline constexpr const char* METRIC_PING_MISMATCH = "ping_perf_mismatch";
inline constexpr const char* METRIC_PING_CONNECTED = "ping_perf_connected_peers";
inline constexpr const char* METRIC_PING_ROUND_SECS = "ping_perf_round_secs";

// 1, 10, 20 ... 100, 200, 300, 500, 750, 800
std::vector<uint32_t> DefaultPeerCounts();

// Configuration for the synthetic peers: full handshake, auto-reply to
// everything, and only PONG reaches the caller.
network::SyntheticNodeConfig PingPeerConfig(network::SyntheticNodeConfig base = network::SyntheticNodeConfig{});

// Configuration for a listening node that answers PING with PONG, for runs
// without an external node under test.
network::SyntheticNodeConfig PingResponderConfig(uint16_t port = 0);

struct PingPongOptions {
  asio::ip::tcp::endpoint target;
  std::vector<uint32_t> peer_counts;
  uint32_t pings;
  std::chrono::milliseconds reply_timeout;  // per PING
  size_t worker_threads;
  network::SyntheticNodeConfig peer_config;

  PingPongOptions()
      : peer_counts(DefaultPeerCounts()), pings(DEFAULT_PINGS), reply_timeout(DEFAULT_PING_TIMEOUT),
        worker_threads(DEFAULT_WORKER_THREADS), peer_config(PingPeerConfig()) {}
};

// How one peer's run ended
struct PeerOutcome {
  bool connected{false};   // handshake completed
  uint32_t completed{0};   // PONGs with the right nonce
  uint32_t mismatches{0};  // PONGs with the wrong nonce
  network::NodeError error{network::NodeError::None};  // None if every PING was answered
};

/**
 * PingPongScenario - PING/PONG latency under increasing peer counts.
 *
 * For each peer count N the recorder is cleared and the round's metrics
 * registered, then N synthetic nodes connect to the target concurrently and
 * each sends `pings` PINGs one at a time, waiting up to `reply_timeout` for
 * the matching PONG. Each answered PING records its latency (ms). A timeout
 * or connection failure ends that peer's run; the other peers continue.
 * When the round ends the gauges hold the number of peers that completed the
 * handshake and the round's wall time in seconds.
 *
 * Every peer runs as a chain of async handlers on one io_context served by
 * `worker_threads` threads, so N may be much larger than the thread count.
 */
class PingPongScenario {
public:
  explicit PingPongScenario(PingPongOptions options, metrics::Recorder& recorder = metrics::Recorder::instance());

  // Every peer count in order
  RequestsTable Run();

  // One peer count
  RequestStats RunRound(uint32_t peers);

  // Outcomes of the last round, one per peer
  const std::vector<PeerOutcome>& last_outcomes() const { return last_outcomes_; }

  const PingPongOptions& options() const { return options_; }

private:
  PingPongOptions options_;
  metrics::Recorder& recorder_;
  std::vector<PeerOutcome> last_outcomes_;
};

}  // namespace scenario
}  // namespace synthnet
