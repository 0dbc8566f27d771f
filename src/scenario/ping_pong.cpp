// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scenario/ping_pong.hpp"

#include "network/message.hpp"
#include "network/protocol.hpp"
#include "network/synthetic_node.hpp"
#include "util/logging.hpp"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace synthnet {
namespace scenario {

using network::NodeError;

std::vector<uint32_t> DefaultPeerCounts() {
  return {1, 10, 20, 30, 40, 50, 60, 70, 80, 90, 100, 200, 300, 500, 750, 800};
}

network::SyntheticNodeConfig PingPeerConfig(network::SyntheticNodeConfig base) {
  base.with_full_handshake().with_all_auto_reply();
  for (size_t i = 0; i < message::MESSAGE_KIND_COUNT; ++i) {
    const auto kind = static_cast<message::MessageKind>(i);
    if (kind != message::MessageKind::Pong) {
      base.with_filter(kind, network::FilterAction::AutoReply);
    }
  }
  base.with_filter(message::MessageKind::Pong, network::FilterAction::Pass);
  return base;
}

network::SyntheticNodeConfig PingResponderConfig(uint16_t port) {
  network::SyntheticNodeConfig config;
  config.with_full_handshake().with_all_auto_reply();
  // Answer and consume everything; nothing is read from the queue
  for (size_t i = 0; i < message::MESSAGE_KIND_COUNT; ++i) {
    config.with_filter(static_cast<message::MessageKind>(i), network::FilterAction::AutoReply);
  }
  config.listen = true;
  config.listen_port = port;
  // Room for the largest default round plus stragglers still closing
  config.max_peers = 2 * DefaultPeerCounts().back() + 10;
  return config;
}

namespace {

// One synthetic peer: connect, then PING/PONG until done or timed out.
class PingPeer : public std::enable_shared_from_this<PingPeer> {
public:
  using DoneCallback = std::function<void(const PeerOutcome&)>;

  PingPeer(asio::io_context& io_context, const PingPongOptions& options, metrics::Recorder& recorder,
           DoneCallback done)
      : io_context_(io_context), options_(options), recorder_(recorder), done_(std::move(done)) {}

  void start() {
    node_ = network::SyntheticNode::create(io_context_, options_.peer_config);
    auto self = shared_from_this();
    node_->async_connect(options_.target, [self](NodeError result) {
      if (result != NodeError::None) {
        LOG_WARN_RL("ping peer failed to connect to {}: {}", protocol::EndpointToString(self->options_.target),
                    network::NodeErrorAsString(result));
        self->finish(result);
        return;
      }
      self->outcome_.connected = true;
      self->send_ping();
    });
  }

private:
  void send_ping() {
    if (outcome_.completed >= options_.pings) {
      finish(NodeError::None);
      return;
    }

    nonce_ = message::GenerateNonce();
    NodeError result = node_->send_direct_message(options_.target, message::Ping{nonce_});
    if (result != NodeError::None) {
      LOG_WARN_RL("ping peer failed to send PING: {}", network::NodeErrorAsString(result));
      finish(result);
      return;
    }
    sent_at_ = std::chrono::steady_clock::now();
    deadline_ = sent_at_ + options_.reply_timeout;
    await_pong();
  }

  void await_pong() {
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - std::chrono::steady_clock::now());
    if (remaining.count() < 0) {
      remaining = std::chrono::milliseconds(0);
    }
    auto self = shared_from_this();
    node_->async_recv_message(remaining, [self](NodeError result, network::InboundMessage inbound) {
      self->on_message(result, std::move(inbound));
    });
  }

  void on_message(NodeError result, network::InboundMessage inbound) {
    if (result != NodeError::None) {
      if (result == NodeError::Timeout) {
        LOG_DEBUG("ping peer timed out after {} PONGs", outcome_.completed);
      }
      finish(result);
      return;
    }

    const auto* pong = std::get_if<message::Pong>(&inbound.msg);
    if (!pong) {
      LOG_TRACE("ping peer ignoring {}", message::CommandOf(inbound.msg));
      await_pong();
      return;
    }
    if (pong->nonce != nonce_) {
      ++outcome_.mismatches;
      recorder_.increment_counter(METRIC_PING_MISMATCH);
      LOG_WARN_RL("PONG nonce mismatch: expected {}, got {}", nonce_, pong->nonce);
      await_pong();
      return;
    }

    recorder_.record_histogram(METRIC_PING_LATENCY, DurationAsMs(std::chrono::steady_clock::now() - sent_at_));
    ++outcome_.completed;
    send_ping();
  }

  void finish(NodeError result) {
    if (finished_) {
      return;
    }
    finished_ = true;
    outcome_.error = result;
    node_->shutdown();
    auto done = std::move(done_);
    done_ = {};
    if (done) {
      done(outcome_);
    }
  }

  asio::io_context& io_context_;
  const PingPongOptions& options_;
  metrics::Recorder& recorder_;
  DoneCallback done_;

  std::shared_ptr<network::SyntheticNode> node_;
  uint64_t nonce_{0};
  std::chrono::steady_clock::time_point sent_at_;
  std::chrono::steady_clock::time_point deadline_;
  PeerOutcome outcome_;
  bool finished_{false};
};

}  // namespace

PingPongScenario::PingPongScenario(PingPongOptions options, metrics::Recorder& recorder)
    : options_(std::move(options)), recorder_(recorder) {
  if (options_.worker_threads == 0) {
    options_.worker_threads = 1;
  }
}

RequestsTable PingPongScenario::Run() {
  RequestsTable table;
  for (uint32_t peers : options_.peer_counts) {
    table.add_row(RunRound(peers));
  }
  return table;
}

RequestStats PingPongScenario::RunRound(uint32_t peers) {
  recorder_.clear();
  recorder_.register_histogram(METRIC_PING_LATENCY);
  recorder_.register_counter(METRIC_PING_MISMATCH);
  recorder_.register_gauge(METRIC_PING_CONNECTED);
  recorder_.register_gauge(METRIC_PING_ROUND_SECS);
  last_outcomes_.clear();

  if (peers == 0) {
    return RequestStats(0, options_.pings, metrics::Histogram{}, 0.0);
  }

  LOG_APP_INFO("ping-pong: {} peers x {} PINGs against {}", peers, options_.pings,
               protocol::EndpointToString(options_.target));

  std::mutex mutex;
  std::condition_variable cv;
  uint32_t remaining = peers;
  std::vector<PeerOutcome> outcomes;
  outcomes.reserve(peers);

  asio::io_context io_context;
  auto work = asio::make_work_guard(io_context);
  std::vector<std::thread> workers;
  workers.reserve(options_.worker_threads);
  for (size_t i = 0; i < options_.worker_threads; ++i) {
    workers.emplace_back([&io_context]() { io_context.run(); });
  }

  const auto started = std::chrono::steady_clock::now();
  for (uint32_t i = 0; i < peers; ++i) {
    auto peer = std::make_shared<PingPeer>(io_context, options_, recorder_, [&](const PeerOutcome& outcome) {
      std::lock_guard<std::mutex> lock(mutex);
      outcomes.push_back(outcome);
      if (--remaining == 0) {
        cv.notify_all();
      }
    });
    peer->start();
  }

  {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&]() { return remaining == 0; });
  }
  const double time_taken_secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

  // Every peer has shut its node down; let the closes drain
  work.reset();
  for (auto& worker : workers) {
    worker.join();
  }

  auto latencies = recorder_.histogram(METRIC_PING_LATENCY).value_or(metrics::Histogram{});
  RequestStats stats(peers, options_.pings, std::move(latencies), time_taken_secs);

  size_t failed = 0;
  size_t connected = 0;
  for (const auto& outcome : outcomes) {
    if (outcome.error != NodeError::None) {
      ++failed;
    }
    if (outcome.connected) {
      ++connected;
    }
  }
  recorder_.set_gauge(METRIC_PING_CONNECTED, static_cast<double>(connected));
  recorder_.set_gauge(METRIC_PING_ROUND_SECS, time_taken_secs);
  LOG_APP_INFO("ping-pong: {} peers done in {:.2f}s, {:.2f}% complete, {} peers ended early", peers, time_taken_secs,
               stats.completion_percent(), failed);

  last_outcomes_ = std::move(outcomes);
  return stats;
}

}  // namespace scenario
}  // namespace synthnet
