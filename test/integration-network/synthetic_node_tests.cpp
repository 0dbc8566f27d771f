// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// SyntheticNode over loopback: connect, send, receive, limits and shutdown

#include <catch2/catch_test_macros.hpp>
#include "network/synthetic_node.hpp"
#include "infra/loopback.hpp"

#include <algorithm>
#include <future>
#include <iterator>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

using namespace synthnet;
using namespace synthnet::network;
using namespace synthnet::test;

namespace {

constexpr auto kRecvTimeout = std::chrono::seconds(3);

std::shared_ptr<SyntheticNode> StartResponder(asio::io_context& io, const SyntheticNodeConfig& config = ResponderConfig()) {
    auto node = SyntheticNode::create(io, config);
    REQUIRE(node->start());
    REQUIRE(node->listening_port() != 0);
    return node;
}

SyntheticNodeConfig HandshakingClient() {
    SyntheticNodeConfig config;
    config.with_full_handshake();
    return config;
}

}  // namespace

TEST_CASE("SyntheticNode handshake and PING auto-reply", "[network][node]") {
    TestIoContext io(4);
    auto responder = StartResponder(io.get());
    auto client = SyntheticNode::create(io.get(), HandshakingClient());
    const auto target = Loopback(responder->listening_port());

    REQUIRE(client->connect(target) == NodeError::None);
    CHECK(client->num_connected() == 1);
    CHECK(client->connected_peers() == std::vector<asio::ip::tcp::endpoint>{target});
    CHECK(WaitFor([&] { return responder->num_connected() == 1; }));

    // Handshake messages are never queued
    CHECK(client->queued_messages() == 0);

    REQUIRE(client->send_direct_message(target, message::Ping{0xfeedbeef}) == NodeError::None);

    InboundMessage inbound;
    REQUIRE(client->recv_message_timeout(kRecvTimeout, inbound) == NodeError::None);
    CHECK(inbound.from == target);
    REQUIRE(std::holds_alternative<message::Pong>(inbound.msg));
    CHECK(std::get<message::Pong>(inbound.msg).nonce == 0xfeedbeef);

    SECTION("AutoReplyAndPass also queues the request on the responder") {
        InboundMessage seen;
        REQUIRE(responder->recv_message_timeout(kRecvTimeout, seen) == NodeError::None);
        REQUIRE(std::holds_alternative<message::Ping>(seen.msg));
        CHECK(std::get<message::Ping>(seen.msg).nonce == 0xfeedbeef);
        CHECK(seen.from.address().is_v4());
    }

    SECTION("Other canonical replies") {
        REQUIRE(client->send_direct_message(target, message::GetAddr{}) == NodeError::None);
        REQUIRE(client->recv_message_timeout(kRecvTimeout, inbound) == NodeError::None);
        CHECK(std::holds_alternative<message::Addr>(inbound.msg));

        message::GetData request;
        request.inventory.push_back(protocol::InventoryVector{protocol::InventoryType::MSG_TX, Hash256{}});
        REQUIRE(client->send_direct_message(target, request) == NodeError::None);
        REQUIRE(client->recv_message_timeout(kRecvTimeout, inbound) == NodeError::None);
        REQUIRE(std::holds_alternative<message::NotFound>(inbound.msg));
        CHECK(std::get<message::NotFound>(inbound.msg).inventory == request.inventory);
    }

    client->shutdown();
    responder->shutdown();
}

TEST_CASE("SyntheticNode recv timeout never consumes a message", "[network][node]") {
    TestIoContext io(4);
    auto responder = StartResponder(io.get());
    auto client = SyntheticNode::create(io.get(), HandshakingClient());
    const auto target = Loopback(responder->listening_port());
    REQUIRE(client->connect(target) == NodeError::None);

    InboundMessage inbound;
    CHECK(client->recv_message_timeout(std::chrono::milliseconds(50), inbound) == NodeError::Timeout);
    CHECK(client->queued_messages() == 0);

    // A reply arriving with nobody waiting stays queued
    REQUIRE(client->send_direct_message(target, message::Ping{1}) == NodeError::None);
    REQUIRE(client->send_direct_message(target, message::Ping{2}) == NodeError::None);
    REQUIRE(WaitFor([&] { return client->queued_messages() == 2; }));

    // Arrival order is preserved
    REQUIRE(client->recv_message_timeout(std::chrono::milliseconds(0), inbound) == NodeError::None);
    CHECK(std::get<message::Pong>(inbound.msg).nonce == 1);
    REQUIRE(client->recv_message_timeout(std::chrono::milliseconds(0), inbound) == NodeError::None);
    CHECK(std::get<message::Pong>(inbound.msg).nonce == 2);
    CHECK(client->queued_messages() == 0);
}

TEST_CASE("SyntheticNode async recv completes when a message arrives", "[network][node]") {
    TestIoContext io(4);
    auto responder = StartResponder(io.get());
    auto client = SyntheticNode::create(io.get(), HandshakingClient());
    const auto target = Loopback(responder->listening_port());
    REQUIRE(client->connect(target) == NodeError::None);

    std::promise<std::pair<NodeError, InboundMessage>> promise;
    auto future = promise.get_future();
    client->async_recv_message(kRecvTimeout, [&promise](NodeError result, InboundMessage inbound) {
        promise.set_value({result, std::move(inbound)});
    });

    REQUIRE(client->send_direct_message(target, message::Ping{99}) == NodeError::None);
    REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    auto [result, inbound] = future.get();
    CHECK(result == NodeError::None);
    CHECK(std::get<message::Pong>(inbound.msg).nonce == 99);
}

TEST_CASE("SyntheticNode filters", "[network][node]") {
    TestIoContext io(4);
    auto responder = StartResponder(io.get());
    const auto target = Loopback(responder->listening_port());

    SECTION("Drop discards the kind") {
        auto config = HandshakingClient();
        config.with_filter(message::MessageKind::Pong, FilterAction::Drop);
        auto client = SyntheticNode::create(io.get(), config);
        REQUIRE(client->connect(target) == NodeError::None);

        REQUIRE(client->send_direct_message(target, message::Ping{5}) == NodeError::None);
        InboundMessage inbound;
        CHECK(client->recv_message_timeout(std::chrono::milliseconds(300), inbound) == NodeError::Timeout);
    }

    SECTION("AutoReply answers without queueing") {
        auto config = ResponderConfig();
        config.with_filter(message::MessageKind::Ping, FilterAction::AutoReply);
        auto quiet = StartResponder(io.get(), config);
        const auto quiet_target = Loopback(quiet->listening_port());

        auto client = SyntheticNode::create(io.get(), HandshakingClient());
        REQUIRE(client->connect(quiet_target) == NodeError::None);
        REQUIRE(client->send_direct_message(quiet_target, message::Ping{6}) == NodeError::None);

        InboundMessage inbound;
        REQUIRE(client->recv_message_timeout(kRecvTimeout, inbound) == NodeError::None);
        CHECK(std::get<message::Pong>(inbound.msg).nonce == 6);
        CHECK(quiet->recv_message_timeout(std::chrono::milliseconds(200), inbound) == NodeError::Timeout);
    }
}

TEST_CASE("SyntheticNode connection bookkeeping errors", "[network][node]") {
    TestIoContext io(4);
    auto responder = StartResponder(io.get());
    const auto target = Loopback(responder->listening_port());

    SECTION("AlreadyConnected") {
        auto client = SyntheticNode::create(io.get(), HandshakingClient());
        REQUIRE(client->connect(target) == NodeError::None);
        CHECK(client->connect(target) == NodeError::AlreadyConnected);
        CHECK(client->num_tracked() == 1);
    }

    SECTION("PeerLimit counts connections still handshaking") {
        auto second = StartResponder(io.get());
        auto config = HandshakingClient();
        config.max_peers = 1;
        auto client = SyntheticNode::create(io.get(), config);
        REQUIRE(client->connect(target) == NodeError::None);
        CHECK(client->connect(Loopback(second->listening_port())) == NodeError::PeerLimit);
        CHECK(client->num_tracked() == 1);
    }

    SECTION("ConnectionNotFound") {
        auto client = SyntheticNode::create(io.get(), HandshakingClient());
        CHECK(client->send_direct_message(target, message::Ping{1}) == NodeError::ConnectionNotFound);
        CHECK(client->disconnect(target) == NodeError::ConnectionNotFound);
    }

    SECTION("ConnectFailed leaves nothing tracked") {
        auto client = SyntheticNode::create(io.get(), HandshakingClient());
        CHECK(client->connect(Loopback(UnusedPort())) == NodeError::ConnectFailed);
        CHECK(client->num_tracked() == 0);
    }

    SECTION("disconnect") {
        auto client = SyntheticNode::create(io.get(), HandshakingClient());
        REQUIRE(client->connect(target) == NodeError::None);
        REQUIRE(WaitFor([&] { return responder->num_connected() == 1; }));

        CHECK(client->disconnect(target) == NodeError::None);
        CHECK(client->num_tracked() == 0);
        CHECK(client->send_direct_message(target, message::Ping{1}) == NodeError::ConnectionNotFound);
        CHECK(WaitFor([&] { return responder->num_tracked() == 0; }));

        // The endpoint can be dialed again
        CHECK(client->connect(target) == NodeError::None);
    }
}

TEST_CASE("SyntheticNode inbound peer limit", "[network][node]") {
    TestIoContext io(4);
    auto config = ResponderConfig();
    config.max_peers = 1;
    auto responder = StartResponder(io.get(), config);
    const auto target = Loopback(responder->listening_port());

    auto first = SyntheticNode::create(io.get(), HandshakingClient());
    auto second = SyntheticNode::create(io.get(), HandshakingClient());
    REQUIRE(first->connect(target) == NodeError::None);
    CHECK(second->connect(target) != NodeError::None);
    CHECK(second->num_tracked() == 0);
    CHECK(responder->num_tracked() == 1);
}

TEST_CASE("SyntheticNode without handshake is Ready on TCP connect", "[network][node]") {
    TestIoContext io(2);
    RawListener silent(io.get());

    auto client = SyntheticNode::create(io.get());
    REQUIRE(client->connect(silent.endpoint()) == NodeError::None);
    CHECK(client->num_connected() == 1);
    CHECK(WaitFor([&] { return silent.accepted() == 1; }));
}

TEST_CASE("SyntheticNode handshake deadline", "[network][node][handshake]") {
    TestIoContext io(2);
    RawListener silent(io.get());

    auto config = HandshakingClient();
    config.io_timeout = std::chrono::milliseconds(200);
    auto client = SyntheticNode::create(io.get(), config);

    // Repeated attempts never leak tracked connections
    for (int attempt = 0; attempt < 3; ++attempt) {
        CHECK(client->connect(silent.endpoint()) == NodeError::HandshakeTimeout);
        CHECK(client->num_tracked() == 0);
    }
    CHECK(silent.accepted() == 3);
}

TEST_CASE("SyntheticNode decodes raw frames", "[network][node]") {
    TestIoContext io(2);

    SECTION("Well-formed frame is queued") {
        RawListener scripted(io.get(), message::EncodeMessage(protocol::magic::TESTNET, message::Ping{31337}));
        auto client = SyntheticNode::create(io.get());
        REQUIRE(client->connect(scripted.endpoint()) == NodeError::None);

        InboundMessage inbound;
        REQUIRE(client->recv_message_timeout(kRecvTimeout, inbound) == NodeError::None);
        CHECK(std::get<message::Ping>(inbound.msg).nonce == 31337);
    }

    SECTION("Unknown command is skipped and the stream continues") {
        auto bytes = message::EncodeMessage(protocol::magic::TESTNET, message::Ping{1});
        // Same body under a command the codec does not know
        const char unknown[12] = {'s', 'e', 'n', 'd', 'h', 'e', 'a', 'd', 'e', 'r', 's', 0};
        std::copy(std::begin(unknown), std::end(unknown), bytes.begin() + 4);
        auto follow = message::EncodeMessage(protocol::magic::TESTNET, message::Pong{2});
        bytes.insert(bytes.end(), follow.begin(), follow.end());

        RawListener scripted(io.get(), bytes);
        auto client = SyntheticNode::create(io.get());
        REQUIRE(client->connect(scripted.endpoint()) == NodeError::None);

        InboundMessage inbound;
        REQUIRE(client->recv_message_timeout(kRecvTimeout, inbound) == NodeError::None);
        CHECK(std::get<message::Pong>(inbound.msg).nonce == 2);
        CHECK(client->num_connected() == 1);
    }

    SECTION("Wrong network magic closes the connection") {
        RawListener scripted(io.get(), message::EncodeMessage(protocol::magic::MAINNET, message::Ping{1}));
        auto client = SyntheticNode::create(io.get());
        REQUIRE(client->connect(scripted.endpoint()) == NodeError::None);

        CHECK(WaitFor([&] { return client->num_tracked() == 0; }));
        InboundMessage inbound;
        CHECK(client->recv_message_timeout(std::chrono::milliseconds(50), inbound) == NodeError::Timeout);
    }
}

TEST_CASE("SyntheticNode shutdown", "[network][node]") {
    TestIoContext io(4);
    auto responder = StartResponder(io.get());
    auto client = SyntheticNode::create(io.get(), HandshakingClient());
    const auto target = Loopback(responder->listening_port());
    REQUIRE(client->connect(target) == NodeError::None);

    std::promise<NodeError> pending;
    auto pending_result = pending.get_future();
    client->async_recv_message(std::chrono::seconds(30),
                               [&pending](NodeError result, InboundMessage) { pending.set_value(result); });

    client->shutdown();
    client->shutdown();
    CHECK(client->is_shut_down());

    REQUIRE(pending_result.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    CHECK(pending_result.get() == NodeError::ShuttingDown);

    CHECK(client->num_tracked() == 0);
    CHECK(client->connect(target) == NodeError::ShuttingDown);
    CHECK(client->send_direct_message(target, message::Ping{1}) == NodeError::ShuttingDown);
    InboundMessage inbound;
    CHECK(client->recv_message_timeout(std::chrono::milliseconds(10), inbound) == NodeError::ShuttingDown);

    CHECK(WaitFor([&] { return responder->num_tracked() == 0; }));
}

TEST_CASE("SyntheticNode blocking calls from an io_context thread", "[network][node]") {
    TestIoContext io(2);
    auto responder = StartResponder(io.get());
    auto client = SyntheticNode::create(io.get(), HandshakingClient());
    const auto target = Loopback(responder->listening_port());

    std::promise<std::pair<NodeError, NodeError>> results;
    auto future = results.get_future();
    asio::post(io.get(), [&]() {
        InboundMessage inbound;
        auto connect_result = client->connect(target);
        auto recv_result = client->recv_message_timeout(std::chrono::seconds(1), inbound);
        results.set_value(std::make_pair(connect_result, recv_result));
    });

    REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    auto [connect_result, recv_result] = future.get();
    CHECK(connect_result == NodeError::WouldBlock);
    CHECK(recv_result == NodeError::WouldBlock);
    CHECK(client->num_tracked() == 0);

    // The same calls from this thread go through
    CHECK(client->connect(target) == NodeError::None);
}

TEST_CASE("SyntheticNode disconnect handler", "[network][node]") {
    TestIoContext io(4);
    auto responder = StartResponder(io.get());
    auto client = SyntheticNode::create(io.get(), HandshakingClient());
    const auto target = Loopback(responder->listening_port());

    std::mutex mutex;
    std::vector<std::pair<asio::ip::tcp::endpoint, NodeError>> reasons;
    client->set_disconnect_handler([&](const asio::ip::tcp::endpoint& remote, NodeError reason) {
        std::lock_guard<std::mutex> lock(mutex);
        reasons.emplace_back(remote, reason);
    });
    auto reason_count = [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return reasons.size();
    };

    SECTION("Remote close is a transport error") {
        REQUIRE(client->connect(target) == NodeError::None);
        REQUIRE(WaitFor([&] { return responder->num_connected() == 1; }));
        auto peers = responder->connected_peers();
        REQUIRE(peers.size() == 1);
        REQUIRE(responder->disconnect(peers[0]) == NodeError::None);

        REQUIRE(WaitFor([&] { return reason_count() == 1; }));
        CHECK(reasons[0].first == target);
        CHECK(reasons[0].second == NodeError::Transport);
        CHECK(client->num_tracked() == 0);
    }

    SECTION("Local disconnect is not reported") {
        REQUIRE(client->connect(target) == NodeError::None);
        REQUIRE(client->disconnect(target) == NodeError::None);
        CHECK(client->num_tracked() == 0);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        CHECK(reason_count() == 0);
    }

    client->shutdown();
}
