// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for SyntheticNodeConfig - defaults, filter resolution, JSON loading

#include <catch2/catch_test_macros.hpp>
#include "network/node_config.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace synthnet;
using namespace synthnet::network;
using message::MessageKind;

TEST_CASE("SyntheticNodeConfig defaults", "[network][config]") {
    SyntheticNodeConfig config;
    CHECK(config.handshake == HandshakeMode::None);
    CHECK(config.auto_reply == AutoReplyMode::None);
    CHECK(config.max_peers == DEFAULT_MAX_PEERS);
    CHECK(config.connect_timeout == DEFAULT_CONNECT_TIMEOUT);
    CHECK(config.io_timeout == DEFAULT_IO_TIMEOUT);
    CHECK(config.network_magic == protocol::magic::TESTNET);
    CHECK_FALSE(config.listen);
    CHECK(config.filters.empty());

    // Nothing is answered automatically by default
    for (size_t i = 0; i < message::MESSAGE_KIND_COUNT; ++i) {
        CHECK(config.action_for(static_cast<MessageKind>(i)) == FilterAction::Pass);
    }
}

TEST_CASE("SyntheticNodeConfig::action_for", "[network][config]") {
    SyntheticNodeConfig config;
    config.with_full_handshake().with_all_auto_reply();
    REQUIRE(config.handshake == HandshakeMode::Full);

    SECTION("Kinds with a canonical reply are answered and still queued") {
        CHECK(config.action_for(MessageKind::Ping) == FilterAction::AutoReplyAndPass);
        CHECK(config.action_for(MessageKind::GetAddr) == FilterAction::AutoReplyAndPass);
        CHECK(config.action_for(MessageKind::GetData) == FilterAction::AutoReplyAndPass);
        CHECK(config.action_for(MessageKind::GetHeaders) == FilterAction::AutoReplyAndPass);
    }

    SECTION("Kinds without a reply pass through") {
        CHECK(config.action_for(MessageKind::Pong) == FilterAction::Pass);
        CHECK(config.action_for(MessageKind::Inv) == FilterAction::Pass);
        CHECK(config.action_for(MessageKind::Headers) == FilterAction::Pass);
    }

    SECTION("Overrides win in either mode") {
        config.with_filter(MessageKind::Ping, FilterAction::AutoReply);
        config.with_filter(MessageKind::Inv, FilterAction::Drop);
        CHECK(config.action_for(MessageKind::Ping) == FilterAction::AutoReply);
        CHECK(config.action_for(MessageKind::Inv) == FilterAction::Drop);

        SyntheticNodeConfig plain;
        plain.with_filter(MessageKind::Ping, FilterAction::AutoReply);
        CHECK(plain.action_for(MessageKind::Ping) == FilterAction::AutoReply);
        CHECK(plain.action_for(MessageKind::GetAddr) == FilterAction::Pass);
    }
}

TEST_CASE("FilterAction names", "[network][config]") {
    for (auto action : {FilterAction::Pass, FilterAction::Drop, FilterAction::AutoReply,
                        FilterAction::AutoReplyAndPass}) {
        auto parsed = ParseFilterAction(FilterActionAsString(action));
        REQUIRE(parsed);
        CHECK(*parsed == action);
    }
    CHECK_FALSE(ParseFilterAction("ignore"));
}

TEST_CASE("MagicForNetwork", "[network][config]") {
    CHECK(MagicForNetwork("mainnet") == protocol::magic::MAINNET);
    CHECK(MagicForNetwork("testnet") == protocol::magic::TESTNET);
    CHECK(MagicForNetwork("regtest") == protocol::magic::REGTEST);
    CHECK_FALSE(MagicForNetwork("signet"));
}

TEST_CASE("LoadNodeConfigFromString", "[network][config][json]") {
    SECTION("Every key") {
        SyntheticNodeConfig config;
        auto err = LoadNodeConfigFromString(R"({
            "handshake": "full",
            "auto_reply": "all",
            "max_peers": 250,
            "connect_timeout_ms": 1500,
            "io_timeout_ms": 2500,
            "network": "regtest",
            "listen": true,
            "listen_port": 18444,
            "user_agent": "/synthnet:test/",
            "start_height": 77,
            "services": 0,
            "filters": { "ping": "auto-reply", "inv": "drop" }
        })",
                                            config);
        REQUIRE_FALSE(err);
        CHECK(config.handshake == HandshakeMode::Full);
        CHECK(config.auto_reply == AutoReplyMode::All);
        CHECK(config.max_peers == 250);
        CHECK(config.connect_timeout == std::chrono::milliseconds(1500));
        CHECK(config.io_timeout == std::chrono::milliseconds(2500));
        CHECK(config.network_magic == protocol::magic::REGTEST);
        CHECK(config.listen);
        CHECK(config.listen_port == 18444);
        CHECK(config.user_agent == "/synthnet:test/");
        CHECK(config.start_height == 77);
        CHECK(config.services == 0);
        CHECK(config.action_for(MessageKind::Ping) == FilterAction::AutoReply);
        CHECK(config.action_for(MessageKind::Inv) == FilterAction::Drop);
    }

    SECTION("Absent keys keep their current values") {
        SyntheticNodeConfig config;
        config.max_peers = 7;
        REQUIRE_FALSE(LoadNodeConfigFromString(R"({"handshake": "full"})", config));
        CHECK(config.max_peers == 7);
        CHECK(config.handshake == HandshakeMode::Full);
    }

    SECTION("Explicit magic overrides the network name") {
        SyntheticNodeConfig config;
        REQUIRE_FALSE(LoadNodeConfigFromString(R"({"network": "mainnet", "network_magic": 1234})", config));
        CHECK(config.network_magic == 1234);
    }

    SECTION("Errors leave the config untouched") {
        SyntheticNodeConfig config;
        const char* bad_inputs[] = {
            "not json",
            "[1, 2, 3]",
            R"({"bogus": 1})",
            R"({"handshake": "partial"})",
            R"({"max_peers": 0})",
            R"({"max_peers": -5})",
            R"({"listen_port": 70000})",
            R"({"network": "signet"})",
            R"({"filters": {"sendheaders": "drop"}})",
            R"({"filters": {"ping": "ignore"}})",
            R"({"handshake": "full", "listen": "yes"})",
            R"({"handshake": "full", "io_timeout_ms": 0})",
            R"({"handshake": "full", "connect_timeout_ms": 0})",
            R"({"handshake": "full", "io_timeout_ms": 86400001})",
            R"({"handshake": "full", "connect_timeout_ms": 18446744073709551615})",
        };
        for (const char* input : bad_inputs) {
            INFO(input);
            auto err = LoadNodeConfigFromString(input, config);
            CHECK(err.has_value());
            CHECK(config.handshake == HandshakeMode::None);
            CHECK(config.max_peers == DEFAULT_MAX_PEERS);
        }
    }
}

TEST_CASE("NodeConfigToJson loads back to the same config", "[network][config][json]") {
    SyntheticNodeConfig original;
    original.with_full_handshake().with_all_auto_reply().with_filter(MessageKind::Pong, FilterAction::Drop);
    original.max_peers = 12;
    original.network_magic = protocol::magic::MAINNET;
    original.user_agent = "/x/";

    SyntheticNodeConfig loaded;
    REQUIRE_FALSE(LoadNodeConfigFromString(NodeConfigToJson(original), loaded));
    CHECK(loaded.handshake == original.handshake);
    CHECK(loaded.auto_reply == original.auto_reply);
    CHECK(loaded.max_peers == 12);
    CHECK(loaded.network_magic == protocol::magic::MAINNET);
    CHECK(loaded.user_agent == "/x/");
    CHECK(loaded.filters == original.filters);
}

TEST_CASE("LoadNodeConfigFromFile", "[network][config][json]") {
    auto path = std::filesystem::temp_directory_path() / "synthnet_node_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"auto_reply": "all", "io_timeout_ms": 300})";
    }

    SyntheticNodeConfig config;
    CHECK_FALSE(LoadNodeConfigFromFile(path.string(), config));
    CHECK(config.auto_reply == AutoReplyMode::All);
    CHECK(config.io_timeout == std::chrono::milliseconds(300));

    std::filesystem::remove(path);
    CHECK(LoadNodeConfigFromFile(path.string(), config).has_value());
}
