// Copyright (c) 2025 The Unicity Foundation
// Connection states and error codes for synthetic node connections

#pragma once

#include <string>

namespace synthnet {
namespace network {

/**
 * Lifecycle of one connection owned by a synthetic node.
 *
 *   Disconnected -> Connecting -> [AwaitingPeerVersion -> AwaitingPeerVerack] -> Ready -> Disconnected
 *
 * The bracketed states are only visited when the node performs the full
 * VERSION/VERACK handshake. With the handshake disabled a connection becomes
 * Ready as soon as the TCP stream is open.
 */
enum class SessionState {
  Disconnected,
  Connecting,
  AwaitingPeerVersion,
  AwaitingPeerVerack,
  Ready,
};

std::string SessionStateAsString(SessionState state);

enum class ConnectionDirection {
  Inbound,   // The remote end connected to our listener
  Outbound,  // We dialed the remote end
};

/**
 * Outcome of a synthetic node operation, and the reason a connection closed.
 */
enum class NodeError {
  None,
  Timeout,             // recv wait elapsed with nothing queued
  HandshakeTimeout,    // TCP connect or a handshake await exceeded its deadline
  ConnectionNotFound,  // Endpoint not tracked or not Ready
  AlreadyConnected,    // Endpoint already tracked
  PeerLimit,           // max_peers reached
  ConnectFailed,       // TCP connect refused or unreachable
  Transport,           // Socket error or remote close
  Decode,              // Frame or payload the session could not decode
  ShuttingDown,        // Node is shutting down or already shut down
  WouldBlock,          // Blocking call made from a thread running the io_context
};

std::string NodeErrorAsString(NodeError error);

/**
 * Coarse grouping of NodeError used by scenarios to tell protocol failures
 * apart from socket failures and ordinary timeouts.
 */
enum class ErrorCategory {
  None,
  Decode,
  Transport,
  HandshakeTimeout,
  Operational,
  Timeout,
};

ErrorCategory ErrorCategoryOf(NodeError error);

std::string ErrorCategoryAsString(ErrorCategory category);

}  // namespace network
}  // namespace synthnet
