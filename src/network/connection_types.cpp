// Copyright (c) 2025 The Unicity Foundation
// Connection types implementation

#include "network/connection_types.hpp"

namespace synthnet {
namespace network {

std::string SessionStateAsString(SessionState state) {
  switch (state) {
  case SessionState::Disconnected:
    return "disconnected";
  case SessionState::Connecting:
    return "connecting";
  case SessionState::AwaitingPeerVersion:
    return "awaiting-peer-version";
  case SessionState::AwaitingPeerVerack:
    return "awaiting-peer-verack";
  case SessionState::Ready:
    return "ready";
  default:
    return "unknown";
  }
}

std::string NodeErrorAsString(NodeError error) {
  switch (error) {
  case NodeError::None:
    return "none";
  case NodeError::Timeout:
    return "timeout";
  case NodeError::HandshakeTimeout:
    return "handshake timeout";
  case NodeError::ConnectionNotFound:
    return "connection not found";
  case NodeError::AlreadyConnected:
    return "already connected";
  case NodeError::PeerLimit:
    return "peer limit reached";
  case NodeError::ConnectFailed:
    return "connect failed";
  case NodeError::Transport:
    return "transport error";
  case NodeError::Decode:
    return "decode error";
  case NodeError::ShuttingDown:
    return "shutting down";
  case NodeError::WouldBlock:
    return "would block";
  default:
    return "unknown";
  }
}

ErrorCategory ErrorCategoryOf(NodeError error) {
  switch (error) {
  case NodeError::None:
    return ErrorCategory::None;
  case NodeError::Decode:
    return ErrorCategory::Decode;
  case NodeError::ConnectFailed:
  case NodeError::Transport:
    return ErrorCategory::Transport;
  case NodeError::HandshakeTimeout:
    return ErrorCategory::HandshakeTimeout;
  case NodeError::Timeout:
    return ErrorCategory::Timeout;
  case NodeError::ConnectionNotFound:
  case NodeError::AlreadyConnected:
  case NodeError::PeerLimit:
  case NodeError::ShuttingDown:
  case NodeError::WouldBlock:
    return ErrorCategory::Operational;
  default:
    return ErrorCategory::Operational;
  }
}

std::string ErrorCategoryAsString(ErrorCategory category) {
  switch (category) {
  case ErrorCategory::None:
    return "none";
  case ErrorCategory::Decode:
    return "decode";
  case ErrorCategory::Transport:
    return "transport";
  case ErrorCategory::HandshakeTimeout:
    return "handshake-timeout";
  case ErrorCategory::Operational:
    return "operational";
  case ErrorCategory::Timeout:
    return "timeout";
  default:
    return "unknown";
  }
}

}  // namespace network
}  // namespace synthnet
