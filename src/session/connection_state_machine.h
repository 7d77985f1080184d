#pragma once

#include "src/session/discovery_session.h"
#include "src/session/peer.h"
#include "src/session/timings.h"
#include "src/session/transport.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace session {

enum class ConnectionState { Idle, Browsing, Connecting, Connected, Failed };

std::string_view stateToString(ConnectionState s);

// The single authoritative connection state. Driven by explicit calls and by the transport's
// connection events; must only be touched from the session executor.
//
// Invariant: activePeer() is set exactly when state() == Connected.
class ConnectionStateMachine {
public:
  using OnStateChanged = std::function<void(ConnectionState from, ConnectionState to)>;
  using OnConnected = std::function<void(const PeerDescriptor&)>;
  // Connected -> Browsing because the link went away.
  using OnDropped = std::function<void(const PeerDescriptor&)>;

  ConnectionStateMachine(Transport& transport, DiscoverySession& discovery, Timings timings);

  ConnectionStateMachine(const ConnectionStateMachine&) = delete;
  ConnectionStateMachine& operator=(const ConnectionStateMachine&) = delete;

  void setOnStateChanged(OnStateChanged cb) { onStateChanged_ = std::move(cb); }
  void setOnConnected(OnConnected cb) { onConnected_ = std::move(cb); }
  void setOnDropped(OnDropped cb) { onDropped_ = std::move(cb); }

  // Idle -> Browsing, or Idle -> Failed when discovery cannot start.
  bool start();
  // Browsing -> Connecting. Any other state makes this a no-op returning false.
  bool connect(const PeerDescriptor& peer);
  // Any -> Idle -> Browsing with a fresh transport session.
  bool restart();

  ConnectionState state() const { return state_; }
  const std::optional<PeerDescriptor>& activePeer() const { return active_; }
  const std::optional<PeerDescriptor>& targetPeer() const { return target_; }
  const std::string& lastKnownPeer() const { return lastKnown_; }
  const std::string& lastError() const { return lastError_; }

  // Incoming invitations are only taken while nothing else is in flight.
  bool acceptsIncoming() const { return state_ == ConnectionState::Browsing; }

private:
  void handleConnected(const PeerDescriptor& peer);
  void handleDisconnected(const PeerDescriptor& peer);
  void handleSetupFailed(const std::string& error);
  void setState(ConnectionState next);

  Transport& transport_;
  DiscoverySession& discovery_;
  Timings timings_;

  ConnectionState state_ = ConnectionState::Idle;
  std::optional<PeerDescriptor> active_;
  std::optional<PeerDescriptor> target_;
  std::string lastKnown_;
  std::string lastError_;

  OnStateChanged onStateChanged_;
  OnConnected onConnected_;
  OnDropped onDropped_;
};

} // namespace session
