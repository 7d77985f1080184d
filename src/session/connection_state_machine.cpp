#include "src/session/connection_state_machine.h"

#include "common/util.hpp"

namespace session {

std::string_view stateToString(ConnectionState s) {
  switch (s) {
    case ConnectionState::Idle:
      return "idle";
    case ConnectionState::Browsing:
      return "browsing";
    case ConnectionState::Connecting:
      return "connecting";
    case ConnectionState::Connected:
      return "connected";
    case ConnectionState::Failed:
      return "failed";
  }
  return "unknown";
}

ConnectionStateMachine::ConnectionStateMachine(Transport& transport, DiscoverySession& discovery, Timings timings)
    : transport_(transport), discovery_(discovery), timings_(timings) {
  Transport::ConnectionHandlers h;
  h.onConnected = [this](const PeerDescriptor& p) { handleConnected(p); };
  h.onDisconnected = [this](const PeerDescriptor& p) { handleDisconnected(p); };
  transport_.setConnectionHandlers(std::move(h));
  discovery_.setOnSetupFailed([this](const std::string& e) { handleSetupFailed(e); });
}

bool ConnectionStateMachine::start() {
  if (state_ != ConnectionState::Idle) return state_ == ConnectionState::Browsing;
  std::string err;
  if (!discovery_.start(&err)) {
    lastError_ = err;
    setState(ConnectionState::Failed);
    return false;
  }
  lastError_.clear();
  setState(ConnectionState::Browsing);
  return true;
}

bool ConnectionStateMachine::connect(const PeerDescriptor& peer) {
  if (state_ != ConnectionState::Browsing) {
    common::log("connect to " + peer.displayName + " ignored while " + std::string(stateToString(state_)));
    return false;
  }
  target_ = peer;
  setState(ConnectionState::Connecting);
  common::log("connecting to " + peer.displayName);

  std::string err;
  if (!discovery_.invite(peer, timings_.inviteTimeout, &err)) {
    common::log("invite to " + peer.displayName + " failed: " + err);
    target_.reset();
    // A synchronous invite failure may already have been reported through handleDisconnected.
    if (state_ == ConnectionState::Connecting) setState(ConnectionState::Browsing);
    return false;
  }
  return true;
}

bool ConnectionStateMachine::restart() {
  common::log("restarting connection session");
  active_.reset();
  target_.reset();
  setState(ConnectionState::Idle);
  discovery_.stop();
  transport_.resetSession();
  return start();
}

void ConnectionStateMachine::handleConnected(const PeerDescriptor& peer) {
  if (state_ == ConnectionState::Connecting) {
    if (!target_ || target_->id != peer.id) {
      common::log("ignoring connection from " + peer.displayName + " while connecting elsewhere");
      return;
    }
  } else if (state_ != ConnectionState::Browsing) {
    common::log("ignoring connection from " + peer.displayName + " in state " + std::string(stateToString(state_)));
    return;
  }
  target_.reset();
  active_ = peer;
  lastKnown_ = peer.displayName;
  setState(ConnectionState::Connected);
  common::log("connected to " + peer.displayName);
  if (onConnected_) onConnected_(peer);
}

void ConnectionStateMachine::handleDisconnected(const PeerDescriptor& peer) {
  if (state_ == ConnectionState::Connecting && target_ && target_->id == peer.id) {
    common::log("could not connect to " + peer.displayName);
    target_.reset();
    setState(ConnectionState::Browsing);
    return;
  }
  if (state_ == ConnectionState::Connected && active_ && active_->id == peer.id) {
    const PeerDescriptor lost = *active_;
    active_.reset();
    setState(ConnectionState::Browsing);
    common::log("disconnected from " + lost.displayName);
    if (onDropped_) onDropped_(lost);
  }
}

void ConnectionStateMachine::handleSetupFailed(const std::string& error) {
  lastError_ = error;
  active_.reset();
  target_.reset();
  setState(ConnectionState::Failed);
}

void ConnectionStateMachine::setState(ConnectionState next) {
  if (next == state_) return;
  const ConnectionState prev = state_;
  state_ = next;
  common::log("state: " + std::string(stateToString(prev)) + " -> " + std::string(stateToString(next)));
  if (onStateChanged_) onStateChanged_(prev, next);
}

} // namespace session
