#include "src/session/discovery_session.h"

#include "common/util.hpp"

namespace session {

DiscoverySession::DiscoverySession(Transport& transport, Config cfg) : transport_(transport), cfg_(std::move(cfg)) {
  Transport::DiscoveryHandlers h;
  h.onPeerFound = [this](const PeerDescriptor& p) { handlePeerFound(p); };
  h.onPeerLost = [this](const std::string& id) { handlePeerLost(id); };
  h.onInvitation = [this](const PeerDescriptor& p) { return handleInvitation(p); };
  h.onSetupFailed = [this](const std::string& e) { handleSetupFailed(e); };
  transport_.setDiscoveryHandlers(std::move(h));
}

bool DiscoverySession::start(std::string* error_out) {
  if (running_) return true;
  std::string err;
  if (!transport_.startAdvertising(cfg_.local, &err)) {
    common::log("discovery: advertise failed: " + err);
    if (error_out) *error_out = "advertise failed: " + err;
    return false;
  }
  if (!transport_.startBrowsing(&err)) {
    transport_.stopAdvertising();
    common::log("discovery: browse failed: " + err);
    if (error_out) *error_out = "browse failed: " + err;
    return false;
  }
  running_ = true;
  common::log("discovery: advertising as '" + cfg_.local.displayName + "' (" +
              std::string(roleToString(cfg_.local.role)) + ")");
  return true;
}

void DiscoverySession::stop() {
  if (running_) {
    transport_.stopBrowsing();
    transport_.stopAdvertising();
    running_ = false;
  }
  peers_.clear();
}

bool DiscoverySession::invite(const PeerDescriptor& peer, std::chrono::milliseconds timeout, std::string* error_out) {
  if (!running_) {
    if (error_out) *error_out = "discovery not running";
    return false;
  }
  return transport_.invite(peer, timeout, error_out);
}

void DiscoverySession::handlePeerFound(const PeerDescriptor& peer) {
  if (!running_) return;
  if (peer.id == cfg_.local.id) return;
  if (!roleAccepted(cfg_.filter, cfg_.local.role, peer.role)) return;
  if (!peers_.insert(peer)) return;
  common::log("discovery: found " + peer.displayName + " (" + std::string(roleToString(peer.role)) + ")");
  if (onPeerFound_) onPeerFound_(peer);
}

void DiscoverySession::handlePeerLost(const std::string& peerId) {
  const PeerDescriptor* known = peers_.find(peerId);
  if (!known) return;
  const PeerDescriptor lost = *known;
  peers_.erase(peerId);
  common::log("discovery: lost " + lost.displayName);
  if (onPeerLost_) onPeerLost_(lost);
}

bool DiscoverySession::handleInvitation(const PeerDescriptor& peer) {
  if (!running_) return false;
  const bool accepted = !guard_ || guard_(peer);
  common::log("discovery: invitation from " + peer.displayName + (accepted ? " accepted" : " rejected"));
  return accepted;
}

void DiscoverySession::handleSetupFailed(const std::string& error) {
  if (!running_) return;
  common::log("discovery: setup failed: " + error);
  stop();
  if (onSetupFailed_) onSetupFailed_(error);
}

} // namespace session
