#pragma once

#include "src/session/peer.h"
#include "src/session/transport.h"

#include <chrono>
#include <functional>
#include <string>

namespace session {

// Advertises the local device, browses for peers and routes invitations. Owns the
// discovered-peers set; nothing else mutates it.
class DiscoverySession {
public:
  struct Config {
    PeerDescriptor local;
    RoleFilter filter = RoleFilter::Opposite;
  };

  using OnPeerFound = std::function<void(const PeerDescriptor&)>;
  using OnPeerLost = std::function<void(const PeerDescriptor&)>;
  using InvitationGuard = std::function<bool(const PeerDescriptor&)>;
  using OnSetupFailed = std::function<void(const std::string& error)>;

  DiscoverySession(Transport& transport, Config cfg);

  DiscoverySession(const DiscoverySession&) = delete;
  DiscoverySession& operator=(const DiscoverySession&) = delete;

  void setOnPeerFound(OnPeerFound cb) { onPeerFound_ = std::move(cb); }
  void setOnPeerLost(OnPeerLost cb) { onPeerLost_ = std::move(cb); }
  void setInvitationGuard(InvitationGuard guard) { guard_ = std::move(guard); }
  void setOnSetupFailed(OnSetupFailed cb) { onSetupFailed_ = std::move(cb); }

  // Starts advertising and browsing; both or neither.
  bool start(std::string* error_out = nullptr);
  // Stops both processes and forgets every discovered peer.
  void stop();
  bool running() const { return running_; }

  bool invite(const PeerDescriptor& peer, std::chrono::milliseconds timeout, std::string* error_out = nullptr);

  const PeerSet& peers() const { return peers_; }
  const PeerDescriptor& local() const { return cfg_.local; }
  RoleFilter filter() const { return cfg_.filter; }

private:
  void handlePeerFound(const PeerDescriptor& peer);
  void handlePeerLost(const std::string& peerId);
  bool handleInvitation(const PeerDescriptor& peer);
  void handleSetupFailed(const std::string& error);

  Transport& transport_;
  Config cfg_;
  PeerSet peers_;
  bool running_ = false;

  OnPeerFound onPeerFound_;
  OnPeerLost onPeerLost_;
  InvitationGuard guard_;
  OnSetupFailed onSetupFailed_;
};

} // namespace session
