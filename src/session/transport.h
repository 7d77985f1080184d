#pragma once

#include "src/session/peer.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace session {

// Progress and cancellation handle for one outgoing resource. The transport reports into it,
// a single observer listens. Values never decrease; 1.0 means the receiver confirmed delivery.
class ResourceProgress {
public:
  using OnUpdate = std::function<void(double fraction)>;
  using OnCancelled = std::function<void()>;
  using AbortHook = std::function<void()>;

  void setHandlers(OnUpdate onUpdate, OnCancelled onCancelled) {
    onUpdate_ = std::move(onUpdate);
    onCancelled_ = std::move(onCancelled);
  }
  void clearHandlers() {
    onUpdate_ = nullptr;
    onCancelled_ = nullptr;
  }
  void setAbortHook(AbortHook hook) { abortHook_ = std::move(hook); }

  void report(double fraction) {
    if (terminal()) return;
    if (fraction > 1.0) fraction = 1.0;
    if (fraction <= fraction_) return;
    fraction_ = fraction;
    if (onUpdate_) onUpdate_(fraction_);
  }

  void cancel() {
    if (terminal()) return;
    cancelled_ = true;
    if (onCancelled_) onCancelled_();
  }

  // Local request to stop sending; the transport tears the stream down.
  void abort() {
    if (terminal()) return;
    auto hook = std::move(abortHook_);
    abortHook_ = nullptr;
    if (hook) hook();
    cancel();
  }

  double fraction() const { return fraction_; }
  bool finished() const { return fraction_ >= 1.0; }
  bool cancelled() const { return cancelled_; }
  bool terminal() const { return finished() || cancelled_; }

private:
  double fraction_ = 0.0;
  bool cancelled_ = false;
  OnUpdate onUpdate_;
  OnCancelled onCancelled_;
  AbortHook abortHook_;
};

struct IncomingResource {
  std::string fromId;
  std::string name;
  std::filesystem::path path;
  bool ok = false;
  std::string error;
};

// Seam between the coordination components and the network. All handlers are invoked on the
// session executor; each event stream has exactly one consumer.
class Transport {
public:
  struct DiscoveryHandlers {
    std::function<void(const PeerDescriptor&)> onPeerFound;
    std::function<void(const std::string& peerId)> onPeerLost;
    // Return true to accept the invitation.
    std::function<bool(const PeerDescriptor&)> onInvitation;
    // Advertising or browsing broke after a successful start.
    std::function<void(const std::string& error)> onSetupFailed;
  };

  struct ConnectionHandlers {
    std::function<void(const PeerDescriptor&)> onConnected;
    std::function<void(const PeerDescriptor&)> onDisconnected;
  };

  using OnData = std::function<void(std::vector<uint8_t> bytes)>;
  using OnResource = std::function<void(const IncomingResource&)>;

  virtual ~Transport() = default;

  virtual void setDiscoveryHandlers(DiscoveryHandlers handlers) = 0;
  virtual void setConnectionHandlers(ConnectionHandlers handlers) = 0;
  virtual void setDataHandler(OnData onData) = 0;
  virtual void setResourceHandler(OnResource onResource) = 0;

  virtual bool startAdvertising(const PeerDescriptor& self, std::string* error_out) = 0;
  virtual void stopAdvertising() = 0;
  virtual bool startBrowsing(std::string* error_out) = 0;
  virtual void stopBrowsing() = 0;

  // Asynchronous: the outcome arrives as onConnected or onDisconnected for `peer`.
  // Returns false when the invitation cannot even be sent.
  virtual bool invite(const PeerDescriptor& peer, std::chrono::milliseconds timeout, std::string* error_out) = 0;

  // Reliable, ordered delivery to the connected peer.
  virtual bool send(std::vector<uint8_t> bytes, std::string* error_out) = 0;

  // nullptr when the send cannot start (no peer, unreadable file).
  virtual std::shared_ptr<ResourceProgress> sendResource(const std::filesystem::path& path,
                                                         const std::string& name) = 0;

  // Closes the command channel, reported as onDisconnected for its peer. Discovery keeps running.
  virtual void closeChannel() = 0;

  // Drops every connection and pending operation. Late events of the old session are discarded.
  virtual void resetSession() = 0;
};

} // namespace session
