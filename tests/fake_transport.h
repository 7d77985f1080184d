#pragma once

#include "src/protocol/command.h"
#include "src/session/resource_channel.h"
#include "src/session/transport.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace testing_support {

// In-memory Transport. Tests raise the transport events by hand.
class FakeTransport : public session::Transport {
public:
  void setDiscoveryHandlers(DiscoveryHandlers handlers) override { discovery = std::move(handlers); }
  void setConnectionHandlers(ConnectionHandlers handlers) override { connection = std::move(handlers); }
  void setDataHandler(OnData onData) override { data = std::move(onData); }
  void setResourceHandler(OnResource onResource) override { resource = std::move(onResource); }

  bool startAdvertising(const session::PeerDescriptor& self, std::string* error_out) override {
    if (failAdvertise) {
      if (error_out) *error_out = "advertise refused";
      return false;
    }
    advertising = true;
    advertisedAs = self;
    return true;
  }
  void stopAdvertising() override { advertising = false; }

  bool startBrowsing(std::string* error_out) override {
    if (failBrowse) {
      if (error_out) *error_out = "browse refused";
      return false;
    }
    browsing = true;
    return true;
  }
  void stopBrowsing() override { browsing = false; }

  bool invite(const session::PeerDescriptor& peer, std::chrono::milliseconds timeout, std::string* error_out) override {
    invites.push_back(peer);
    lastInviteTimeout = timeout;
    if (failInvite) {
      if (error_out) *error_out = "invite refused";
      return false;
    }
    if (connectOnInvite) connected(peer);
    return true;
  }

  bool send(std::vector<uint8_t> bytes, std::string* error_out) override {
    if (failSend) {
      if (error_out) *error_out = "not connected";
      return false;
    }
    sent.push_back(std::move(bytes));
    return true;
  }

  std::shared_ptr<session::ResourceProgress> sendResource(const std::filesystem::path& path,
                                                          const std::string& name) override {
    resourcePaths.push_back(path);
    resourceNames.push_back(name);
    auto handle = std::make_shared<session::ResourceProgress>();
    handles.push_back(handle);
    return handle;
  }

  void closeChannel() override {
    ++channelCloses;
    if (!openPeer) return;
    const auto peer = *openPeer;
    openPeer.reset();
    if (connection.onDisconnected) connection.onDisconnected(peer);
  }

  void resetSession() override {
    ++resets;
    openPeer.reset();
  }

  // Event injection.
  void peerFound(const session::PeerDescriptor& p) {
    if (discovery.onPeerFound) discovery.onPeerFound(p);
  }
  void peerLost(const std::string& id) {
    if (discovery.onPeerLost) discovery.onPeerLost(id);
  }
  bool invitation(const session::PeerDescriptor& p) { return discovery.onInvitation && discovery.onInvitation(p); }
  void setupFailed(const std::string& error) {
    if (discovery.onSetupFailed) discovery.onSetupFailed(error);
  }
  void connected(const session::PeerDescriptor& p) {
    openPeer = p;
    if (connection.onConnected) connection.onConnected(p);
  }
  void disconnected(const session::PeerDescriptor& p) {
    if (openPeer && openPeer->id == p.id) openPeer.reset();
    if (connection.onDisconnected) connection.onDisconnected(p);
  }
  // Raw bytes on the command channel, as a misbehaving peer might send them.
  void deliverRaw(std::vector<uint8_t> bytes) {
    if (data) data(std::move(bytes));
  }
  void deliver(const protocol::Command& cmd) {
    if (auto bytes = protocol::encodeCommand(cmd); bytes && data) data(*bytes);
  }

  // Decoded view of everything sent so far.
  std::vector<protocol::Command> sentCommands() const {
    std::vector<protocol::Command> out;
    for (const auto& b : sent) {
      if (auto cmd = protocol::decodeCommand(b)) out.push_back(*cmd);
    }
    return out;
  }

  DiscoveryHandlers discovery;
  ConnectionHandlers connection;
  OnData data;
  OnResource resource;

  bool failAdvertise = false;
  bool failBrowse = false;
  bool failInvite = false;
  bool failSend = false;
  bool connectOnInvite = false;

  bool advertising = false;
  bool browsing = false;
  session::PeerDescriptor advertisedAs;
  std::vector<session::PeerDescriptor> invites;
  std::chrono::milliseconds lastInviteTimeout{0};
  std::vector<std::vector<uint8_t>> sent;
  std::vector<std::filesystem::path> resourcePaths;
  std::vector<std::string> resourceNames;
  std::vector<std::shared_ptr<session::ResourceProgress>> handles;
  int resets = 0;
  int channelCloses = 0;
  // Peer of the channel the fake considers open.
  std::optional<session::PeerDescriptor> openPeer;
};

// ResourceChannel that records commands and hands out controllable progress handles.
class FakeChannel : public session::ResourceChannel {
public:
  bool sendCommand(const protocol::Command& cmd) override {
    commands.push_back(cmd);
    return true;
  }

  std::shared_ptr<session::ResourceProgress> sendResource(const std::filesystem::path& path,
                                                          const std::string& name) override {
    names.push_back(name);
    paths.push_back(path);
    if (refuseResources) return nullptr;
    auto handle = std::make_shared<session::ResourceProgress>();
    handles.push_back(handle);
    if (onResourceStarted) onResourceStarted(handles.size() - 1, handle);
    return handle;
  }

  template <class T>
  int count() const {
    int n = 0;
    for (const auto& c : commands) n += std::holds_alternative<T>(c) ? 1 : 0;
    return n;
  }

  bool refuseResources = false;
  std::function<void(std::size_t index, const std::shared_ptr<session::ResourceProgress>&)> onResourceStarted;
  std::vector<protocol::Command> commands;
  std::vector<std::string> names;
  std::vector<std::filesystem::path> paths;
  std::vector<std::shared_ptr<session::ResourceProgress>> handles;
};

inline session::PeerDescriptor makePeer(std::string id, std::string name, session::Role role) {
  return session::PeerDescriptor{std::move(id), std::move(name), role};
}

} // namespace testing_support
