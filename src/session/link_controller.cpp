#include "src/session/link_controller.h"

#include "common/settings_store.hpp"
#include "common/util.hpp"

namespace session {

LinkController::LinkController(boost::asio::any_io_executor ex, Transport& transport, Config cfg)
    : transport_(transport),
      cfg_(std::move(cfg)),
      discovery_(transport_, DiscoverySession::Config{cfg_.local, cfg_.filter}),
      machine_(transport_, discovery_, cfg_.timings),
      supervisor_(std::make_shared<ReconnectSupervisor>(ex, machine_, discovery_, cfg_.timings, cfg_.reconnectEnabled)) {
  discovery_.setInvitationGuard([this](const PeerDescriptor&) { return machine_.acceptsIncoming(); });
  discovery_.setOnPeerFound([this](const PeerDescriptor& p) {
    supervisor_->notifyPeerFound(p);
    if (onPeerFound_) onPeerFound_(p);
  });
  discovery_.setOnPeerLost([this](const PeerDescriptor& p) {
    // Beacons stopped: the channel may be dead without the socket knowing yet.
    if (machine_.state() == ConnectionState::Connected && machine_.activePeer() &&
        machine_.activePeer()->id == p.id) {
      common::log("connected peer " + p.displayName + " stopped advertising");
      transport_.closeChannel();
    }
    if (onPeerLost_) onPeerLost_(p);
  });

  machine_.setOnStateChanged([this](ConnectionState from, ConnectionState to) {
    if (onStateChanged_) onStateChanged_(from, to);
  });
  machine_.setOnConnected([this](const PeerDescriptor& p) { handleConnected(p); });
  machine_.setOnDropped([this](const PeerDescriptor& p) { handleDropped(p); });

  transport_.setDataHandler([this](std::vector<uint8_t> bytes) { handleData(std::move(bytes)); });
  transport_.setResourceHandler([this](const IncomingResource& r) {
    if (onResource_) onResource_(r);
  });
}

LinkController::~LinkController() {
  supervisor_->cancel();
}

bool LinkController::start() {
  const bool first = !started_;
  started_ = true;
  if (!machine_.start()) return false;
  if (first && reconnects() && !cfg_.lastPeer.empty()) supervisor_->start(cfg_.lastPeer);
  return true;
}

bool LinkController::restart() {
  supervisor_->cancel();
  return machine_.restart();
}

bool LinkController::connect(const std::string& idOrName) {
  supervisor_->cancel();
  const PeerDescriptor* peer = discovery_.peers().find(idOrName);
  if (!peer) peer = discovery_.peers().findByName(idOrName);
  if (!peer) {
    common::log("connect: no discovered peer named " + idOrName);
    return false;
  }
  const PeerDescriptor chosen = *peer;
  return machine_.connect(chosen);
}

bool LinkController::sendCommand(const protocol::Command& cmd) {
  const auto bytes = protocol::encodeCommand(cmd);
  if (!bytes) {
    common::log("send " + std::string(protocol::commandName(cmd)) + ": cannot encode");
    return false;
  }
  std::string err;
  if (!transport_.send(*bytes, &err)) {
    common::log("send " + std::string(protocol::commandName(cmd)) + " failed: " + err);
    return false;
  }
  return true;
}

std::shared_ptr<ResourceProgress> LinkController::sendResource(const std::filesystem::path& path,
                                                               const std::string& name) {
  if (machine_.state() != ConnectionState::Connected) {
    common::log("send resource " + name + ": not connected");
    return nullptr;
  }
  auto progress = transport_.sendResource(path, name);
  if (!progress) common::log("send resource " + name + ": could not start");
  return progress;
}

void LinkController::handleData(std::vector<uint8_t> bytes) {
  std::string err;
  auto cmd = protocol::decodeCommand(bytes, &err);
  if (!cmd) {
    common::log("dropping undecodable command (" + std::to_string(bytes.size()) + " bytes): " + err);
    return;
  }
  if (onCommand_) onCommand_(*cmd);
}

void LinkController::handleConnected(const PeerDescriptor& peer) {
  supervisor_->notifyConnected(peer);
  if (cfg_.settingsRoot.empty()) return;
  std::string err;
  if (!common::settings_store::remember_last_peer(cfg_.settingsRoot, peer.displayName, &err)) {
    common::log("failed to remember last peer: " + err);
  }
}

void LinkController::handleDropped(const PeerDescriptor& peer) {
  if (!reconnects()) return;
  supervisor_->start(peer.displayName);
}

} // namespace session
