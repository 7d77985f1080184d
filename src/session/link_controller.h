#pragma once

#include "src/protocol/command.h"
#include "src/session/connection_state_machine.h"
#include "src/session/discovery_session.h"
#include "src/session/reconnect_supervisor.h"
#include "src/session/resource_channel.h"
#include "src/session/timings.h"
#include "src/session/transport.h"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace session {

// Owns discovery, the state machine and the reconnect supervisor for one transport and wires
// their events together. Everything runs on one executor; callers on other threads post.
class LinkController : public ResourceChannel {
public:
  struct Config {
    PeerDescriptor local;
    RoleFilter filter = RoleFilter::Opposite;
    Timings timings;
    bool reconnectEnabled = true;
    // Seeds the supervisor at the first start().
    std::string lastPeer;
    // Where the last connected peer is remembered; empty disables persistence.
    std::filesystem::path settingsRoot;
  };

  using OnCommand = std::function<void(const protocol::Command&)>;
  using OnPeerEvent = std::function<void(const PeerDescriptor&)>;
  using OnStateChanged = ConnectionStateMachine::OnStateChanged;
  using OnGaveUp = ReconnectSupervisor::OnGaveUp;

  LinkController(boost::asio::any_io_executor ex, Transport& transport, Config cfg);
  ~LinkController() override;

  LinkController(const LinkController&) = delete;
  LinkController& operator=(const LinkController&) = delete;

  void setOnCommand(OnCommand cb) { onCommand_ = std::move(cb); }
  void setOnResource(Transport::OnResource cb) { onResource_ = std::move(cb); }
  void setOnPeerFound(OnPeerEvent cb) { onPeerFound_ = std::move(cb); }
  void setOnPeerLost(OnPeerEvent cb) { onPeerLost_ = std::move(cb); }
  void setOnStateChanged(OnStateChanged cb) { onStateChanged_ = std::move(cb); }
  void setOnGaveUp(OnGaveUp cb) { supervisor_->setOnGaveUp(std::move(cb)); }

  bool start();
  bool restart();
  // Manual connect by peer id or display name. Always stops a running reconnect loop.
  bool connect(const std::string& idOrName);

  bool sendCommand(const protocol::Command& cmd) override;
  std::shared_ptr<ResourceProgress> sendResource(const std::filesystem::path& path, const std::string& name) override;

  ConnectionState state() const { return machine_.state(); }
  const std::optional<PeerDescriptor>& activePeer() const { return machine_.activePeer(); }
  const PeerSet& peers() const { return discovery_.peers(); }
  const PeerDescriptor& local() const { return discovery_.local(); }
  const ConnectionStateMachine& machine() const { return machine_; }
  const ReconnectSupervisor& supervisor() const { return *supervisor_; }

private:
  void handleData(std::vector<uint8_t> bytes);
  void handleConnected(const PeerDescriptor& peer);
  void handleDropped(const PeerDescriptor& peer);
  // Only the initiating side runs the reconnect loop; the responder waits to be invited.
  bool reconnects() const { return cfg_.local.role == Role::Initiator; }

  Transport& transport_;
  Config cfg_;
  DiscoverySession discovery_;
  ConnectionStateMachine machine_;
  std::shared_ptr<ReconnectSupervisor> supervisor_;
  bool started_ = false;

  OnCommand onCommand_;
  Transport::OnResource onResource_;
  OnPeerEvent onPeerFound_;
  OnPeerEvent onPeerLost_;
  OnStateChanged onStateChanged_;
};

} // namespace session
