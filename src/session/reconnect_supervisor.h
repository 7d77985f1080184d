#pragma once

#include "src/session/connection_state_machine.h"
#include "src/session/discovery_session.h"
#include "src/session/peer.h"
#include "src/session/timings.h"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace session {

// Bounded background retry towards one peer display name. At most one loop runs; every
// suspension (observation window, inter-attempt delay) is a cancellable timer wait on the
// session executor.
class ReconnectSupervisor : public std::enable_shared_from_this<ReconnectSupervisor> {
public:
  using OnGaveUp = std::function<void(const std::string& target, int attempts)>;
  using OnReconnected = std::function<void(const PeerDescriptor&)>;

  ReconnectSupervisor(boost::asio::any_io_executor ex,
                      ConnectionStateMachine& machine,
                      const DiscoverySession& discovery,
                      Timings timings,
                      bool enabled = true);

  void setOnGaveUp(OnGaveUp cb) { onGaveUp_ = std::move(cb); }
  void setOnReconnected(OnReconnected cb) { onReconnected_ = std::move(cb); }
  void setEnabled(bool enabled);
  bool enabled() const { return enabled_; }

  // Replaces any running loop.
  void start(std::string targetName);
  void cancel();

  // The target showing up cuts an inter-attempt delay short.
  void notifyPeerFound(const PeerDescriptor& peer);
  // A connection to any peer ends the loop.
  void notifyConnected(const PeerDescriptor& peer);

  bool active() const { return active_; }
  const std::string& target() const { return target_; }
  int attempts() const { return attempts_; }

private:
  enum class Phase { None, Observing, Delaying };

  void attempt(uint64_t gen);
  void observe(uint64_t gen);
  void delay(uint64_t gen);
  void giveUp();
  void finish();

  boost::asio::any_io_executor ex_;
  boost::asio::steady_timer timer_;
  ConnectionStateMachine& machine_;
  const DiscoverySession& discovery_;
  Timings timings_;
  bool enabled_;

  bool active_ = false;
  Phase phase_ = Phase::None;
  std::string target_;
  int attempts_ = 0;
  uint64_t generation_ = 0;

  OnGaveUp onGaveUp_;
  OnReconnected onReconnected_;
};

} // namespace session
