#include "src/session/reconnect_supervisor.h"

#include "common/util.hpp"

namespace session {

ReconnectSupervisor::ReconnectSupervisor(boost::asio::any_io_executor ex,
                                         ConnectionStateMachine& machine,
                                         const DiscoverySession& discovery,
                                         Timings timings,
                                         bool enabled)
    : ex_(ex), timer_(ex), machine_(machine), discovery_(discovery), timings_(timings), enabled_(enabled) {}

void ReconnectSupervisor::setEnabled(bool enabled) {
  enabled_ = enabled;
  if (!enabled_) cancel();
}

void ReconnectSupervisor::start(std::string targetName) {
  cancel();
  if (!enabled_) {
    common::log("reconnect: disabled, not watching for " + targetName);
    return;
  }
  if (targetName.empty() || machine_.state() == ConnectionState::Connected) return;

  active_ = true;
  target_ = std::move(targetName);
  attempts_ = 0;
  common::log("reconnect: watching for " + target_ + " (max " + std::to_string(timings_.maxAttempts) + " attempts)");

  const uint64_t gen = generation_;
  boost::asio::post(ex_, [weak = weak_from_this(), gen] {
    if (auto self = weak.lock()) self->attempt(gen);
  });
}

void ReconnectSupervisor::cancel() {
  ++generation_;
  timer_.cancel();
  if (active_) common::log("reconnect: cancelled (target " + target_ + ")");
  active_ = false;
  phase_ = Phase::None;
}

void ReconnectSupervisor::notifyPeerFound(const PeerDescriptor& peer) {
  if (!active_ || phase_ != Phase::Delaying || peer.displayName != target_) return;
  common::log("reconnect: " + target_ + " reappeared, retrying now");
  // The pending wait completes with operation_aborted and proceeds under the same generation.
  timer_.cancel();
}

void ReconnectSupervisor::notifyConnected(const PeerDescriptor& peer) {
  if (!active_) return;
  const bool sameTarget = peer.displayName == target_;
  finish();
  if (sameTarget && onReconnected_) onReconnected_(peer);
}

void ReconnectSupervisor::attempt(uint64_t gen) {
  if (gen != generation_ || !active_) return;
  phase_ = Phase::None;

  if (machine_.state() == ConnectionState::Connected) {
    finish();
    return;
  }
  if (attempts_ >= timings_.maxAttempts) {
    giveUp();
    return;
  }
  ++attempts_;

  if (machine_.state() == ConnectionState::Connecting) {
    common::log("reconnect: attempt " + std::to_string(attempts_) + " skipped, connection already in progress");
    delay(gen);
    return;
  }

  const PeerDescriptor* peer = discovery_.peers().findByName(target_);
  if (!peer || machine_.state() != ConnectionState::Browsing) {
    common::log("reconnect: attempt " + std::to_string(attempts_) + "/" + std::to_string(timings_.maxAttempts) +
                ", " + target_ + " not visible");
    delay(gen);
    return;
  }

  common::log("reconnect: attempt " + std::to_string(attempts_) + "/" + std::to_string(timings_.maxAttempts) +
              ", connecting to " + target_);
  const PeerDescriptor chosen = *peer;
  machine_.connect(chosen);
  // connect() can complete synchronously and end this loop through notifyConnected.
  if (gen != generation_) return;
  observe(gen);
}

void ReconnectSupervisor::observe(uint64_t gen) {
  phase_ = Phase::Observing;
  timer_.expires_after(timings_.observationWindow);
  timer_.async_wait([weak = weak_from_this(), gen](const boost::system::error_code&) {
    auto self = weak.lock();
    if (!self || gen != self->generation_ || !self->active_) return;
    if (self->machine_.state() == ConnectionState::Connected) {
      self->finish();
      return;
    }
    self->delay(gen);
  });
}

void ReconnectSupervisor::delay(uint64_t gen) {
  if (attempts_ >= timings_.maxAttempts) {
    giveUp();
    return;
  }
  phase_ = Phase::Delaying;
  timer_.expires_after(timings_.reconnectDelay);
  timer_.async_wait([weak = weak_from_this(), gen](const boost::system::error_code&) {
    if (auto self = weak.lock()) self->attempt(gen);
  });
}

void ReconnectSupervisor::giveUp() {
  const std::string target = target_;
  const int attempts = attempts_;
  ++generation_;
  active_ = false;
  phase_ = Phase::None;
  common::log("reconnect: gave up on " + target + " after " + std::to_string(attempts) + " attempts");
  if (onGaveUp_) onGaveUp_(target, attempts);
}

void ReconnectSupervisor::finish() {
  ++generation_;
  timer_.cancel();
  active_ = false;
  phase_ = Phase::None;
  common::log("reconnect: done (target " + target_ + ")");
}

} // namespace session
