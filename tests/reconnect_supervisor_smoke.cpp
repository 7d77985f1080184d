#include "src/session/connection_state_machine.h"
#include "src/session/discovery_session.h"
#include "src/session/reconnect_supervisor.h"
#include "tests/fake_transport.h"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <cassert>
#include <chrono>
#include <memory>
#include <string>

using namespace std::chrono_literals;
using session::ConnectionState;
using session::Role;
using session::RoleFilter;
using testing_support::FakeTransport;
using testing_support::makePeer;

namespace {

session::Timings fastTimings(int maxAttempts) {
  session::Timings t;
  t.observationWindow = 5ms;
  t.reconnectDelay = 5ms;
  t.maxAttempts = maxAttempts;
  return t;
}

struct Rig {
  explicit Rig(session::Timings timings)
      : machine(transport, discovery, timings),
        supervisor(std::make_shared<session::ReconnectSupervisor>(io.get_executor(), machine, discovery, timings)) {
    supervisor->setOnGaveUp([this](const std::string& target, int attempts) {
      ++gaveUp;
      gaveUpTarget = target;
      gaveUpAttempts = attempts;
    });
    supervisor->setOnReconnected([this](const session::PeerDescriptor&) { ++reconnected; });
    machine.setOnConnected([this](const session::PeerDescriptor& p) { supervisor->notifyConnected(p); });
    discovery.setOnPeerFound([this](const session::PeerDescriptor& p) { supervisor->notifyPeerFound(p); });
  }

  boost::asio::io_context io;
  FakeTransport transport;
  session::DiscoverySession discovery{transport, {makePeer("local-device-0000001", "Phone", Role::Initiator),
                                                  RoleFilter::Opposite}};
  session::ConnectionStateMachine machine;
  std::shared_ptr<session::ReconnectSupervisor> supervisor;
  int gaveUp = 0;
  std::string gaveUpTarget;
  int gaveUpAttempts = 0;
  int reconnected = 0;
};

const auto kDesk = makePeer("peer-device-aaaaaaaa", "Desk", Role::Responder);

// Visible peer that never answers: exactly one give-up once the attempt budget is spent.
void testGivesUpAfterMaxAttempts() {
  Rig r(fastTimings(3));
  assert(r.machine.start());
  r.transport.peerFound(kDesk);

  r.supervisor->start("Desk");
  assert(r.supervisor->active());

  r.io.run();

  assert(r.gaveUp == 1);
  assert(r.gaveUpTarget == "Desk");
  assert(r.gaveUpAttempts == 3);
  assert(!r.supervisor->active());
  assert(r.supervisor->attempts() == 3);
  // The first invite left the machine Connecting, so later attempts were skipped without inviting.
  assert(r.transport.invites.size() == 1);
}

void testEveryAttemptInvitesWhenDeclined() {
  Rig r(fastTimings(4));
  assert(r.machine.start());
  r.transport.peerFound(kDesk);
  r.transport.failInvite = true;

  r.supervisor->start("Desk");
  r.io.run();

  assert(r.gaveUp == 1);
  assert(r.transport.invites.size() == 4);
  assert(r.machine.state() == ConnectionState::Browsing);
}

void testInvisibleTargetStillCountsAttempts() {
  Rig r(fastTimings(2));
  assert(r.machine.start());
  r.supervisor->start("Nowhere");
  r.io.run();
  assert(r.gaveUp == 1);
  assert(r.gaveUpAttempts == 2);
  assert(r.transport.invites.empty());
}

void testReconnects() {
  Rig r(fastTimings(5));
  assert(r.machine.start());
  r.transport.peerFound(kDesk);
  r.transport.connectOnInvite = true;

  r.supervisor->start("Desk");
  r.io.run();

  assert(r.machine.state() == ConnectionState::Connected);
  assert(r.reconnected == 1);
  assert(r.gaveUp == 0);
  assert(!r.supervisor->active());
  assert(r.transport.invites.size() == 1);
}

void testCancelStopsLoop() {
  Rig r(fastTimings(5));
  assert(r.machine.start());
  r.transport.failInvite = true;
  r.transport.peerFound(kDesk);

  r.supervisor->start("Desk");
  r.io.run_one(); // first attempt
  assert(r.transport.invites.size() == 1);
  r.supervisor->cancel();
  assert(!r.supervisor->active());
  r.io.run();

  assert(r.transport.invites.size() == 1);
  assert(r.gaveUp == 0);
}

void testRestartReplacesLoop() {
  Rig r(fastTimings(2));
  assert(r.machine.start());
  r.supervisor->start("First");
  r.supervisor->start("Second");
  r.io.run();
  assert(r.gaveUp == 1);
  assert(r.gaveUpTarget == "Second");
}

void testIncomingConnectionEndsLoop() {
  Rig r(fastTimings(50));
  assert(r.machine.start());
  r.supervisor->start("Desk");
  r.io.run_one();
  assert(r.supervisor->active());

  // Any connection ends the loop; only the target counts as a reconnect.
  r.transport.connected(makePeer("peer-device-cccccccc", "Tablet", Role::Responder));
  assert(!r.supervisor->active());
  assert(r.reconnected == 0);
  r.io.run();
  assert(r.gaveUp == 0);
}

void testPeerFoundCutsDelayShort() {
  session::Timings t = fastTimings(3);
  t.reconnectDelay = 10min;
  Rig r(t);
  assert(r.machine.start());
  r.transport.connectOnInvite = true;

  r.supervisor->start("Desk");
  r.io.run_one(); // attempt 1: not visible, long delay armed
  assert(r.supervisor->attempts() == 1);
  assert(r.supervisor->active());

  r.transport.peerFound(kDesk);
  const auto began = std::chrono::steady_clock::now();
  r.io.run();
  assert(std::chrono::steady_clock::now() - began < 1min);

  assert(r.machine.state() == ConnectionState::Connected);
  assert(r.reconnected == 1);
  assert(r.supervisor->attempts() == 2);
}

void testDisabled() {
  session::Timings t = fastTimings(3);
  Rig r(t);
  r.supervisor->setEnabled(false);
  assert(r.machine.start());
  r.supervisor->start("Desk");
  assert(!r.supervisor->active());
  r.io.run();
  assert(r.gaveUp == 0);
}

} // namespace

int main() {
  testGivesUpAfterMaxAttempts();
  testEveryAttemptInvitesWhenDeclined();
  testInvisibleTargetStillCountsAttempts();
  testReconnects();
  testCancelStopsLoop();
  testRestartReplacesLoop();
  testIncomingConnectionEndsLoop();
  testPeerFoundCutsDelayShort();
  testDisabled();
  return 0;
}
