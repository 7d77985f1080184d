#include "src/session/connection_state_machine.h"
#include "src/session/discovery_session.h"
#include "tests/fake_transport.h"

#include <cassert>
#include <string>
#include <utility>
#include <vector>

using session::ConnectionState;
using session::Role;
using session::RoleFilter;
using testing_support::FakeTransport;
using testing_support::makePeer;

namespace {

struct Rig {
  FakeTransport transport;
  session::DiscoverySession discovery{transport, {makePeer("local-device-0000001", "Phone", Role::Initiator),
                                                  RoleFilter::Opposite}};
  session::ConnectionStateMachine machine{transport, discovery, session::Timings{}};
  std::vector<std::pair<ConnectionState, ConnectionState>> transitions;
  std::vector<std::string> dropped;
  int connectedEvents = 0;

  Rig() {
    machine.setOnStateChanged([this](ConnectionState from, ConnectionState to) { transitions.emplace_back(from, to); });
    machine.setOnConnected([this](const session::PeerDescriptor&) { ++connectedEvents; });
    machine.setOnDropped([this](const session::PeerDescriptor& p) { dropped.push_back(p.displayName); });
  }
};

const auto kDesk = makePeer("peer-device-aaaaaaaa", "Desk", Role::Responder);
const auto kLaptop = makePeer("peer-device-bbbbbbbb", "Laptop", Role::Responder);

void testHappyPath() {
  Rig r;
  assert(r.machine.state() == ConnectionState::Idle);
  assert(!r.machine.connect(kDesk)); // only from Browsing
  assert(r.transport.invites.empty());

  assert(r.machine.start());
  assert(r.machine.state() == ConnectionState::Browsing);
  assert(r.machine.acceptsIncoming());

  assert(r.machine.connect(kDesk));
  assert(r.machine.state() == ConnectionState::Connecting);
  assert(r.machine.targetPeer() && r.machine.targetPeer()->id == kDesk.id);
  assert(r.transport.invites.size() == 1);
  assert(r.transport.lastInviteTimeout == session::Timings{}.inviteTimeout);
  assert(!r.machine.acceptsIncoming());

  // A second connect while one is in flight is a no-op.
  assert(!r.machine.connect(kLaptop));
  assert(r.transport.invites.size() == 1);

  // Connection from somebody else while connecting is ignored.
  r.transport.connected(kLaptop);
  assert(r.machine.state() == ConnectionState::Connecting);

  r.transport.connected(kDesk);
  assert(r.machine.state() == ConnectionState::Connected);
  assert(r.machine.activePeer() && r.machine.activePeer()->id == kDesk.id);
  assert(!r.machine.targetPeer());
  assert(r.machine.lastKnownPeer() == "Desk");
  assert(r.connectedEvents == 1);

  // Connected -> Browsing on loss, and the drop is reported once.
  r.transport.disconnected(kLaptop);
  assert(r.machine.state() == ConnectionState::Connected);
  r.transport.disconnected(kDesk);
  assert(r.machine.state() == ConnectionState::Browsing);
  assert(!r.machine.activePeer());
  assert(r.dropped.size() == 1 && r.dropped[0] == "Desk");
  r.transport.disconnected(kDesk);
  assert(r.dropped.size() == 1);

  const std::vector<std::pair<ConnectionState, ConnectionState>> expected = {
      {ConnectionState::Idle, ConnectionState::Browsing},
      {ConnectionState::Browsing, ConnectionState::Connecting},
      {ConnectionState::Connecting, ConnectionState::Connected},
      {ConnectionState::Connected, ConnectionState::Browsing},
  };
  assert(r.transitions == expected);
}

void testInviteOutcomes() {
  Rig r;
  assert(r.machine.start());

  // Declined or timed out: back to Browsing, not a drop.
  assert(r.machine.connect(kDesk));
  r.transport.disconnected(kDesk);
  assert(r.machine.state() == ConnectionState::Browsing);
  assert(r.dropped.empty());

  // Synchronous invite failure.
  r.transport.failInvite = true;
  assert(!r.machine.connect(kDesk));
  assert(r.machine.state() == ConnectionState::Browsing);
  assert(!r.machine.targetPeer());

  // Invite that connects before returning.
  r.transport.failInvite = false;
  r.transport.connectOnInvite = true;
  assert(r.machine.connect(kDesk));
  assert(r.machine.state() == ConnectionState::Connected);
}

void testIncoming() {
  Rig r;
  assert(r.machine.start());
  r.transport.connected(kLaptop);
  assert(r.machine.state() == ConnectionState::Connected);
  assert(r.machine.activePeer()->id == kLaptop.id);

  // A second connection while connected is ignored.
  r.transport.connected(kDesk);
  assert(r.machine.activePeer()->id == kLaptop.id);
}

void testFailureAndRestart() {
  Rig r;
  r.transport.failAdvertise = true;
  assert(!r.machine.start());
  assert(r.machine.state() == ConnectionState::Failed);
  assert(!r.machine.lastError().empty());
  assert(!r.machine.connect(kDesk));

  r.transport.failAdvertise = false;
  assert(r.machine.restart());
  assert(r.machine.state() == ConnectionState::Browsing);
  assert(r.transport.resets == 1);
  assert(r.machine.lastError().empty());

  // Restart while connected drops the peer without reporting a drop.
  r.transport.connected(kDesk);
  assert(r.machine.state() == ConnectionState::Connected);
  assert(r.machine.restart());
  assert(r.machine.state() == ConnectionState::Browsing);
  assert(!r.machine.activePeer());
  assert(r.dropped.empty());
  assert(r.transport.resets == 2);

  // Setup failure after start.
  r.transport.setupFailed("interface went away");
  assert(r.machine.state() == ConnectionState::Failed);
  assert(r.machine.lastError() == "interface went away");
}

} // namespace

int main() {
  testHappyPath();
  testInviteOutcomes();
  testIncoming();
  testFailureAndRestart();
  return 0;
}
