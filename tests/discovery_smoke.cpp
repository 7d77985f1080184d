#include "common/identity.hpp"
#include "src/session/discovery_beacon.h"
#include "src/session/discovery_session.h"
#include "tests/fake_transport.h"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

using session::Role;
using session::RoleFilter;
using testing_support::FakeTransport;
using testing_support::makePeer;

namespace {

std::vector<uint8_t> bytesOf(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

const std::string kLocalId = "local-device-0000001";
const std::string kPeerA = "peer-device-aaaaaaaa";
const std::string kPeerB = "peer-device-bbbbbbbb";

void testRoles() {
  assert(session::roleFromString("initiator") == Role::Initiator);
  assert(session::roleFromString("responder") == Role::Responder);
  assert(!session::roleFromString("Initiator"));
  assert(session::oppositeRole(Role::Initiator) == Role::Responder);

  assert(session::roleAccepted(RoleFilter::Opposite, Role::Initiator, Role::Responder));
  assert(!session::roleAccepted(RoleFilter::Opposite, Role::Initiator, Role::Initiator));
  assert(session::roleAccepted(RoleFilter::AcceptAll, Role::Responder, Role::Responder));

  session::PeerSet set;
  assert(set.insert(makePeer(kPeerA, "Desk", Role::Responder)));
  assert(!set.insert(makePeer(kPeerA, "Renamed", Role::Responder)));
  assert(set.insert(makePeer(kPeerB, "Desk", Role::Responder)));
  assert(set.size() == 2);
  assert(set.find(kPeerA)->displayName == "Desk");
  assert(set.findByName("Desk")->id == kPeerA);
  assert(set.erase(kPeerA));
  assert(!set.erase(kPeerA));
  assert(set.findByName("Desk")->id == kPeerB);
}

void testBeacon() {
  session::Beacon b;
  const auto identity = common::DeviceIdentity::ephemeral();
  b.peer = makePeer(std::string(identity->device_id()), "Kitchen iPad", Role::Initiator);
  b.port = 40123;
  const std::string wire = session::encodeBeacon(b);
  const auto back = session::decodeBeacon(bytesOf(wire));
  assert(back.has_value());
  assert(back->service == session::kServiceName);
  assert(back->peer == b.peer);
  assert(back->port == 40123);

  std::string err;
  assert(!session::decodeBeacon(bytesOf("{}"), &err));
  assert(!err.empty());
  assert(!session::decodeBeacon(bytesOf(
      R"({"type":"beacon","service":"keybridge","id":"short","name":"x","role":"initiator","port":1})")));
  assert(!session::decodeBeacon(bytesOf(
      R"({"type":"beacon","service":"keybridge","id":"peer-device-aaaaaaaa","name":"x","role":"boss","port":1})")));
  assert(!session::decodeBeacon(bytesOf(
      R"({"type":"beacon","service":"keybridge","id":"peer-device-aaaaaaaa","name":"x","role":"initiator","port":0})")));
  assert(!session::decodeBeacon(bytesOf(
      R"({"type":"beacon","service":"keybridge","id":"peer-device-aaaaaaaa","name":"","role":"initiator","port":9})")));
  assert(session::decodeBeacon(bytesOf(
      R"({"type":"beacon","service":"keybridge","id":"peer-device-aaaaaaaa","name":"x","role":"initiator","port":9})")));

  assert(session::isValidDisplayName("Living room"));
  assert(!session::isValidDisplayName(""));
  assert(!session::isValidDisplayName(std::string(64, 'n')));
  assert(session::isValidDisplayName(std::string(63, 'n')));
  assert(!session::isValidDisplayName("tab\there"));
}

void testSessionFiltering() {
  FakeTransport t;
  session::DiscoverySession d(t, {makePeer(kLocalId, "Phone", Role::Initiator), RoleFilter::Opposite});

  std::vector<std::string> found;
  d.setOnPeerFound([&](const session::PeerDescriptor& p) { found.push_back(p.id); });
  std::vector<std::string> lost;
  d.setOnPeerLost([&](const session::PeerDescriptor& p) { lost.push_back(p.displayName); });

  // Events before start are ignored.
  t.peerFound(makePeer(kPeerA, "Desk", Role::Responder));
  assert(d.peers().empty());

  assert(d.start());
  assert(d.running() && t.advertising && t.browsing);
  assert(t.advertisedAs.id == kLocalId);

  t.peerFound(makePeer(kLocalId, "Phone", Role::Responder)); // self
  t.peerFound(makePeer(kPeerB, "Other phone", Role::Initiator)); // same role
  t.peerFound(makePeer(kPeerA, "Desk", Role::Responder));
  t.peerFound(makePeer(kPeerA, "Desk", Role::Responder)); // duplicate
  assert(d.peers().size() == 1);
  assert(found.size() == 1 && found[0] == kPeerA);

  t.peerLost("unknown-peer-000000");
  t.peerLost(kPeerA);
  assert(d.peers().empty());
  assert(lost.size() == 1 && lost[0] == "Desk");

  d.stop();
  assert(!d.running() && !t.advertising && !t.browsing);
}

void testAcceptAll() {
  FakeTransport t;
  session::DiscoverySession d(t, {makePeer(kLocalId, "Phone", Role::Initiator), RoleFilter::AcceptAll});
  assert(d.start());
  t.peerFound(makePeer(kPeerB, "Other phone", Role::Initiator));
  t.peerFound(makePeer(kPeerA, "Desk", Role::Responder));
  assert(d.peers().size() == 2);
  d.stop();
  assert(d.peers().empty());
}

void testStartFailures() {
  FakeTransport t;
  t.failBrowse = true;
  session::DiscoverySession d(t, {makePeer(kLocalId, "Phone", Role::Initiator), RoleFilter::Opposite});
  std::string err;
  assert(!d.start(&err));
  assert(!err.empty());
  assert(!d.running());
  assert(!t.advertising); // rolled back

  std::string inviteErr;
  assert(!d.invite(makePeer(kPeerA, "Desk", Role::Responder), std::chrono::seconds(1), &inviteErr));
  assert(t.invites.empty());
}

void testInvitationsAndSetupFailure() {
  FakeTransport t;
  session::DiscoverySession d(t, {makePeer(kLocalId, "Phone", Role::Initiator), RoleFilter::Opposite});
  const auto desk = makePeer(kPeerA, "Desk", Role::Responder);

  assert(!t.invitation(desk)); // not running
  assert(d.start());
  assert(t.invitation(desk)); // no guard installed

  bool accepting = false;
  d.setInvitationGuard([&](const session::PeerDescriptor&) { return accepting; });
  assert(!t.invitation(desk));
  accepting = true;
  assert(t.invitation(desk));

  assert(d.invite(desk, std::chrono::seconds(10)));
  assert(t.invites.size() == 1 && t.lastInviteTimeout == std::chrono::seconds(10));

  t.peerFound(desk);
  std::string failure;
  d.setOnSetupFailed([&](const std::string& e) { failure = e; });
  t.setupFailed("socket closed");
  assert(failure == "socket closed");
  assert(!d.running());
  assert(d.peers().empty());
}

} // namespace

int main() {
  testRoles();
  testBeacon();
  testSessionFiltering();
  testAcceptAll();
  testStartFailures();
  testInvitationsAndSetupFailure();
  return 0;
}
