#include "src/session/peer.h"

#include <algorithm>

namespace session {

std::string_view roleToString(Role role) {
  switch (role) {
    case Role::Initiator:
      return "initiator";
    case Role::Responder:
      return "responder";
  }
  return "unknown";
}

std::optional<Role> roleFromString(std::string_view s) {
  if (s == "initiator") return Role::Initiator;
  if (s == "responder") return Role::Responder;
  return std::nullopt;
}

Role oppositeRole(Role role) {
  return role == Role::Initiator ? Role::Responder : Role::Initiator;
}

bool roleAccepted(RoleFilter filter, Role local, Role remote) {
  if (filter == RoleFilter::AcceptAll) return true;
  return remote == oppositeRole(local);
}

bool PeerSet::insert(PeerDescriptor peer) {
  if (find(peer.id)) return false;
  peers_.push_back(std::move(peer));
  return true;
}

bool PeerSet::erase(std::string_view id) {
  auto it = std::find_if(peers_.begin(), peers_.end(), [&](const PeerDescriptor& p) { return p.id == id; });
  if (it == peers_.end()) return false;
  peers_.erase(it);
  return true;
}

const PeerDescriptor* PeerSet::find(std::string_view id) const {
  for (const auto& p : peers_) {
    if (p.id == id) return &p;
  }
  return nullptr;
}

const PeerDescriptor* PeerSet::findByName(std::string_view displayName) const {
  for (const auto& p : peers_) {
    if (p.displayName == displayName) return &p;
  }
  return nullptr;
}

} // namespace session
