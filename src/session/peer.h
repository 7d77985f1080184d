#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace session {

enum class Role { Initiator, Responder };

// Browse policy: surface only peers of the complementary role, or everyone.
enum class RoleFilter { Opposite, AcceptAll };

std::string_view roleToString(Role role);
std::optional<Role> roleFromString(std::string_view s);
Role oppositeRole(Role role);
bool roleAccepted(RoleFilter filter, Role local, Role remote);

struct PeerDescriptor {
  std::string id;
  std::string displayName;
  Role role = Role::Responder;

  bool operator==(const PeerDescriptor&) const = default;
};

// Discovered peers keyed by id, kept in discovery order. Display names are not unique.
class PeerSet {
public:
  // Returns false when a peer with the same id is already present (the stored entry wins).
  bool insert(PeerDescriptor peer);
  bool erase(std::string_view id);
  void clear() { peers_.clear(); }

  const PeerDescriptor* find(std::string_view id) const;
  // First match in discovery order.
  const PeerDescriptor* findByName(std::string_view displayName) const;

  const std::vector<PeerDescriptor>& list() const { return peers_; }
  std::size_t size() const { return peers_.size(); }
  bool empty() const { return peers_.empty(); }

private:
  std::vector<PeerDescriptor> peers_;
};

} // namespace session
