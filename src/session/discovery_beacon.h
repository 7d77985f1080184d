#pragma once

#include "src/session/peer.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace session {

constexpr std::string_view kServiceName = "keybridge";
constexpr std::size_t kMaxDisplayName = 63;
constexpr std::size_t kMaxBeaconBytes = 1024;

// Presence announcement broadcast on the discovery port.
struct Beacon {
  std::string service{kServiceName};
  PeerDescriptor peer;
  uint16_t port = 0; // TCP listen port for invitations and resources
};

bool isValidDisplayName(std::string_view name);

std::string encodeBeacon(const Beacon& beacon);
std::optional<Beacon> decodeBeacon(std::span<const uint8_t> bytes, std::string* err = nullptr);

} // namespace session
