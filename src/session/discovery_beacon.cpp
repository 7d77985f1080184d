#include "src/session/discovery_beacon.h"

#include "common/framing.hpp"
#include "common/json.hpp"
#include "common/util.hpp"

namespace session {

using common::json;

namespace {

std::optional<Beacon> reject(std::string* err, const char* why) {
  if (err) *err = why;
  return std::nullopt;
}

} // namespace

bool isValidDisplayName(std::string_view name) {
  if (name.empty() || name.size() > kMaxDisplayName) return false;
  for (unsigned char ch : name) {
    if (ch < 0x20 || ch == 0x7F) return false;
  }
  return true;
}

std::string encodeBeacon(const Beacon& beacon) {
  json j;
  j["type"] = "beacon";
  j["service"] = beacon.service;
  j["id"] = beacon.peer.id;
  j["name"] = beacon.peer.displayName;
  j["role"] = std::string(roleToString(beacon.peer.role));
  j["port"] = beacon.port;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<Beacon> decodeBeacon(std::span<const uint8_t> bytes, std::string* err) {
  if (bytes.empty() || bytes.size() > kMaxBeaconBytes) return reject(err, "bad beacon size");
  const auto parsed = common::parse_json_bytes(bytes);
  if (!parsed || !parsed->is_object()) return reject(err, "beacon is not a json object");
  const json& j = *parsed;

  if (!j.contains("type") || !j["type"].is_string() || j["type"].get<std::string>() != "beacon") {
    return reject(err, "not a beacon");
  }
  for (const char* key : {"service", "id", "name", "role"}) {
    if (!j.contains(key) || !j[key].is_string()) return reject(err, "beacon missing field");
  }
  if (!j.contains("port") || !j["port"].is_number_unsigned()) return reject(err, "beacon missing port");

  Beacon b;
  b.service = j["service"].get<std::string>();
  b.peer.id = j["id"].get<std::string>();
  b.peer.displayName = j["name"].get<std::string>();
  const auto role = roleFromString(j["role"].get<std::string>());
  if (!role) return reject(err, "unknown role");
  b.peer.role = *role;
  const auto port = j["port"].get<uint64_t>();
  if (port == 0 || port > 65535) return reject(err, "port out of range");
  b.port = static_cast<uint16_t>(port);

  if (!common::is_valid_id(b.peer.id, 16, 64)) return reject(err, "invalid peer id");
  if (!isValidDisplayName(b.peer.displayName)) return reject(err, "invalid display name");
  return b;
}

} // namespace session
