#pragma once

#include "common/json.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace common::settings_store {

struct Settings {
  int format = 1;
  // Display name of the last peer we were connected to; seeds auto-reconnect at startup.
  std::string last_peer;
  bool reconnect_enabled = true;
  bool accept_all_roles = false;
};

inline std::filesystem::path resolve_root() {
  if (const char* env = std::getenv("KEYBRIDGE_CONFIG_DIR"); env && *env) {
    return std::filesystem::path(env);
  }
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "keybridge";
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config" / "keybridge";
  }
  return std::filesystem::path(".") / "keybridge";
}

inline std::filesystem::path settings_path(const std::filesystem::path& root) {
  return root / "settings.json";
}

inline std::filesystem::path device_id_path(const std::filesystem::path& root) {
  return root / "device_id";
}

inline std::filesystem::path history_path(const std::filesystem::path& root) {
  return root / "history.json";
}

inline bool load_settings(const std::filesystem::path& root, Settings* out, std::string* error_out = nullptr) {
  if (!out) return false;
  std::ifstream in(settings_path(root));
  if (!in) {
    if (error_out) *error_out = "settings not found";
    return false;
  }

  json j = json::parse(in, nullptr, /*allow_exceptions*/ false, /*ignore_comments*/ true);
  if (j.is_discarded()) {
    if (error_out) *error_out = "failed to parse settings";
    return false;
  }
  if (!j.is_object()) {
    if (error_out) *error_out = "settings is not an object";
    return false;
  }

  Settings s;
  if (j.contains("format") && j["format"].is_number_integer()) s.format = j["format"].get<int>();
  if (j.contains("last_peer") && j["last_peer"].is_string()) s.last_peer = j["last_peer"].get<std::string>();
  if (j.contains("reconnect_enabled") && j["reconnect_enabled"].is_boolean()) {
    s.reconnect_enabled = j["reconnect_enabled"].get<bool>();
  }
  if (j.contains("accept_all_roles") && j["accept_all_roles"].is_boolean()) {
    s.accept_all_roles = j["accept_all_roles"].get<bool>();
  }
  *out = std::move(s);
  return true;
}

inline bool save_settings(const std::filesystem::path& root, const Settings& s, std::string* error_out = nullptr) {
  std::error_code ec;
  std::filesystem::create_directories(root, ec);
  if (ec) {
    if (error_out) *error_out = "failed to create config root: " + root.string();
    return false;
  }

  json j;
  j["format"] = s.format;
  j["last_peer"] = s.last_peer;
  j["reconnect_enabled"] = s.reconnect_enabled;
  j["accept_all_roles"] = s.accept_all_roles;

  std::ofstream out(settings_path(root), std::ios::trunc);
  if (!out) {
    if (error_out) *error_out = "failed to write settings";
    return false;
  }
  out << j.dump(2, ' ', false, json::error_handler_t::replace);
  return static_cast<bool>(out);
}

// Read-modify-write of the last connected peer. Other fields keep their stored values.
inline bool remember_last_peer(const std::filesystem::path& root,
                               std::string_view peer_name,
                               std::string* error_out = nullptr) {
  Settings s;
  if (!load_settings(root, &s, nullptr)) s = Settings{};
  s.last_peer = std::string(peer_name);
  return save_settings(root, s, error_out);
}

} // namespace common::settings_store
