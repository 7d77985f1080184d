#pragma once

#include "common/util.hpp"

#include <openssl/rand.h>

#include <array>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace common {

// Stable per-installation device id. Peers are told apart by this id, never by display name.
class DeviceIdentity {
 public:
  static constexpr std::size_t kIdBytes = 16;

  static std::shared_ptr<DeviceIdentity> load_or_create(std::string path) {
    auto id = std::shared_ptr<DeviceIdentity>(new DeviceIdentity());
    id->id_path_ = std::move(path);
    if (!id->load_from_disk()) {
      id->generate_new();
      id->save_to_disk_best_effort();
    }
    return id;
  }

  // Fresh id that is never persisted (tests, throwaway sessions).
  static std::shared_ptr<DeviceIdentity> ephemeral() {
    auto id = std::shared_ptr<DeviceIdentity>(new DeviceIdentity());
    id->generate_new();
    return id;
  }

  std::string_view device_id() const { return device_id_; }

 private:
  DeviceIdentity() = default;

  static std::string expand_user_path(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
      const char* home = std::getenv("HOME");
      if (!home) return path;
      if (path.size() == 1) return std::string(home);
      if (path[1] == '/') return std::string(home) + path.substr(1);
    }
    return path;
  }

  bool load_from_disk() {
    std::ifstream in(expand_user_path(id_path_));
    if (!in) return false;
    std::string line;
    std::getline(in, line);
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.pop_back();
    if (!is_valid_id(line, 16, 64)) return false;
    device_id_ = std::move(line);
    return true;
  }

  void generate_new() {
    std::array<uint8_t, kIdBytes> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
      throw std::runtime_error("RAND_bytes failed");
    }
    device_id_ = base64url_encode(std::span<const uint8_t>(raw.data(), raw.size()));
  }

  void save_to_disk_best_effort() {
    const std::filesystem::path fp(expand_user_path(id_path_));
    std::error_code ec;
    std::filesystem::create_directories(fp.parent_path(), ec);
    std::ofstream out(fp, std::ios::trunc);
    if (!out) {
      log("identity: could not persist device id to " + fp.string());
      return;
    }
    out << device_id_ << "\n";
  }

  std::string id_path_;
  std::string device_id_;
};

} // namespace common
