#pragma once

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace common {

// Incremental SHA-256 for streamed resources.
class Sha256 {
 public:
  Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
      throw std::runtime_error("sha256 init failed");
    }
  }

  void update(std::span<const uint8_t> data) {
    if (finished_) throw std::logic_error("sha256 already finalized");
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
      throw std::runtime_error("sha256 update failed");
    }
  }

  std::array<uint8_t, 32> finish() {
    std::array<uint8_t, 32> out{};
    unsigned int len = 0;
    if (finished_ || EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1 || len != out.size()) {
      throw std::runtime_error("sha256 final failed");
    }
    finished_ = true;
    return out;
  }

 private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
  };
  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  bool finished_ = false;
};

inline std::array<uint8_t, 32> sha256(std::span<const uint8_t> data) {
  Sha256 h;
  h.update(data);
  return h.finish();
}

inline std::string to_hex(std::span<const uint8_t> data) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t b : data) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

// Hex SHA-256 of a file's contents; nullopt when the file cannot be read.
inline std::optional<std::string> sha256_file_hex(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  Sha256 h;
  std::vector<uint8_t> buf(64 * 1024);
  while (in) {
    in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    const auto got = in.gcount();
    if (got > 0) h.update(std::span<const uint8_t>(buf.data(), static_cast<std::size_t>(got)));
  }
  if (in.bad()) return std::nullopt;
  const auto d = h.finish();
  return to_hex(d);
}

} // namespace common
