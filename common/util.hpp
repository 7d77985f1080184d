#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <chrono>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace common {

inline std::string iso_timestamp_utc() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t t = system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  char buf[32];
  std::snprintf(buf,
                sizeof(buf),
                "%04d-%02d-%02dT%02d:%02d:%02dZ",
                tm.tm_year + 1900,
                tm.tm_mon + 1,
                tm.tm_mday,
                tm.tm_hour,
                tm.tm_min,
                tm.tm_sec);
  return buf;
}

// Receives every formatted log line (timestamp included) after it hits stderr.
using LogSink = std::function<void(const std::string& line)>;

namespace detail {
inline std::mutex& log_mutex() {
  static std::mutex m;
  return m;
}
inline LogSink& log_sink() {
  static LogSink sink;
  return sink;
}
} // namespace detail

inline void set_log_sink(LogSink sink) {
  std::lock_guard lk(detail::log_mutex());
  detail::log_sink() = std::move(sink);
}

inline void log(std::string_view msg) {
  std::string line;
  line.reserve(msg.size() + 24);
  line.append("[").append(iso_timestamp_utc()).append("] ").append(msg);
  std::lock_guard lk(detail::log_mutex());
  std::cerr << line << "\n";
  if (detail::log_sink()) detail::log_sink()(line);
}

// Bounded in-memory copy of the most recent log lines.
class LogRing {
 public:
  explicit LogRing(std::size_t capacity = 50) : capacity_(capacity) {}

  void push(std::string line) {
    std::lock_guard lk(m_);
    lines_.push_back(std::move(line));
    while (lines_.size() > capacity_) lines_.pop_front();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard lk(m_);
    return {lines_.begin(), lines_.end()};
  }

  void clear() {
    std::lock_guard lk(m_);
    lines_.clear();
  }

 private:
  std::size_t capacity_;
  mutable std::mutex m_;
  std::deque<std::string> lines_;
};

template <class Endpoint>
inline std::string endpoint_to_string(const Endpoint& ep) {
  std::ostringstream oss;
  oss << ep.address().to_string() << ":" << ep.port();
  return oss.str();
}

inline bool is_valid_id(std::string_view id, std::size_t min_len = 8, std::size_t max_len = 128) {
  if (id.size() < min_len || id.size() > max_len) return false;
  for (unsigned char ch : id) {
    const bool ok = std::isalnum(ch) || ch == '_' || ch == '-';
    if (!ok) return false;
  }
  return true;
}

inline std::string base64url_encode(std::span<const uint8_t> data) {
  static constexpr char kB64[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);

  std::size_t i = 0;
  while (i + 3 <= data.size()) {
    const uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                       (static_cast<uint32_t>(data[i + 1]) << 8) |
                       (static_cast<uint32_t>(data[i + 2]));
    out.push_back(kB64[(v >> 18) & 0x3F]);
    out.push_back(kB64[(v >> 12) & 0x3F]);
    out.push_back(kB64[(v >> 6) & 0x3F]);
    out.push_back(kB64[v & 0x3F]);
    i += 3;
  }

  const std::size_t rem = data.size() - i;
  if (rem == 1) {
    const uint32_t v = static_cast<uint32_t>(data[i]) << 16;
    out.push_back(kB64[(v >> 18) & 0x3F]);
    out.push_back(kB64[(v >> 12) & 0x3F]);
    out.push_back('=');
    out.push_back('=');
  } else if (rem == 2) {
    const uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                       (static_cast<uint32_t>(data[i + 1]) << 8);
    out.push_back(kB64[(v >> 18) & 0x3F]);
    out.push_back(kB64[(v >> 12) & 0x3F]);
    out.push_back(kB64[(v >> 6) & 0x3F]);
    out.push_back('=');
  }

  // Make URL-safe and strip padding.
  for (char& c : out) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  while (!out.empty() && out.back() == '=') out.pop_back();
  return out;
}

inline std::optional<std::vector<uint8_t>> base64url_decode(std::string_view s) {
  std::string b64;
  b64.reserve(s.size() + 4);
  for (char c : s) {
    if (c == '-') b64.push_back('+');
    else if (c == '_') b64.push_back('/');
    else b64.push_back(c);
  }
  while ((b64.size() % 4) != 0) b64.push_back('=');

  auto val = [](unsigned char c) -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    if (c == '=') return -2;
    return -1;
  };

  std::vector<uint8_t> out;
  out.reserve((b64.size() / 4) * 3);

  for (std::size_t i = 0; i < b64.size(); i += 4) {
    int v0 = val(static_cast<unsigned char>(b64[i]));
    int v1 = val(static_cast<unsigned char>(b64[i + 1]));
    int v2 = val(static_cast<unsigned char>(b64[i + 2]));
    int v3 = val(static_cast<unsigned char>(b64[i + 3]));
    if (v0 < 0 || v1 < 0 || v2 == -1 || v3 == -1) return std::nullopt;
    if (v2 == -2 && v3 != -2) return std::nullopt;

    const uint32_t n0 = static_cast<uint32_t>(v0);
    const uint32_t n1 = static_cast<uint32_t>(v1);
    const uint32_t n2 = (v2 == -2) ? 0u : static_cast<uint32_t>(v2);
    const uint32_t n3 = (v3 == -2) ? 0u : static_cast<uint32_t>(v3);
    const uint32_t v = (n0 << 18) | (n1 << 12) | (n2 << 6) | n3;

    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    if (v2 != -2) out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    if (v3 != -2) out.push_back(static_cast<uint8_t>(v & 0xFF));
  }
  return out;
}

inline uint16_t choose_default_listen_port() {
  thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<int> dist(30000, 40000);
  return static_cast<uint16_t>(dist(rng));
}

} // namespace common
