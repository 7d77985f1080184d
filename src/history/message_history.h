#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <string>

namespace history {

// Recently sent texts, newest first, persisted as JSON.
class MessageHistory {
public:
  static constexpr std::size_t kDefaultCapacity = 100;

  explicit MessageHistory(std::filesystem::path file, std::size_t capacity = kDefaultCapacity);

  // A missing file is an empty history, not an error.
  bool load(std::string* error_out = nullptr);
  bool save(std::string* error_out = nullptr) const;

  // Returns false for empty text or a repeat of the newest entry.
  bool add(std::string text);
  void clear() { entries_.clear(); }

  const std::deque<std::string>& entries() const { return entries_; }
  std::size_t capacity() const { return capacity_; }

private:
  std::filesystem::path file_;
  std::size_t capacity_;
  std::deque<std::string> entries_;
};

} // namespace history
