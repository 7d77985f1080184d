#include "src/history/message_history.h"

#include "common/json.hpp"

#include <fstream>

namespace history {

using common::json;

MessageHistory::MessageHistory(std::filesystem::path file, std::size_t capacity)
    : file_(std::move(file)), capacity_(capacity == 0 ? 1 : capacity) {}

bool MessageHistory::load(std::string* error_out) {
  entries_.clear();
  std::ifstream in(file_);
  if (!in) return true;

  json j = json::parse(in, nullptr, /*allow_exceptions*/ false, /*ignore_comments*/ true);
  if (j.is_discarded() || !j.is_object()) {
    if (error_out) *error_out = "failed to parse history";
    return false;
  }
  if (!j.contains("entries") || !j["entries"].is_array()) {
    if (error_out) *error_out = "history has no entries";
    return false;
  }
  for (const auto& e : j["entries"]) {
    if (!e.is_string()) continue;
    if (entries_.size() >= capacity_) break;
    entries_.push_back(e.get<std::string>());
  }
  return true;
}

bool MessageHistory::save(std::string* error_out) const {
  std::error_code ec;
  if (file_.has_parent_path()) std::filesystem::create_directories(file_.parent_path(), ec);
  if (ec) {
    if (error_out) *error_out = "failed to create history dir: " + file_.parent_path().string();
    return false;
  }

  json j;
  j["format"] = 1;
  j["entries"] = json::array();
  for (const auto& e : entries_) j["entries"].push_back(e);

  std::ofstream out(file_, std::ios::trunc);
  if (!out) {
    if (error_out) *error_out = "failed to write history";
    return false;
  }
  out << j.dump(2, ' ', false, json::error_handler_t::replace);
  return static_cast<bool>(out);
}

bool MessageHistory::add(std::string text) {
  if (text.empty()) return false;
  if (!entries_.empty() && entries_.front() == text) return false;
  entries_.push_front(std::move(text));
  while (entries_.size() > capacity_) entries_.pop_back();
  return true;
}

} // namespace history
