#include "src/transfer/temp_resources.h"

#include "common/util.hpp"

#include <cstdint>
#include <cstdio>
#include <random>

namespace transfer {

namespace {

std::string randomTag() {
  thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> dist;
  char buf[9];
  std::snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(dist(rng)));
  return buf;
}

} // namespace

TempResources::TempResources(std::filesystem::path dir) : dir_(std::move(dir)) {}

bool TempResources::reset(std::string* error_out) {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    if (error_out) *error_out = "cannot create " + dir_.string() + ": " + ec.message();
    return false;
  }
  int removed = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
    std::error_code rm;
    if (entry.is_regular_file(rm) && std::filesystem::remove(entry.path(), rm)) ++removed;
  }
  if (ec) {
    if (error_out) *error_out = "cannot list " + dir_.string() + ": " + ec.message();
    return false;
  }
  if (removed > 0) common::log("temp: removed " + std::to_string(removed) + " stale files");
  return true;
}

std::optional<std::vector<TransferItem>> TempResources::prepareBatch(const std::vector<std::filesystem::path>& sources,
                                                                     ImageCodec& codec,
                                                                     double quality,
                                                                     std::string* error_out) {
  if (sources.empty()) {
    if (error_out) *error_out = "no sources";
    return std::nullopt;
  }
  if (!reset(error_out)) return std::nullopt;

  const int total = static_cast<int>(sources.size());
  std::vector<TransferItem> items;
  for (int i = 0; i < total; ++i) {
    const auto& src = sources[static_cast<std::size_t>(i)];
    const auto dest = dir_ / ("image_" + std::to_string(i + 1) + "_" + randomTag() + src.extension().string());
    std::string err;
    if (!codec.encode(src, quality, dest, &err)) {
      common::log("temp: skipping " + src.string() + ": " + err);
      continue;
    }
    items.push_back(TransferItem{dest, resourceName(i + 1, total, src)});
  }
  if (items.empty()) {
    if (error_out) *error_out = "no source could be encoded";
    return std::nullopt;
  }
  return items;
}

std::string TempResources::resourceName(int index, int total, const std::filesystem::path& source) {
  return "batch_" + std::to_string(index) + "_of_" + std::to_string(total) + "_" + source.filename().string();
}

void TempResources::removeFiles(const std::vector<std::filesystem::path>& paths) {
  int removed = 0;
  for (const auto& p : paths) {
    std::error_code ec;
    if (std::filesystem::remove(p, ec)) ++removed;
    else if (ec) common::log("temp: cannot remove " + p.string() + ": " + ec.message());
  }
  common::log("temp: cleaned up " + std::to_string(removed) + " of " + std::to_string(paths.size()) + " files");
}

} // namespace transfer
