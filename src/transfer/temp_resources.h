#pragma once

#include "src/transfer/image_codec.h"
#include "src/transfer/transfer_coordinator.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace transfer {

// Per-process scratch directory holding encoded payloads until their batch is cleaned up.
class TempResources {
public:
  explicit TempResources(std::filesystem::path dir);

  const std::filesystem::path& dir() const { return dir_; }

  // Creates the directory and removes leftovers from earlier batches.
  bool reset(std::string* error_out = nullptr);

  // Encodes every source into the directory. Sources that fail to encode are skipped;
  // nullopt when nothing could be prepared.
  std::optional<std::vector<TransferItem>> prepareBatch(const std::vector<std::filesystem::path>& sources,
                                                        ImageCodec& codec,
                                                        double quality = kDefaultImageQuality,
                                                        std::string* error_out = nullptr);

  // "batch_<index>_of_<total>_<file name>"
  static std::string resourceName(int index, int total, const std::filesystem::path& source);
  static void removeFiles(const std::vector<std::filesystem::path>& paths);

private:
  std::filesystem::path dir_;
};

} // namespace transfer
