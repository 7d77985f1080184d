#pragma once

#include <filesystem>
#include <string>

namespace transfer {

constexpr double kDefaultImageQuality = 0.7;

// Turns a captured image into the payload file that gets sent.
class ImageCodec {
public:
  virtual ~ImageCodec() = default;

  // quality is in (0, 1].
  virtual bool encode(const std::filesystem::path& source,
                      double quality,
                      const std::filesystem::path& dest,
                      std::string* error_out) = 0;
};

// Sends files as they are; used when no platform encoder is available.
class CopyCodec : public ImageCodec {
public:
  bool encode(const std::filesystem::path& source,
              double quality,
              const std::filesystem::path& dest,
              std::string* error_out) override;
};

} // namespace transfer
