#include "src/transfer/image_codec.h"

namespace transfer {

bool CopyCodec::encode(const std::filesystem::path& source,
                       double quality,
                       const std::filesystem::path& dest,
                       std::string* error_out) {
  if (quality <= 0.0 || quality > 1.0) {
    if (error_out) *error_out = "quality out of range";
    return false;
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    if (error_out) *error_out = "not a regular file: " + source.string();
    return false;
  }
  std::filesystem::copy_file(source, dest, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    if (error_out) *error_out = "copy " + source.string() + ": " + ec.message();
    return false;
  }
  return true;
}

} // namespace transfer
