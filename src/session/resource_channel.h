#pragma once

#include "src/protocol/command.h"
#include "src/session/transport.h"

#include <filesystem>
#include <memory>
#include <string>

namespace session {

// What a batch sender needs from the connected link: the command channel and the
// out-of-band resource channel.
class ResourceChannel {
public:
  virtual ~ResourceChannel() = default;

  virtual bool sendCommand(const protocol::Command& cmd) = 0;
  virtual std::shared_ptr<ResourceProgress> sendResource(const std::filesystem::path& path,
                                                         const std::string& name) = 0;
};

} // namespace session
