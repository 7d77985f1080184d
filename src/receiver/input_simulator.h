#pragma once

#include "src/protocol/command.h"

namespace receiver {

// Permission-gated keyboard/mouse facility of the receiving host.
class InputSimulator {
public:
  virtual ~InputSimulator() = default;

  virtual bool hasPermission() const = 0;
  // Editing commands only; side effect only.
  virtual void perform(const protocol::Command& cmd) = 0;
  // Clicks the position the user saved on this host.
  virtual void clickSavedPosition() = 0;
};

} // namespace receiver
