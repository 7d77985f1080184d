#pragma once

#include <chrono>

namespace session {

// Policy values shared by the connection and transfer components. Tests shrink them.
struct Timings {
  std::chrono::milliseconds inviteTimeout{10'000};
  std::chrono::milliseconds observationWindow{3'000};
  std::chrono::milliseconds reconnectDelay{2'000};
  int maxAttempts = 10;
  std::chrono::milliseconds itemTimeout{60'000};
  std::chrono::milliseconds cleanupGrace{5'000};
  std::chrono::milliseconds beaconInterval{1'000};
  std::chrono::milliseconds finalizeTimeout{30'000};
  std::chrono::milliseconds receivedCleanupDelay{10'000};
};

} // namespace session
