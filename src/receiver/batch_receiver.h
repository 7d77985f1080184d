#pragma once

#include "src/protocol/command.h"
#include "src/session/timings.h"
#include "src/session/transport.h"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace receiver {

enum class ReceivePhase { Idle, Receiving, Completed, Failed };

std::string_view phaseToString(ReceivePhase phase);

struct ReceiveStatus {
  ReceivePhase phase = ReceivePhase::Idle;
  int count = 0; // files received so far
  int expected = 0;
  double progress = 0.0;
  std::string message;
};

// Collects the resources of one announced batch and hands them on once the batch is closed.
// Must be owned by a shared_ptr; all calls happen on the executor.
class BatchReceiver : public std::enable_shared_from_this<BatchReceiver> {
public:
  using Deliver = std::function<void(const std::vector<std::filesystem::path>&)>;
  using Cleanup = std::function<void(const std::vector<std::filesystem::path>&)>;
  using OnStatus = std::function<void(const ReceiveStatus&)>;

  BatchReceiver(boost::asio::any_io_executor ex, session::Timings timings);

  void setDeliver(Deliver cb) { deliver_ = std::move(cb); }
  void setCleanup(Cleanup cb) { cleanup_ = std::move(cb); }
  void setOnStatus(OnStatus cb) { onStatus_ = std::move(cb); }

  void handleAnnounce(const protocol::BatchAnnounce& cmd);
  void handleItemStarting(const protocol::BatchItemStarting& cmd);
  void handleComplete();
  void handleResource(const session::IncomingResource& resource);

  const ReceiveStatus& status() const { return status_; }
  int currentIndex() const { return currentIndex_; }

private:
  void maybeFinalize();
  void finalize(bool timedOut);
  void scheduleCleanup(std::vector<std::filesystem::path> paths);
  void updateProgress();
  void publish();

  boost::asio::any_io_executor ex_;
  session::Timings timings_;
  boost::asio::steady_timer finalizeTimer_;

  std::vector<std::string> expected_;
  std::vector<std::filesystem::path> received_;
  std::set<std::string> resolved_;
  int currentIndex_ = 0;
  bool completeSeen_ = false;
  uint64_t generation_ = 0;
  ReceiveStatus status_;

  Deliver deliver_;
  Cleanup cleanup_;
  OnStatus onStatus_;
};

} // namespace receiver
