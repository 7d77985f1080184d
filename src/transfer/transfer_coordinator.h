#pragma once

#include "src/session/resource_channel.h"
#include "src/session/timings.h"
#include "src/session/transport.h"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transfer {

enum class ItemOutcome { Pending, InFlight, Succeeded, Cancelled, TimedOut };

std::string_view outcomeToString(ItemOutcome outcome);

struct TransferItem {
  std::filesystem::path source; // temp file owned by the batch
  std::string name;             // name announced to the receiver
};

struct ProgressSnapshot {
  bool active = false;
  int currentIndex = 0; // 1-based
  int total = 0;
  double progress = 0.0;
};

struct BatchResult {
  int successCount = 0;
  int total = 0;
  std::vector<ItemOutcome> outcomes;

  bool success() const { return successCount > 0; }
  bool partial() const { return successCount > 0 && successCount < total; }
};

// Sends one batch at a time over a ResourceChannel: announce, then each item strictly in
// order with its own completion race (done, cancelled, timed out), then BatchComplete.
// Temp sources are handed to the cleanup hook once per batch after the grace delay.
// Must be owned by a shared_ptr; all calls happen on the executor.
class TransferCoordinator : public std::enable_shared_from_this<TransferCoordinator> {
public:
  using OnProgress = std::function<void(const ProgressSnapshot&)>;
  using OnItemFinished = std::function<void(int index, const std::string& name, ItemOutcome outcome)>;
  using OnBatchFinished = std::function<void(const BatchResult&)>;
  using Cleanup = std::function<void(const std::vector<std::filesystem::path>&)>;

  TransferCoordinator(boost::asio::any_io_executor ex, session::ResourceChannel& channel, session::Timings timings);

  TransferCoordinator(const TransferCoordinator&) = delete;
  TransferCoordinator& operator=(const TransferCoordinator&) = delete;

  void setOnProgress(OnProgress cb) { onProgress_ = std::move(cb); }
  void setOnItemFinished(OnItemFinished cb) { onItemFinished_ = std::move(cb); }
  void setOnBatchFinished(OnBatchFinished cb) { onBatchFinished_ = std::move(cb); }
  void setCleanup(Cleanup cleanup) { cleanup_ = std::move(cleanup); }

  // True once the first item's send has begun; the rest continues in the background.
  // Rejected while another batch is in flight.
  bool startTransfer(std::vector<TransferItem> items, bool peerAvailable);

  ProgressSnapshot snapshot() const;
  bool busy() const { return batch_ != nullptr; }
  const std::optional<BatchResult>& lastResult() const { return lastResult_; }

private:
  struct Batch {
    std::vector<TransferItem> items;
    std::vector<ItemOutcome> outcomes;
    std::vector<double> progress;
    std::size_t current = 0;
    bool settled = false;
    std::shared_ptr<session::ResourceProgress> handle;
  };

  bool beginItem(const std::shared_ptr<Batch>& b, std::size_t i);
  void watchItem(const std::shared_ptr<Batch>& b, std::size_t i);
  void handleProgress(const std::shared_ptr<Batch>& b, std::size_t i, double fraction);
  void settle(const std::shared_ptr<Batch>& b, std::size_t i, ItemOutcome outcome);
  void advance(const std::shared_ptr<Batch>& b);
  void finishBatch(const std::shared_ptr<Batch>& b);
  void scheduleCleanup(const Batch& b);
  void publishProgress();
  bool isCurrent(const std::shared_ptr<Batch>& b, std::size_t i) const;

  boost::asio::any_io_executor ex_;
  session::ResourceChannel& channel_;
  session::Timings timings_;
  boost::asio::steady_timer itemTimer_;
  std::shared_ptr<Batch> batch_;
  std::optional<BatchResult> lastResult_;

  OnProgress onProgress_;
  OnItemFinished onItemFinished_;
  OnBatchFinished onBatchFinished_;
  Cleanup cleanup_;
};

} // namespace transfer
