#include "src/transfer/transfer_coordinator.h"

#include "common/util.hpp"
#include "src/transfer/temp_resources.h"

#include <algorithm>

namespace transfer {

std::string_view outcomeToString(ItemOutcome outcome) {
  switch (outcome) {
    case ItemOutcome::Pending:
      return "pending";
    case ItemOutcome::InFlight:
      return "in_flight";
    case ItemOutcome::Succeeded:
      return "succeeded";
    case ItemOutcome::Cancelled:
      return "cancelled";
    case ItemOutcome::TimedOut:
      return "timed_out";
  }
  return "unknown";
}

TransferCoordinator::TransferCoordinator(boost::asio::any_io_executor ex,
                                         session::ResourceChannel& channel,
                                         session::Timings timings)
    : ex_(ex), channel_(channel), timings_(timings), itemTimer_(ex), cleanup_(&TempResources::removeFiles) {}

bool TransferCoordinator::startTransfer(std::vector<TransferItem> items, bool peerAvailable) {
  if (items.empty()) {
    common::log("transfer: nothing to send");
    return false;
  }
  if (!peerAvailable) {
    common::log("transfer: no connected peer");
    return false;
  }
  if (batch_) {
    common::log("transfer: a batch is already in flight");
    return false;
  }

  auto b = std::make_shared<Batch>();
  b->items = std::move(items);
  b->outcomes.assign(b->items.size(), ItemOutcome::Pending);
  b->progress.assign(b->items.size(), 0.0);
  batch_ = b;

  protocol::BatchAnnounce announce;
  for (const auto& item : b->items) announce.fileNames.push_back(item.name);
  channel_.sendCommand(announce);
  common::log("transfer: batch of " + std::to_string(b->items.size()) + " started");

  if (!beginItem(b, 0)) {
    common::log("transfer: first item could not start, batch abandoned");
    batch_.reset();
    scheduleCleanup(*b);
    publishProgress();
    return false;
  }
  return true;
}

ProgressSnapshot TransferCoordinator::snapshot() const {
  ProgressSnapshot s;
  if (!batch_) return s;
  s.active = true;
  s.currentIndex = static_cast<int>(batch_->current) + 1;
  s.total = static_cast<int>(batch_->items.size());
  s.progress = batch_->progress[batch_->current];
  return s;
}

bool TransferCoordinator::beginItem(const std::shared_ptr<Batch>& b, std::size_t i) {
  b->current = i;
  b->settled = false;
  const auto& item = b->items[i];
  channel_.sendCommand(protocol::BatchItemStarting{item.name, static_cast<int>(i) + 1, static_cast<int>(b->items.size())});

  auto handle = channel_.sendResource(item.source, item.name);
  if (!handle) return false;
  b->handle = handle;
  b->outcomes[i] = ItemOutcome::InFlight;
  publishProgress();
  watchItem(b, i);
  return true;
}

void TransferCoordinator::watchItem(const std::shared_ptr<Batch>& b, std::size_t i) {
  std::weak_ptr<TransferCoordinator> weak = weak_from_this();
  auto handle = b->handle;
  handle->setHandlers(
      [weak, b, i](double fraction) {
        if (auto self = weak.lock()) self->handleProgress(b, i, fraction);
      },
      [weak, b, i]() {
        if (auto self = weak.lock()) self->settle(b, i, ItemOutcome::Cancelled);
      });

  itemTimer_.expires_after(timings_.itemTimeout);
  itemTimer_.async_wait([weak, b, i](const boost::system::error_code& ec) {
    if (ec) return;
    auto self = weak.lock();
    if (!self || !self->isCurrent(b, i)) return;
    common::log("transfer: item " + std::to_string(i + 1) + " timed out");
    self->settle(b, i, ItemOutcome::TimedOut);
  });

  // The handle may have reached a terminal state before we subscribed.
  if (handle->finished()) {
    handleProgress(b, i, 1.0);
  } else if (handle->cancelled()) {
    settle(b, i, ItemOutcome::Cancelled);
  } else if (handle->fraction() > 0.0) {
    handleProgress(b, i, handle->fraction());
  }
}

void TransferCoordinator::handleProgress(const std::shared_ptr<Batch>& b, std::size_t i, double fraction) {
  if (!isCurrent(b, i)) return;
  if (fraction > b->progress[i]) {
    b->progress[i] = std::min(1.0, fraction);
    publishProgress();
  }
  if (fraction >= 1.0) settle(b, i, ItemOutcome::Succeeded);
}

void TransferCoordinator::settle(const std::shared_ptr<Batch>& b, std::size_t i, ItemOutcome outcome) {
  if (!isCurrent(b, i)) return;
  b->settled = true;
  itemTimer_.cancel();

  auto handle = std::move(b->handle);
  b->handle.reset();
  if (handle) {
    handle->clearHandlers();
    if (outcome == ItemOutcome::TimedOut) handle->abort();
  }

  b->outcomes[i] = outcome;
  common::log("transfer: item " + std::to_string(i + 1) + "/" + std::to_string(b->items.size()) + " " +
              std::string(outcomeToString(outcome)));
  if (onItemFinished_) onItemFinished_(static_cast<int>(i) + 1, b->items[i].name, outcome);
  publishProgress();

  boost::asio::post(ex_, [weak = weak_from_this(), b] {
    if (auto self = weak.lock()) self->advance(b);
  });
}

void TransferCoordinator::advance(const std::shared_ptr<Batch>& b) {
  if (batch_ != b) return;
  for (std::size_t next = b->current + 1; next < b->items.size(); ++next) {
    if (beginItem(b, next)) return;
    b->outcomes[next] = ItemOutcome::Cancelled;
    common::log("transfer: item " + std::to_string(next + 1) + " could not start");
    if (onItemFinished_) onItemFinished_(static_cast<int>(next) + 1, b->items[next].name, ItemOutcome::Cancelled);
  }
  finishBatch(b);
}

void TransferCoordinator::finishBatch(const std::shared_ptr<Batch>& b) {
  channel_.sendCommand(protocol::BatchComplete{});

  BatchResult result;
  result.total = static_cast<int>(b->items.size());
  result.outcomes = b->outcomes;
  result.successCount =
      static_cast<int>(std::count(b->outcomes.begin(), b->outcomes.end(), ItemOutcome::Succeeded));

  batch_.reset();
  lastResult_ = result;
  scheduleCleanup(*b);
  common::log("transfer: batch finished, " + std::to_string(result.successCount) + "/" +
              std::to_string(result.total) + " delivered");
  publishProgress();
  if (onBatchFinished_) onBatchFinished_(result);
}

void TransferCoordinator::scheduleCleanup(const Batch& b) {
  std::vector<std::filesystem::path> paths;
  paths.reserve(b.items.size());
  for (const auto& item : b.items) paths.push_back(item.source);

  auto timer = std::make_shared<boost::asio::steady_timer>(ex_);
  timer->expires_after(timings_.cleanupGrace);
  // Not tied to the coordinator's lifetime.
  timer->async_wait([timer, paths = std::move(paths), cleanup = cleanup_](const boost::system::error_code&) {
    if (cleanup) cleanup(paths);
  });
}

void TransferCoordinator::publishProgress() {
  if (onProgress_) onProgress_(snapshot());
}

bool TransferCoordinator::isCurrent(const std::shared_ptr<Batch>& b, std::size_t i) const {
  return batch_ == b && b->current == i && !b->settled;
}

} // namespace transfer
