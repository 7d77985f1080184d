#include "src/receiver/batch_receiver.h"

#include "common/util.hpp"
#include "src/transfer/temp_resources.h"

#include <algorithm>

namespace receiver {

std::string_view phaseToString(ReceivePhase phase) {
  switch (phase) {
    case ReceivePhase::Idle:
      return "idle";
    case ReceivePhase::Receiving:
      return "receiving";
    case ReceivePhase::Completed:
      return "completed";
    case ReceivePhase::Failed:
      return "failed";
  }
  return "unknown";
}

BatchReceiver::BatchReceiver(boost::asio::any_io_executor ex, session::Timings timings)
    : ex_(ex), timings_(timings), finalizeTimer_(ex), cleanup_(&transfer::TempResources::removeFiles) {}

void BatchReceiver::handleAnnounce(const protocol::BatchAnnounce& cmd) {
  if (status_.phase == ReceivePhase::Receiving) {
    common::log("receiver: previous batch abandoned after " + std::to_string(received_.size()) + " files");
    scheduleCleanup(std::move(received_));
  }
  ++generation_;
  finalizeTimer_.cancel();
  expected_ = cmd.fileNames;
  received_.clear();
  resolved_.clear();
  currentIndex_ = 0;
  completeSeen_ = false;

  status_ = ReceiveStatus{};
  status_.expected = static_cast<int>(expected_.size());
  if (expected_.empty()) {
    status_.phase = ReceivePhase::Failed;
    status_.message = "empty batch announced";
    publish();
    return;
  }
  status_.phase = ReceivePhase::Receiving;
  common::log("receiver: expecting " + std::to_string(expected_.size()) + " files");
  publish();
}

void BatchReceiver::handleItemStarting(const protocol::BatchItemStarting& cmd) {
  if (status_.phase != ReceivePhase::Receiving) {
    common::log("receiver: item " + cmd.fileName + " announced outside a batch");
    return;
  }
  currentIndex_ = cmd.index;
  publish();
}

void BatchReceiver::handleComplete() {
  if (status_.phase != ReceivePhase::Receiving) {
    common::log("receiver: batch complete outside a batch");
    return;
  }
  completeSeen_ = true;
  if (resolved_.size() == expected_.size()) {
    finalize(false);
    return;
  }
  const uint64_t gen = generation_;
  finalizeTimer_.expires_after(timings_.finalizeTimeout);
  finalizeTimer_.async_wait([weak = weak_from_this(), gen](const boost::system::error_code& ec) {
    if (ec) return;
    auto self = weak.lock();
    if (!self || gen != self->generation_) return;
    self->finalize(true);
  });
}

void BatchReceiver::handleResource(const session::IncomingResource& resource) {
  const bool announced = std::find(expected_.begin(), expected_.end(), resource.name) != expected_.end();
  if (status_.phase != ReceivePhase::Receiving || !announced || resolved_.count(resource.name)) {
    common::log("receiver: unexpected resource " + resource.name);
    if (resource.ok) scheduleCleanup({resource.path});
    return;
  }
  resolved_.insert(resource.name);
  if (resource.ok) {
    received_.push_back(resource.path);
  } else {
    common::log("receiver: " + resource.name + " failed: " + resource.error);
  }
  updateProgress();
  publish();
  if (completeSeen_ && resolved_.size() == expected_.size()) finalize(false);
}

void BatchReceiver::finalize(bool timedOut) {
  ++generation_;
  finalizeTimer_.cancel();
  auto files = std::move(received_);
  received_.clear();

  status_.count = static_cast<int>(files.size());
  if (files.empty()) {
    status_.phase = ReceivePhase::Failed;
    status_.message = timedOut ? "timed out waiting for files" : "no files received";
  } else {
    status_.phase = ReceivePhase::Completed;
    if (static_cast<int>(files.size()) < status_.expected) {
      status_.message = std::to_string(status_.expected - status_.count) + " files missing";
    }
  }
  common::log("receiver: batch " + std::string(phaseToString(status_.phase)) + " with " +
              std::to_string(files.size()) + "/" + std::to_string(status_.expected) + " files");
  publish();
  if (!files.empty() && deliver_) deliver_(files);
  scheduleCleanup(std::move(files));
}

void BatchReceiver::scheduleCleanup(std::vector<std::filesystem::path> paths) {
  if (paths.empty()) return;
  auto timer = std::make_shared<boost::asio::steady_timer>(ex_);
  timer->expires_after(timings_.receivedCleanupDelay);
  timer->async_wait([timer, paths = std::move(paths), cleanup = cleanup_](const boost::system::error_code&) {
    if (cleanup) cleanup(paths);
  });
}

void BatchReceiver::updateProgress() {
  if (expected_.empty()) return;
  status_.count = static_cast<int>(received_.size());
  status_.progress = static_cast<double>(resolved_.size()) / static_cast<double>(expected_.size());
}

void BatchReceiver::publish() {
  if (onStatus_) onStatus_(status_);
}

} // namespace receiver
