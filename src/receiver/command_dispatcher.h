#pragma once

#include "src/protocol/command.h"
#include "src/receiver/batch_receiver.h"
#include "src/receiver/input_simulator.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace receiver {

// Routes decoded commands from the peer to the host-side collaborators.
class CommandDispatcher {
public:
  using Reply = std::function<bool(const protocol::Command&)>;
  using OnPreview = std::function<void(const std::string& text)>;
  using OnPermissionDenied = std::function<void(std::string_view command)>;
  using OnRemoteClickState = std::function<void(bool enabled)>;

  CommandDispatcher(InputSimulator& simulator, std::shared_ptr<BatchReceiver> batches, Reply reply);

  void setOnPreview(OnPreview cb) { onPreview_ = std::move(cb); }
  void setOnPermissionDenied(OnPermissionDenied cb) { onPermissionDenied_ = std::move(cb); }
  void setOnRemoteClickState(OnRemoteClickState cb) { onRemoteClickState_ = std::move(cb); }

  void dispatch(const protocol::Command& cmd);

  bool prePositionClick() const { return prePositionClick_; }
  // Last setting the peer reported for its own pre-position click.
  std::optional<bool> remoteClickState() const { return remoteClickState_; }
  const std::string& previewText() const { return previewText_; }
  uint64_t receivedCount() const { return received_; }

private:
  void performEditing(const protocol::Command& cmd);

  InputSimulator& simulator_;
  std::shared_ptr<BatchReceiver> batches_;
  Reply reply_;

  bool prePositionClick_ = false;
  std::optional<bool> remoteClickState_;
  std::string previewText_;
  uint64_t received_ = 0;

  OnPreview onPreview_;
  OnPermissionDenied onPermissionDenied_;
  OnRemoteClickState onRemoteClickState_;
};

} // namespace receiver
