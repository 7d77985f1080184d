#include "src/receiver/command_dispatcher.h"

#include "common/util.hpp"

namespace receiver {

namespace {

// Commands that edit the focused field and so start with the saved-position click.
bool clicksFirst(const protocol::Command& cmd) {
  return std::holds_alternative<protocol::Insert>(cmd) || std::holds_alternative<protocol::InsertAndSubmit>(cmd) ||
         std::holds_alternative<protocol::ClearField>(cmd) || std::holds_alternative<protocol::Paste>(cmd) ||
         std::holds_alternative<protocol::SelectAll>(cmd);
}

} // namespace

CommandDispatcher::CommandDispatcher(InputSimulator& simulator, std::shared_ptr<BatchReceiver> batches, Reply reply)
    : simulator_(simulator), batches_(std::move(batches)), reply_(std::move(reply)) {}

void CommandDispatcher::dispatch(const protocol::Command& cmd) {
  ++received_;

  if (const auto* preview = std::get_if<protocol::Preview>(&cmd)) {
    previewText_ = preview->text;
    if (onPreview_) onPreview_(previewText_);
    return;
  }
  if (const auto* set = std::get_if<protocol::SetPrePositionClick>(&cmd)) {
    prePositionClick_ = set->enabled;
    common::log(std::string("pre-position click ") + (prePositionClick_ ? "enabled" : "disabled"));
    if (reply_) reply_(protocol::PrePositionClickState{prePositionClick_});
    return;
  }
  if (const auto* state = std::get_if<protocol::PrePositionClickState>(&cmd)) {
    remoteClickState_ = state->enabled;
    if (onRemoteClickState_) onRemoteClickState_(state->enabled);
    return;
  }
  if (const auto* announce = std::get_if<protocol::BatchAnnounce>(&cmd)) {
    if (batches_) batches_->handleAnnounce(*announce);
    return;
  }
  if (const auto* starting = std::get_if<protocol::BatchItemStarting>(&cmd)) {
    if (batches_) batches_->handleItemStarting(*starting);
    return;
  }
  if (std::holds_alternative<protocol::BatchComplete>(cmd)) {
    if (batches_) batches_->handleComplete();
    return;
  }
  performEditing(cmd);
}

void CommandDispatcher::performEditing(const protocol::Command& cmd) {
  if (!simulator_.hasPermission()) {
    common::log("input permission missing, dropped " + std::string(protocol::commandName(cmd)));
    if (onPermissionDenied_) onPermissionDenied_(protocol::commandName(cmd));
    return;
  }
  if (prePositionClick_ && clicksFirst(cmd)) simulator_.clickSavedPosition();
  simulator_.perform(cmd);
}

} // namespace receiver
