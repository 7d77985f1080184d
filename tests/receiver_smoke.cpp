#include "src/receiver/batch_receiver.h"
#include "src/receiver/command_dispatcher.h"
#include "src/receiver/input_simulator.h"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using receiver::ReceivePhase;

namespace {

class RecordingSimulator : public receiver::InputSimulator {
public:
  bool hasPermission() const override { return allowed; }
  void perform(const protocol::Command& cmd) override { actions.emplace_back(protocol::commandName(cmd)); }
  void clickSavedPosition() override { actions.emplace_back("click"); }

  bool allowed = true;
  std::vector<std::string> actions;
};

session::Timings fastTimings() {
  session::Timings t;
  t.finalizeTimeout = 20ms;
  t.receivedCleanupDelay = 5ms;
  return t;
}

session::IncomingResource resource(const std::string& name, bool ok = true) {
  session::IncomingResource r;
  r.fromId = "peer-device-aaaaaaaa";
  r.name = name;
  r.path = std::filesystem::path("/tmp/kb-in") / name;
  r.ok = ok;
  if (!ok) r.error = "digest mismatch";
  return r;
}

struct ReceiverRig {
  ReceiverRig() : batches(std::make_shared<receiver::BatchReceiver>(io.get_executor(), fastTimings())) {
    batches->setDeliver([this](const std::vector<std::filesystem::path>& files) { delivered.push_back(files); });
    batches->setCleanup([this](const std::vector<std::filesystem::path>& paths) {
      cleaned.insert(cleaned.end(), paths.begin(), paths.end());
    });
  }

  boost::asio::io_context io;
  std::shared_ptr<receiver::BatchReceiver> batches;
  std::vector<std::vector<std::filesystem::path>> delivered;
  std::vector<std::filesystem::path> cleaned;
};

void testCompleteBatch() {
  ReceiverRig r;
  r.batches->handleAnnounce({{"batch_1_of_2_a.jpg", "batch_2_of_2_b.jpg"}});
  assert(r.batches->status().phase == ReceivePhase::Receiving);
  assert(r.batches->status().expected == 2);

  r.batches->handleItemStarting({"batch_1_of_2_a.jpg", 1, 2});
  assert(r.batches->currentIndex() == 1);
  r.batches->handleResource(resource("batch_1_of_2_a.jpg"));
  assert(r.batches->status().progress > 0.49 && r.batches->status().progress < 0.51);
  r.batches->handleItemStarting({"batch_2_of_2_b.jpg", 2, 2});
  r.batches->handleResource(resource("batch_2_of_2_b.jpg"));
  assert(r.delivered.empty()); // waits for BatchComplete

  r.batches->handleComplete();
  assert(r.batches->status().phase == ReceivePhase::Completed);
  assert(r.batches->status().count == 2);
  assert(r.delivered.size() == 1 && r.delivered[0].size() == 2);

  r.io.run();
  assert(r.cleaned.size() == 2);
}

void testCompleteBeforeLastResource() {
  ReceiverRig r;
  r.batches->handleAnnounce({{"a.jpg", "b.jpg"}});
  r.batches->handleResource(resource("a.jpg"));
  r.batches->handleComplete();
  assert(r.batches->status().phase == ReceivePhase::Receiving);

  // The late resource closes the batch without waiting for the timer.
  r.batches->handleResource(resource("b.jpg"));
  assert(r.batches->status().phase == ReceivePhase::Completed);
  assert(r.delivered.size() == 1 && r.delivered[0].size() == 2);
  r.io.run();
  assert(r.delivered.size() == 1);
}

void testMissingResourceTimesOut() {
  ReceiverRig r;
  r.batches->handleAnnounce({{"a.jpg", "b.jpg", "c.jpg"}});
  r.batches->handleResource(resource("a.jpg"));
  r.batches->handleResource(resource("b.jpg", false));
  r.batches->handleComplete();
  r.io.run();

  assert(r.batches->status().phase == ReceivePhase::Completed);
  assert(r.batches->status().count == 1);
  assert(r.batches->status().message == "2 files missing");
  assert(r.delivered.size() == 1 && r.delivered[0].size() == 1);
  assert(r.cleaned.size() == 1);
}

void testNothingArrives() {
  ReceiverRig r;
  r.batches->handleAnnounce({{"a.jpg"}});
  r.batches->handleResource(resource("a.jpg", false));
  r.batches->handleComplete();
  assert(r.batches->status().phase == ReceivePhase::Failed);
  assert(r.delivered.empty());

  r.batches->handleAnnounce({});
  assert(r.batches->status().phase == ReceivePhase::Failed);
}

void testUnexpectedResources() {
  ReceiverRig r;
  // Outside any batch.
  r.batches->handleResource(resource("stray.jpg"));
  r.batches->handleAnnounce({{"a.jpg"}});
  r.batches->handleResource(resource("other.jpg"));
  r.batches->handleResource(resource("a.jpg"));
  r.batches->handleResource(resource("a.jpg")); // duplicate
  assert(r.batches->status().count == 1);
  r.batches->handleComplete();
  assert(r.delivered.size() == 1 && r.delivered[0].size() == 1);
  r.io.run();
  assert(r.cleaned.size() == 4);
}

void testNewAnnounceAbandonsPrevious() {
  ReceiverRig r;
  r.batches->handleAnnounce({{"a.jpg", "b.jpg"}});
  r.batches->handleResource(resource("a.jpg"));
  r.batches->handleComplete();
  r.batches->handleAnnounce({{"c.jpg"}});
  assert(r.batches->status().expected == 1);
  r.batches->handleResource(resource("c.jpg"));
  r.batches->handleComplete();
  r.io.run();

  // The old finalize timer never fired: only the new batch was delivered.
  assert(r.delivered.size() == 1);
  assert(r.delivered[0].size() == 1 && r.delivered[0][0].filename() == "c.jpg");
  assert(r.cleaned.size() == 2);
}

void testDispatcher() {
  boost::asio::io_context io;
  RecordingSimulator sim;
  auto batches = std::make_shared<receiver::BatchReceiver>(io.get_executor(), fastTimings());
  std::vector<protocol::Command> replies;
  receiver::CommandDispatcher d(sim, batches, [&](const protocol::Command& c) {
    replies.push_back(c);
    return true;
  });
  std::vector<std::string> previews;
  d.setOnPreview([&](const std::string& t) { previews.push_back(t); });
  std::vector<std::string> denied;
  d.setOnPermissionDenied([&](std::string_view c) { denied.emplace_back(c); });

  d.dispatch(protocol::Preview{"hel"});
  d.dispatch(protocol::Preview{"hello"});
  assert(previews.size() == 2 && d.previewText() == "hello");
  assert(sim.actions.empty());

  d.dispatch(protocol::Insert{"hello"});
  d.dispatch(protocol::Submit{});
  assert((sim.actions == std::vector<std::string>{"insert", "submit"}));

  // With pre-position click on, field edits click first; the rest do not.
  sim.actions.clear();
  d.dispatch(protocol::SetPrePositionClick{true});
  assert(d.prePositionClick());
  assert(replies.size() == 1);
  assert(std::get<protocol::PrePositionClickState>(replies[0]).enabled);

  d.dispatch(protocol::InsertAndSubmit{"x"});
  d.dispatch(protocol::DeleteChar{});
  d.dispatch(protocol::Paste{});
  d.dispatch(protocol::Copy{});
  assert((sim.actions ==
          std::vector<std::string>{"click", "insert_and_submit", "delete_char", "click", "paste", "copy"}));

  // The peer's own state is mirrored, not applied.
  d.dispatch(protocol::PrePositionClickState{false});
  assert(d.remoteClickState() == false);
  assert(d.prePositionClick());

  // Permission denied: reported, nothing performed, still counted.
  sim.actions.clear();
  sim.allowed = false;
  const auto before = d.receivedCount();
  d.dispatch(protocol::Cut{});
  assert(sim.actions.empty());
  assert(denied.size() == 1 && denied[0] == "cut");
  assert(d.receivedCount() == before + 1);

  // Batch commands reach the receiver and need no input permission.
  d.dispatch(protocol::BatchAnnounce{{"a.jpg"}});
  assert(batches->status().phase == ReceivePhase::Receiving);
  d.dispatch(protocol::BatchItemStarting{"a.jpg", 1, 1});
  assert(batches->currentIndex() == 1);
  d.dispatch(protocol::BatchComplete{});
  assert(denied.size() == 1);
}

} // namespace

int main() {
  testCompleteBatch();
  testCompleteBeforeLastResource();
  testMissingResourceTimesOut();
  testNothingArrives();
  testUnexpectedResources();
  testNewAnnounceAbandonsPrevious();
  testDispatcher();
  return 0;
}
