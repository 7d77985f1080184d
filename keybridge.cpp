#include "common/identity.hpp"
#include "common/settings_store.hpp"
#include "common/util.hpp"
#include "src/history/message_history.h"
#include "src/protocol/command.h"
#include "src/receiver/batch_receiver.h"
#include "src/receiver/command_dispatcher.h"
#include "src/receiver/input_simulator.h"
#include "src/session/lan_transport.h"
#include "src/session/link_controller.h"
#include "src/transfer/image_codec.h"
#include "src/transfer/temp_resources.h"
#include "src/transfer/transfer_coordinator.h"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <atomic>
#include <charconv>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

namespace {

// Prints what a real keyboard/mouse backend would do on this host.
class ConsoleInputSimulator : public receiver::InputSimulator {
 public:
  explicit ConsoleInputSimulator(bool allowed) : allowed_(allowed) {}

  bool hasPermission() const override { return allowed_; }

  void perform(const protocol::Command& cmd) override {
    std::cout << "[input] " << protocol::commandName(cmd);
    if (const auto* c = std::get_if<protocol::Insert>(&cmd)) std::cout << ": " << c->text;
    if (const auto* c = std::get_if<protocol::InsertAndSubmit>(&cmd)) std::cout << ": " << c->text;
    std::cout << "\n";
    std::cout.flush();
  }

  void clickSavedPosition() override {
    std::cout << "[input] click saved position\n";
    std::cout.flush();
  }

 private:
  bool allowed_;
};

class App : public std::enable_shared_from_this<App> {
 public:
  struct Options {
    std::string display_name;
    session::Role role = session::Role::Responder;
    uint16_t listen_port = 0;
    uint16_t discovery_port = 47811;
    std::string beacon_address = "255.255.255.255";
    std::string config_dir;
    bool accept_all = false;
    bool no_reconnect = false;
    bool deny_input = false;
  };

  App(boost::asio::io_context& io, Options opt)
      : io_(io),
        opt_(std::move(opt)),
        config_root_(opt_.config_dir.empty() ? common::settings_store::resolve_root()
                                             : std::filesystem::path(opt_.config_dir)),
        signals_(io, SIGINT, SIGTERM),
        stdin_(io, ::dup(STDIN_FILENO)),
        history_(common::settings_store::history_path(config_root_)),
        temp_(std::filesystem::temp_directory_path() / ("keybridge-outgoing-" + std::to_string(::getpid()))),
        simulator_(!opt_.deny_input) {}

  void run() {
    log_ring_ = std::make_shared<common::LogRing>(50);
    common::set_log_sink([ring = log_ring_](const std::string& line) { ring->push(line); });

    signals_.async_wait([self = shared_from_this()](const boost::system::error_code&, int) {
      common::log("signal received, shutting down");
      self->shutdown();
    });

    std::string err;
    if (!common::settings_store::load_settings(config_root_, &settings_, &err)) {
      common::log("using default settings (" + err + ")");
      settings_ = common::settings_store::Settings{};
    }
    auto identity = common::DeviceIdentity::load_or_create(common::settings_store::device_id_path(config_root_).string());
    if (!history_.load(&err)) common::log("history not loaded: " + err);

    session::Timings timings;
    session::LanTransport::Config tcfg;
    tcfg.listenPort = opt_.listen_port;
    tcfg.discoveryPort = opt_.discovery_port;
    tcfg.beaconAddress = opt_.beacon_address;
    tcfg.beaconInterval = timings.beaconInterval;
    transport_ = std::make_shared<session::LanTransport>(io_, tcfg);

    session::LinkController::Config lcfg;
    lcfg.local.id = std::string(identity->device_id());
    lcfg.local.displayName = opt_.display_name;
    lcfg.local.role = opt_.role;
    lcfg.filter = (opt_.accept_all || settings_.accept_all_roles) ? session::RoleFilter::AcceptAll
                                                                   : session::RoleFilter::Opposite;
    lcfg.timings = timings;
    lcfg.reconnectEnabled = settings_.reconnect_enabled && !opt_.no_reconnect;
    lcfg.lastPeer = settings_.last_peer;
    lcfg.settingsRoot = config_root_;
    link_ = std::make_unique<session::LinkController>(io_.get_executor(), *transport_, std::move(lcfg));

    coordinator_ = std::make_shared<transfer::TransferCoordinator>(io_.get_executor(), *link_, timings);
    batches_ = std::make_shared<receiver::BatchReceiver>(io_.get_executor(), timings);
    dispatcher_ = std::make_unique<receiver::CommandDispatcher>(
        simulator_, batches_, [this](const protocol::Command& reply) { return link_->sendCommand(reply); });

    wire_events();
    transport_->start();
    if (!link_->start()) {
      common::log("discovery could not start: " + link_->machine().lastError() + " (use /restart)");
    }
    print_help();
    start_stdin_read();
  }

 private:
  void wire_events() {
    link_->setOnCommand([this](const protocol::Command& cmd) { dispatcher_->dispatch(cmd); });
    link_->setOnResource([this](const session::IncomingResource& r) { batches_->handleResource(r); });
    link_->setOnPeerFound([](const session::PeerDescriptor& p) {
      std::cout << "peer available: " << p.displayName << " (" << session::roleToString(p.role) << ")\n";
      std::cout.flush();
    });
    link_->setOnStateChanged([](session::ConnectionState, session::ConnectionState to) {
      std::cout << "state: " << session::stateToString(to) << "\n";
      std::cout.flush();
    });
    link_->setOnGaveUp([](const std::string& target, int attempts) {
      std::cout << "gave up reconnecting to " << target << " after " << attempts << " attempts; use /connect\n";
      std::cout.flush();
    });

    coordinator_->setOnItemFinished([](int index, const std::string& name, transfer::ItemOutcome outcome) {
      std::cout << "sent " << index << ": " << name << " " << transfer::outcomeToString(outcome) << "\n";
      std::cout.flush();
    });
    coordinator_->setOnBatchFinished([](const transfer::BatchResult& r) {
      std::cout << "batch done: " << r.successCount << "/" << r.total << (r.partial() ? " (partial)" : "") << "\n";
      std::cout.flush();
    });

    batches_->setDeliver([](const std::vector<std::filesystem::path>& files) {
      std::cout << "received " << files.size() << " files:\n";
      for (const auto& f : files) std::cout << "  " << f.string() << "\n";
      std::cout.flush();
    });

    dispatcher_->setOnPreview([](const std::string& text) {
      std::cout << "[preview] " << text << "\n";
      std::cout.flush();
    });
    dispatcher_->setOnPermissionDenied([](std::string_view command) {
      std::cout << "input permission denied for " << command << "\n";
      std::cout.flush();
    });
    dispatcher_->setOnRemoteClickState([](bool enabled) {
      std::cout << "peer pre-position click: " << (enabled ? "on" : "off") << "\n";
      std::cout.flush();
    });
  }

  void print_help() {
    std::cout << "keybridge as '" << opt_.display_name << "' (" << session::roleToString(opt_.role) << ")\n"
              << "  <text>            insert text on the peer\n"
              << "  /enter <text>     insert text and submit\n"
              << "  /preview <text>   show a live preview\n"
              << "  /submit /clear /paste /delete /selectall /copy /cut\n"
              << "  /click on|off     click the saved position before editing\n"
              << "  /send <file>...   transfer a batch of images\n"
              << "  /peers /connect <name> /restart /state /progress /history /logs /quit\n";
    std::cout.flush();
  }

  void start_stdin_read() {
    auto self = shared_from_this();
    boost::asio::async_read_until(stdin_, stdin_buf_, '\n',
                                  [self](const boost::system::error_code& ec, std::size_t) {
                                    if (ec) {
                                      if (ec != boost::asio::error::operation_aborted) {
                                        self->shutdown();
                                      }
                                      return;
                                    }
                                    std::istream is(&self->stdin_buf_);
                                    std::string line;
                                    std::getline(is, line);
                                    if (!line.empty() && line.back() == '\r') line.pop_back();
                                    self->handle_stdin_line(line);
                                    self->start_stdin_read();
                                  });
  }

  // Argument-less editing commands.
  static std::optional<protocol::Command> simple_command(const std::string& line) {
    if (line == "/submit") return protocol::Submit{};
    if (line == "/clear") return protocol::ClearField{};
    if (line == "/paste") return protocol::Paste{};
    if (line == "/delete") return protocol::DeleteChar{};
    if (line == "/selectall") return protocol::SelectAll{};
    if (line == "/copy") return protocol::Copy{};
    if (line == "/cut") return protocol::Cut{};
    return std::nullopt;
  }

  static std::string rest_of(const std::string& line, std::string_view cmd) {
    std::string rest = line.substr(cmd.size());
    while (!rest.empty() && rest.front() == ' ') rest.erase(rest.begin());
    return rest;
  }

  void handle_stdin_line(const std::string& line) {
    if (line.empty()) return;
    if (line == "/quit") {
      shutdown();
      return;
    }
    if (line == "/peers") {
      if (link_->peers().empty()) std::cout << "no peers discovered\n";
      for (const auto& p : link_->peers().list()) {
        std::cout << "  " << p.displayName << " [" << p.id << "] " << session::roleToString(p.role) << "\n";
      }
      std::cout.flush();
      return;
    }
    if (line.rfind("/connect ", 0) == 0) {
      link_->connect(rest_of(line, "/connect"));
      return;
    }
    if (line == "/restart") {
      link_->restart();
      return;
    }
    if (line == "/state") {
      print_state();
      return;
    }
    if (line == "/progress") {
      const auto s = coordinator_->snapshot();
      if (!s.active) {
        std::cout << "no transfer in flight\n";
      } else {
        std::cout << "item " << s.currentIndex << "/" << s.total << " " << static_cast<int>(s.progress * 100) << "%\n";
      }
      std::cout.flush();
      return;
    }
    if (line == "/history") {
      for (const auto& e : history_.entries()) std::cout << "  " << e << "\n";
      std::cout.flush();
      return;
    }
    if (line == "/logs") {
      for (const auto& l : log_ring_->snapshot()) std::cout << l << "\n";
      std::cout.flush();
      return;
    }
    if (line.rfind("/send ", 0) == 0) {
      send_files(rest_of(line, "/send"));
      return;
    }
    if (line.rfind("/click ", 0) == 0) {
      const std::string arg = rest_of(line, "/click");
      if (arg != "on" && arg != "off") {
        common::log("usage: /click on|off");
        return;
      }
      link_->sendCommand(protocol::SetPrePositionClick{arg == "on"});
      return;
    }
    if (line.rfind("/preview ", 0) == 0) {
      link_->sendCommand(protocol::Preview{rest_of(line, "/preview")});
      return;
    }
    if (line.rfind("/enter ", 0) == 0) {
      send_text(rest_of(line, "/enter"), true);
      return;
    }
    if (const auto simple = simple_command(line)) {
      link_->sendCommand(*simple);
      return;
    }
    if (line.front() == '/') {
      common::log("unknown command: " + line);
      return;
    }
    send_text(line, false);
  }

  void send_text(std::string text, bool submit) {
    if (text.empty()) return;
    const bool sent = submit ? link_->sendCommand(protocol::InsertAndSubmit{text})
                             : link_->sendCommand(protocol::Insert{text});
    if (!sent) return;
    if (history_.add(std::move(text))) {
      std::string err;
      if (!history_.save(&err)) common::log("history not saved: " + err);
    }
  }

  void send_files(const std::string& args) {
    std::vector<std::filesystem::path> sources;
    std::istringstream is(args);
    std::string token;
    while (is >> token) sources.emplace_back(token);
    if (sources.empty()) {
      common::log("usage: /send <file> [file...]");
      return;
    }
    if (link_->state() != session::ConnectionState::Connected) {
      common::log("not connected");
      return;
    }
    if (coordinator_->busy()) {
      common::log("a transfer is already in progress");
      return;
    }

    std::string err;
    auto items = temp_.prepareBatch(sources, codec_, transfer::kDefaultImageQuality, &err);
    if (!items) {
      common::log("cannot prepare batch: " + err);
      return;
    }
    if (coordinator_->startTransfer(std::move(*items), true)) {
      std::cout << "transfer started\n";
    } else {
      std::cout << "transfer failed to start\n";
    }
    std::cout.flush();
  }

  void print_state() {
    std::cout << "state: " << session::stateToString(link_->state());
    if (const auto& peer = link_->activePeer()) std::cout << " with " << peer->displayName;
    std::cout << "\n";
    const auto& sup = link_->supervisor();
    if (sup.active()) {
      std::cout << "reconnecting to " << sup.target() << " (attempt " << sup.attempts() << ")\n";
    }
    const auto& rs = batches_->status();
    std::cout << "receive: " << receiver::phaseToString(rs.phase) << " " << rs.count << "/" << rs.expected;
    if (!rs.message.empty()) std::cout << " (" << rs.message << ")";
    std::cout << "\n";
    std::cout.flush();
  }

  void shutdown() {
    if (shutting_down_.exchange(true)) return;

    common::log("shutting down");
    if (transport_) transport_->shutdown();

    boost::system::error_code ignored;
    signals_.cancel(ignored);
    stdin_.close(ignored);
    common::set_log_sink(nullptr);
    io_.stop();
  }

  boost::asio::io_context& io_;
  Options opt_;
  std::filesystem::path config_root_;
  boost::asio::signal_set signals_;
  boost::asio::posix::stream_descriptor stdin_;
  boost::asio::streambuf stdin_buf_;

  common::settings_store::Settings settings_;
  std::shared_ptr<common::LogRing> log_ring_;
  history::MessageHistory history_;
  transfer::TempResources temp_;
  transfer::CopyCodec codec_;
  ConsoleInputSimulator simulator_;

  std::shared_ptr<session::LanTransport> transport_;
  std::unique_ptr<session::LinkController> link_;
  std::shared_ptr<transfer::TransferCoordinator> coordinator_;
  std::shared_ptr<receiver::BatchReceiver> batches_;
  std::unique_ptr<receiver::CommandDispatcher> dispatcher_;
  std::atomic<bool> shutting_down_{false};
};

std::optional<uint16_t> parse_port(const std::string& s) {
  int v = 0;
  const auto res = std::from_chars(s.data(), s.data() + s.size(), v);
  if (res.ec != std::errc() || res.ptr != s.data() + s.size() || v <= 0 || v > 65535) return std::nullopt;
  return static_cast<uint16_t>(v);
}

std::string default_display_name() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0] != '\0') {
    std::string name(buf);
    if (name.size() > session::kMaxDisplayName) name.resize(session::kMaxDisplayName);
    return name;
  }
  return "keybridge";
}

std::optional<App::Options> parse_args(int argc, char** argv) {
  App::Options opt;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto get_val = [&](std::string_view flag) -> std::optional<std::string> {
      if (a == flag) {
        if (i + 1 >= argc) return std::nullopt;
        return std::string(argv[++i]);
      }
      return std::nullopt;
    };

    if (auto v = get_val("--name")) {
      opt.display_name = *v;
      continue;
    }
    if (auto v = get_val("--role")) {
      const auto role = session::roleFromString(*v);
      if (!role) return std::nullopt;
      opt.role = *role;
      continue;
    }
    if (auto v = get_val("--listen")) {
      const auto p = parse_port(*v);
      if (!p) return std::nullopt;
      opt.listen_port = *p;
      continue;
    }
    if (auto v = get_val("--discovery-port")) {
      const auto p = parse_port(*v);
      if (!p) return std::nullopt;
      opt.discovery_port = *p;
      continue;
    }
    if (auto v = get_val("--beacon-addr")) {
      boost::system::error_code ec;
      boost::asio::ip::make_address_v4(*v, ec);
      if (ec) return std::nullopt;
      opt.beacon_address = *v;
      continue;
    }
    if (auto v = get_val("--config-dir")) {
      opt.config_dir = *v;
      continue;
    }
    if (a == "--accept-all") {
      opt.accept_all = true;
      continue;
    }
    if (a == "--no-reconnect") {
      opt.no_reconnect = true;
      continue;
    }
    if (a == "--deny-input") {
      opt.deny_input = true;
      continue;
    }
    return std::nullopt;
  }

  if (opt.display_name.empty()) opt.display_name = default_display_name();
  if (!session::isValidDisplayName(opt.display_name)) return std::nullopt;
  return opt;
}

} // namespace

int main(int argc, char** argv) {
  const auto opt = parse_args(argc, argv);
  if (!opt) {
    std::cerr << "Usage: " << argv[0]
              << " [--name <name>] [--role initiator|responder] [--listen <port>] [--discovery-port <port>]"
                 " [--beacon-addr <ipv4>] [--config-dir <dir>] [--accept-all] [--no-reconnect] [--deny-input]\n"
              << "Names are at most 63 printable characters.\n";
    return 2;
  }

  try {
    boost::asio::io_context io;
    auto app = std::make_shared<App>(io, *opt);
    app->run();
    io.run();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return 1;
  }
}
