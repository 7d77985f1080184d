#include "common/digest.hpp"
#include "common/identity.hpp"
#include "src/session/lan_transport.h"
#include "src/session/link_controller.h"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <unistd.h>

namespace {

std::filesystem::path mkTempDir(const std::string& name) {
  const auto base = std::filesystem::temp_directory_path() / name;
  std::filesystem::create_directories(base);
  return base;
}

std::optional<uint16_t> parsePort(const std::string& s) {
  int v = 0;
  const auto res = std::from_chars(s.data(), s.data() + s.size(), v);
  if (res.ec != std::errc() || v <= 0 || v > 65535) return std::nullopt;
  return static_cast<uint16_t>(v);
}

} // namespace

// Two devices on loopback: discover each other, connect, exchange a command and one resource.
int main(int argc, char** argv) {
  uint16_t basePort = 47900;
  int timeoutMs = 15000;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto needVal = [&](const char* flag) -> std::optional<std::string> {
      if (a != flag) return std::nullopt;
      if (i + 1 >= argc) return std::nullopt;
      return std::string(argv[++i]);
    };
    if (auto v = needVal("--base-port")) {
      const auto p = parsePort(*v);
      if (!p || *p > 65000) {
        std::cerr << "invalid --base-port\n";
        return 2;
      }
      basePort = *p;
      continue;
    }
    if (auto v = needVal("--timeout-ms")) {
      int ms = 0;
      const auto res = std::from_chars(v->data(), v->data() + v->size(), ms);
      timeoutMs = (res.ec != std::errc() || ms < 1000) ? 15000 : ms;
      continue;
    }
    if (a == "--help") {
      std::cout << "Usage: lan_smoke [--base-port N] [--timeout-ms N]\n";
      return 0;
    }
  }

  const auto dirA = mkTempDir("keybridge-smoke-A-" + std::to_string(::getpid()));
  const auto dirB = mkTempDir("keybridge-smoke-B-" + std::to_string(::getpid()));
  const auto payload = dirA / "photo.jpg";
  {
    std::ofstream out(payload, std::ios::binary | std::ios::trunc);
    for (int i = 0; i < 100000; ++i) out.put(static_cast<char>(i * 31));
  }

  boost::asio::io_context io;

  // Each side listens for beacons on its own port and sends to the other's.
  session::LanTransport::Config ca;
  ca.discoveryPort = basePort;
  ca.beaconPort = static_cast<uint16_t>(basePort + 1);
  ca.beaconAddress = "127.0.0.1";
  ca.beaconInterval = std::chrono::milliseconds(200);
  ca.incomingDir = dirA / "incoming";
  session::LanTransport::Config cb = ca;
  cb.discoveryPort = ca.beaconPort;
  cb.beaconPort = ca.discoveryPort;
  cb.incomingDir = dirB / "incoming";

  auto ta = std::make_shared<session::LanTransport>(io, ca);
  auto tb = std::make_shared<session::LanTransport>(io, cb);

  session::LinkController::Config la;
  la.local = {std::string(common::DeviceIdentity::ephemeral()->device_id()), "smokeA", session::Role::Initiator};
  la.reconnectEnabled = false;
  session::LinkController::Config lb;
  lb.local = {std::string(common::DeviceIdentity::ephemeral()->device_id()), "smokeB", session::Role::Responder};
  lb.reconnectEnabled = false;

  session::LinkController a(io.get_executor(), *ta, la);
  session::LinkController b(io.get_executor(), *tb, lb);

  int rc = 1;
  bool gotCommand = false;
  bool gotResource = false;
  std::shared_ptr<session::ResourceProgress> upload;
  boost::asio::steady_timer deadline(io);

  auto finish = [&](int code) {
    rc = code;
    deadline.cancel();
    ta->shutdown();
    tb->shutdown();
    io.stop();
  };
  auto maybeDone = [&] {
    if (gotCommand && gotResource) {
      std::cout << "OK: command and resource delivered over loopback\n";
      finish(0);
    }
  };

  a.setOnPeerFound([&](const session::PeerDescriptor& p) {
    if (p.displayName == "smokeB") a.connect(p.id);
  });
  a.setOnStateChanged([&](session::ConnectionState, session::ConnectionState to) {
    if (to != session::ConnectionState::Connected) return;
    if (!a.sendCommand(protocol::Insert{"hello over lan"})) {
      std::cerr << "command send failed\n";
      finish(1);
      return;
    }
    upload = a.sendResource(payload, "batch_1_of_1_photo.jpg");
    if (!upload) {
      std::cerr << "resource send failed to start\n";
      finish(1);
    }
  });

  b.setOnCommand([&](const protocol::Command& cmd) {
    const auto* insert = std::get_if<protocol::Insert>(&cmd);
    if (!insert || insert->text != "hello over lan") return;
    gotCommand = true;
    maybeDone();
  });
  b.setOnResource([&](const session::IncomingResource& r) {
    if (!r.ok) {
      std::cerr << "resource error: " << r.error << "\n";
      finish(1);
      return;
    }
    if (common::sha256_file_hex(r.path) != common::sha256_file_hex(payload)) {
      std::cerr << "resource content mismatch\n";
      finish(1);
      return;
    }
    gotResource = true;
    maybeDone();
  });

  deadline.expires_after(std::chrono::milliseconds(timeoutMs));
  deadline.async_wait([&](const boost::system::error_code& ec) {
    if (ec) return;
    std::cerr << "timeout (A " << session::stateToString(a.state()) << ", B " << session::stateToString(b.state())
              << ")\n";
    finish(1);
  });

  ta->start();
  tb->start();
  if (!a.start() || !b.start()) {
    std::cerr << "discovery failed to start\n";
    return 1;
  }

  io.run();
  std::filesystem::remove_all(dirA);
  std::filesystem::remove_all(dirB);
  return rc;
}
