#include "common/framing.hpp"
#include "src/session/lan_transport.h"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <array>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unistd.h>

using namespace std::chrono_literals;
using boost::asio::ip::tcp;
using common::json;

namespace {

void writeFrame(tcp::socket& sock, const json& j) {
  const std::string payload = j.dump();
  uint8_t header[4];
  common::write_u32_be(static_cast<uint32_t>(payload.size()), header);
  const std::array<boost::asio::const_buffer, 2> bufs{boost::asio::buffer(header, 4), boost::asio::buffer(payload)};
  boost::asio::write(sock, bufs);
}

void runFor(boost::asio::io_context& io, std::chrono::milliseconds d) {
  io.restart();
  io.run_for(d);
}

// A peer that answers pings stays connected; once it goes quiet without closing its socket the
// channel is closed after three heartbeat intervals.
void testSilentPeerIsDisconnected() {
  boost::asio::io_context io;

  session::LanTransport::Config cfg;
  cfg.discoveryPort = static_cast<uint16_t>(46000 + ::getpid() % 1000);
  cfg.beaconAddress = "127.0.0.1";
  cfg.heartbeatInterval = 20ms;
  auto transport = std::make_shared<session::LanTransport>(io, cfg);

  int connected = 0;
  int disconnected = 0;
  session::Transport::ConnectionHandlers handlers;
  handlers.onConnected = [&](const session::PeerDescriptor& p) {
    assert(p.displayName == "Tablet");
    ++connected;
  };
  handlers.onDisconnected = [&](const session::PeerDescriptor& p) {
    assert(p.displayName == "Tablet");
    ++disconnected;
    io.stop();
  };
  transport->setConnectionHandlers(std::move(handlers));
  transport->start();

  const session::PeerDescriptor self{"heartbeat-local-0001", "Desk", session::Role::Responder};
  std::string err;
  assert(transport->startAdvertising(self, &err));

  tcp::socket client(io);
  client.connect(tcp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), transport->listenPort()));
  json invite;
  invite["type"] = "invite";
  invite["id"] = "heartbeat-remote-0001";
  invite["name"] = "Tablet";
  invite["role"] = "initiator";
  invite["port"] = 9;
  writeFrame(client, invite);

  bool answering = true;
  int pings = 0;
  bool sawInviteOk = false;
  std::function<void()> readNext = [&] {
    common::async_read_json(client, common::kMaxFrameSize, [&](const boost::system::error_code& ec, json j) {
      if (ec) return;
      const std::string type = j.value("type", "");
      if (type == "invite_ok") sawInviteOk = true;
      if (type == "ping") {
        ++pings;
        if (answering) writeFrame(client, j);
      }
      readNext();
    });
  };
  readNext();

  runFor(io, 250ms);
  assert(sawInviteOk);
  assert(connected == 1);
  assert(disconnected == 0);
  assert(pings >= 3);

  answering = false;
  const auto quietSince = std::chrono::steady_clock::now();
  runFor(io, 2000ms);
  assert(disconnected == 1);
  // The last answer may predate quietSince by up to one interval.
  assert(std::chrono::steady_clock::now() - quietSince >= 40ms);

  // The transport no longer has a channel to send on.
  assert(!transport->send({1, 2, 3}, &err));

  transport->shutdown();
  boost::system::error_code ignored;
  client.close(ignored);
}

} // namespace

int main() {
  testSilentPeerIsDisconnected();
  return 0;
}
