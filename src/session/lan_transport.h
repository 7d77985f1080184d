#pragma once

#include "common/json.hpp"
#include "src/session/discovery_beacon.h"
#include "src/session/transport.h"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace session {

class PeerChannel;

// Transport over the local network: UDP beacons for presence, one TCP connection for the
// command channel and one short-lived TCP connection per resource. Single-threaded; every
// method and handler runs on the io_context.
class LanTransport : public Transport, public std::enable_shared_from_this<LanTransport> {
public:
  struct Config {
    uint16_t listenPort = 0; // 0 picks a random free port
    uint16_t discoveryPort = 47811;
    uint16_t beaconPort = 0; // destination port of our beacons; 0 means discoveryPort
    std::string beaconAddress = "255.255.255.255";
    std::chrono::milliseconds beaconInterval{1'000};
    // Ping period on the command channel; three silent periods close it.
    std::chrono::milliseconds heartbeatInterval{1'000};
    std::filesystem::path incomingDir;
    std::uint64_t maxResourceBytes = 256ull * 1024 * 1024;
  };

  // Binds the TCP listener; throws std::runtime_error when no port can be bound.
  LanTransport(boost::asio::io_context& io, Config cfg);
  ~LanTransport() override;

  LanTransport(const LanTransport&) = delete;
  LanTransport& operator=(const LanTransport&) = delete;

  // Starts accepting connections. Requires shared ownership.
  void start();
  void shutdown();
  uint16_t listenPort() const { return listenPort_; }

  void setDiscoveryHandlers(DiscoveryHandlers handlers) override { discoveryHandlers_ = std::move(handlers); }
  void setConnectionHandlers(ConnectionHandlers handlers) override { connectionHandlers_ = std::move(handlers); }
  void setDataHandler(OnData onData) override { onData_ = std::move(onData); }
  void setResourceHandler(OnResource onResource) override { onResource_ = std::move(onResource); }

  bool startAdvertising(const PeerDescriptor& self, std::string* error_out) override;
  void stopAdvertising() override;
  bool startBrowsing(std::string* error_out) override;
  void stopBrowsing() override;

  bool invite(const PeerDescriptor& peer, std::chrono::milliseconds timeout, std::string* error_out) override;
  bool send(std::vector<uint8_t> bytes, std::string* error_out) override;
  std::shared_ptr<ResourceProgress> sendResource(const std::filesystem::path& path, const std::string& name) override;
  void closeChannel() override;
  void resetSession() override;

private:
  struct KnownPeer {
    PeerDescriptor peer;
    boost::asio::ip::address address;
    uint16_t port = 0;
    std::chrono::steady_clock::time_point lastSeen;
  };

  struct PendingInvite {
    PeerDescriptor peer;
    boost::asio::ip::tcp::endpoint endpoint;
    std::shared_ptr<boost::asio::ip::tcp::socket> socket;
    std::shared_ptr<boost::asio::steady_timer> timer;
  };

  void bindAcceptor();
  void acceptLoop();
  void handleIncomingSocket(boost::asio::ip::tcp::socket socket);
  void handleInvite(std::shared_ptr<boost::asio::ip::tcp::socket> sock, const common::json& j);
  void handleResource(std::shared_ptr<boost::asio::ip::tcp::socket> sock, const common::json& j);

  void scheduleBeacon(uint64_t epoch);
  void sendBeacon();
  void receiveLoop(uint64_t epoch);
  void handleBeacon(std::span<const uint8_t> bytes, const boost::asio::ip::udp::endpoint& from);
  void schedulePrune(uint64_t epoch);
  void prune();
  void reportSetupFailure(const std::string& error);

  bool isPendingInvite(const std::shared_ptr<boost::asio::ip::tcp::socket>& sock) const;
  void failInvite(const std::string& reason);
  void completeInvite();
  void openChannel(std::shared_ptr<boost::asio::ip::tcp::socket> sock,
                   PeerDescriptor peer,
                   boost::asio::ip::tcp::endpoint resourceEndpoint);
  void trackSocket(const std::shared_ptr<boost::asio::ip::tcp::socket>& sock);

  boost::asio::io_context& io_;
  Config cfg_;
  boost::asio::ip::tcp::acceptor acceptor_;
  uint16_t listenPort_ = 0;

  boost::asio::ip::udp::socket advertiseSocket_;
  boost::asio::ip::udp::socket browseSocket_;
  boost::asio::steady_timer beaconTimer_;
  boost::asio::steady_timer pruneTimer_;
  boost::asio::ip::udp::endpoint beaconTarget_;
  bool advertising_ = false;
  bool browsing_ = false;
  uint64_t advertiseEpoch_ = 0;
  uint64_t browseEpoch_ = 0;

  std::optional<PeerDescriptor> self_;
  std::unordered_map<std::string, KnownPeer> known_;
  std::optional<PendingInvite> pendingInvite_;
  std::shared_ptr<PeerChannel> channel_;
  std::vector<std::weak_ptr<boost::asio::ip::tcp::socket>> resourceSockets_;
  uint64_t generation_ = 0;

  DiscoveryHandlers discoveryHandlers_;
  ConnectionHandlers connectionHandlers_;
  OnData onData_;
  OnResource onResource_;
};

} // namespace session
