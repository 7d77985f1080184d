#include "src/session/lan_transport.h"

#include "common/digest.hpp"
#include "common/framing.hpp"
#include "common/util.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <stdexcept>

namespace session {

using boost::asio::ip::tcp;
using boost::asio::ip::udp;
using common::json;

namespace {

constexpr std::size_t kChunkBytes = 16 * 1024;

void closeSocket(tcp::socket& sock) {
  boost::system::error_code ignored;
  sock.shutdown(tcp::socket::shutdown_both, ignored);
  sock.close(ignored);
}

// Writes one reply frame and closes the connection afterwards.
void replyAndClose(const std::shared_ptr<tcp::socket>& sock, const json& reply) {
  common::async_write_json(*sock, reply, [sock](const boost::system::error_code&) { closeSocket(*sock); });
}

std::string safeResourceName(const std::string& name) {
  const std::string base = std::filesystem::path(name).filename().string();
  if (base.empty() || base == "." || base == "..") return {};
  return base;
}

bool isHexDigest(const std::string& s) {
  if (s.size() != 64) return false;
  return std::all_of(s.begin(), s.end(), [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

std::optional<PeerDescriptor> peerFromFrame(const json& j) {
  for (const char* key : {"id", "name", "role"}) {
    if (!j.contains(key) || !j[key].is_string()) return std::nullopt;
  }
  PeerDescriptor p;
  p.id = j["id"].get<std::string>();
  p.displayName = j["name"].get<std::string>();
  const auto role = roleFromString(j["role"].get<std::string>());
  if (!role) return std::nullopt;
  p.role = *role;
  if (!common::is_valid_id(p.id, 16, 64) || !isValidDisplayName(p.displayName)) return std::nullopt;
  return p;
}

json selfFrame(std::string_view type, const PeerDescriptor& self, uint16_t port) {
  json j;
  j["type"] = std::string(type);
  j["id"] = self.id;
  j["name"] = self.displayName;
  j["role"] = std::string(roleToString(self.role));
  j["port"] = port;
  return j;
}

// Streams one file to the peer's listener and waits for its verdict.
class ResourceUpload : public std::enable_shared_from_this<ResourceUpload> {
public:
  ResourceUpload(std::shared_ptr<tcp::socket> sock,
                 std::ifstream file,
                 std::uint64_t size,
                 std::shared_ptr<ResourceProgress> progress,
                 std::string name)
      : sock_(std::move(sock)),
        file_(std::move(file)),
        size_(size),
        progress_(std::move(progress)),
        name_(std::move(name)),
        buf_(kChunkBytes) {}

  void start(const tcp::endpoint& ep, json header) {
    auto self = shared_from_this();
    sock_->async_connect(ep, [self, header = std::move(header)](const boost::system::error_code& ec) {
      if (ec) return self->fail("connect: " + ec.message());
      common::async_write_json(*self->sock_, header, [self](const boost::system::error_code& ec2) {
        if (ec2) return self->fail("header: " + ec2.message());
        self->writeNext();
      });
    });
  }

private:
  void writeNext() {
    if (sent_ >= size_) return awaitReply();
    const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(size_ - sent_, buf_.size()));
    file_.read(reinterpret_cast<char*>(buf_.data()), want);
    const auto got = file_.gcount();
    if (got <= 0) return fail("file shrank while sending");

    auto self = shared_from_this();
    boost::asio::async_write(*sock_,
                             boost::asio::buffer(buf_.data(), static_cast<std::size_t>(got)),
                             [self](const boost::system::error_code& ec, std::size_t n) {
                               if (ec) return self->fail("write: " + ec.message());
                               self->sent_ += n;
                               // 1.0 is reserved for the receiver's confirmation.
                               const double f = static_cast<double>(self->sent_) / static_cast<double>(self->size_);
                               self->progress_->report(std::min(0.99, f));
                               self->writeNext();
                             });
  }

  void awaitReply() {
    auto self = shared_from_this();
    common::async_read_json(*sock_, common::kMaxFrameSize, [self](const boost::system::error_code& ec, json j) {
      if (ec) return self->fail("reply: " + ec.message());
      const std::string type = j.contains("type") && j["type"].is_string() ? j["type"].get<std::string>() : "";
      if (type != "resource_ok") {
        std::string msg = "receiver rejected";
        if (j.contains("message") && j["message"].is_string()) msg += ": " + j["message"].get<std::string>();
        return self->fail(msg);
      }
      closeSocket(*self->sock_);
      common::log("resource " + self->name_ + ": delivered (" + std::to_string(self->size_) + " bytes)");
      self->progress_->report(1.0);
    });
  }

  void fail(const std::string& reason) {
    closeSocket(*sock_);
    if (progress_->terminal()) return;
    common::log("resource " + name_ + ": " + reason);
    progress_->cancel();
  }

  std::shared_ptr<tcp::socket> sock_;
  std::ifstream file_;
  std::uint64_t size_;
  std::uint64_t sent_ = 0;
  std::shared_ptr<ResourceProgress> progress_;
  std::string name_;
  std::vector<uint8_t> buf_;
};

// Receives one announced file into the incoming directory and verifies its digest.
class ResourceDownload : public std::enable_shared_from_this<ResourceDownload> {
public:
  using OnDone = std::function<void(const IncomingResource&)>;

  ResourceDownload(std::shared_ptr<tcp::socket> sock, IncomingResource meta, std::uint64_t size, std::string digest)
      : sock_(std::move(sock)), meta_(std::move(meta)), remaining_(size), expected_(std::move(digest)), buf_(kChunkBytes) {}

  bool open(std::string* error_out) {
    std::error_code ec;
    std::filesystem::create_directories(meta_.path.parent_path(), ec);
    out_.open(meta_.path, std::ios::binary | std::ios::trunc);
    if (!out_) {
      if (error_out) *error_out = "cannot write " + meta_.path.string();
      return false;
    }
    return true;
  }

  void start(OnDone onDone) {
    onDone_ = std::move(onDone);
    readNext();
  }

private:
  void readNext() {
    if (remaining_ == 0) return finish();
    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining_, buf_.size()));
    auto self = shared_from_this();
    boost::asio::async_read(*sock_,
                            boost::asio::buffer(buf_.data(), want),
                            [self](const boost::system::error_code& ec, std::size_t got) {
                              if (ec) return self->fail("read: " + ec.message(), false);
                              self->out_.write(reinterpret_cast<const char*>(self->buf_.data()),
                                               static_cast<std::streamsize>(got));
                              if (!self->out_) return self->fail("disk write failed", true);
                              self->hash_.update(std::span<const uint8_t>(self->buf_.data(), got));
                              self->remaining_ -= got;
                              self->readNext();
                            });
  }

  void finish() {
    out_.close();
    const auto digest = common::to_hex(hash_.finish());
    if (digest != expected_) return fail("digest mismatch", true);
    meta_.ok = true;
    json ok;
    ok["type"] = "resource_ok";
    replyAndClose(sock_, ok);
    done();
  }

  void fail(const std::string& reason, bool reply) {
    out_.close();
    std::error_code ec;
    std::filesystem::remove(meta_.path, ec);
    meta_.ok = false;
    meta_.error = reason;
    common::log("incoming resource " + meta_.name + ": " + reason);
    if (reply) {
      json e;
      e["type"] = "resource_error";
      e["message"] = reason;
      replyAndClose(sock_, e);
    } else {
      closeSocket(*sock_);
    }
    done();
  }

  void done() {
    auto cb = std::move(onDone_);
    onDone_ = nullptr;
    if (cb) cb(meta_);
  }

  std::shared_ptr<tcp::socket> sock_;
  IncomingResource meta_;
  std::uint64_t remaining_;
  std::string expected_;
  std::ofstream out_;
  common::Sha256 hash_;
  std::vector<uint8_t> buf_;
  OnDone onDone_;
};

} // namespace

// The command channel: framed JSON over the connection established by an invitation.
class PeerChannel : public std::enable_shared_from_this<PeerChannel> {
public:
  using OnData = std::function<void(std::vector<uint8_t>)>;
  using OnClosed = std::function<void()>;

  PeerChannel(std::shared_ptr<tcp::socket> socket,
              PeerDescriptor peer,
              tcp::endpoint resourceEndpoint,
              std::chrono::milliseconds heartbeat)
      : socket_(std::move(socket)),
        peer_(std::move(peer)),
        resourceEndpoint_(std::move(resourceEndpoint)),
        heartbeat_(heartbeat),
        heartbeatTimer_(socket_->get_executor()) {}

  void start(OnData onData, OnClosed onClosed) {
    onData_ = std::move(onData);
    onClosed_ = std::move(onClosed);
    std::weak_ptr<PeerChannel> weak = weak_from_this();
    writer_ = std::make_shared<common::JsonWriteQueue<tcp::socket>>(*socket_, [weak](const boost::system::error_code& ec) {
      if (auto self = weak.lock()) self->onIoError("peer write", ec);
    });
    lastHeard_ = std::chrono::steady_clock::now();
    readLoop();
    scheduleHeartbeat();
  }

  void sendFrame(json msg) {
    if (closed_) return;
    writer_->send(std::move(msg));
  }

  // notify=false closes without reporting a disconnect.
  void close(bool notify = true) {
    if (closed_) return;
    closed_ = true;
    heartbeatTimer_.cancel();
    closeSocket(*socket_);
    auto cb = std::move(onClosed_);
    onClosed_ = nullptr;
    if (notify && cb) cb();
  }

  bool closed() const { return closed_; }
  const PeerDescriptor& peer() const { return peer_; }
  const tcp::endpoint& resourceEndpoint() const { return resourceEndpoint_; }

private:
  void readLoop() {
    auto self = shared_from_this();
    common::async_read_json(*socket_, common::kMaxFrameSize, [self](const boost::system::error_code& ec, json j) {
      if (ec) return self->onIoError("peer read", ec);
      self->lastHeard_ = std::chrono::steady_clock::now();
      self->handleFrame(j);
      if (!self->closed_) self->readLoop();
    });
  }

  // Both ends ping every interval; a peer silent for three intervals is gone even if the
  // socket never reports an error.
  void scheduleHeartbeat() {
    heartbeatTimer_.expires_after(heartbeat_);
    std::weak_ptr<PeerChannel> weak = weak_from_this();
    heartbeatTimer_.async_wait([weak](const boost::system::error_code& ec) {
      auto self = weak.lock();
      if (ec || !self || self->closed_) return;
      const auto silent = std::chrono::steady_clock::now() - self->lastHeard_;
      if (silent > 3 * self->heartbeat_) {
        common::log("peer " + self->peer_.displayName + " silent for " +
                    std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(silent).count()) +
                    " ms, closing");
        self->close();
        return;
      }
      json ping;
      ping["type"] = "ping";
      self->sendFrame(std::move(ping));
      self->scheduleHeartbeat();
    });
  }

  void handleFrame(const json& j) {
    if (!j.contains("type") || !j["type"].is_string()) return;
    const std::string type = j["type"].get<std::string>();
    if (type != "data") return;
    if (!j.contains("b64") || !j["b64"].is_string()) {
      common::log("peer sent a data frame without payload");
      return;
    }
    auto bytes = common::base64url_decode(j["b64"].get<std::string>());
    if (!bytes) {
      common::log("peer sent a data frame with bad encoding");
      return;
    }
    if (onData_) onData_(std::move(*bytes));
  }

  void onIoError(std::string_view where, const boost::system::error_code& ec) {
    if (closed_ || ec == boost::asio::error::operation_aborted) return;
    if (ec == boost::asio::error::eof) {
      common::log(std::string(where) + ": disconnected");
    } else {
      common::log(std::string(where) + ": " + ec.message());
    }
    close();
  }

  std::shared_ptr<tcp::socket> socket_;
  PeerDescriptor peer_;
  tcp::endpoint resourceEndpoint_;
  std::chrono::milliseconds heartbeat_;
  boost::asio::steady_timer heartbeatTimer_;
  std::chrono::steady_clock::time_point lastHeard_;
  std::shared_ptr<common::JsonWriteQueue<tcp::socket>> writer_;
  bool closed_ = false;
  OnData onData_;
  OnClosed onClosed_;
};

LanTransport::LanTransport(boost::asio::io_context& io, Config cfg)
    : io_(io),
      cfg_(std::move(cfg)),
      acceptor_(io),
      advertiseSocket_(io),
      browseSocket_(io),
      beaconTimer_(io),
      pruneTimer_(io) {
  if (cfg_.beaconPort == 0) cfg_.beaconPort = cfg_.discoveryPort;
  if (cfg_.incomingDir.empty()) cfg_.incomingDir = std::filesystem::temp_directory_path() / "keybridge-incoming";
  bindAcceptor();
}

LanTransport::~LanTransport() {
  boost::system::error_code ignored;
  acceptor_.close(ignored);
}

void LanTransport::start() {
  acceptLoop();
}

void LanTransport::shutdown() {
  resetSession();
  boost::system::error_code ignored;
  acceptor_.close(ignored);
}

void LanTransport::bindAcceptor() {
  uint16_t port = cfg_.listenPort ? cfg_.listenPort : common::choose_default_listen_port();
  for (int attempt = 0; attempt < 20; ++attempt) {
    boost::system::error_code ec;
    tcp::endpoint ep(boost::asio::ip::address_v4::any(), port);
    acceptor_.open(ep.protocol(), ec);
    if (ec) {
      port = common::choose_default_listen_port();
      continue;
    }
    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    acceptor_.bind(ep, ec);
    if (ec) {
      acceptor_.close();
      port = common::choose_default_listen_port();
      continue;
    }
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      acceptor_.close();
      port = common::choose_default_listen_port();
      continue;
    }
    listenPort_ = port;
    common::log("listening for peers on 0.0.0.0:" + std::to_string(listenPort_));
    return;
  }
  throw std::runtime_error("failed to bind acceptor");
}

void LanTransport::acceptLoop() {
  acceptor_.async_accept([self = shared_from_this()](const boost::system::error_code& ec, tcp::socket socket) {
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) common::log(std::string("accept error: ") + ec.message());
      return;
    }
    self->handleIncomingSocket(std::move(socket));
    self->acceptLoop();
  });
}

void LanTransport::handleIncomingSocket(tcp::socket socket) {
  auto sock = std::make_shared<tcp::socket>(std::move(socket));
  trackSocket(sock);
  auto self = shared_from_this();
  const uint64_t gen = generation_;
  common::async_read_json(*sock, common::kMaxFrameSize, [self, sock, gen](const boost::system::error_code& ec, json j) {
    if (ec || gen != self->generation_) {
      closeSocket(*sock);
      return;
    }
    const std::string type = j.contains("type") && j["type"].is_string() ? j["type"].get<std::string>() : "";
    if (type == "invite") return self->handleInvite(sock, j);
    if (type == "resource") return self->handleResource(sock, j);
    common::log("unexpected first frame '" + type + "' on incoming connection");
    closeSocket(*sock);
  });
}

void LanTransport::handleInvite(std::shared_ptr<tcp::socket> sock, const json& j) {
  const auto peer = peerFromFrame(j);
  if (!peer || !j.contains("port") || !j["port"].is_number_unsigned()) {
    common::log("malformed invite");
    closeSocket(*sock);
    return;
  }
  const auto port = j["port"].get<uint64_t>();
  boost::system::error_code ec;
  const auto remote = sock->remote_endpoint(ec);
  if (ec || port == 0 || port > 65535) {
    closeSocket(*sock);
    return;
  }

  bool accept = advertising_ && self_ && !channel_ && !pendingInvite_;
  if (accept && discoveryHandlers_.onInvitation) accept = discoveryHandlers_.onInvitation(*peer);
  if (!accept) {
    json reject;
    reject["type"] = "invite_reject";
    replyAndClose(sock, reject);
    return;
  }

  openChannel(sock, *peer, tcp::endpoint(remote.address(), static_cast<uint16_t>(port)));
  channel_->sendFrame(selfFrame("invite_ok", *self_, listenPort_));
  if (connectionHandlers_.onConnected) connectionHandlers_.onConnected(*peer);
}

void LanTransport::handleResource(std::shared_ptr<tcp::socket> sock, const json& j) {
  auto reject = [sock](const std::string& why) {
    common::log("rejecting incoming resource: " + why);
    json e;
    e["type"] = "resource_error";
    e["message"] = why;
    replyAndClose(sock, e);
  };

  if (!j.contains("from") || !j["from"].is_string() || !j.contains("name") || !j["name"].is_string() ||
      !j.contains("size") || !j["size"].is_number_unsigned() || !j.contains("sha256") || !j["sha256"].is_string()) {
    return reject("malformed header");
  }
  const std::string from = j["from"].get<std::string>();
  if (!channel_ || channel_->peer().id != from) return reject("sender is not the connected peer");
  const std::string name = safeResourceName(j["name"].get<std::string>());
  if (name.empty()) return reject("bad name");
  const auto size = j["size"].get<uint64_t>();
  if (size > cfg_.maxResourceBytes) return reject("too large");
  const std::string digest = j["sha256"].get<std::string>();
  if (!isHexDigest(digest)) return reject("bad digest");

  IncomingResource meta;
  meta.fromId = from;
  meta.name = name;
  meta.path = cfg_.incomingDir / name;
  auto download = std::make_shared<ResourceDownload>(sock, std::move(meta), size, digest);
  std::string err;
  if (!download->open(&err)) return reject(err);

  common::log("receiving resource " + name + " (" + std::to_string(size) + " bytes)");
  std::weak_ptr<LanTransport> weak = weak_from_this();
  const uint64_t gen = generation_;
  download->start([weak, gen](const IncomingResource& r) {
    auto self = weak.lock();
    if (!self || gen != self->generation_) return;
    if (self->onResource_) self->onResource_(r);
  });
}

bool LanTransport::startAdvertising(const PeerDescriptor& self, std::string* error_out) {
  self_ = self;
  if (advertising_) return true;

  boost::system::error_code ec;
  const auto addr = boost::asio::ip::make_address_v4(cfg_.beaconAddress, ec);
  if (ec) {
    if (error_out) *error_out = "invalid beacon address " + cfg_.beaconAddress;
    return false;
  }
  beaconTarget_ = udp::endpoint(addr, cfg_.beaconPort);

  advertiseSocket_.open(udp::v4(), ec);
  if (!ec) advertiseSocket_.set_option(boost::asio::socket_base::broadcast(true), ec);
  if (ec) {
    boost::system::error_code ignored;
    advertiseSocket_.close(ignored);
    if (error_out) *error_out = "beacon socket: " + ec.message();
    return false;
  }

  advertising_ = true;
  const uint64_t epoch = ++advertiseEpoch_;
  sendBeacon();
  scheduleBeacon(epoch);
  return true;
}

void LanTransport::stopAdvertising() {
  advertising_ = false;
  ++advertiseEpoch_;
  beaconTimer_.cancel();
  boost::system::error_code ignored;
  advertiseSocket_.close(ignored);
}

bool LanTransport::startBrowsing(std::string* error_out) {
  if (browsing_) return true;

  boost::system::error_code ec;
  browseSocket_.open(udp::v4(), ec);
  if (!ec) browseSocket_.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (!ec) browseSocket_.bind(udp::endpoint(boost::asio::ip::address_v4::any(), cfg_.discoveryPort), ec);
  if (ec) {
    boost::system::error_code ignored;
    browseSocket_.close(ignored);
    if (error_out) *error_out = "discovery port " + std::to_string(cfg_.discoveryPort) + ": " + ec.message();
    return false;
  }

  browsing_ = true;
  const uint64_t epoch = ++browseEpoch_;
  receiveLoop(epoch);
  schedulePrune(epoch);
  return true;
}

void LanTransport::stopBrowsing() {
  browsing_ = false;
  ++browseEpoch_;
  pruneTimer_.cancel();
  boost::system::error_code ignored;
  browseSocket_.close(ignored);
}

void LanTransport::scheduleBeacon(uint64_t epoch) {
  beaconTimer_.expires_after(cfg_.beaconInterval);
  beaconTimer_.async_wait([self = shared_from_this(), epoch](const boost::system::error_code& ec) {
    if (ec || epoch != self->advertiseEpoch_) return;
    self->sendBeacon();
    self->scheduleBeacon(epoch);
  });
}

void LanTransport::sendBeacon() {
  if (!advertising_ || !self_) return;
  Beacon b;
  b.peer = *self_;
  b.port = listenPort_;
  auto payload = std::make_shared<std::string>(encodeBeacon(b));
  advertiseSocket_.async_send_to(boost::asio::buffer(*payload),
                                 beaconTarget_,
                                 [payload](const boost::system::error_code& ec, std::size_t) {
                                   if (ec && ec != boost::asio::error::operation_aborted) {
                                     common::log("beacon send failed: " + ec.message());
                                   }
                                 });
}

void LanTransport::receiveLoop(uint64_t epoch) {
  auto buf = std::make_shared<std::array<uint8_t, kMaxBeaconBytes>>();
  auto from = std::make_shared<udp::endpoint>();
  browseSocket_.async_receive_from(
      boost::asio::buffer(*buf),
      *from,
      [self = shared_from_this(), epoch, buf, from](const boost::system::error_code& ec, std::size_t n) {
        if (epoch != self->browseEpoch_) return;
        if (ec == boost::asio::error::message_size) return self->receiveLoop(epoch);
        if (ec) {
          if (ec != boost::asio::error::operation_aborted) self->reportSetupFailure("discovery socket: " + ec.message());
          return;
        }
        self->handleBeacon(std::span<const uint8_t>(buf->data(), n), *from);
        self->receiveLoop(epoch);
      });
}

void LanTransport::handleBeacon(std::span<const uint8_t> bytes, const udp::endpoint& from) {
  auto beacon = decodeBeacon(bytes);
  if (!beacon || beacon->service != kServiceName) return;
  if (self_ && beacon->peer.id == self_->id) return;

  const auto now = std::chrono::steady_clock::now();
  auto it = known_.find(beacon->peer.id);
  if (it != known_.end()) {
    it->second.address = from.address();
    it->second.port = beacon->port;
    it->second.lastSeen = now;
    return;
  }
  known_.emplace(beacon->peer.id, KnownPeer{beacon->peer, from.address(), beacon->port, now});
  if (discoveryHandlers_.onPeerFound) discoveryHandlers_.onPeerFound(beacon->peer);
}

void LanTransport::schedulePrune(uint64_t epoch) {
  pruneTimer_.expires_after(cfg_.beaconInterval);
  pruneTimer_.async_wait([self = shared_from_this(), epoch](const boost::system::error_code& ec) {
    if (ec || epoch != self->browseEpoch_) return;
    self->prune();
    self->schedulePrune(epoch);
  });
}

void LanTransport::prune() {
  const auto now = std::chrono::steady_clock::now();
  const auto cutoff = 3 * cfg_.beaconInterval;
  std::vector<std::string> lost;
  for (auto it = known_.begin(); it != known_.end();) {
    if (now - it->second.lastSeen > cutoff) {
      lost.push_back(it->first);
      it = known_.erase(it);
    } else {
      ++it;
    }
  }
  for (const auto& id : lost) {
    if (discoveryHandlers_.onPeerLost) discoveryHandlers_.onPeerLost(id);
  }
}

void LanTransport::reportSetupFailure(const std::string& error) {
  common::log("discovery failure: " + error);
  stopAdvertising();
  stopBrowsing();
  if (discoveryHandlers_.onSetupFailed) discoveryHandlers_.onSetupFailed(error);
}

bool LanTransport::invite(const PeerDescriptor& peer, std::chrono::milliseconds timeout, std::string* error_out) {
  if (!self_) {
    if (error_out) *error_out = "not advertising";
    return false;
  }
  if (channel_ || pendingInvite_) {
    if (error_out) *error_out = "another connection is active";
    return false;
  }
  auto it = known_.find(peer.id);
  if (it == known_.end()) {
    if (error_out) *error_out = "peer address unknown";
    return false;
  }

  PendingInvite pending;
  pending.peer = peer;
  pending.endpoint = tcp::endpoint(it->second.address, it->second.port);
  pending.socket = std::make_shared<tcp::socket>(io_);
  pending.timer = std::make_shared<boost::asio::steady_timer>(io_);
  pendingInvite_ = pending;

  auto self = shared_from_this();
  auto sock = pending.socket;
  const uint64_t gen = generation_;

  pending.timer->expires_after(timeout);
  pending.timer->async_wait([self, sock, gen](const boost::system::error_code& ec) {
    if (ec || gen != self->generation_ || !self->isPendingInvite(sock)) return;
    self->failInvite("timed out");
  });

  common::log("inviting " + peer.displayName + " at " + common::endpoint_to_string(pending.endpoint));
  sock->async_connect(pending.endpoint, [self, sock, gen](const boost::system::error_code& ec) {
    if (gen != self->generation_ || !self->isPendingInvite(sock)) return;
    if (ec) return self->failInvite("connect: " + ec.message());
    const json inv = selfFrame("invite", *self->self_, self->listenPort_);
    common::async_write_json(*sock, inv, [self, sock, gen](const boost::system::error_code& ec2) {
      if (gen != self->generation_ || !self->isPendingInvite(sock)) return;
      if (ec2) return self->failInvite("write: " + ec2.message());
      common::async_read_json(*sock, common::kMaxFrameSize, [self, sock, gen](const boost::system::error_code& ec3, json j) {
        if (gen != self->generation_ || !self->isPendingInvite(sock)) return;
        if (ec3) return self->failInvite("read: " + ec3.message());
        const bool ok = j.contains("type") && j["type"].is_string() && j["type"].get<std::string>() == "invite_ok";
        if (!ok) return self->failInvite("rejected");
        self->completeInvite();
      });
    });
  });
  return true;
}

bool LanTransport::isPendingInvite(const std::shared_ptr<tcp::socket>& sock) const {
  return pendingInvite_ && pendingInvite_->socket == sock;
}

void LanTransport::failInvite(const std::string& reason) {
  if (!pendingInvite_) return;
  PendingInvite p = std::move(*pendingInvite_);
  pendingInvite_.reset();
  p.timer->cancel();
  closeSocket(*p.socket);
  common::log("invite to " + p.peer.displayName + " failed: " + reason);
  if (connectionHandlers_.onDisconnected) connectionHandlers_.onDisconnected(p.peer);
}

void LanTransport::completeInvite() {
  PendingInvite p = std::move(*pendingInvite_);
  pendingInvite_.reset();
  p.timer->cancel();
  openChannel(p.socket, p.peer, p.endpoint);
  if (connectionHandlers_.onConnected) connectionHandlers_.onConnected(p.peer);
}

void LanTransport::openChannel(std::shared_ptr<tcp::socket> sock, PeerDescriptor peer, tcp::endpoint resourceEndpoint) {
  auto ch = std::make_shared<PeerChannel>(std::move(sock), std::move(peer), std::move(resourceEndpoint),
                                          cfg_.heartbeatInterval);
  channel_ = ch;

  std::weak_ptr<LanTransport> weak = weak_from_this();
  std::weak_ptr<PeerChannel> weakCh = ch;
  const uint64_t gen = generation_;
  ch->start(
      [weak, gen](std::vector<uint8_t> bytes) {
        auto self = weak.lock();
        if (!self || gen != self->generation_) return;
        if (self->onData_) self->onData_(std::move(bytes));
      },
      [weak, weakCh, gen]() {
        auto self = weak.lock();
        auto closed = weakCh.lock();
        if (!self || !closed || gen != self->generation_ || self->channel_ != closed) return;
        self->channel_.reset();
        if (self->connectionHandlers_.onDisconnected) self->connectionHandlers_.onDisconnected(closed->peer());
      });
}

bool LanTransport::send(std::vector<uint8_t> bytes, std::string* error_out) {
  if (!channel_ || channel_->closed()) {
    if (error_out) *error_out = "not connected";
    return false;
  }
  json j;
  j["type"] = "data";
  j["b64"] = common::base64url_encode(bytes);
  if (j["b64"].get_ref<const std::string&>().size() + 32 > common::kMaxFrameSize) {
    if (error_out) *error_out = "payload too large";
    return false;
  }
  channel_->sendFrame(std::move(j));
  return true;
}

std::shared_ptr<ResourceProgress> LanTransport::sendResource(const std::filesystem::path& path, const std::string& name) {
  if (!channel_ || channel_->closed() || !self_) return nullptr;

  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    common::log("resource " + name + ": " + ec.message());
    return nullptr;
  }
  const auto digest = common::sha256_file_hex(path);
  std::ifstream file(path, std::ios::binary);
  if (!digest || !file) {
    common::log("resource " + name + ": cannot read " + path.string());
    return nullptr;
  }

  json header;
  header["type"] = "resource";
  header["from"] = self_->id;
  header["name"] = name;
  header["size"] = static_cast<uint64_t>(size);
  header["sha256"] = *digest;

  auto progress = std::make_shared<ResourceProgress>();
  auto sock = std::make_shared<tcp::socket>(io_);
  trackSocket(sock);
  std::weak_ptr<tcp::socket> weakSock = sock;
  progress->setAbortHook([weakSock] {
    if (auto s = weakSock.lock()) closeSocket(*s);
  });

  auto upload = std::make_shared<ResourceUpload>(sock, std::move(file), static_cast<std::uint64_t>(size), progress, name);
  upload->start(channel_->resourceEndpoint(), std::move(header));
  common::log("sending resource " + name + " (" + std::to_string(size) + " bytes)");
  return progress;
}

void LanTransport::closeChannel() {
  if (!channel_) return;
  common::log("closing channel to " + channel_->peer().displayName);
  channel_->close();
}

void LanTransport::resetSession() {
  ++generation_;
  stopAdvertising();
  stopBrowsing();
  known_.clear();
  if (pendingInvite_) {
    pendingInvite_->timer->cancel();
    closeSocket(*pendingInvite_->socket);
    pendingInvite_.reset();
  }
  if (channel_) {
    channel_->close(false);
    channel_.reset();
  }
  for (const auto& weak : resourceSockets_) {
    if (auto s = weak.lock()) closeSocket(*s);
  }
  resourceSockets_.clear();
}

void LanTransport::trackSocket(const std::shared_ptr<tcp::socket>& sock) {
  resourceSockets_.erase(std::remove_if(resourceSockets_.begin(),
                                        resourceSockets_.end(),
                                        [](const std::weak_ptr<tcp::socket>& w) { return w.expired(); }),
                         resourceSockets_.end());
  resourceSockets_.push_back(sock);
}

} // namespace session
