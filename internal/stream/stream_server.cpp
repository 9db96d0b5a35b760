#include "stream_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/stream/protocol.hpp"
#include "internal/util/errors.hpp"

namespace ledcast::stream {

using observability::IntField;
using observability::StringField;

namespace {

constexpr int kListenBacklog = 64;
constexpr int kAcceptPollMs  = 200;

// A rejected client gets this long to take its ERROR message.
constexpr int kRejectSendTimeoutMs = 1000;

std::string PeerName(const sockaddr_in& addr) {
  char host[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &addr.sin_addr, host, sizeof(host));
  return std::string(host) + ":" + std::to_string(ntohs(addr.sin_port));
}

void SetSocketOption(int fd, int level, int name, int value, const char* label) {
  if (::setsockopt(fd, level, name, &value, sizeof(value)) != 0) {
    LEDCAST_LOG_WARN("setsockopt failed", {StringField("option", label), StringField("error", std::strerror(errno))});
  }
}

} // namespace

StreamServer::StreamServer(StreamServerOptions options, std::shared_ptr<cache::CacheStore> cache, std::vector<model::TargetGeometry> geometries)
    : options_(std::move(options)), cache_(std::move(cache)), geometries_(std::move(geometries)), activity_(options_.activity_log_size) {
}

StreamServer::~StreamServer() {
  Stop();
}

void StreamServer::Start() {
  if (running_) return;

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port   = htons(options_.port);
  if (::inet_pton(AF_INET, options_.bind_address.c_str(), &addr.sin_addr) != 1) {
    throw util::ConfigurationError("stream.bind_address is not an IPv4 address: " + options_.bind_address);
  }

  const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    throw util::StreamIOError(std::string("socket: ") + std::strerror(errno));
  }
  SetSocketOption(fd, SOL_SOCKET, SO_REUSEADDR, 1, "SO_REUSEADDR");

  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd, kListenBacklog) != 0) {
    const std::string error = std::strerror(errno);
    ::close(fd);
    throw util::StreamIOError("bind " + options_.bind_address + ":" + std::to_string(options_.port) + ": " + error);
  }

  sockaddr_in bound{};
  socklen_t   bound_len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    bound_port_ = ntohs(bound.sin_port);
  } else {
    bound_port_ = options_.port;
  }

  listen_fd_     = fd;
  running_       = true;
  accept_thread_ = std::thread(&StreamServer::AcceptLoop, this);

  LEDCAST_LOG_INFO("stream server listening", {StringField("address", options_.bind_address), IntField("port", bound_port_.load()),
                                               IntField("max_sessions", options_.max_sessions)});
}

void StreamServer::Stop() {
  if (!running_.exchange(false)) return;

  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  ::close(listen_fd_);
  listen_fd_ = -1;

  std::vector<std::unique_ptr<Session>> sessions;
  {
    std::lock_guard lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto& session : sessions) {
    session->Stop();
  }
  sessions.clear();
  observability::Metrics::Instance().SetActiveSessions(0);

  LEDCAST_LOG_INFO("stream server stopped");
}

void StreamServer::AcceptLoop() {
  while (running_) {
    pollfd    pfd{listen_fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, kAcceptPollMs);
    ReapFinished();
    if (ready < 0) {
      if (errno == EINTR) continue;
      LEDCAST_LOG_ERROR("stream accept poll failed", {StringField("error", std::strerror(errno))});
      return;
    }
    if (ready == 0) continue;

    sockaddr_in peer{};
    socklen_t   peer_len = sizeof(peer);
    const int   fd       = ::accept4(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len, SOCK_CLOEXEC);
    if (fd < 0) {
      if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK && errno != ECONNABORTED) {
        LEDCAST_LOG_WARN("stream accept failed", {StringField("error", std::strerror(errno))});
      }
      continue;
    }

    SetSocketOption(fd, IPPROTO_TCP, TCP_NODELAY, 1, "TCP_NODELAY");
    SetSocketOption(fd, SOL_SOCKET, SO_KEEPALIVE, 1, "SO_KEEPALIVE");
    Admit(fd, PeerName(peer));
  }
}

void StreamServer::Admit(int fd, std::string peer) {
  std::lock_guard lock(sessions_mutex_);

  if (options_.max_sessions > 0 && sessions_.size() >= options_.max_sessions) {
    timeval timeout{};
    timeout.tv_sec  = kRejectSendTimeoutMs / 1000;
    timeout.tv_usec = (kRejectSendTimeoutMs % 1000) * 1000;
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

    const auto message = EncodeError("server busy");
    if (::send(fd, message.data(), message.size(), MSG_NOSIGNAL) < 0) {
      LEDCAST_LOG_DEBUG("busy notice not delivered", {StringField("peer", peer), StringField("error", std::strerror(errno))});
    }
    ::close(fd);

    ledcast::v1::ActivityEvent event;
    event.set_peer(peer);
    event.set_kind(ledcast::v1::ACTIVITY_KIND_ERROR);
    event.set_detail("server busy");
    activity_.Record(std::move(event));
    LEDCAST_LOG_WARN("stream session rejected", {StringField("peer", peer), IntField("sessions", static_cast<int64_t>(sessions_.size()))});
    return;
  }

  auto session = std::make_unique<Session>(next_session_id_++, fd, std::move(peer), options_.session, cache_, geometries_, activity_);
  session->Start();
  sessions_.push_back(std::move(session));
  observability::Metrics::Instance().SetActiveSessions(sessions_.size());
}

void StreamServer::ReapFinished() {
  std::vector<std::unique_ptr<Session>> finished;
  {
    std::lock_guard lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if ((*it)->Finished()) {
        finished.push_back(std::move(*it));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
    if (!finished.empty()) {
      observability::Metrics::Instance().SetActiveSessions(sessions_.size());
    }
  }
  // Joins outside the lock.
  finished.clear();
}

std::vector<ledcast::v1::SessionInfo> StreamServer::Snapshots() const {
  std::lock_guard                       lock(sessions_mutex_);
  std::vector<ledcast::v1::SessionInfo> out;
  out.reserve(sessions_.size());
  for (const auto& session : sessions_) {
    if (session->Finished()) continue;
    out.push_back(session->Snapshot());
  }
  return out;
}

std::vector<ledcast::v1::ActivityEvent> StreamServer::RecentActivity(std::size_t limit) const {
  return activity_.Recent(limit);
}

std::size_t StreamServer::ActiveSessions() const {
  std::lock_guard lock(sessions_mutex_);
  std::size_t     active = 0;
  for (const auto& session : sessions_) {
    if (!session->Finished()) ++active;
  }
  return active;
}

} // namespace ledcast::stream
