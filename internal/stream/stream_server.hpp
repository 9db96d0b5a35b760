#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/model/geometry.hpp"
#include "internal/stream/activity_log.hpp"
#include "internal/stream/session.hpp"
#include "ledcast/v1.hpp"

namespace ledcast::cache {
class CacheStore;
}

namespace ledcast::stream {

struct StreamServerOptions {
  std::string    bind_address      = "0.0.0.0";
  // 0 binds an ephemeral port; see BoundPort().
  uint16_t       port              = 8766;
  uint32_t       max_sessions      = 64;
  uint32_t       activity_log_size = 256;
  SessionOptions session;
};

/*
  TCP listener for display clients. One Session per accepted connection;
  finished sessions are reaped by the accept loop.
*/
class StreamServer {
 public:
  StreamServer(StreamServerOptions                options,
               std::shared_ptr<cache::CacheStore> cache,
               std::vector<model::TargetGeometry> geometries);
  ~StreamServer();

  StreamServer(const StreamServer&)            = delete;
  StreamServer& operator=(const StreamServer&) = delete;

  // Binds and listens; throws util::ConfigurationError for a bad address
  // and util::StreamIOError when the socket cannot be bound.
  void Start();

  // Closes the listener and every session, joining all threads.
  void Stop();

  uint16_t BoundPort() const {
    return bound_port_.load();
  }

  std::vector<ledcast::v1::SessionInfo> Snapshots() const;

  // Newest first.
  std::vector<ledcast::v1::ActivityEvent> RecentActivity(std::size_t limit) const;

  std::size_t ActiveSessions() const;

 private:
  void AcceptLoop();
  void Admit(int fd, std::string peer);
  void ReapFinished();

  const StreamServerOptions                options_;
  std::shared_ptr<cache::CacheStore>       cache_;
  const std::vector<model::TargetGeometry> geometries_;

  ActivityLog activity_;

  int                   listen_fd_ = -1;
  std::atomic<uint16_t> bound_port_{0};
  std::atomic<bool>     running_{false};
  std::thread           accept_thread_;
  std::atomic<uint64_t> next_session_id_{1};

  mutable std::mutex                    sessions_mutex_;
  std::vector<std::unique_ptr<Session>> sessions_;
};

} // namespace ledcast::stream
