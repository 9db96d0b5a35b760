#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/model/artifact_record.hpp"
#include "internal/model/geometry.hpp"
#include "internal/stream/protocol.hpp"
#include "ledcast/v1.hpp"

namespace ledcast::cache {
class CacheStore;
struct CachedArtifact;
}

namespace ledcast::stream {

class ActivityLog;

// Lowest served count, then least recently served. The artifact of
// last_played is skipped when any other candidate exists.
std::optional<db::model::ArtifactRecord> PickRotationCandidate(const std::vector<db::model::ArtifactRecord>& candidates,
                                                               const std::string&                            last_played);

struct SessionOptions {
  uint32_t outbound_queue_frames   = 4;
  uint32_t handshake_timeout_ms    = 10000;
  uint32_t send_timeout_ms         = 5000;
  uint32_t not_ready_retry_ms      = 1000;
  uint32_t pending_wait_timeout_ms = 60000;
  uint32_t rotation_min_ms         = 30000;
};

/*
  One display client connection.

  The pacer thread negotiates, then emits messages at each frame's
  declared duration into a bounded outbound queue. The writer thread
  drains the queue to the socket. A full queue drops frames (counted);
  INFO, NOT_READY and ERROR are never dropped.

  The session owns the socket; it is closed in the destructor only.
*/
class Session {
 public:
  Session(uint64_t                           id,
          int                                fd,
          std::string                        peer,
          SessionOptions                     options,
          std::shared_ptr<cache::CacheStore> cache,
          std::vector<model::TargetGeometry> geometries,
          ActivityLog&                       activity);
  ~Session();

  Session(const Session&)            = delete;
  Session& operator=(const Session&) = delete;

  void Start();

  // Cancels pending waits, shuts the socket down and joins both threads.
  void Stop();

  bool Finished() const {
    return finished_.load();
  }

  uint64_t Id() const {
    return id_;
  }

  ledcast::v1::SessionInfo Snapshot() const;

 private:
  struct Outbound {
    std::vector<uint8_t> bytes;
    bool                 frame = false;
  };

  // Signals why playback ended early.
  enum class PlayEnd { kDone, kStopped };

  void RunPacer();
  void RunWriter();

  std::string ReadHandshakeLine();
  void        Negotiate(const Handshake& handshake);

  void PlayNamed(const Handshake& handshake);
  void PlayRotation(const Handshake& handshake, std::string last_played);

  // Repeats N until ready or pending_wait_timeout_ms; nullopt on timeout
  // (E already queued) or stop.
  template <typename Check>
  auto WaitUntilReady(const std::string& what, Check&& check) -> decltype(check());

  PlayEnd PlayPasses(const cache::CachedArtifact& artifact, const std::string& source_name, uint64_t min_duration_ms, bool forever);

  void EnqueueControl(std::vector<uint8_t> bytes);
  void EnqueueFrame(std::vector<uint8_t> bytes);
  void SendError(const std::string& reason);

  void SendAll(const std::vector<uint8_t>& bytes);
  bool PeerHungUp();

  // Sleeps until the deadline; false when the session is stopping.
  bool SleepUntil(std::chrono::steady_clock::time_point deadline);

  void RequestStop(const std::string& reason);
  void SetEndReason(const std::string& reason);
  void Finish();

  void SetState(ledcast::v1::SessionState state);
  void Touch();
  void RecordActivity(ledcast::v1::ActivityKind kind, const std::string& detail, const std::string& source_id = {},
                      const std::string& source_name = {});

  const uint64_t                           id_;
  const int                                fd_;
  const std::string                        peer_;
  const SessionOptions                     options_;
  std::shared_ptr<cache::CacheStore>       cache_;
  const std::vector<model::TargetGeometry> geometries_;
  ActivityLog&                             activity_;

  std::thread pacer_;
  std::thread writer_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<Outbound>    outbound_;
  std::size_t             queued_frames_ = 0;
  bool                    draining_      = false;

  std::atomic<bool>     stopping_{false};
  std::atomic<bool>     finished_{false};
  std::atomic<uint64_t> frames_sent_{0};
  std::atomic<uint64_t> frames_dropped_{0};
  std::atomic<uint64_t> last_activity_ms_{0};

  // Guarded by mutex_.
  ledcast::v1::SessionState state_ = ledcast::v1::SESSION_STATE_CONNECTED;
  std::string               geometry_tag_;
  std::string               selector_;
  ledcast::v1::PixelFormat  pixel_format_ = ledcast::v1::PIXEL_FORMAT_RGB888;
  std::string               source_id_;
  std::string               end_reason_;
  const uint64_t            started_at_ms_;
};

} // namespace ledcast::stream
