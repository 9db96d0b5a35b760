#include "session.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "internal/cache/cache_store.hpp"
#include "internal/codec/pixel_format.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/stream/activity_log.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledcast::stream {

using observability::IntField;
using observability::StringField;

namespace {

// Writer wakes this often to look for a client hang-up while idle.
constexpr auto kIdlePoll = std::chrono::milliseconds(200);

constexpr uint32_t kFallbackFrameMs = 100;

std::string DisplayName(const db::model::SourceRecord& source) {
  return source.display_name.empty() ? source.filename : source.display_name;
}

} // namespace

std::optional<db::model::ArtifactRecord> PickRotationCandidate(const std::vector<db::model::ArtifactRecord>& candidates,
                                                               const std::string&                            last_played) {
  const db::model::ArtifactRecord* best = nullptr;
  for (const auto& candidate : candidates) {
    if (candidates.size() > 1 && candidate.source_id == last_played) continue;
    if (!best || candidate.served_count < best->served_count ||
        (candidate.served_count == best->served_count && candidate.last_served_ms < best->last_served_ms)) {
      best = &candidate;
    }
  }
  if (!best) return std::nullopt;
  return *best;
}

Session::Session(uint64_t id, int fd, std::string peer, SessionOptions options, std::shared_ptr<cache::CacheStore> cache,
                 std::vector<model::TargetGeometry> geometries, ActivityLog& activity)
    : id_(id),
      fd_(fd),
      peer_(std::move(peer)),
      options_(options),
      cache_(std::move(cache)),
      geometries_(std::move(geometries)),
      activity_(activity),
      started_at_ms_(util::NowMs()) {
  last_activity_ms_ = started_at_ms_;
}

Session::~Session() {
  Stop();
  ::close(fd_);
}

void Session::Start() {
  timeval timeout{};
  timeout.tv_sec  = options_.send_timeout_ms / 1000;
  timeout.tv_usec = static_cast<suseconds_t>(options_.send_timeout_ms % 1000) * 1000;
  if (::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) != 0) {
    LEDCAST_LOG_WARN("SO_SNDTIMEO failed", {IntField("session", static_cast<int64_t>(id_)), StringField("error", std::strerror(errno))});
  }

  RecordActivity(ledcast::v1::ACTIVITY_KIND_CONNECT, "");
  LEDCAST_LOG_INFO("stream session opened", {IntField("session", static_cast<int64_t>(id_)), StringField("peer", peer_)});

  pacer_ = std::thread(&Session::RunPacer, this);
}

void Session::Stop() {
  RequestStop("server stopping");
  ::shutdown(fd_, SHUT_RDWR);
  if (pacer_.joinable()) {
    pacer_.join();
  }
}

// ---------------------------------------------------------------------
// Pacer
// ---------------------------------------------------------------------

void Session::RunPacer() {
  SetState(ledcast::v1::SESSION_STATE_NEGOTIATING);

  Handshake handshake;
  try {
    handshake = ParseHandshake(ReadHandshakeLine());
    Negotiate(handshake);
  } catch (const util::InvalidState& e) {
    // No writer yet; the error goes out on this thread.
    SetEndReason(e.what());
    RecordActivity(ledcast::v1::ACTIVITY_KIND_ERROR, e.what());
    try {
      SendAll(EncodeError(e.what()));
    } catch (const util::StreamIOError& io) {
      LEDCAST_LOG_DEBUG("handshake error not delivered", {IntField("session", static_cast<int64_t>(id_)), StringField("error", io.what())});
    }
    Finish();
    return;
  } catch (const util::StreamIOError& e) {
    SetEndReason(e.what());
    Finish();
    return;
  }

  SetState(ledcast::v1::SESSION_STATE_STREAMING);
  writer_ = std::thread(&Session::RunWriter, this);

  try {
    if (handshake.selector.empty()) {
      PlayRotation(handshake, {});
    } else {
      PlayNamed(handshake);
    }
  } catch (const std::exception& e) {
    LEDCAST_LOG_ERROR("stream playback failed", {IntField("session", static_cast<int64_t>(id_)), StringField("error", e.what())});
    SendError("internal error");
  }

  SetState(ledcast::v1::SESSION_STATE_DRAINING);
  {
    std::lock_guard lock(mutex_);
    draining_ = true;
  }
  cv_.notify_all();
  writer_.join();

  SetEndReason("completed");
  Finish();
}

std::string Session::ReadHandshakeLine() {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.handshake_timeout_ms);

  std::string line;
  char        buffer[kMaxHandshakeBytes + 1];
  for (;;) {
    if (stopping_) throw util::StreamIOError("session stopped");

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) throw util::InvalidState("handshake timeout");

    pollfd pfd{fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(remaining));
    if (ready < 0) {
      if (errno == EINTR) continue;
      throw util::StreamIOError(std::string("poll: ") + std::strerror(errno));
    }
    if (ready == 0) throw util::InvalidState("handshake timeout");

    const auto want = kMaxHandshakeBytes + 1 - line.size();
    const auto got  = ::recv(fd_, buffer, want, 0);
    if (got == 0) throw util::StreamIOError("client closed during handshake");
    if (got < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
      throw util::StreamIOError(std::string("recv: ") + std::strerror(errno));
    }
    line.append(buffer, static_cast<std::size_t>(got));

    const auto newline = line.find('\n');
    if (newline != std::string::npos) {
      line.resize(newline);
      return line;
    }
    if (line.size() > kMaxHandshakeBytes) throw util::InvalidState("handshake too long");
  }
}

void Session::Negotiate(const Handshake& handshake) {
  const auto tag = handshake.geometry.Tag();
  if (std::find(geometries_.begin(), geometries_.end(), handshake.geometry) == geometries_.end()) {
    throw util::InvalidState("geometry not configured " + tag);
  }

  std::lock_guard lock(mutex_);
  geometry_tag_ = tag;
  selector_     = handshake.selector;
  pixel_format_ = handshake.pixel_format;
}

void Session::PlayNamed(const Handshake& handshake) {
  const auto source = cache_->FindSource(handshake.selector);
  if (!source) {
    SendError("unknown source " + handshake.selector);
    return;
  }

  const auto tag      = handshake.geometry.Tag();
  const auto artifact = WaitUntilReady(handshake.selector, [&] { return cache_->Get(source->id, tag); });
  if (!artifact) return;

  if (PlayPasses(*artifact, DisplayName(*source), 0, artifact->frames.loop) == PlayEnd::kStopped) return;

  // A one-shot item hands over to rotation once it has played.
  PlayRotation(handshake, source->id);
}

void Session::PlayRotation(const Handshake& handshake, std::string last_played) {
  const auto tag = handshake.geometry.Tag();

  while (!stopping_) {
    const auto artifact = WaitUntilReady(tag, [&]() -> std::optional<cache::CachedArtifact> {
      const auto pick = PickRotationCandidate(cache_->ListArtifacts(tag), last_played);
      if (!pick) return std::nullopt;
      return cache_->Get(pick->source_id, tag);
    });
    if (!artifact) return;

    const auto source = cache_->GetSource(artifact->record.source_id);
    const auto name   = source ? DisplayName(*source) : artifact->record.source_id;
    const auto min_ms = artifact->frames.loop ? options_.rotation_min_ms : 0;
    if (PlayPasses(*artifact, name, min_ms, false) == PlayEnd::kStopped) return;

    last_played = artifact->record.source_id;
  }
}

template <typename Check>
auto Session::WaitUntilReady(const std::string& what, Check&& check) -> decltype(check()) {
  const auto started   = std::chrono::steady_clock::now();
  const auto limit     = std::chrono::milliseconds(options_.pending_wait_timeout_ms);
  bool       announced = false;

  for (;;) {
    auto ready = check();
    if (ready) return ready;
    if (stopping_) return {};

    if (!announced) {
      RecordActivity(ledcast::v1::ACTIVITY_KIND_NOT_READY, what);
      announced = true;
    }
    EnqueueControl(EncodeNotReady(what));

    if (std::chrono::steady_clock::now() - started >= limit) {
      SendError("timed out waiting for " + what);
      return {};
    }
    if (!SleepUntil(std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.not_ready_retry_ms))) return {};
  }
}

Session::PlayEnd Session::PlayPasses(const cache::CachedArtifact& artifact, const std::string& source_name, uint64_t min_duration_ms,
                                     bool forever) {
  const auto& frames    = artifact.frames;
  const auto& source_id = artifact.record.source_id;

  ledcast::v1::PixelFormat format;
  {
    std::lock_guard lock(mutex_);
    source_id_ = source_id;
    format     = pixel_format_;
  }

  RecordActivity(ledcast::v1::ACTIVITY_KIND_STREAM, "", source_id, source_name);
  EnqueueControl(EncodeInfo(StreamInfo{frames.geometry, source_name, static_cast<uint32_t>(frames.FrameCount()), frames.loop, source_id}));

  if (frames.FrameCount() == 0) return PlayEnd::kDone;

  std::vector<std::vector<uint8_t>> wire;
  wire.reserve(frames.FrameCount());
  for (const auto& frame : frames.frames) {
    wire.push_back(codec::AdaptFrame(frame, format));
  }

  const auto started  = std::chrono::steady_clock::now();
  auto       deadline = started;
  for (;;) {
    for (std::size_t i = 0; i < wire.size(); ++i) {
      const auto duration = i < frames.durations_ms.size() ? std::max<uint32_t>(frames.durations_ms[i], 1) : kFallbackFrameMs;
      EnqueueFrame(EncodeFrame(static_cast<uint32_t>(i), duration, wire[i]));
      deadline += std::chrono::milliseconds(duration);
      if (!SleepUntil(deadline)) return PlayEnd::kStopped;
    }
    if (forever) continue;
    if (std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(min_duration_ms)) return PlayEnd::kDone;
  }
}

// ---------------------------------------------------------------------
// Outbound queue
// ---------------------------------------------------------------------

void Session::EnqueueControl(std::vector<uint8_t> bytes) {
  {
    std::lock_guard lock(mutex_);
    outbound_.push_back(Outbound{std::move(bytes), false});
  }
  cv_.notify_all();
}

void Session::EnqueueFrame(std::vector<uint8_t> bytes) {
  const std::size_t capacity = std::max<uint32_t>(options_.outbound_queue_frames, 1);

  std::string tag;
  {
    std::lock_guard lock(mutex_);
    if (queued_frames_ < capacity) {
      outbound_.push_back(Outbound{std::move(bytes), true});
      ++queued_frames_;
      cv_.notify_all();
      return;
    }
    tag = geometry_tag_;
  }

  ++frames_dropped_;
  observability::Metrics::Instance().RecordFramesDropped(tag, 1);
}

void Session::SendError(const std::string& reason) {
  SetEndReason(reason);
  RecordActivity(ledcast::v1::ACTIVITY_KIND_ERROR, reason);
  EnqueueControl(EncodeError(reason));
}

// ---------------------------------------------------------------------
// Writer
// ---------------------------------------------------------------------

void Session::RunWriter() {
  std::string tag;
  {
    std::lock_guard lock(mutex_);
    tag = geometry_tag_;
  }

  for (;;) {
    Outbound next;
    {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, kIdlePoll, [&] { return stopping_.load() || draining_ || !outbound_.empty(); });
      if (stopping_) return;

      if (outbound_.empty()) {
        if (draining_) return;
        lock.unlock();
        if (PeerHungUp()) {
          RequestStop("client closed");
          return;
        }
        continue;
      }

      next = std::move(outbound_.front());
      outbound_.pop_front();
      if (next.frame) --queued_frames_;
    }

    try {
      SendAll(next.bytes);
    } catch (const util::StreamIOError& e) {
      RequestStop(e.what());
      return;
    }

    if (next.frame) {
      ++frames_sent_;
      observability::Metrics::Instance().RecordFramesSent(tag, 1);
    }
    Touch();
  }
}

void Session::SendAll(const std::vector<uint8_t>& bytes) {
  std::size_t offset = 0;
  while (offset < bytes.size()) {
    const auto sent = ::send(fd_, bytes.data() + offset, bytes.size() - offset, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) throw util::StreamIOError("send timeout");
      throw util::StreamIOError(std::string("send: ") + std::strerror(errno));
    }
    offset += static_cast<std::size_t>(sent);
  }
}

bool Session::PeerHungUp() {
  pollfd    pfd{fd_, POLLIN | POLLRDHUP, 0};
  const int ready = ::poll(&pfd, 1, 0);
  if (ready <= 0) return false;
  if (pfd.revents & (POLLHUP | POLLERR | POLLRDHUP | POLLNVAL)) return true;
  if (pfd.revents & POLLIN) {
    // Clients have nothing to say after the handshake; discard it.
    char       scratch[256];
    const auto got = ::recv(fd_, scratch, sizeof(scratch), MSG_DONTWAIT);
    if (got == 0) return true;
    if (got < 0) return errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR;
  }
  return false;
}

// ---------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------

bool Session::SleepUntil(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock lock(mutex_);
  cv_.wait_until(lock, deadline, [&] { return stopping_.load(); });
  return !stopping_;
}

void Session::RequestStop(const std::string& reason) {
  SetEndReason(reason);
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
}

void Session::SetEndReason(const std::string& reason) {
  std::lock_guard lock(mutex_);
  if (end_reason_.empty()) end_reason_ = reason;
}

void Session::Finish() {
  std::string reason;
  {
    std::lock_guard lock(mutex_);
    reason = end_reason_;
  }

  SetState(ledcast::v1::SESSION_STATE_CLOSED);
  RecordActivity(ledcast::v1::ACTIVITY_KIND_DISCONNECT, reason);
  LEDCAST_LOG_INFO("stream session closed", {IntField("session", static_cast<int64_t>(id_)), StringField("peer", peer_), StringField("reason", reason),
                                             IntField("frames_sent", static_cast<int64_t>(frames_sent_.load())),
                                             IntField("frames_dropped", static_cast<int64_t>(frames_dropped_.load()))});
  finished_ = true;
}

void Session::SetState(ledcast::v1::SessionState state) {
  std::lock_guard lock(mutex_);
  state_ = state;
}

void Session::Touch() {
  last_activity_ms_ = util::NowMs();
}

void Session::RecordActivity(ledcast::v1::ActivityKind kind, const std::string& detail, const std::string& source_id,
                             const std::string& source_name) {
  ledcast::v1::ActivityEvent event;
  event.set_time_ms(util::NowMs());
  event.set_session_id(id_);
  event.set_peer(peer_);
  event.set_kind(kind);
  event.set_source_id(source_id);
  event.set_source_name(source_name);
  event.set_frames_sent(frames_sent_.load());
  event.set_frames_dropped(frames_dropped_.load());
  event.set_detail(detail);
  {
    std::lock_guard lock(mutex_);
    event.set_geometry(geometry_tag_);
  }
  activity_.Record(std::move(event));
}

ledcast::v1::SessionInfo Session::Snapshot() const {
  ledcast::v1::SessionInfo info;
  info.set_session_id(id_);
  info.set_peer(peer_);
  info.set_started_at_ms(started_at_ms_);
  info.set_frames_sent(frames_sent_.load());
  info.set_frames_dropped(frames_dropped_.load());
  info.set_last_activity_ms(last_activity_ms_.load());

  std::lock_guard lock(mutex_);
  info.set_geometry(geometry_tag_);
  info.set_pixel_format(pixel_format_);
  info.set_selector(selector_);
  info.set_state(state_);
  info.set_source_id(source_id_);
  return info;
}

} // namespace ledcast::stream
