#include "internal/stream/stream_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "support/fixtures.hpp"

namespace {

using namespace ledcast;
using ledcast::stream::Message;
using ledcast::stream::MessageType;
using ledcast::testing::MakeCache;
using ledcast::testing::MakeSequence;
using ledcast::testing::MakeSource;
using ledcast::testing::MakeTempDir;

const model::TargetGeometry k16{16, 16};

/*
  Minimal display client over loopback.
*/
class TestClient {
 public:
  // receive_buffer > 0 shrinks SO_RCVBUF before connecting.
  explicit TestClient(uint16_t port, int receive_buffer = 0) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd_ >= 0);

    timeval timeout{};
    timeout.tv_sec = 3;
    ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    if (receive_buffer > 0) {
      ::setsockopt(fd_, SOL_SOCKET, SO_RCVBUF, &receive_buffer, sizeof(receive_buffer));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    const int rc = ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(rc == 0);
    (void)rc;
  }

  ~TestClient() {
    if (fd_ >= 0) ::close(fd_);
  }

  void Send(const std::string& line) {
    const auto sent = ::send(fd_, line.data(), line.size(), MSG_NOSIGNAL);
    assert(sent == static_cast<ssize_t>(line.size()));
    (void)sent;
  }

  // nullopt on timeout or close.
  std::optional<Message> Next() {
    for (;;) {
      std::size_t consumed = 0;
      auto        message  = stream::DecodeMessage(buffer_.data(), buffer_.size(), consumed);
      if (message) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(consumed));
        return message;
      }
      uint8_t    chunk[4096];
      const auto got = ::recv(fd_, chunk, sizeof(chunk), 0);
      if (got <= 0) return std::nullopt;
      buffer_.insert(buffer_.end(), chunk, chunk + got);
    }
  }

  std::optional<Message> NextOfType(MessageType type) {
    while (auto message = Next()) {
      if (message->type == type) return message;
    }
    return std::nullopt;
  }

  void Close() {
    ::close(fd_);
    fd_ = -1;
  }

  // "127.0.0.1:<port>" as the server names this peer.
  std::string PeerName() const {
    sockaddr_in local{};
    socklen_t   length = sizeof(local);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&local), &length);
    return "127.0.0.1:" + std::to_string(ntohs(local.sin_port));
  }

 private:
  int                  fd_ = -1;
  std::vector<uint8_t> buffer_;
};

std::string Text(const Message& message) {
  return std::string(message.payload.begin(), message.payload.end());
}

stream::StreamServerOptions FastOptions() {
  stream::StreamServerOptions options;
  options.bind_address                     = "127.0.0.1";
  options.port                             = 0;
  options.max_sessions                     = 8;
  options.session.handshake_timeout_ms     = 2000;
  options.session.not_ready_retry_ms       = 50;
  options.session.pending_wait_timeout_ms  = 200;
  options.session.rotation_min_ms          = 1;
  options.session.outbound_queue_frames    = 8;
  return options;
}

struct Fixture {
  std::shared_ptr<cache::CacheStore>    cache;
  std::unique_ptr<stream::StreamServer> server;
  db::model::SourceRecord               fire;
  db::model::SourceRecord               wave;
  db::model::SourceRecord               pending;
};

Fixture StartServer(const std::string& name, stream::StreamServerOptions options = FastOptions()) {
  Fixture f;
  f.cache   = MakeCache(MakeTempDir(name));
  f.fire    = MakeSource("fire-bytes", "fire.gif");
  f.wave    = MakeSource("wave-bytes", "wave.gif");
  f.pending = MakeSource("pending-bytes", "pending.gif");
  for (const auto& s : {f.fire, f.wave, f.pending}) f.cache->RegisterSource(s);
  f.cache->Put(f.fire.id, MakeSequence(k16, 2, 40, true, 10));
  f.cache->Put(f.wave.id, MakeSequence(k16, 2, 40, true, 90));

  f.server = std::make_unique<stream::StreamServer>(options, f.cache, std::vector<model::TargetGeometry>{k16, {32, 32}});
  f.server->Start();
  assert(f.server->BoundPort() != 0);
  return f;
}

void TestNamedStreamSendsInfoThenFrames() {
  auto       f = StartServer("stream_named");
  TestClient client(f.server->BoundPort());
  client.Send("STREAM:16x16:fire\n");

  const auto info = client.Next();
  assert(info && info->type == MessageType::kInfo);
  assert(Text(*info) == "16:16:fire:2:1:" + f.fire.id);

  for (uint32_t i = 0; i < 4; ++i) {
    const auto frame = client.Next();
    assert(frame && frame->type == MessageType::kFrame);
    const auto decoded = stream::DecodeFramePayload(frame->payload);
    assert(decoded.index == i % 2);
    assert(decoded.duration_ms == 40);
    assert(decoded.pixels.size() == k16.FrameBytes());
    assert(decoded.pixels[0] == static_cast<uint8_t>(10 + i % 2));
  }

  const auto sessions = f.server->Snapshots();
  assert(sessions.size() == 1);
  assert(sessions[0].geometry() == "16x16");
  assert(sessions[0].state() == ledcast::v1::SESSION_STATE_STREAMING);
  assert(sessions[0].source_id() == f.fire.id);

  client.Close();
  f.server->Stop();
  assert(f.server->ActiveSessions() == 0);
  assert(f.cache->Get(f.fire.id, "16x16")->record.served_count >= 2);
}

void TestRgb565HalvesFrameSize() {
  auto       f = StartServer("stream_rgb565");
  TestClient client(f.server->BoundPort());
  client.Send("STREAM:16x16:" + f.wave.id.substr(0, 12) + ":rgb565\r\n");

  const auto info = client.NextOfType(MessageType::kInfo);
  assert(info && Text(*info).find(":wave:") != std::string::npos);
  const auto frame = client.NextOfType(MessageType::kFrame);
  assert(frame);
  assert(stream::DecodeFramePayload(frame->payload).pixels.size() == 16 * 16 * 2);
  f.server->Stop();
}

void TestHandshakeErrors() {
  auto f = StartServer("stream_errors");

  const std::vector<std::pair<std::string, std::string>> cases = {
      {"STREAM:16x16:nope\n", "unknown source nope"},
      {"STREAM:8x8\n", "geometry not configured 8x8"},
      {"HELLO\n", "malformed handshake"},
      {"STREAM:16x16:fire:yuv\n", "unsupported pixel format yuv"},
  };
  for (const auto& [line, reason] : cases) {
    TestClient client(f.server->BoundPort());
    client.Send(line);
    const auto error = client.NextOfType(MessageType::kError);
    assert(error);
    assert(Text(*error) == reason);
    // server closes after an error
    assert(!client.Next().has_value());
  }
  f.server->Stop();
}

void TestPendingSourceSendsNotReadyThenTimesOut() {
  auto       f = StartServer("stream_pending");
  TestClient client(f.server->BoundPort());
  client.Send("STREAM:16x16:pending\n");

  const auto first = client.Next();
  assert(first && first->type == MessageType::kNotReady);
  assert(Text(*first) == "pending");

  std::size_t not_ready = 1;
  std::optional<Message> message;
  while ((message = client.Next()) && message->type == MessageType::kNotReady) ++not_ready;
  assert(not_ready >= 2);
  assert(message && message->type == MessageType::kError);
  assert(Text(*message) == "timed out waiting for pending");

  // one not-ready event per wait, however many retries
  std::size_t events = 0;
  for (const auto& event : f.server->RecentActivity(0)) {
    if (event.kind() == ledcast::v1::ACTIVITY_KIND_NOT_READY) ++events;
  }
  assert(events == 1);
  f.server->Stop();
}

void TestPendingSourceStreamsOnceConverted() {
  auto options                            = FastOptions();
  options.session.pending_wait_timeout_ms = 5000;
  auto       f                            = StartServer("stream_pending_ready", options);
  TestClient client(f.server->BoundPort());
  client.Send("STREAM:16x16:pending\n");

  for (int i = 0; i < 2; ++i) {
    const auto not_ready = client.Next();
    assert(not_ready && not_ready->type == MessageType::kNotReady);
    assert(Text(*not_ready) == "pending");
  }

  // conversion completes while the client waits
  f.cache->Put(f.pending.id, MakeSequence(k16, 3, 40, true, 50));

  std::optional<Message> message;
  while ((message = client.Next()) && message->type == MessageType::kNotReady) {
  }
  assert(message && message->type == MessageType::kInfo);
  assert(Text(*message) == "16:16:pending:3:1:" + f.pending.id);

  const auto frame = client.Next();
  assert(frame && frame->type == MessageType::kFrame);
  const auto decoded = stream::DecodeFramePayload(frame->payload);
  assert(decoded.index == 0);
  assert(decoded.pixels[0] == 50);
  f.server->Stop();
}

void TestStalledClientDropsWithoutSlowingOthers() {
  const model::TargetGeometry large{256, 256};
  constexpr uint32_t          kFrameMs = 20;

  auto cache = MakeCache(MakeTempDir("stream_backpressure"));
  auto movie = MakeSource("movie-bytes", "movie.gif");
  cache->RegisterSource(movie);
  cache->Put(movie.id, MakeSequence(large, 4, kFrameMs, true, 7));

  auto options                          = FastOptions();
  options.session.outbound_queue_frames = 2;
  options.session.send_timeout_ms       = 10000;
  stream::StreamServer server(options, cache, {large});
  server.Start();

  // Never reads past the handshake, with a tiny receive window.
  TestClient stalled(server.BoundPort(), 4096);
  stalled.Send("STREAM:256x256:movie\n");

  TestClient fast(server.BoundPort());
  fast.Send("STREAM:256x256:movie\n");
  assert(fast.NextOfType(MessageType::kInfo));

  const auto window   = std::chrono::milliseconds(1500);
  const auto started  = std::chrono::steady_clock::now();
  auto       previous = started;
  auto       max_gap  = std::chrono::steady_clock::duration::zero();
  std::size_t frames  = 0;
  while (std::chrono::steady_clock::now() - started < window) {
    const auto frame = fast.NextOfType(MessageType::kFrame);
    assert(frame);
    const auto now = std::chrono::steady_clock::now();
    max_gap        = std::max(max_gap, now - previous);
    previous       = now;
    ++frames;
  }

  // roughly 75 frames are due in the window
  assert(frames >= 40);
  assert(max_gap < std::chrono::milliseconds(250));

  bool saw_stalled = false;
  for (const auto& session : server.Snapshots()) {
    if (session.peer() == stalled.PeerName()) {
      saw_stalled = true;
      assert(session.frames_dropped() > 0);
      assert(session.state() == ledcast::v1::SESSION_STATE_STREAMING);
    } else {
      assert(session.peer() == fast.PeerName());
      assert(session.frames_dropped() < session.frames_sent());
    }
  }
  assert(saw_stalled);
  server.Stop();
}

void TestRotationAlternatesSources() {
  auto       f = StartServer("stream_rotation");
  TestClient client(f.server->BoundPort());
  client.Send("STREAM:16x16\n");

  const auto first = client.NextOfType(MessageType::kInfo);
  assert(first);
  const auto second = client.NextOfType(MessageType::kInfo);
  assert(second);
  assert(Text(*first) != Text(*second));

  const auto first_id  = Text(*first).substr(Text(*first).rfind(':') + 1);
  const auto second_id = Text(*second).substr(Text(*second).rfind(':') + 1);
  assert(first_id == f.fire.id || first_id == f.wave.id);
  assert(second_id == f.fire.id || second_id == f.wave.id);
  f.server->Stop();
}

void TestBusyServerRejectsExtraClients() {
  auto options         = FastOptions();
  options.max_sessions = 1;
  auto f               = StartServer("stream_busy", options);

  TestClient first(f.server->BoundPort());
  first.Send("STREAM:16x16:fire\n");
  assert(first.NextOfType(MessageType::kInfo));

  TestClient second(f.server->BoundPort());
  const auto rejected = second.Next();
  assert(rejected && rejected->type == MessageType::kError);
  assert(Text(*rejected) == "server busy");

  bool saw_connect = false;
  bool saw_stream  = false;
  bool saw_busy    = false;
  for (const auto& event : f.server->RecentActivity(0)) {
    saw_connect |= event.kind() == ledcast::v1::ACTIVITY_KIND_CONNECT;
    saw_stream |= event.kind() == ledcast::v1::ACTIVITY_KIND_STREAM && event.source_name() == "fire";
    saw_busy |= event.kind() == ledcast::v1::ACTIVITY_KIND_ERROR && event.detail() == "server busy";
  }
  assert(saw_connect);
  assert(saw_stream);
  assert(saw_busy);
  assert(f.server->RecentActivity(1).size() == 1);

  f.server->Stop();
  bool saw_disconnect = false;
  for (const auto& event : f.server->RecentActivity(0)) {
    saw_disconnect |= event.kind() == ledcast::v1::ACTIVITY_KIND_DISCONNECT;
  }
  assert(saw_disconnect);
}

void TestBadBindAddressIsConfigurationError() {
  auto options         = FastOptions();
  options.bind_address = "not-an-address";
  stream::StreamServer server(options, MakeCache(MakeTempDir("stream_bad_bind")), {k16});

  bool rejected = false;
  try {
    server.Start();
  } catch (const util::ConfigurationError&) {
    rejected = true;
  }
  assert(rejected);
}

} // namespace

int main() {
  TestNamedStreamSendsInfoThenFrames();
  TestRgb565HalvesFrameSize();
  TestHandshakeErrors();
  TestPendingSourceSendsNotReadyThenTimesOut();
  TestPendingSourceStreamsOnceConverted();
  TestStalledClientDropsWithoutSlowingOthers();
  TestRotationAlternatesSources();
  TestBusyServerRejectsExtraClients();
  TestBadBindAddressIsConfigurationError();

  std::cout << "ledcast_unit_stream_server: pass\n";
  return 0;
}
