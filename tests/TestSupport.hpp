#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "core/AudioBuffer.hpp"
#include "core/Errors.hpp"
#include "core/Notification.hpp"
#include "dsp/PcmSamples.hpp"
#include "streaming/WebSocketTransport.hpp"

// Polls pred until it holds or the timeout elapses.
inline bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

inline AudioBufferPtr pcm16Buffer(const std::vector<int16_t>& samples, AudioFormat fmt = AudioFormat::defaultFormat()) {
  std::vector<uint8_t> bytes(samples.size() * 2);
  for (size_t i = 0; i < samples.size(); ++i) writePcm16(&bytes[i * 2], samples[i]);
  return makeAudioBuffer(std::move(bytes), fmt);
}

inline std::vector<int16_t> pcm16Samples(const AudioBuffer& b) {
  std::vector<int16_t> out(b.size() / 2);
  for (size_t i = 0; i < out.size(); ++i) out[i] = readPcm16(&b.bytes()[i * 2]);
  return out;
}

inline std::vector<Notification> drainOfType(NotificationSubscription& sub, NotificationType type) {
  std::vector<Notification> all;
  sub.drain(all);
  std::vector<Notification> out;
  for (auto& n : all) if (n.type == type) out.push_back(std::move(n));
  return out;
}

// Both ends of a scripted socket. Transports created by fakeFactory() share it.
struct FakeWire {
  struct Frame {
    MessageKind kind;
    std::vector<uint8_t> data;
  };

  std::mutex m;
  std::condition_variable cv;
  std::deque<Frame> inbound;
  std::vector<Frame> sent;
  std::vector<std::string> uris;
  std::vector<std::pair<std::string, std::string>> headers;
  int connects = 0;
  int closes = 0;
  bool failConnect = false;
  bool failNextReceive = false;

  void deliver(MessageKind kind, std::vector<uint8_t> data) {
    {
      std::lock_guard<std::mutex> lk(m);
      inbound.push_back(Frame{kind, std::move(data)});
    }
    cv.notify_all();
  }
  void deliverText(const std::string& s) { deliver(MessageKind::Text, std::vector<uint8_t>(s.begin(), s.end())); }
  void deliverClose() { deliver(MessageKind::Close, {}); }
  void breakReceive() {
    {
      std::lock_guard<std::mutex> lk(m);
      failNextReceive = true;
    }
    cv.notify_all();
  }

  size_t sentCount() { std::lock_guard<std::mutex> lk(m); return sent.size(); }
  Frame sentAt(size_t i) { std::lock_guard<std::mutex> lk(m); return sent.at(i); }
  int connectCount() { std::lock_guard<std::mutex> lk(m); return connects; }
  std::string lastUri() { std::lock_guard<std::mutex> lk(m); return uris.empty() ? std::string{} : uris.back(); }
};

class FakeTransport : public WebSocketTransport {
public:
  explicit FakeTransport(std::shared_ptr<FakeWire> wire) : wire_(std::move(wire)) {}

  TransportState state() const override { return state_.load(); }

  void connect(const std::string& uri) override {
    std::lock_guard<std::mutex> lk(wire_->m);
    ++wire_->connects;
    wire_->uris.push_back(uri);
    state_.store(TransportState::Connecting);
    if (wire_->failConnect) {
      state_.store(TransportState::Closed);
      throw TransportError("connection refused: " + uri);
    }
    state_.store(TransportState::Open);
  }

  void send(const uint8_t* data, size_t size, MessageKind kind, bool) override {
    if (state() != TransportState::Open) throw NotConnectedError();
    std::lock_guard<std::mutex> lk(wire_->m);
    wire_->sent.push_back(FakeWire::Frame{kind, std::vector<uint8_t>(data, data + size)});
  }

  ReceivedFrame receive(std::vector<uint8_t>& buffer) override {
    std::unique_lock<std::mutex> lk(wire_->m);
    wire_->cv.wait(lk, [&] { return cancelled_ || wire_->failNextReceive || !wire_->inbound.empty(); });
    if (cancelled_) throw TransportCancelled();
    if (wire_->failNextReceive) {
      wire_->failNextReceive = false;
      state_.store(TransportState::Closed);
      throw TransportError("connection reset by peer");
    }
    FakeWire::Frame f = std::move(wire_->inbound.front());
    wire_->inbound.pop_front();
    ReceivedFrame out;
    out.kind = f.kind;
    if (f.kind == MessageKind::Close) {
      state_.store(TransportState::Closed);
      return out;
    }
    if (buffer.size() < f.data.size()) buffer.resize(f.data.size());
    std::copy(f.data.begin(), f.data.end(), buffer.begin());
    out.size = f.data.size();
    return out;
  }

  void close(uint16_t, const std::string&) override {
    if (state() != TransportState::Open) return;
    state_.store(TransportState::Closed);
    std::lock_guard<std::mutex> lk(wire_->m);
    ++wire_->closes;
  }

  void cancel() override {
    {
      std::lock_guard<std::mutex> lk(wire_->m);
      cancelled_ = true;
      state_.store(TransportState::Closed);
    }
    wire_->cv.notify_all();
  }

  void setHeader(const std::string& name, const std::string& value) override {
    std::lock_guard<std::mutex> lk(wire_->m);
    wire_->headers.emplace_back(name, value);
  }

private:
  std::shared_ptr<FakeWire> wire_;
  std::atomic<TransportState> state_{TransportState::None};
  bool cancelled_ = false; // guarded by wire_->m
};

inline TransportFactory fakeFactory(const std::shared_ptr<FakeWire>& wire) {
  return [wire]() -> std::unique_ptr<WebSocketTransport> { return std::make_unique<FakeTransport>(wire); };
}
