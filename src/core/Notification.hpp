#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "AudioBuffer.hpp"

class ProcessingContext;

enum class TransportState : uint8_t { None = 0, Connecting, Open, CloseSent, CloseReceived, Closed };
enum class MessageKind : uint8_t { Text = 0, Binary, Close };

inline const char* transportStateName(TransportState s) {
  switch (s) {
    case TransportState::None: return "None";
    case TransportState::Connecting: return "Connecting";
    case TransportState::Open: return "Open";
    case TransportState::CloseSent: return "CloseSent";
    case TransportState::CloseReceived: return "CloseReceived";
    case TransportState::Closed: return "Closed";
  }
  return "?";
}

enum class NotificationType : uint8_t {
  DataTransferred = 0,
  ExecutionStarted,
  ExecutionCompleted,
  ExecutionCancelled,
  ExecutionFailed,
  NodeProcessingStarted,
  NodeProcessingCompleted,
  StreamingStarted,
  StreamingStopped,
  ConnectionStateChanged,
  MessageReceived,
  TranscriptionReceived,
  TextProcessed,
  SpeechAudioReceived,
  SpeechCompleted
};

// Flat event record; fields not relevant to a type stay default.
struct Notification {
  NotificationType type = NotificationType::DataTransferred;
  std::string sourceId;       // node, connection or pipeline id
  std::string targetId;       // DataTransferred: receiving node
  std::string connectionId;   // DataTransferred
  std::string executionId;
  std::string sessionId;
  std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
  AudioBufferPtr audio{};
  std::string text;
  std::vector<uint8_t> bytes{};
  MessageKind messageKind = MessageKind::Binary;
  bool isFinal = false;
  TransportState previousState = TransportState::None;
  TransportState currentState = TransportState::None;
  size_t resultCount = 0;
  std::chrono::nanoseconds duration{0};
  std::string error;
  std::shared_ptr<ProcessingContext> context{}; // StreamingStarted: context bound to the new scope
};

// One subscriber's queue. Bounded; when full the oldest entry is dropped.
class NotificationSubscription {
public:
  explicit NotificationSubscription(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  void push(const Notification& n) {
    std::lock_guard<std::mutex> lk(m_);
    if (queue_.size() >= capacity_) { queue_.pop_front(); ++dropped_; }
    queue_.push_back(n);
  }

  // Move up to maxCount pending notifications into out; returns how many were moved.
  size_t drainUpTo(size_t maxCount, std::vector<Notification>& out) {
    std::lock_guard<std::mutex> lk(m_);
    size_t n = 0;
    while (!queue_.empty() && n < maxCount) {
      out.push_back(std::move(queue_.front()));
      queue_.pop_front();
      ++n;
    }
    return n;
  }
  size_t drain(std::vector<Notification>& out) { return drainUpTo(static_cast<size_t>(-1), out); }

  size_t pending() const { std::lock_guard<std::mutex> lk(m_); return queue_.size(); }
  uint64_t dropped() const { std::lock_guard<std::mutex> lk(m_); return dropped_; }

private:
  mutable std::mutex m_;
  std::deque<Notification> queue_{};
  size_t capacity_;
  uint64_t dropped_ = 0;
};

// Explicit multi-subscriber outbound channel. Publishing never blocks on a subscriber.
class NotificationChannel {
public:
  std::shared_ptr<NotificationSubscription> subscribe(size_t capacity = 4096) {
    auto sub = std::make_shared<NotificationSubscription>(capacity);
    std::lock_guard<std::mutex> lk(m_);
    subs_.push_back(sub);
    return sub;
  }

  void publish(const Notification& n) {
    std::vector<std::shared_ptr<NotificationSubscription>> live;
    {
      std::lock_guard<std::mutex> lk(m_);
      live.reserve(subs_.size());
      for (auto it = subs_.begin(); it != subs_.end();) {
        if (auto s = it->lock()) { live.push_back(std::move(s)); ++it; }
        else it = subs_.erase(it);
      }
    }
    for (auto& s : live) s->push(n);
  }

  size_t subscriberCount() const {
    std::lock_guard<std::mutex> lk(m_);
    size_t n = 0;
    for (const auto& w : subs_) if (!w.expired()) ++n;
    return n;
  }

private:
  mutable std::mutex m_;
  std::vector<std::weak_ptr<NotificationSubscription>> subs_{};
};

inline const char* notificationTypeName(NotificationType t) {
  switch (t) {
    case NotificationType::DataTransferred: return "DataTransferred";
    case NotificationType::ExecutionStarted: return "ExecutionStarted";
    case NotificationType::ExecutionCompleted: return "ExecutionCompleted";
    case NotificationType::ExecutionCancelled: return "ExecutionCancelled";
    case NotificationType::ExecutionFailed: return "ExecutionFailed";
    case NotificationType::NodeProcessingStarted: return "NodeProcessingStarted";
    case NotificationType::NodeProcessingCompleted: return "NodeProcessingCompleted";
    case NotificationType::StreamingStarted: return "StreamingStarted";
    case NotificationType::StreamingStopped: return "StreamingStopped";
    case NotificationType::ConnectionStateChanged: return "ConnectionStateChanged";
    case NotificationType::MessageReceived: return "MessageReceived";
    case NotificationType::TranscriptionReceived: return "TranscriptionReceived";
    case NotificationType::TextProcessed: return "TextProcessed";
    case NotificationType::SpeechAudioReceived: return "SpeechAudioReceived";
    case NotificationType::SpeechCompleted: return "SpeechCompleted";
  }
  return "?";
}
