#pragma once

#include <any>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "Cancellation.hpp"
#include "Random.hpp"

enum class LogLevel : uint8_t { Information = 0, Warning, Error };

inline const char* logLevelName(LogLevel l) {
  switch (l) {
    case LogLevel::Information: return "info";
    case LogLevel::Warning: return "warning";
    case LogLevel::Error: return "error";
  }
  return "?";
}

struct LogMessage {
  LogLevel level = LogLevel::Information;
  std::string message;
  std::chrono::system_clock::time_point timestamp{};
};

// Scope of one propagation pass. Session data survives across passes that share the context;
// transient data is cleared by the pipeline at the end of every pass.
class ProcessingContext {
public:
  using Clock = std::chrono::system_clock;

  explicit ProcessingContext(std::string sessionId = {}, CancellationToken cancellation = {})
  : sessionId_(sessionId.empty() ? generateUuid() : std::move(sessionId)),
    cancellation_(std::move(cancellation)),
    startTime_(Clock::now()), lastUpdated_(startTime_) {}

  ProcessingContext(const ProcessingContext&) = delete;
  ProcessingContext& operator=(const ProcessingContext&) = delete;

  const std::string& sessionId() const { return sessionId_; }
  const CancellationToken& cancellation() const { return cancellation_; }
  bool isCancelled() const { return cancellation_.isCancellationRequested(); }

  Clock::time_point startTime() const { return startTime_; }
  Clock::time_point lastUpdated() const { std::lock_guard<std::mutex> lk(m_); return lastUpdated_; }

  template <class T>
  T sessionValue(const std::string& key, T fallback = T{}) const {
    std::lock_guard<std::mutex> lk(m_);
    return lookup<T>(sessionData_, key, std::move(fallback));
  }
  template <class T>
  void setSessionValue(const std::string& key, T value) {
    std::lock_guard<std::mutex> lk(m_);
    sessionData_[key] = std::move(value);
    lastUpdated_ = Clock::now();
  }
  bool hasSessionValue(const std::string& key) const {
    std::lock_guard<std::mutex> lk(m_);
    return sessionData_.count(key) != 0;
  }

  template <class T>
  T transientValue(const std::string& key, T fallback = T{}) const {
    std::lock_guard<std::mutex> lk(m_);
    return lookup<T>(transientData_, key, std::move(fallback));
  }
  template <class T>
  void setTransientValue(const std::string& key, T value) {
    std::lock_guard<std::mutex> lk(m_);
    transientData_[key] = std::move(value);
    lastUpdated_ = Clock::now();
  }
  bool hasTransientValue(const std::string& key) const {
    std::lock_guard<std::mutex> lk(m_);
    return transientData_.count(key) != 0;
  }
  bool removeTransientValue(const std::string& key) {
    std::lock_guard<std::mutex> lk(m_);
    return transientData_.erase(key) != 0;
  }
  void clearTransientData() {
    std::lock_guard<std::mutex> lk(m_);
    transientData_.clear();
  }

  void log(LogLevel level, std::string message) {
    std::lock_guard<std::mutex> lk(m_);
    lastUpdated_ = Clock::now();
    log_.push_back(LogMessage{level, std::move(message), lastUpdated_});
  }
  void logInfo(std::string message) { log(LogLevel::Information, std::move(message)); }
  void logWarning(std::string message) { log(LogLevel::Warning, std::move(message)); }
  void logError(std::string message) { log(LogLevel::Error, std::move(message)); }

  std::vector<LogMessage> logMessages() const {
    std::lock_guard<std::mutex> lk(m_);
    return log_;
  }

private:
  template <class T>
  static T lookup(const std::unordered_map<std::string, std::any>& map, const std::string& key, T fallback) {
    auto it = map.find(key);
    if (it == map.end()) return fallback;
    if (const T* v = std::any_cast<T>(&it->second)) return *v;
    return fallback;
  }

  std::string sessionId_;
  CancellationToken cancellation_;
  Clock::time_point startTime_;
  Clock::time_point lastUpdated_;
  mutable std::mutex m_;
  std::unordered_map<std::string, std::any> sessionData_{};
  std::unordered_map<std::string, std::any> transientData_{};
  std::vector<LogMessage> log_{};
};
