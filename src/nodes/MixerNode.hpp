#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "../core/Node.hpp"

struct MixerChannel { std::string id; float gain = 1.0f; };

// N-source mixer. Each accepted buffer is stored under the pass's "SourceId" (transient context
// data, a fresh id when absent) with its arrival time; entries older than maxBufferAge are evicted
// before every mix. Only buffers matching the oldest entry's format are mixed.
class MixerNode : public ProcessorNode {
public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;
  static constexpr const char* kSourceIdKey = "SourceId";

  MixerNode(std::string id, std::string name);

  const char* typeName() const override { return "mixer"; }
  bool acceptAudio(const AudioBufferPtr& audio, ProcessingContext& context) override;

  std::chrono::milliseconds maxBufferAge() const;
  void setMaxBufferAge(std::chrono::milliseconds age);
  bool normalize() const { return configuration().value("normalize", true); }
  void setNormalize(bool on) { configuration()["normalize"] = on; }
  std::vector<double> channelWeights() const;
  void setChannelWeights(const std::vector<double>& weights) { configuration()["channelWeights"] = weights; }
  float sourceGain(const std::string& sourceId) const;
  void setSourceGain(const std::string& sourceId, float gain);
  std::vector<MixerChannel> sourceGains() const;

  size_t bufferedSourceCount() const { std::lock_guard<std::mutex> lk(tableMutex_); return table_.size(); }
  void setClock(ClockFn clock) { std::lock_guard<std::mutex> lk(tableMutex_); clock_ = std::move(clock); }

protected:
  AudioBufferPtr processAudio(const AudioBufferPtr& input, ProcessingContext& context) override;
  // Drops buffered audio; gains and weights stay configured.
  void onReset() override;

private:
  struct BufferEntry {
    std::string sourceId;
    AudioBufferPtr audio;
    Clock::time_point admittedAt;
  };
  void evictExpiredLocked(Clock::time_point now);

  mutable std::mutex tableMutex_;
  std::vector<BufferEntry> table_{};
  ClockFn clock_;
};
