#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include "../core/AudioFormatJson.hpp"
#include "../core/Node.hpp"

// Entry node fed with raw PCM. Forwards accepted audio and declares the format it forwards.
// Buffers may also be queued and pumped later.
class RawPcmInputNode : public Node {
public:
  using Node::Node;

  const char* typeName() const override { return "raw_pcm_input"; }
  CapabilitySet capabilities() const override { return {Capability::AudioInput}; }

  bool acceptAudio(const AudioBufferPtr& audio, ProcessingContext& context) override {
    if (!audio || !enabled() || context.isCancelled()) return false;
    if (!isFormatSupported(audio->format())) {
      context.logWarning("Input node '" + id() + "' does not support format " + audio->format().toString());
      return false;
    }
    {
      std::lock_guard<std::mutex> lk(m_);
      lastFormat_ = audio->format();
    }
    const auto t0 = std::chrono::steady_clock::now();
    propagateToOutputs(audio, context);
    trackProcessing(std::chrono::steady_clock::now() - t0);
    return true;
  }

  std::optional<AudioFormat> outputFormat() const override {
    {
      std::lock_guard<std::mutex> lk(m_);
      if (lastFormat_) return lastFormat_;
    }
    auto it = configuration().find("format");
    if (it != configuration().end()) return audioFormatFromJson(*it);
    if (!supportedFormats().empty()) return supportedFormats().front();
    return AudioFormat::defaultFormat();
  }

  void queueAudio(AudioBufferPtr audio) { std::lock_guard<std::mutex> lk(m_); queue_.push_back(std::move(audio)); }
  bool hasQueued() const { std::lock_guard<std::mutex> lk(m_); return !queue_.empty(); }
  size_t queuedCount() const { std::lock_guard<std::mutex> lk(m_); return queue_.size(); }
  void clearQueue() { std::lock_guard<std::mutex> lk(m_); queue_.clear(); }
  AudioBufferPtr next() {
    std::lock_guard<std::mutex> lk(m_);
    if (queue_.empty()) return nullptr;
    AudioBufferPtr a = std::move(queue_.front());
    queue_.pop_front();
    return a;
  }
  // Feeds every queued buffer through acceptAudio; returns how many were accepted.
  size_t pumpQueued(ProcessingContext& context) {
    size_t n = 0;
    while (!context.isCancelled()) {
      AudioBufferPtr a = next();
      if (!a) break;
      if (acceptAudio(a, context)) ++n;
    }
    return n;
  }

protected:
  void onReset() override {
    std::lock_guard<std::mutex> lk(m_);
    queue_.clear();
    lastFormat_.reset();
  }

private:
  mutable std::mutex m_;
  std::deque<AudioBufferPtr> queue_{};
  std::optional<AudioFormat> lastFormat_{};
};
