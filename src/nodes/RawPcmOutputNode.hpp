#pragma once

#include <functional>
#include <mutex>
#include "../core/AudioFormatJson.hpp"
#include "../core/Node.hpp"
#include "../dsp/AudioConvert.hpp"

// Terminal sink: keeps the most recent buffer and adopts its format. An optional "targetFormat"
// converts 16-bit/float on the way in.
class RawPcmOutputNode : public ProcessorNode {
public:
  using AudioSink = std::function<void(const AudioBufferPtr&)>;
  using ProcessorNode::ProcessorNode;

  const char* typeName() const override { return "raw_pcm_output"; }
  // Only receives over connections; never fed the pass input directly.
  bool isEntryPoint() const override { return false; }

  // Called on every received buffer, possibly from a receive-loop thread.
  void setAudioSink(AudioSink sink) { std::lock_guard<std::mutex> lk(sinkMutex_); sink_ = std::move(sink); }
  AudioBufferPtr lastAudio() const { return lastOutput(); }

protected:
  AudioBufferPtr processAudio(const AudioBufferPtr& input, ProcessingContext& context) override {
    AudioBufferPtr out = input;
    auto it = configuration().find("targetFormat");
    if (it != configuration().end()) out = convertOrKeep(input, audioFormatFromJson(*it), context);
    setOutputFormat(out->format());
    AudioSink sink;
    {
      std::lock_guard<std::mutex> lk(sinkMutex_);
      sink = sink_;
    }
    if (sink) sink(out);
    return out;
  }

private:
  std::mutex sinkMutex_;
  AudioSink sink_{};
};
