#pragma once

#include <mutex>
#include <string>
#include "WebSocketNode.hpp"

// Speech-to-text over a socket. Audio goes out as binary frames; inbound text frames carry
// {"text": ..., "is_final": ...}. Final transcripts are forwarded to text-accepting nodes.
class TranscriptionNode : public WebSocketNode {
public:
  static constexpr size_t kStreamingChunkSize = 8192;

  TranscriptionNode(std::string id, std::string name, std::string endpoint = {});
  ~TranscriptionNode() override;

  const char* typeName() const override { return "transcription"; }
  CapabilitySet capabilities() const override { return {Capability::AudioInput, Capability::Streaming}; }

  bool acceptAudio(const AudioBufferPtr& audio, ProcessingContext& context) override;

  bool forwardPartialResults() const { return configuration().value("forwardPartialResults", false); }
  void setForwardPartialResults(bool on) { configuration()["forwardPartialResults"] = on; }
  std::string lastTranscript() const { std::lock_guard<std::mutex> lk(transcriptMutex_); return lastTranscript_; }

protected:
  void onMessageReceived(const std::vector<uint8_t>& data, MessageKind kind, bool isFinal, ProcessingContext& context) override;

private:
  mutable std::mutex transcriptMutex_;
  std::string lastTranscript_;
};
