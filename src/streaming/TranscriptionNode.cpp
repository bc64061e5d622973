#include "TranscriptionNode.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <nlohmann/json.hpp>
#include "../core/Errors.hpp"

TranscriptionNode::TranscriptionNode(std::string id, std::string name, std::string endpoint)
: WebSocketNode(std::move(id), std::move(name), std::move(endpoint)) {
  setSupportedFormats({AudioFormat::defaultFormat()});
}

TranscriptionNode::~TranscriptionNode() { stopStreaming(); }

bool TranscriptionNode::acceptAudio(const AudioBufferPtr& audio, ProcessingContext& context) {
  if (!audio || !enabled() || context.isCancelled()) return false;
  if (!isFormatSupported(audio->format())) {
    context.logWarning("Transcription node '" + id() + "' does not support format " + audio->format().toString());
    return false;
  }
  const auto t0 = std::chrono::steady_clock::now();
  try {
    const auto& bytes = audio->bytes();
    if (isStreaming()) {
      for (size_t off = 0; off < bytes.size(); off += kStreamingChunkSize) {
        if (context.isCancelled()) return false;
        const size_t n = std::min(kStreamingChunkSize, bytes.size() - off);
        send(bytes.data() + off, n, MessageKind::Binary, true);
      }
    } else {
      if (!isConnected()) connect();
      send(bytes, MessageKind::Binary, true);
    }
  } catch (const TransportError& e) {
    recordError("LastWebSocketError", e.what());
    context.logError("Transcription node '" + id() + "' send failed: " + e.what());
    return false;
  }
  trackProcessing(std::chrono::steady_clock::now() - t0);
  return true;
}

void TranscriptionNode::onMessageReceived(const std::vector<uint8_t>& data, MessageKind kind, bool, ProcessingContext& context) {
  if (kind != MessageKind::Text) return;
  const std::string message(data.begin(), data.end());
  std::string text;
  bool isFinal = false;
  try {
    const nlohmann::json j = nlohmann::json::parse(message);
    if (!j.is_object()) return;
    text = j.value("text", std::string{});
    isFinal = j.value("is_final", false);
  } catch (const nlohmann::json::exception& e) {
    context.logError("Error parsing transcription message: " + std::string(e.what()));
    std::fprintf(stderr, "Warning: [ws] %s: unparseable transcription message\n", id().c_str());
    return;
  }
  if (text.empty()) return;
  {
    std::lock_guard<std::mutex> lk(transcriptMutex_);
    lastTranscript_ = text;
  }
  Notification n;
  n.type = NotificationType::TranscriptionReceived;
  n.sessionId = context.sessionId();
  n.text = text;
  n.isFinal = isFinal;
  publish(n);
  if (isFinal || forwardPartialResults()) propagateText(text, context);
}
