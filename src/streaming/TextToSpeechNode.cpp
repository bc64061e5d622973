#include "TextToSpeechNode.hpp"
#include <cstdio>
#include <nlohmann/json.hpp>
#include "../core/AudioFormatJson.hpp"
#include "../core/Errors.hpp"

namespace {
AudioFormat defaultSpeechFormat() { return AudioFormat(24000, 1, 16, false); }
}

TextToSpeechNode::TextToSpeechNode(std::string id, std::string name, std::string endpoint)
: WebSocketNode(std::move(id), std::move(name), std::move(endpoint)), assembler_(defaultSpeechFormat()) {}

TextToSpeechNode::~TextToSpeechNode() { stopStreaming(); }

void TextToSpeechNode::configure(const nlohmann::json& config) {
  WebSocketNode::configure(config);
  if (config.contains("outputFormat")) assembler_.setFormat(audioFormatFromJson(config.at("outputFormat")));
}

std::optional<AudioFormat> TextToSpeechNode::outputFormat() const {
  auto it = configuration().find("outputFormat");
  if (it == configuration().end()) return defaultSpeechFormat();
  return audioFormatFromJson(*it);
}

void TextToSpeechNode::setOutputFormat(const AudioFormat& f) {
  configuration()["outputFormat"] = audioFormatToJson(f);
  assembler_.setFormat(f);
}

AudioBufferPtr TextToSpeechNode::audioOutput(ProcessingContext&) {
  std::lock_guard<std::mutex> lk(audioMutex_);
  return lastAudio_;
}

bool TextToSpeechNode::acceptText(const std::string& text, ProcessingContext& context) {
  if (!enabled() || text.empty() || context.isCancelled()) return false;
  try {
    speakText(text);
  } catch (const TransportError& e) {
    recordError("LastWebSocketError", e.what());
    context.logError("Text-to-speech node '" + id() + "' send failed: " + e.what());
    return false;
  }
  return true;
}

void TextToSpeechNode::speakText(const std::string& text) {
  if (text.empty()) return;
  if (!isConnected()) connect();
  const nlohmann::json request{{"text", text}};
  speaking_.store(true, std::memory_order_release);
  sendText(request.dump());
}

void TextToSpeechNode::onMessageReceived(const std::vector<uint8_t>& data, MessageKind kind, bool, ProcessingContext& context) {
  if (kind == MessageKind::Binary) {
    AudioBufferPtr audio = assembler_.push(data);
    if (!audio) return;
    {
      std::lock_guard<std::mutex> lk(audioMutex_);
      lastAudio_ = audio;
    }
    Notification n;
    n.type = NotificationType::SpeechAudioReceived;
    n.sessionId = context.sessionId();
    n.audio = audio;
    publish(n);
    propagateToOutputs(audio, context);
    return;
  }
  if (kind != MessageKind::Text) return;
  try {
    const nlohmann::json j = nlohmann::json::parse(std::string(data.begin(), data.end()));
    if (j.is_object() && j.value("audio_complete", false)) {
      speaking_.store(false, std::memory_order_release);
      Notification n;
      n.type = NotificationType::SpeechCompleted;
      n.sessionId = context.sessionId();
      publish(n);
    }
  } catch (const nlohmann::json::exception& e) {
    context.logError("Error parsing text-to-speech message: " + std::string(e.what()));
    std::fprintf(stderr, "Warning: [ws] %s: unparseable speech control message\n", id().c_str());
  }
}

void TextToSpeechNode::onReset() {
  assembler_.clear();
  std::lock_guard<std::mutex> lk(audioMutex_);
  lastAudio_.reset();
}
