#include "Node.hpp"
#include <algorithm>
#include <stdexcept>
#include "AudioFormatJson.hpp"
#include "Connection.hpp"

Node::Node(std::string id, std::string name)
: id_(std::move(id)), name_(std::move(name)) {
  if (id_.empty()) throw std::invalid_argument("Node id must not be empty");
  if (name_.empty()) name_ = id_;
}

void Node::configure(const nlohmann::json& config) {
  if (config.is_null()) return;
  if (!config.is_object()) throw std::invalid_argument("Node '" + id_ + "': configuration must be a JSON object");
  for (auto it = config.begin(); it != config.end(); ++it) configuration_[it.key()] = it.value();
  if (config.contains("supportedFormats")) supportedFormats_ = audioFormatsFromJson(config.at("supportedFormats"));
}

void Node::initialize() {
  {
    std::lock_guard<std::mutex> lk(statusMutex_);
    if (status_.initialized) return;
  }
  onInitialize();
  std::lock_guard<std::mutex> lk(statusMutex_);
  status_.initialized = true;
}

void Node::shutdown() {
  {
    std::lock_guard<std::mutex> lk(statusMutex_);
    if (!status_.initialized) return;
  }
  onShutdown();
  std::lock_guard<std::mutex> lk(statusMutex_);
  status_.initialized = false;
}

void Node::reset() {
  {
    std::lock_guard<std::mutex> lk(statusMutex_);
    status_.processingCount = 0;
    status_.totalProcessingMs = 0.0;
    status_.lastError.clear();
  }
  onReset();
}

bool Node::acceptAudio(const AudioBufferPtr&, ProcessingContext&) { return false; }

AudioBufferPtr Node::audioOutput(ProcessingContext&) { return nullptr; }

bool Node::acceptText(const std::string&, ProcessingContext&) { return false; }

void Node::setSupportedFormats(std::vector<AudioFormat> formats) {
  supportedFormats_ = std::move(formats);
  if (supportedFormats_.empty()) configuration_.erase("supportedFormats");
  else configuration_["supportedFormats"] = audioFormatsToJson(supportedFormats_);
}

bool Node::isFormatSupported(const AudioFormat& f) const {
  if (supportedFormats_.empty()) return true;
  return std::find(supportedFormats_.begin(), supportedFormats_.end(), f) != supportedFormats_.end();
}

std::vector<Connection*> Node::orderedOutbound() const {
  std::vector<Connection*> out;
  out.reserve(outbound_.size());
  for (auto* c : outbound_) if (c->enabled()) out.push_back(c);
  std::stable_sort(out.begin(), out.end(), [](const Connection* a, const Connection* b) { return a->priority() < b->priority(); });
  return out;
}

bool Node::propagateToOutputs(const AudioBufferPtr& audio, ProcessingContext& context) {
  if (!audio) return false;
  bool delivered = false;
  for (auto* c : orderedOutbound()) {
    if (context.isCancelled()) break;
    if (c->transferData(audio, context)) delivered = true;
  }
  return delivered;
}

bool Node::propagateText(const std::string& text, ProcessingContext& context) {
  bool delivered = false;
  for (auto* c : orderedOutbound()) {
    if (context.isCancelled()) break;
    if (c->transferText(text, context)) delivered = true;
  }
  return delivered;
}

void Node::publish(Notification n) {
  if (n.sourceId.empty()) n.sourceId = id_;
  notifications_.publish(n);
  if (feed_) feed_->publish(n);
}

void Node::trackProcessing(std::chrono::steady_clock::duration elapsed) {
  const double ms = std::chrono::duration<double, std::milli>(elapsed).count();
  std::lock_guard<std::mutex> lk(statusMutex_);
  status_.processingCount += 1;
  status_.totalProcessingMs += ms;
}

void Node::recordError(const std::string& diagnosticsKey, const std::string& message) {
  std::lock_guard<std::mutex> lk(statusMutex_);
  status_.lastError = message;
  diagnostics_[diagnosticsKey] = message;
}

void Node::setDiagnostic(const std::string& key, std::string value) {
  std::lock_guard<std::mutex> lk(statusMutex_);
  diagnostics_[key] = std::move(value);
}

bool ProcessorNode::acceptAudio(const AudioBufferPtr& audio, ProcessingContext& context) {
  if (!audio || !enabled() || context.isCancelled()) return false;
  if (!isFormatSupported(audio->format())) {
    context.logWarning("Node '" + id() + "' does not support format " + audio->format().toString());
    return false;
  }
  Notification started;
  started.type = NotificationType::NodeProcessingStarted;
  started.sessionId = context.sessionId();
  started.audio = audio;
  publish(started);
  context.logInfo("Node '" + id() + "' processing " + std::to_string(audio->size()) + " bytes");

  const auto t0 = std::chrono::steady_clock::now();
  AudioBufferPtr processed;
  try {
    processed = processAudio(audio, context);
  } catch (const std::exception& e) {
    recordError("LastError", e.what());
    context.logError("Node '" + id() + "' failed: " + e.what());
    throw;
  }
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  trackProcessing(elapsed);
  context.logInfo("Node '" + id() + "' finished in " +
                  std::to_string(std::chrono::duration<double, std::milli>(elapsed).count()) + " ms");
  if (!processed) return false;
  {
    std::lock_guard<std::mutex> lk(outputMutex_);
    lastOutput_ = processed;
  }

  Notification done;
  done.type = NotificationType::NodeProcessingCompleted;
  done.sessionId = context.sessionId();
  done.audio = processed;
  done.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed);
  publish(done);

  propagateResult(processed, context);
  return true;
}

std::optional<AudioFormat> ProcessorNode::outputFormat() const {
  std::lock_guard<std::mutex> lk(outputMutex_);
  return outputFormat_;
}

AudioBufferPtr ProcessorNode::audioOutput(ProcessingContext&) { return lastOutput(); }

void ProcessorNode::onReset() {
  std::lock_guard<std::mutex> lk(outputMutex_);
  lastOutput_.reset();
}
