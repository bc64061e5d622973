#include "SplitterNode.hpp"
#include <algorithm>
#include <stdexcept>
#include "../core/Connection.hpp"

void SplitterNode::addChannel(std::string channelId, std::string name, ChannelTransform transform) {
  if (channelId.empty()) throw std::invalid_argument("Splitter '" + id() + "': channel id must not be empty");
  {
    std::lock_guard<std::mutex> lk(channelsMutex_);
    for (const auto& c : channels_) {
      if (c.id == channelId) throw std::invalid_argument("Splitter '" + id() + "': duplicate channel '" + channelId + "'");
    }
    if (name.empty()) name = channelId;
    channels_.push_back(SplitterChannel{std::move(channelId), std::move(name), true, std::move(transform)});
  }
  syncChannelConfiguration();
}

bool SplitterNode::removeChannel(const std::string& channelId) {
  bool removed = false;
  {
    std::lock_guard<std::mutex> lk(channelsMutex_);
    auto it = std::find_if(channels_.begin(), channels_.end(), [&](const SplitterChannel& c) { return c.id == channelId; });
    if (it != channels_.end()) { channels_.erase(it); removed = true; }
  }
  if (removed) syncChannelConfiguration();
  return removed;
}

void SplitterNode::setChannelEnabled(const std::string& channelId, bool enabled) {
  {
    std::lock_guard<std::mutex> lk(channelsMutex_);
    auto it = std::find_if(channels_.begin(), channels_.end(), [&](const SplitterChannel& c) { return c.id == channelId; });
    if (it == channels_.end()) throw std::invalid_argument("Splitter '" + id() + "': unknown channel '" + channelId + "'");
    it->enabled = enabled;
  }
  syncChannelConfiguration();
}

void SplitterNode::setChannelTransform(const std::string& channelId, ChannelTransform transform) {
  std::lock_guard<std::mutex> lk(channelsMutex_);
  for (auto& c : channels_) if (c.id == channelId) { c.transform = std::move(transform); return; }
  throw std::invalid_argument("Splitter '" + id() + "': unknown channel '" + channelId + "'");
}

bool SplitterNode::hasChannel(const std::string& channelId) const {
  std::lock_guard<std::mutex> lk(channelsMutex_);
  return std::any_of(channels_.begin(), channels_.end(), [&](const SplitterChannel& c) { return c.id == channelId; });
}

std::vector<std::string> SplitterNode::channelIds() const {
  std::lock_guard<std::mutex> lk(channelsMutex_);
  std::vector<std::string> out;
  for (const auto& c : channels_) out.push_back(c.id);
  return out;
}

size_t SplitterNode::enabledChannelCount() const {
  std::lock_guard<std::mutex> lk(channelsMutex_);
  return static_cast<size_t>(std::count_if(channels_.begin(), channels_.end(), [](const SplitterChannel& c) { return c.enabled; }));
}

// "channels": [{"id": "voice", "name": "Voice", "enabled": true}, ...]. Transforms are code and never persisted.
void SplitterNode::configure(const nlohmann::json& config) {
  ProcessorNode::configure(config);
  if (!config.is_object() || !config.contains("channels")) return;
  const auto& arr = config.at("channels");
  if (!arr.is_array()) throw std::invalid_argument("Splitter '" + id() + "': \"channels\" must be an array");
  for (const auto& c : arr) {
    const std::string cid = c.is_string() ? c.get<std::string>() : c.value("id", std::string{});
    if (!hasChannel(cid)) addChannel(cid, c.is_object() ? c.value("name", std::string{}) : std::string{});
    if (c.is_object() && c.contains("enabled")) setChannelEnabled(cid, c.at("enabled").get<bool>());
  }
  syncChannelConfiguration();
}

std::vector<SplitterChannel> SplitterNode::channelsSnapshot() const {
  std::lock_guard<std::mutex> lk(channelsMutex_);
  return channels_;
}

void SplitterNode::syncChannelConfiguration() {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& c : channelsSnapshot()) arr.push_back({{"id", c.id}, {"name", c.name}, {"enabled", c.enabled}});
  configuration()["channels"] = arr;
}

AudioBufferPtr SplitterNode::processAudio(const AudioBufferPtr& input, ProcessingContext& context) {
  setOutputFormat(input->format());
  context.setTransientValue(kOriginalInputKey, input);
  const auto channels = channelsSnapshot();
  const auto outbound = orderedOutbound();
  for (const auto& ch : channels) {
    if (!ch.enabled) continue;
    if (context.isCancelled()) break;
    AudioBufferPtr out;
    auto copy = input->clone();
    copy->metadata()["channelId"] = ch.id;
    if (ch.transform) out = ch.transform(copy, context);
    else out = copy;
    if (!out) {
      context.logWarning("Splitter '" + id() + "': channel '" + ch.id + "' produced no audio");
      continue;
    }
    context.setTransientValue(channelOutputKey(ch.id), out);
    for (auto* c : outbound) {
      if (context.isCancelled()) break;
      if (c->channelTag() == ch.id) c->transferData(out, context);
    }
  }
  return input;
}

bool SplitterNode::propagateResult(const AudioBufferPtr& result, ProcessingContext& context) {
  bool delivered = false;
  for (auto* c : orderedOutbound()) {
    if (context.isCancelled()) break;
    if (!c->channelTag().empty()) continue;
    if (c->transferData(result, context)) delivered = true;
  }
  return delivered;
}

void SplitterNode::onReset() {
  ProcessorNode::onReset();
  {
    std::lock_guard<std::mutex> lk(channelsMutex_);
    for (auto& c : channels_) c.enabled = true;
  }
  syncChannelConfiguration();
}
