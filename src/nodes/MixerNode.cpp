#include "MixerNode.hpp"
#include <algorithm>
#include "../core/Errors.hpp"
#include "../core/Random.hpp"
#include "../dsp/AudioMix.hpp"

MixerNode::MixerNode(std::string id, std::string name)
: ProcessorNode(std::move(id), std::move(name)), clock_([] { return Clock::now(); }) {}

std::chrono::milliseconds MixerNode::maxBufferAge() const {
  return std::chrono::milliseconds(configuration().value("maxBufferAgeMs", static_cast<int64_t>(5000)));
}

void MixerNode::setMaxBufferAge(std::chrono::milliseconds age) {
  configuration()["maxBufferAgeMs"] = static_cast<int64_t>(age.count());
}

std::vector<double> MixerNode::channelWeights() const {
  auto it = configuration().find("channelWeights");
  if (it == configuration().end() || !it->is_array()) return {};
  return it->get<std::vector<double>>();
}

float MixerNode::sourceGain(const std::string& sourceId) const {
  auto it = configuration().find("sourceGains");
  if (it == configuration().end() || !it->is_object()) return 1.0f;
  return it->value(sourceId, 1.0f);
}

void MixerNode::setSourceGain(const std::string& sourceId, float gain) {
  configuration()["sourceGains"][sourceId] = gain;
}

std::vector<MixerChannel> MixerNode::sourceGains() const {
  std::vector<MixerChannel> out;
  auto it = configuration().find("sourceGains");
  if (it == configuration().end() || !it->is_object()) return out;
  for (auto g = it->begin(); g != it->end(); ++g) out.push_back(MixerChannel{g.key(), g.value().get<float>()});
  return out;
}

bool MixerNode::acceptAudio(const AudioBufferPtr& audio, ProcessingContext& context) {
  if (!audio || !enabled() || context.isCancelled()) return false;
  if (isFormatSupported(audio->format())) {
    std::string sourceId = context.transientValue<std::string>(kSourceIdKey);
    if (sourceId.empty()) sourceId = generateUuid();
    std::lock_guard<std::mutex> lk(tableMutex_);
    const auto now = clock_();
    auto it = std::find_if(table_.begin(), table_.end(), [&](const BufferEntry& e) { return e.sourceId == sourceId; });
    if (it != table_.end()) { it->audio = audio; it->admittedAt = now; }
    else table_.push_back(BufferEntry{sourceId, audio, now});
  }
  return ProcessorNode::acceptAudio(audio, context);
}

void MixerNode::evictExpiredLocked(Clock::time_point now) {
  const auto maxAge = maxBufferAge();
  table_.erase(std::remove_if(table_.begin(), table_.end(),
                              [&](const BufferEntry& e) { return now - e.admittedAt > maxAge; }),
               table_.end());
}

AudioBufferPtr MixerNode::processAudio(const AudioBufferPtr& input, ProcessingContext& context) {
  std::vector<BufferEntry> snapshot;
  {
    std::lock_guard<std::mutex> lk(tableMutex_);
    evictExpiredLocked(clock_());
    snapshot = table_;
  }
  if (snapshot.empty()) {
    setOutputFormat(input->format());
    return input;
  }
  const AudioFormat ref = snapshot.front().audio->format();
  std::vector<const BufferEntry*> compatible;
  for (const auto& e : snapshot) if (e.audio->format() == ref) compatible.push_back(&e);
  setOutputFormat(ref);
  if (compatible.size() == 1) return compatible.front()->audio;

  std::vector<MixSource> sources;
  sources.reserve(compatible.size());
  for (const auto* e : compatible) sources.push_back(MixSource{e->audio.get(), static_cast<double>(sourceGain(e->sourceId))});
  try {
    auto mixed = std::make_shared<AudioBuffer>(mixSources(sources, channelWeights(), normalize()));
    mixed->metadata()["mixedBuffers"] = compatible.size();
    context.logInfo("Mixer '" + id() + "' mixed " + std::to_string(compatible.size()) + " buffers");
    return mixed;
  } catch (const UnsupportedMixFormat& e) {
    context.logWarning(e.what());
    return compatible.front()->audio;
  }
}

void MixerNode::onReset() {
  ProcessorNode::onReset();
  std::lock_guard<std::mutex> lk(tableMutex_);
  table_.clear();
}
