#pragma once

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "../core/Pipeline.hpp"
#include "../core/Random.hpp"
#include "../nodes/MixerNode.hpp"
#include "OfflineProgress.hpp"

struct OfflineRunResult {
  std::shared_ptr<AudioBuffer> output;   // concatenation of the output node's result per chunk; null if none
  size_t chunks = 0;
  size_t chunksWithOutput = 0;
  bool cancelled = false;
};

// The node whose audio an offline run collects: the named node, else the first enabled exit point
// that forwards no audio over an enabled connection.
inline Node* offlineOutputNode(const Pipeline& pipeline, const std::string& nodeId = {}) {
  if (!nodeId.empty()) {
    Node* n = pipeline.findNode(nodeId);
    if (!n || !n->hasCapability(Capability::AudioOutput)) {
      throw std::invalid_argument("Output node '" + nodeId + "' is not an audio exit of pipeline '" + pipeline.id() + "'");
    }
    return n;
  }
  Node* fallback = nullptr;
  for (auto* n : pipeline.exitPoints()) {
    if (!n->enabled()) continue;
    if (!fallback) fallback = n;
    const auto& out = n->outbound();
    const bool forwards = std::any_of(out.begin(), out.end(), [](const Connection* c) {
      return c->enabled() && c->kind() == "audio";
    });
    if (!forwards) return n;
  }
  return fallback;
}

// Feeds a long buffer through the pipeline in frame-aligned chunks of chunkMs, in order. Every chunk
// runs under one mixer source id so successive chunks replace each other instead of mixing.
inline OfflineRunResult runPipelineOffline(Pipeline& pipeline, const AudioBuffer& input, uint32_t chunkMs,
                                           ProcessingContext& context, const std::string& outputNodeId = {}) {
  const AudioFormat& fmt = input.format();
  const size_t frame = fmt.frameSize();
  size_t framesPerChunk = static_cast<size_t>(static_cast<uint64_t>(fmt.sampleRate()) * std::max<uint32_t>(chunkMs, 1) / 1000);
  if (framesPerChunk == 0) framesPerChunk = 1;
  const size_t chunkBytes = framesPerChunk * frame;
  const size_t total = input.size() - input.size() % frame;

  Node* sink = offlineOutputNode(pipeline, outputNodeId);
  const std::string sourceId = "offline-" + generateUuid();
  AudioBufferPtr previous;

  OfflineRunResult result;
  OfflineProgress progress;
  for (size_t off = 0; off < total; off += chunkBytes) {
    if (context.isCancelled()) { result.cancelled = true; break; }
    const size_t len = std::min(chunkBytes, total - off);
    auto chunk = std::make_shared<AudioBuffer>(input.segment(off, len));
    context.setTransientValue(MixerNode::kSourceIdKey, sourceId);
    const auto outs = pipeline.execute(chunk, context);
    ++result.chunks;
    if (context.isCancelled()) { result.cancelled = true; break; }
    // A node not reached this pass still holds the previous chunk's buffer.
    AudioBufferPtr produced = (sink && !outs.empty()) ? sink->audioOutput(context) : nullptr;
    if (produced == previous) produced = nullptr;
    if (produced) {
      previous = produced;
      const AudioBuffer& o = *produced;
      if (!result.output) {
        result.output = std::make_shared<AudioBuffer>(std::vector<uint8_t>{}, o.format());
      }
      if (o.format() != result.output->format()) {
        context.logWarning("Offline run: chunk output format " + o.format().toString() + " differs; chunk dropped");
      } else {
        auto& dst = result.output->mutableBytes();
        dst.insert(dst.end(), o.bytes().begin(), o.bytes().end());
        ++result.chunksWithOutput;
      }
    }
    progress.update(off + len, total);
  }
  if (result.output) result.output->metadata()["chunks"] = result.chunks;
  progress.finish(input.durationSeconds());
  return result;
}
