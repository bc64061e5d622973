#include "NodeFactory.hpp"
#include "../nodes/MixerNode.hpp"
#include "../nodes/PassthroughNode.hpp"
#include "../nodes/RawPcmInputNode.hpp"
#include "../nodes/RawPcmOutputNode.hpp"
#include "../nodes/SplitterNode.hpp"
#include "../nodes/TextProcessingNode.hpp"
#include "../nodes/VolumeNode.hpp"
#include "../streaming/RealtimeAgentNode.hpp"
#include "../streaming/TextToSpeechNode.hpp"
#include "../streaming/TranscriptionNode.hpp"

void registerBuiltinNodeTypes(NodeRegistry& registry) {
  registry.registerType<RawPcmInputNode>("raw_pcm_input");
  registry.registerType<RawPcmOutputNode>("raw_pcm_output");
  registry.registerType<PassthroughNode>("passthrough");
  registry.registerType<VolumeNode>("volume");
  registry.registerType<MixerNode>("mixer");
  registry.registerType<SplitterNode>("splitter");
  registry.registerType<TextProcessingNode>("text_processor");
  registry.registerType<TranscriptionNode>("transcription");
  registry.registerType<TextToSpeechNode>("text_to_speech");
  registry.registerType<RealtimeAgentNode>("realtime_agent");
}
