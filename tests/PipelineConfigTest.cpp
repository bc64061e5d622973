#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "core/NodeFactory.hpp"
#include "core/Pipeline.hpp"
#include "core/PipelineConfig.hpp"
#include "core/PipelineUtils.hpp"
#include "TestSupport.hpp"
#include "nodes/RawPcmInputNode.hpp"
#include "nodes/RawPcmOutputNode.hpp"
#include "nodes/SplitterNode.hpp"
#include "nodes/VolumeNode.hpp"

using nlohmann::json;

namespace {

NodeRegistry builtinRegistry() {
  NodeRegistry r;
  registerBuiltinNodeTypes(r);
  return r;
}

const char* kVoicePipeline = R"({
  "kind": "pipeline",
  "version": 1,
  "id": "voice",
  "name": "Voice Split",
  "description": "mic -> splitter -> two outputs",
  "nodes": [
    {"id": "mic", "name": "Mic", "type": "raw_pcm_input"},
    {"id": "split", "name": "Split", "type": "splitter",
     "configuration": {"channels": [{"id": "voice", "name": "Voice"}, "music"]}},
    {"id": "gain", "type": "volume", "configuration": {"gain": 0.5}},
    {"id": "out", "name": "Out", "type": "raw_pcm_output", "enabled": false},
    {"id": "text", "type": "text_processor"}
  ],
  "connections": [
    {"id": "c1", "sourceId": "mic", "targetId": "split"},
    {"id": "c2", "sourceId": "split", "targetId": "gain", "priority": 2, "configuration": {"channelId": "voice"}},
    {"id": "c3", "sourceId": "gain", "targetId": "out", "label": "loud", "enabled": false},
    {"id": "c4", "sourceId": "text", "targetId": "out", "kind": "text"}
  ]
})";

std::string tempPath(const std::string& name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

TEST(NodeRegistry, ListsBuiltinTypes) {
  const auto r = builtinRegistry();
  const auto names = r.typeNames();
  EXPECT_EQ(names.size(), 10u);
  EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
  for (const char* t : {"raw_pcm_input", "raw_pcm_output", "passthrough", "volume", "mixer", "splitter",
                        "text_processor", "transcription", "text_to_speech", "realtime_agent"}) {
    EXPECT_TRUE(r.contains(t)) << t;
  }
  auto n = r.createNode("mixer", "m1", "Mixer");
  EXPECT_STREQ(n->typeName(), "mixer");
  EXPECT_EQ(n->name(), "Mixer");
  EXPECT_THROW(r.createNode("reverb", "r", ""), std::runtime_error);
  NodeRegistry empty;
  EXPECT_THROW(empty.registerType("x", NodeRegistry::Constructor{}), std::invalid_argument);
}

TEST(PipelineConfig, ParseAndBuild) {
  const auto spec = parsePipelineSpec(json::parse(kVoicePipeline));
  EXPECT_EQ(spec.id, "voice");
  EXPECT_EQ(spec.description, "mic -> splitter -> two outputs");
  ASSERT_EQ(spec.nodes.size(), 5u);
  ASSERT_EQ(spec.connections.size(), 4u);
  EXPECT_EQ(spec.connections[3].kind, "text");
  EXPECT_TRUE(checkPipelineSpec(spec, nullptr).empty());

  const auto r = builtinRegistry();
  auto p = buildPipeline(spec, r);
  EXPECT_EQ(p->name(), "Voice Split");
  EXPECT_EQ(p->nodes().size(), 5u);

  auto* split = dynamic_cast<SplitterNode*>(p->findNode("split"));
  ASSERT_NE(split, nullptr);
  EXPECT_EQ(split->channelIds(), (std::vector<std::string>{"voice", "music"}));
  auto* gain = dynamic_cast<VolumeNode*>(p->findNode("gain"));
  ASSERT_NE(gain, nullptr);
  EXPECT_DOUBLE_EQ(gain->gain(), 0.5);
  EXPECT_FALSE(p->findNode("out")->enabled());

  Connection* c2 = p->findConnection("c2");
  ASSERT_NE(c2, nullptr);
  EXPECT_EQ(c2->priority(), 2);
  EXPECT_EQ(c2->channelTag(), "voice");
  EXPECT_EQ(c2->label(), "Split -> gain");
  Connection* c3 = p->findConnection("c3");
  EXPECT_EQ(c3->label(), "loud");
  EXPECT_FALSE(c3->enabled());
  EXPECT_EQ(p->findConnection("c4")->kind(), "text");
}

TEST(PipelineConfig, DescribeRoundTripsThroughJson) {
  const auto r = builtinRegistry();
  auto p = buildPipeline(parsePipelineSpec(json::parse(kVoicePipeline)), r);
  auto* split = dynamic_cast<SplitterNode*>(p->findNode("split"));
  ASSERT_NE(split, nullptr);
  split->setChannelEnabled("music", false);
  const std::vector<AudioFormat> gainFormats{AudioFormat::defaultFormat(), AudioFormat::cdQuality()};
  p->findNode("gain")->setSupportedFormats(gainFormats);

  const json j = toJson(*p);
  EXPECT_EQ(j.at("kind"), "pipeline");
  EXPECT_EQ(j.at("nodes").size(), 5u);
  EXPECT_EQ(j.at("nodes")[1].at("type"), "splitter");
  const json& channels = j.at("nodes")[1].at("configuration").at("channels");
  EXPECT_EQ(channels[1].at("id"), "music");
  EXPECT_TRUE(channels[0].at("enabled").get<bool>());
  EXPECT_FALSE(channels[1].at("enabled").get<bool>());
  const json& formats = j.at("nodes")[2].at("configuration").at("supportedFormats");
  ASSERT_EQ(formats.size(), 2u);
  EXPECT_EQ(formats[1].at("sampleRate"), 44100);
  EXPECT_FALSE(j.at("connections")[0].contains("kind"));
  EXPECT_EQ(j.at("connections")[3].at("kind"), "text");

  auto again = buildPipeline(parsePipelineSpec(j), r);
  EXPECT_EQ(toJson(*again), j);
  auto* split2 = dynamic_cast<SplitterNode*>(again->findNode("split"));
  ASSERT_NE(split2, nullptr);
  EXPECT_EQ(split2->enabledChannelCount(), 1u);
  EXPECT_TRUE(again->findNode("gain")->supportedFormats() == gainFormats);

  again->findNode("gain")->setSupportedFormats({});
  EXPECT_FALSE(again->findNode("gain")->configuration().contains("supportedFormats"));
}

TEST(PipelineConfig, SplitGainExampleRoutesVoiceAndDry) {
  const auto spec = loadPipelineSpecFromJsonFile(std::string(VOXFLOW_SOURCE_DIR) + "/examples/pipelines/split_gain.json");
  auto p = buildPipeline(spec, builtinRegistry());
  p->initialize();
  const auto results = p->execute(pcm16Buffer({1000, -2000}));

  auto* out = dynamic_cast<RawPcmOutputNode*>(p->findNode("out"));
  auto* dry = dynamic_cast<RawPcmOutputNode*>(p->findNode("dry"));
  ASSERT_NE(out, nullptr);
  ASSERT_NE(dry, nullptr);
  ASSERT_TRUE(out->lastAudio());
  ASSERT_TRUE(dry->lastAudio());
  EXPECT_EQ(pcm16Samples(*out->lastAudio()), (std::vector<int16_t>{500, -1000}));
  EXPECT_EQ(pcm16Samples(*dry->lastAudio()), (std::vector<int16_t>{1000, -2000}));
  // split, gain, out, dry
  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(pcm16Samples(*results[2]), (std::vector<int16_t>{500, -1000}));
  EXPECT_EQ(pcm16Samples(*results[3]), (std::vector<int16_t>{1000, -2000}));
  EXPECT_EQ(p->entryPoints().size(), 3u);
}

TEST(PipelineConfig, KindMismatchIsRejected) {
  EXPECT_THROW(parsePipelineSpec(json{{"kind", "graph"}}), std::runtime_error);
  EXPECT_THROW(parsePipelineSpec(json::array()), std::runtime_error);
  const auto spec = parsePipelineSpec(json{{"id", "bare"}});
  EXPECT_EQ(spec.id, "bare");
  EXPECT_EQ(spec.version, 1);
  EXPECT_TRUE(spec.nodes.empty());
}

TEST(PipelineConfig, UnknownTypeFailsToBuild) {
  PipelineSpec spec;
  spec.id = "p";
  spec.nodes.push_back(NodeSpec{"a", "A", "granular_reverb", true, json::object()});
  EXPECT_THROW(buildPipeline(spec, builtinRegistry()), std::runtime_error);
}

TEST(PipelineConfig, CheckReportsStructuralIssues) {
  PipelineSpec spec;
  spec.nodes.push_back(NodeSpec{"a", "", "volume", true, json::object()});
  spec.nodes.push_back(NodeSpec{"a", "", "volume", true, json::object()});
  spec.nodes.push_back(NodeSpec{"b", "", "", true, json::object()});
  spec.nodes.push_back(NodeSpec{"c", "", "granular_reverb", true, json::object()});
  ConnectionSpec ok;
  ok.id = "c1"; ok.sourceId = "a"; ok.targetId = "b";
  ConnectionSpec dup = ok;
  ConnectionSpec dangling;
  dangling.sourceId = "a"; dangling.targetId = "zzz"; dangling.kind = "video";
  spec.connections = {ok, dup, dangling};

  const auto r = builtinRegistry();
  const auto issues = checkPipelineSpec(spec, &r);
  auto has = [&](const std::string& needle) {
    return std::any_of(issues.begin(), issues.end(), [&](const std::string& s) { return s.find(needle) != std::string::npos; });
  };
  EXPECT_TRUE(has("duplicate node id 'a'"));
  EXPECT_TRUE(has("node 'b' has no type"));
  EXPECT_TRUE(has("unknown type 'granular_reverb'"));
  EXPECT_TRUE(has("duplicate connection id 'c1'"));
  EXPECT_TRUE(has("unknown target 'zzz'"));
  EXPECT_TRUE(has("unknown kind 'video'"));
  EXPECT_EQ(issues.size(), 6u);

  // Without a registry the type is not checked.
  EXPECT_EQ(checkPipelineSpec(spec, nullptr).size(), 5u);
}

TEST(PipelineConfig, SaveAndLoadFile) {
  const auto r = builtinRegistry();
  auto p = buildPipeline(parsePipelineSpec(json::parse(kVoicePipeline)), r);
  const std::string path = tempPath("voxflow_pipeline_roundtrip.json");
  savePipelineToJsonFile(*p, path);
  const auto loaded = loadPipelineSpecFromJsonFile(path);
  EXPECT_EQ(toJson(loaded), toJson(*p));
  std::remove(path.c_str());

  EXPECT_THROW(loadPipelineSpecFromJsonFile(tempPath("voxflow_missing_pipeline.json")), std::runtime_error);

  const std::string bad = tempPath("voxflow_bad_pipeline.json");
  {
    std::ofstream f(bad);
    f << "{ \"nodes\": [ ";
  }
  EXPECT_THROW(loadPipelineSpecFromJsonFile(bad), std::runtime_error);
  std::remove(bad.c_str());
}

TEST(PipelineUtils, TopoOrderFollowsDeclarationOrder) {
  PipelineSpec spec;
  for (const char* id : {"out", "mic", "gain", "loop"}) spec.nodes.push_back(NodeSpec{id, "", "volume", true, json::object()});
  auto edge = [](const char* s, const char* t) { ConnectionSpec c; c.sourceId = s; c.targetId = t; return c; };
  spec.connections = {edge("mic", "gain"), edge("gain", "out"), edge("loop", "loop")};
  EXPECT_EQ(topoOrder(spec), (std::vector<std::string>{"mic", "gain", "out"}));
}

TEST(PipelineUtils, ValidPathNeedsEnabledRoute) {
  const auto r = builtinRegistry();
  auto p = buildPipeline(parsePipelineSpec(json::parse(kVoicePipeline)), r);
  // mic -> split -> gain is a route from an entry to an exit.
  EXPECT_TRUE(hasValidPath(*p));

  Pipeline bare("bare");
  bare.emplaceNode<RawPcmInputNode>("in", "");
  EXPECT_FALSE(hasValidPath(bare));
}

TEST(PipelineUtils, DotAndMermaidExports) {
  const auto r = builtinRegistry();
  auto p = buildPipeline(parsePipelineSpec(json::parse(kVoicePipeline)), r);
  const std::string dot = toDotGraph(*p);
  EXPECT_EQ(dot.rfind("digraph \"Voice Split\" {", 0), 0u);
  EXPECT_NE(dot.find("rankdir=LR;"), std::string::npos);
  EXPECT_NE(dot.find("\"mic\" [label=\"Mic\\n(raw_pcm_input)\", fillcolor=lightgreen];"), std::string::npos);
  EXPECT_NE(dot.find("\"split\" [label=\"Split\\n(splitter)\", fillcolor=lightyellow];"), std::string::npos);
  EXPECT_NE(dot.find("\"text\" [label=\"text\\n(text_processor)\", fillcolor=lightblue];"), std::string::npos);
  EXPECT_NE(dot.find("\"gain\" -> \"out\" [label=\"loud\"] [style=dashed];"), std::string::npos);
  EXPECT_NE(dot.find("\"mic\" -> \"split\" [label=\"Mic -> Split\"] [style=solid];"), std::string::npos);

  const std::string md = toMermaid(*p);
  EXPECT_EQ(md.rfind("graph LR\n", 0), 0u);
  EXPECT_NE(md.find("n0[\"Mic (raw_pcm_input)\"]"), std::string::npos);
  EXPECT_NE(md.find("n2 -.->|\"loud\"| n3"), std::string::npos);
}
