#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class NodeRegistry;
class Pipeline;

struct NodeSpec {
  std::string id;
  std::string name;
  std::string type;
  bool enabled = true;
  nlohmann::json configuration = nlohmann::json::object();
};

struct ConnectionSpec {
  std::string id;       // optional; generated on build when empty
  std::string sourceId;
  std::string targetId;
  std::string label;
  bool enabled = true;
  int priority = 0;
  std::string kind = "audio"; // "audio" | "text"
  nlohmann::json configuration = nlohmann::json::object();
};

struct PipelineSpec {
  std::string id;
  std::string name;
  std::string description; // optional human-readable description
  int version = 1;
  std::vector<NodeSpec> nodes;
  std::vector<ConnectionSpec> connections;
};

PipelineSpec parsePipelineSpec(const nlohmann::json& j);
nlohmann::json toJson(const PipelineSpec& spec);

// Snapshot of a live pipeline in persisted form.
PipelineSpec describePipeline(const Pipeline& pipeline);
nlohmann::json toJson(const Pipeline& pipeline);

// Throws std::runtime_error for unknown node types, GraphError for bad ids.
std::unique_ptr<Pipeline> buildPipeline(const PipelineSpec& spec, const NodeRegistry& registry);

// Relative paths are also tried under VOXFLOW_SEARCH_PATHS (colon-separated).
PipelineSpec loadPipelineSpecFromJsonFile(const std::string& path);
void savePipelineToJsonFile(const Pipeline& pipeline, const std::string& path);
void savePipelineSpecToJsonFile(const PipelineSpec& spec, const std::string& path);

// Structural problems (duplicate ids, unknown types, dangling connection ends); empty when clean.
std::vector<std::string> checkPipelineSpec(const PipelineSpec& spec, const NodeRegistry* registry = nullptr);
