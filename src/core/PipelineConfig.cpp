#include "PipelineConfig.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include "NodeFactory.hpp"
#include "Pipeline.hpp"

using nlohmann::json;

static std::string readFileToString(const std::string& path) {
  auto tryRead = [](const std::string& p, std::string& out) -> bool {
    std::ifstream f(p);
    if (!f) return false;
    std::ostringstream ss; ss << f.rdbuf();
    out = ss.str();
    return true;
  };

  std::string text;
  if (tryRead(path, text)) return text;
  if (std::filesystem::path(path).is_absolute()) {
    throw std::runtime_error("Failed to open JSON file: " + path);
  }

  // Search roots: CWD, examples/pipelines, env VOXFLOW_SEARCH_PATHS (colon-separated)
  std::vector<std::string> roots;
  roots.emplace_back("examples/pipelines/");
  if (const char* env = std::getenv("VOXFLOW_SEARCH_PATHS")) {
    std::string s(env);
    size_t start = 0; while (start <= s.size()) {
      size_t sep = s.find(':', start);
      std::string tok = (sep == std::string::npos) ? s.substr(start) : s.substr(start, sep - start);
      if (!tok.empty()) {
        if (tok.back() != '/') tok.push_back('/');
        roots.push_back(tok);
      }
      if (sep == std::string::npos) break; else start = sep + 1;
    }
  }
  for (const auto& r : roots) {
    if (tryRead(r + path, text)) return text;
  }
  throw std::runtime_error("Failed to open JSON file: " + path);
}

PipelineSpec parsePipelineSpec(const json& j) {
  if (!j.is_object()) throw std::runtime_error("Pipeline JSON must be an object");
  if (j.contains("kind")) {
    const std::string k = j.at("kind").get<std::string>();
    if (k != "pipeline") throw std::runtime_error("JSON kind mismatch: expected 'pipeline' but got '" + k + "'");
  }
  PipelineSpec spec;
  spec.id = j.value("id", "");
  spec.name = j.value("name", "");
  spec.description = j.value("description", "");
  spec.version = j.value("version", 1);

  if (j.contains("nodes")) {
    for (const auto& n : j.at("nodes")) {
      NodeSpec ns;
      ns.id = n.value("id", "");
      ns.name = n.value("name", "");
      ns.type = n.value("type", "");
      ns.enabled = n.value("enabled", true);
      ns.configuration = n.value("configuration", json::object());
      spec.nodes.push_back(std::move(ns));
    }
  }
  if (j.contains("connections")) {
    for (const auto& c : j.at("connections")) {
      ConnectionSpec cs;
      cs.id = c.value("id", "");
      cs.sourceId = c.value("sourceId", "");
      cs.targetId = c.value("targetId", "");
      cs.label = c.value("label", "");
      cs.enabled = c.value("enabled", true);
      cs.priority = c.value("priority", 0);
      cs.kind = c.value("kind", std::string("audio"));
      cs.configuration = c.value("configuration", json::object());
      spec.connections.push_back(std::move(cs));
    }
  }
  return spec;
}

json toJson(const PipelineSpec& spec) {
  json j;
  j["kind"] = "pipeline";
  j["version"] = spec.version;
  j["id"] = spec.id;
  j["name"] = spec.name;
  if (!spec.description.empty()) j["description"] = spec.description;
  json nodes = json::array();
  for (const auto& n : spec.nodes) {
    nodes.push_back({{"id", n.id}, {"name", n.name}, {"type", n.type}, {"enabled", n.enabled}, {"configuration", n.configuration}});
  }
  j["nodes"] = nodes;
  json conns = json::array();
  for (const auto& c : spec.connections) {
    json cj = {{"id", c.id}, {"sourceId", c.sourceId}, {"targetId", c.targetId}, {"label", c.label},
               {"enabled", c.enabled}, {"priority", c.priority}, {"configuration", c.configuration}};
    if (c.kind != "audio") cj["kind"] = c.kind;
    conns.push_back(cj);
  }
  j["connections"] = conns;
  return j;
}

PipelineSpec describePipeline(const Pipeline& pipeline) {
  PipelineSpec spec;
  spec.id = pipeline.id();
  spec.name = pipeline.name();
  for (const Node* n : pipeline.nodes()) {
    NodeSpec ns;
    ns.id = n->id();
    ns.name = n->name();
    ns.type = n->typeName();
    ns.enabled = n->enabled();
    ns.configuration = n->configuration();
    spec.nodes.push_back(std::move(ns));
  }
  for (const Connection* c : pipeline.connections()) {
    ConnectionSpec cs;
    cs.id = c->id();
    cs.sourceId = c->source().id();
    cs.targetId = c->target().id();
    cs.label = c->label();
    cs.enabled = c->enabled();
    cs.priority = c->priority();
    cs.kind = c->kind();
    cs.configuration = c->configuration();
    spec.connections.push_back(std::move(cs));
  }
  return spec;
}

json toJson(const Pipeline& pipeline) { return toJson(describePipeline(pipeline)); }

std::unique_ptr<Pipeline> buildPipeline(const PipelineSpec& spec, const NodeRegistry& registry) {
  auto pipeline = std::make_unique<Pipeline>(spec.id, spec.name);
  for (const auto& ns : spec.nodes) {
    auto node = registry.createNode(ns.type, ns.id, ns.name);
    node->setEnabled(ns.enabled);
    node->configure(ns.configuration);
    pipeline->addNode(std::move(node));
  }
  for (const auto& cs : spec.connections) {
    Connection& c = pipeline->connect(cs.sourceId, cs.targetId, cs.id);
    if (!cs.label.empty()) c.setLabel(cs.label);
    c.setEnabled(cs.enabled);
    c.setPriority(cs.priority);
    c.setKind(cs.kind);
    if (cs.configuration.is_object()) {
      for (auto it = cs.configuration.begin(); it != cs.configuration.end(); ++it) c.configuration()[it.key()] = it.value();
    }
  }
  return pipeline;
}

PipelineSpec loadPipelineSpecFromJsonFile(const std::string& path) {
  const std::string text = readFileToString(path);
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("Invalid pipeline JSON in " + path + ": " + e.what());
  }
  if (!j.contains("kind")) {
    std::fprintf(stderr, "Warning: pipeline JSON missing 'kind'; assuming pipeline (%s)\n", path.c_str());
  }
  return parsePipelineSpec(j);
}

void savePipelineSpecToJsonFile(const PipelineSpec& spec, const std::string& path) {
  std::ofstream f(path);
  if (!f) throw std::runtime_error("Failed to open for writing: " + path);
  f << toJson(spec).dump(2) << "\n";
  if (!f) throw std::runtime_error("Failed to write: " + path);
}

void savePipelineToJsonFile(const Pipeline& pipeline, const std::string& path) {
  savePipelineSpecToJsonFile(describePipeline(pipeline), path);
}

std::vector<std::string> checkPipelineSpec(const PipelineSpec& spec, const NodeRegistry* registry) {
  std::vector<std::string> issues;
  std::unordered_set<std::string> nodeIds;
  for (const auto& n : spec.nodes) {
    if (n.id.empty()) { issues.push_back("node with empty id (type '" + n.type + "')"); continue; }
    if (!nodeIds.insert(n.id).second) issues.push_back("duplicate node id '" + n.id + "'");
    if (n.type.empty()) issues.push_back("node '" + n.id + "' has no type");
    else if (registry && !registry->contains(n.type)) issues.push_back("node '" + n.id + "' has unknown type '" + n.type + "'");
  }
  std::unordered_set<std::string> connIds;
  for (const auto& c : spec.connections) {
    const std::string label = c.id.empty() ? (c.sourceId + "->" + c.targetId) : c.id;
    if (!c.id.empty() && !connIds.insert(c.id).second) issues.push_back("duplicate connection id '" + c.id + "'");
    if (!nodeIds.count(c.sourceId)) issues.push_back("connection '" + label + "' has unknown source '" + c.sourceId + "'");
    if (!nodeIds.count(c.targetId)) issues.push_back("connection '" + label + "' has unknown target '" + c.targetId + "'");
    if (c.kind != "audio" && c.kind != "text") issues.push_back("connection '" + label + "' has unknown kind '" + c.kind + "'");
  }
  return issues;
}
