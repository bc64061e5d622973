#pragma once

#include <cstdio>
#include <deque>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "PipelineConfig.hpp"
#include "Pipeline.hpp"

inline const char* nodeColor(const Node& n) {
  const bool in = n.hasCapability(Capability::AudioInput);
  const bool out = n.hasCapability(Capability::AudioOutput);
  if (in && out) return "lightyellow";
  if (in) return "lightgreen";
  if (out) return "lightpink";
  return "lightblue";
}

inline std::string toDotGraph(const Pipeline& pipeline) {
  std::ostringstream dot;
  dot << "digraph \"" << pipeline.name() << "\" {\n";
  dot << "  rankdir=LR;\n";
  dot << "  node [shape=box, style=\"rounded,filled\", fillcolor=lightblue];\n\n";
  for (const Node* n : pipeline.nodes()) {
    dot << "  \"" << n->id() << "\" [label=\"" << n->name() << "\\n(" << n->typeName() << ")\", fillcolor=" << nodeColor(*n) << "];\n";
  }
  dot << "\n";
  for (const Connection* c : pipeline.connections()) {
    dot << "  \"" << c->source().id() << "\" -> \"" << c->target().id() << "\"";
    if (!c->label().empty()) dot << " [label=\"" << c->label() << "\"]";
    dot << " [style=" << (c->enabled() ? "solid" : "dashed") << "];\n";
  }
  dot << "}\n";
  return dot.str();
}

inline std::string toMermaid(const Pipeline& pipeline) {
  // Mermaid ids cannot carry '-' or spaces; map each node to n<index>.
  std::unordered_map<std::string, std::string> alias;
  std::ostringstream md;
  md << "graph LR\n";
  size_t i = 0;
  for (const Node* n : pipeline.nodes()) {
    const std::string a = "n" + std::to_string(i++);
    alias[n->id()] = a;
    md << "  " << a << "[\"" << n->name() << " (" << n->typeName() << ")\"]\n";
  }
  for (const Connection* c : pipeline.connections()) {
    md << "  " << alias[c->source().id()] << (c->enabled() ? " -->" : " -.->");
    if (!c->label().empty()) md << "|\"" << c->label() << "\"|";
    md << " " << alias[c->target().id()] << "\n";
  }
  return md.str();
}

// True when some entry point reaches an exit point over enabled connections.
inline bool hasValidPath(const Pipeline& pipeline) {
  const auto& entries = pipeline.entryPoints();
  const auto& exits = pipeline.exitPoints();
  if (entries.empty() || exits.empty()) return false;
  const std::unordered_set<const Node*> targets(exits.begin(), exits.end());
  for (const Node* start : entries) {
    std::unordered_set<const Node*> visited{start};
    std::deque<const Node*> q{start};
    while (!q.empty()) {
      const Node* n = q.front(); q.pop_front();
      if (targets.count(n)) return true;
      for (const Connection* c : n->outbound()) {
        if (!c->enabled()) continue;
        const Node* t = &c->target();
        if (visited.insert(t).second) q.push_back(t);
      }
    }
  }
  return false;
}

// Kahn order over the spec; nodes on a cycle are left out.
inline std::vector<std::string> topoOrder(const PipelineSpec& spec) {
  std::unordered_map<std::string,int> indeg;
  std::unordered_multimap<std::string,std::string> adj;
  for (const auto& n : spec.nodes) indeg[n.id] = 0;
  for (const auto& e : spec.connections) { if (indeg.count(e.targetId)) indeg[e.targetId]++; adj.emplace(e.sourceId, e.targetId); }
  std::vector<std::string> q; q.reserve(indeg.size());
  // Seed in declaration order so the result is stable.
  for (const auto& n : spec.nodes) if (indeg[n.id] == 0) q.push_back(n.id);
  std::vector<std::string> order; order.reserve(indeg.size());
  for (size_t qi=0; qi<q.size(); ++qi) {
    const auto u = q[qi]; order.push_back(u);
    auto range = adj.equal_range(u);
    for (auto it = range.first; it != range.second; ++it) {
      auto& v = it->second; if (indeg.count(v) && --indeg[v]==0) q.push_back(v);
    }
  }
  return order;
}

inline void printTopoOrderFromSpec(const PipelineSpec& spec) {
  const auto order = topoOrder(spec);
  std::fprintf(stderr, "Topo order (%zu): ", order.size());
  for (size_t i=0;i<order.size();++i) std::fprintf(stderr, "%s%s", order[i].c_str(), (i+1<order.size()?" -> ":""));
  std::fprintf(stderr, "\n");
  if (order.size() < spec.nodes.size()) {
    std::fprintf(stderr, "Warning: %zu node(s) sit on a cycle\n", spec.nodes.size() - order.size());
  }
}

inline void printConnectionsSummary(const PipelineSpec& spec) {
  if (spec.connections.empty()) {
    std::fprintf(stderr, "No connections defined.\n");
    return;
  }
  std::fprintf(stderr, "Connections (%zu):\n", spec.connections.size());
  for (const auto& c : spec.connections) {
    std::fprintf(stderr, "  %s -> %s  kind=%s priority=%d%s\n", c.sourceId.c_str(), c.targetId.c_str(),
                 c.kind.c_str(), c.priority, c.enabled ? "" : " (disabled)");
  }
}
