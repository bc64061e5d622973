#pragma once

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "Node.hpp"

// Explicit type-name -> constructor table used when rebuilding a pipeline from JSON.
class NodeRegistry {
public:
  using Constructor = std::function<std::unique_ptr<Node>(const std::string& id, const std::string& name)>;

  void registerType(const std::string& typeName, Constructor ctor) {
    if (typeName.empty()) throw std::invalid_argument("Node type name must not be empty");
    if (!ctor) throw std::invalid_argument("Node type '" + typeName + "' needs a constructor");
    ctors_[typeName] = std::move(ctor);
  }

  template <class T>
  void registerType(const std::string& typeName) {
    registerType(typeName, [](const std::string& id, const std::string& name) -> std::unique_ptr<Node> {
      return std::make_unique<T>(id, name);
    });
  }

  bool contains(const std::string& typeName) const { return ctors_.count(typeName) != 0; }

  std::vector<std::string> typeNames() const {
    std::vector<std::string> out;
    out.reserve(ctors_.size());
    for (const auto& kv : ctors_) out.push_back(kv.first);
    return out;
  }

  // Throws std::runtime_error for an unregistered type.
  std::unique_ptr<Node> createNode(const std::string& typeName, const std::string& id, const std::string& name) const {
    auto it = ctors_.find(typeName);
    if (it == ctors_.end()) throw std::runtime_error("Unknown node type: " + typeName);
    return it->second(id, name);
  }

private:
  std::map<std::string, Constructor> ctors_{};
};

// Registers every node type shipped with voxflow.
void registerBuiltinNodeTypes(NodeRegistry& registry);
