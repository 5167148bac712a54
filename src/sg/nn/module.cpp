// ============================
// File: src/sg/nn/module.cpp
// ============================
#include "sg/nn/module.hpp"
#include <stdexcept>
#include <unordered_set>

namespace sg::nn {

std::vector<Value*> Module::parameters() {
  std::vector<Value*> out;
  for (auto& [name, p] : named_params_) out.push_back(p);
  for (auto& [name, child] : children_) {
    auto child_params = child->parameters();
    out.insert(out.end(), child_params.begin(), child_params.end());
  }

  // Order-preserving dedup by node identity (two handles may share a node)
  std::vector<Value*> deduped;
  deduped.reserve(out.size());
  std::unordered_set<Node*> seen;
  for (auto* p : out) {
    if (seen.insert(p->n.get()).second) deduped.push_back(p);
  }
  return deduped;
}

std::vector<std::pair<std::string, Value*>> Module::named_parameters(const std::string& prefix) {
  std::vector<std::pair<std::string, Value*>> out;
  for (auto& [name, p] : named_params_) {
    out.emplace_back(prefix.empty() ? name : prefix + "." + name, p);
  }
  for (auto& [cname, child] : children_) {
    std::string child_prefix = prefix.empty() ? cname : (prefix + "." + cname);
    auto child_named = child->named_parameters(child_prefix);
    out.insert(out.end(), child_named.begin(), child_named.end());
  }
  return out;
}

void Module::zero_grad() {
  for (auto* p : parameters()) p->zero_grad();
}

std::shared_ptr<Module> Module::register_module(const std::string& name, std::shared_ptr<Module> m) {
  if (!m) throw std::invalid_argument("register_module: null module '" + name + "'");
  children_.emplace_back(name, m.get());
  owned_.push_back(m);
  return m;
}

Module& Module::register_parameter(const std::string& name, Value& v) {
  named_params_.emplace_back(name, &v);
  return *this;
}

} // namespace sg::nn
