// ============================
// File: include/sg/nn/module.hpp
// ============================
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sg/core/value.hpp"

namespace sg::nn {

// Minimal base class for network modules over scalar values.
// - Pure-virtual forward()
// - Parameter registration + recursive collection
// - Named children/params (for debugging dumps)
// - zero_grad()
//
// Notes:
// * Copy/move are deleted to avoid dangling Module*/Value* registrations.
// * Registered Value members must not be reallocated after registration.
class Module {
public:
  Module() = default;
  virtual ~Module() = default;

  Module(const Module&)            = delete;
  Module& operator=(const Module&) = delete;
  Module(Module&&)                 = delete;
  Module& operator=(Module&&)      = delete;

  virtual std::vector<Value> forward(const std::vector<Value>& x) = 0;

  // Parameter utilities
  std::vector<Value*> parameters();
  std::vector<std::pair<std::string, Value*>> named_parameters(const std::string& prefix = "");
  void zero_grad();

  // register an owning child
  std::shared_ptr<Module> register_module(const std::string& name, std::shared_ptr<Module> m);

  Module& register_parameter(const std::string& name, Value& v);

private:
  std::vector<std::pair<std::string, Module*>> children_;
  std::vector<std::shared_ptr<Module>> owned_;
  std::vector<std::pair<std::string, Value*>> named_params_;
};

} // namespace sg::nn
