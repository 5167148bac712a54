#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "sg/all.hpp"

namespace py = pybind11;

// `seed=None` resolves to the configured default at construction time.
void bind_nn(py::module_ &m) {
  auto nn = m.def_submodule("nn", "Scalar neural network modules");

  py::class_<sg::nn::Module, std::shared_ptr<sg::nn::Module>>(nn, "Module")
    .def("forward", &sg::nn::Module::forward, py::arg("x"))
    .def("__call__", &sg::nn::Module::forward, py::arg("x"))
    // Handles share the parameter nodes, so updates made from Python stick.
    .def("parameters", [](sg::nn::Module& self) {
      std::vector<sg::Value> out;
      for (auto* p : self.parameters()) out.push_back(*p);
      return out;
    })
    .def("named_parameters", [](sg::nn::Module& self) {
      std::vector<std::pair<std::string, sg::Value>> out;
      for (auto& [name, p] : self.named_parameters()) out.emplace_back(name, *p);
      return out;
    })
    .def("zero_grad", &sg::nn::Module::zero_grad);

  py::class_<sg::nn::Neuron, sg::nn::Module, std::shared_ptr<sg::nn::Neuron>>(nn, "Neuron")
    .def(py::init([](std::size_t in, bool relu, std::optional<std::uint64_t> seed) {
           return std::make_shared<sg::nn::Neuron>(in, relu, seed.value_or(sg::config::default_seed()));
         }),
         py::arg("in_features"), py::arg("relu") = false,
         py::arg("seed") = py::none())
    .def("activate", &sg::nn::Neuron::activate, py::arg("x"));

  py::class_<sg::nn::Dense, sg::nn::Module, std::shared_ptr<sg::nn::Dense>>(nn, "Dense")
    .def(py::init([](std::size_t in, std::size_t out, bool relu, std::optional<std::uint64_t> seed) {
           return std::make_shared<sg::nn::Dense>(in, out, relu, seed.value_or(sg::config::default_seed()));
         }),
         py::arg("in_features"), py::arg("out_features"), py::arg("relu") = false,
         py::arg("seed") = py::none());

  py::class_<sg::nn::MLP, sg::nn::Module, std::shared_ptr<sg::nn::MLP>>(nn, "MLP")
    .def(py::init([](const std::vector<std::size_t>& sizes, bool hidden_relu, std::optional<std::uint64_t> seed) {
           return std::make_shared<sg::nn::MLP>(sizes, hidden_relu, seed.value_or(sg::config::default_seed()));
         }),
         py::arg("sizes"), py::arg("hidden_relu") = false,
         py::arg("seed") = py::none())
    .def("dump", [](const sg::nn::MLP& net) {
      std::ostringstream oss;
      net.dump(oss);
      return oss.str();
    });

  nn.def("mse_loss", &sg::nn::mse_loss, py::arg("predicted"), py::arg("targets"));

  py::class_<sg::nn::SGD>(nn, "SGD")
    .def(py::init<double>(), py::arg("lr") = 1e-4)
    .def_readwrite("lr", &sg::nn::SGD::lr)
    .def("step", [](sg::nn::SGD& opt, sg::nn::Module& m) { opt.step(m); }, py::arg("module"));
}
