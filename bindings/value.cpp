// bindings/value.cpp: pybind11 bindings for sg::Value and the scalar ops.
#include <memory>
#include <sstream>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

// forward declare nn binder implemented in bindings/nn.cpp
void bind_nn(py::module_ &m);

#include "sg/all.hpp"

#ifndef SG_BINDINGS_VERSION
#define SG_BINDINGS_VERSION "0.1.0"
#endif

namespace {
// Context-manager wrapper for NoGradGuard so `with scalargrad.nograd():` works
struct PyNoGradCtx {
  std::unique_ptr<sg::NoGradGuard> guard;
  PyNoGradCtx() = default;
  PyNoGradCtx& enter() { guard = std::make_unique<sg::NoGradGuard>(); return *this; }
  void exit(py::object, py::object, py::object) { guard.reset(); }
};

sg::Value as_value(py::object o) {
  if (py::isinstance<sg::Value>(o)) return o.cast<sg::Value>();
  return sg::constant(o.cast<double>());
}
} // anon

PYBIND11_MODULE(scalargrad, m) {
  bind_nn(m);
  m.attr("__version__") = SG_BINDINGS_VERSION;

  // --- Grad mode ---
  m.def("is_grad_enabled", &sg::is_grad_enabled, "Return grad mode of the calling thread");
  m.def("set_grad_enabled", &sg::set_grad_enabled, py::arg("enabled"),
        "Enable/disable graph recording for new nodes");

  py::class_<PyNoGradCtx>(m, "nograd")
      .def(py::init<>())
      .def("__enter__", &PyNoGradCtx::enter, py::return_value_policy::reference_internal)
      .def("__exit__", &PyNoGradCtx::exit);

  // --- Config ---
  m.def("set_default_seed", &sg::config::set_default_seed, py::arg("seed"));
  m.def("default_seed", &sg::config::default_seed);
  m.def("set_print_precision", &sg::config::set_print_precision, py::arg("digits"));

  py::enum_<sg::Op>(m, "Op")
    .value("Leaf", sg::Op::None)
    .value("Add", sg::Op::Add)
    .value("Mul", sg::Op::Mul)
    .value("Pow", sg::Op::Pow)
    .value("Relu", sg::Op::Relu);

  py::class_<sg::Value>(m, "Value")
    .def(py::init<double>(), py::arg("value") = 0.0)
    .def("value", &sg::Value::value)
    .def("grad", &sg::Value::grad)
    .def("op", &sg::Value::op)
    .def("is_leaf", &sg::Value::is_leaf)
    .def("compute_gradients", &sg::Value::compute_gradients)
    .def("zero_grad", &sg::Value::zero_grad)
    .def("update", &sg::Value::update, py::arg("learning_rate"))
    .def("dump", [](const sg::Value& v){
      std::ostringstream oss;
      v.dump(oss);
      return oss.str();
    })
    .def("__add__",  [](const sg::Value& a, py::object b){ return sg::add(a, as_value(b)); })
    .def("__radd__", [](const sg::Value& a, py::object b){ return sg::add(as_value(b), a); })
    .def("__sub__",  [](const sg::Value& a, py::object b){ return sg::sub(a, as_value(b)); })
    .def("__rsub__", [](const sg::Value& a, py::object b){ return sg::sub(as_value(b), a); })
    .def("__mul__",  [](const sg::Value& a, py::object b){ return sg::mul(a, as_value(b)); })
    .def("__rmul__", [](const sg::Value& a, py::object b){ return sg::mul(as_value(b), a); })
    .def("__pow__",  [](const sg::Value& a, py::object b){ return sg::pow(a, as_value(b)); })
    .def("__repr__", [](const sg::Value& v){
      std::ostringstream oss;
      oss << "Value(value=" << v.value() << ", grad=" << v.grad() << ")";
      return oss.str();
    });

  // --- Graph helpers ---
  m.def("stop_gradient", &sg::stop_gradient, py::arg("x"));
  m.def("detach", &sg::detach, py::arg("x"));

  // --- Ops ---
  m.def("constant", &sg::constant, py::arg("x"));
  m.def("add", &sg::add, py::arg("a"), py::arg("b"));
  m.def("sub", &sg::sub, py::arg("a"), py::arg("b"));
  m.def("mul", &sg::mul, py::arg("a"), py::arg("b"));
  m.def("pow", &sg::pow, py::arg("base"), py::arg("exponent"));
  m.def("squared", &sg::squared, py::arg("x"));
  m.def("relu", &sg::relu, py::arg("x"));
  m.def("sum", &sg::sum, py::arg("xs"));
  m.def("mean", &sg::mean, py::arg("xs"));
}
