// tests/test_nn_mlp.cpp
#include "test_framework.hpp"
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "sg/core/value.hpp"
#include "sg/ops/arithmetic.hpp"
#include "sg/nn/layers/dense.hpp"
#include "sg/nn/layers/neuron.hpp"
#include "sg/core/config.hpp"
#include "sg/nn/mlp.hpp"

using sg::Value;
using sg::constant;
using sg::nn::Dense;
using sg::nn::MLP;
using sg::nn::Neuron;

static std::vector<Value> inputs(std::initializer_list<double> xs) {
    std::vector<Value> out;
    for (double x : xs) out.push_back(constant(x));
    return out;
}

TEST("nn/neuron/weighted_sum_plus_bias") {
    Neuron n(3, /*relu=*/false, 123ull);
    ASSERT_TRUE(n.in_features() == 3);
    ASSERT_TRUE(n.parameters().size() == 4);
    for (auto* p : n.parameters()) {
        ASSERT_TRUE(p->value() >= -1.0 && p->value() < 1.0);
        ASSERT_TRUE(p->is_leaf());
    }

    const auto& w = n.weights();
    const double expect = w[0].value() * 1.0 + w[1].value() * -2.0 + w[2].value() * 0.5 + n.bias().value();
    auto y = n.forward(inputs({1.0, -2.0, 0.5}));
    ASSERT_TRUE(y.size() == 1);
    ASSERT_NEAR(y[0].value(), expect, 1e-12);

    y[0].compute_gradients();
    ASSERT_NEAR(w[0].grad(), 1.0, 0.0);
    ASSERT_NEAR(w[1].grad(), -2.0, 0.0);
    ASSERT_NEAR(w[2].grad(), 0.5, 0.0);
    ASSERT_NEAR(n.bias().grad(), 1.0, 0.0);
}

TEST("nn/neuron/relu_output") {
    Neuron n(1, /*relu=*/true, 5ull);
    ASSERT_TRUE(n.has_relu());
    auto y = n.activate(inputs({3.0}));
    ASSERT_TRUE(y.op() == sg::Op::Relu);
    ASSERT_TRUE(y.value() >= 0.0);
}

TEST("nn/neuron/same_seed_same_init") {
    Neuron a(4, false, 77ull), b(4, false, 77ull), c(4, false, 78ull);
    bool all_same = true, any_diff = false;
    for (std::size_t i = 0; i < 4; ++i) {
        all_same = all_same && (a.weights()[i].value() == b.weights()[i].value());
        any_diff = any_diff || (a.weights()[i].value() != c.weights()[i].value());
    }
    ASSERT_TRUE(all_same);
    ASSERT_TRUE(any_diff);
}

TEST("nn/neuron/input_width_mismatch_throws") {
    Neuron n(2, false, 1ull);
    ASSERT_THROWS((void)n.forward(inputs({1.0})), std::invalid_argument);
    ASSERT_THROWS(Neuron(0), std::invalid_argument);
}

TEST("nn/dense/one_output_per_neuron") {
    Dense d(2, 3, false, 9ull);
    ASSERT_TRUE(d.in_features() == 2 && d.out_features() == 3);
    ASSERT_TRUE(d.parameters().size() == 9);
    auto y = d.forward(inputs({0.5, -1.0}));
    ASSERT_TRUE(y.size() == 3);
    for (std::size_t j = 0; j < 3; ++j) {
        ASSERT_NEAR(y[j].value(), d.neurons()[j]->activate(inputs({0.5, -1.0})).value(), 0.0);
    }
    ASSERT_THROWS((void)d.forward(inputs({0.5})), std::invalid_argument);
    ASSERT_THROWS(Dense(2, 0), std::invalid_argument);
}

TEST("nn/mlp/shapes_and_parameter_count") {
    MLP net({2, 4, 3, 1}, /*hidden_relu=*/true, 11ull);
    ASSERT_TRUE(net.layers.size() == 3);
    // (2+1)*4 + (4+1)*3 + (3+1)*1
    ASSERT_TRUE(net.parameters().size() == 12 + 15 + 4);
    auto y = net.forward(inputs({1.0, 2.0}));
    ASSERT_TRUE(y.size() == 1);
    ASSERT_TRUE(y[0].op() != sg::Op::Relu);  // output layer stays linear
    ASSERT_TRUE(net.layers[0]->neurons()[0]->has_relu());
}

TEST("nn/mlp/named_parameters_paths") {
    MLP net({2, 1}, false, 3ull);
    auto named = net.named_parameters();
    ASSERT_TRUE(named.size() == 3);
    ASSERT_TRUE(named[0].first == "layer0.neuron0.w0");
    ASSERT_TRUE(named[1].first == "layer0.neuron0.w1");
    ASSERT_TRUE(named[2].first == "layer0.neuron0.b");
    ASSERT_TRUE(named[2].second->n == net.layers[0]->neurons()[0]->bias().n);
}

TEST("nn/mlp/neuron_seeds_distinct_across_layers") {
    MLP net({1, 2, 2}, false, 100ull);
    const double a = net.layers[0]->neurons()[0]->weights()[0].value();
    const double b = net.layers[0]->neurons()[1]->weights()[0].value();
    const double c = net.layers[1]->neurons()[0]->weights()[0].value();
    ASSERT_TRUE(a != b);
    ASSERT_TRUE(a != c && b != c);
}

TEST("nn/mlp/omitted_seed_reads_current_default") {
    const auto saved = sg::config::default_seed();
    sg::config::set_default_seed(11);
    MLP a({2, 2, 1});
    sg::config::set_default_seed(12);
    MLP b({2, 2, 1});
    sg::config::set_default_seed(saved);

    MLP a_ref({2, 2, 1}, false, 11ull), b_ref({2, 2, 1}, false, 12ull);
    const auto pa = a.parameters(), pb = b.parameters();
    const auto ra = a_ref.parameters(), rb = b_ref.parameters();
    ASSERT_TRUE(pa.size() == ra.size() && pb.size() == rb.size());
    for (std::size_t i = 0; i < pa.size(); ++i) {
        ASSERT_EQ(pa[i]->value(), ra[i]->value());
        ASSERT_EQ(pb[i]->value(), rb[i]->value());
    }
    ASSERT_TRUE(pa[0]->value() != pb[0]->value());
}

TEST("nn/mlp/bad_sizes_throw") {
    ASSERT_THROWS(MLP({2}), std::invalid_argument);
    ASSERT_THROWS(MLP({}), std::invalid_argument);
    ASSERT_THROWS(MLP({2, 0, 1}), std::invalid_argument);
    MLP net({2, 1}, false, 1ull);
    ASSERT_THROWS((void)net.forward(inputs({1.0, 2.0, 3.0})), std::invalid_argument);
}

TEST("nn/mlp/zero_grad_clears_parameters") {
    MLP net({2, 2, 1}, false, 21ull);
    auto y = net.forward(inputs({1.0, 1.0}));
    y[0].compute_gradients();
    bool any = false;
    for (auto* p : net.parameters()) any = any || p->grad() != 0.0;
    ASSERT_TRUE(any);
    net.zero_grad();
    for (auto* p : net.parameters()) ASSERT_NEAR(p->grad(), 0.0, 0.0);
}

TEST("nn/mlp/dump_lists_layers") {
    MLP net({2, 2, 1}, false, 8ull);
    std::ostringstream oss;
    net.dump(oss);
    const std::string s = oss.str();
    std::size_t layers = 0, neurons = 0;
    for (std::size_t pos = 0; (pos = s.find("layer\n", pos)) != std::string::npos; ++pos) ++layers;
    for (std::size_t pos = 0; (pos = s.find("w=[", pos)) != std::string::npos; ++pos) ++neurons;
    ASSERT_TRUE(layers == 2);
    ASSERT_TRUE(neurons == 3);
    ASSERT_TRUE(s.find("], b=") != std::string::npos);
}

TEST("nn/module/register_null_child_throws") {
    MLP net({1, 1}, false, 1ull);
    ASSERT_THROWS(net.register_module("x", std::shared_ptr<sg::nn::Module>()), std::invalid_argument);
}
