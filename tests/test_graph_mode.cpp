// tests/test_graph_mode.cpp
#include "test_framework.hpp"
#include "sg/core/value.hpp"
#include "sg/ops/activations.hpp"
#include "sg/ops/arithmetic.hpp"
#include "sg/ops/graph.hpp"
#include "sg/ops/reduce.hpp"

using sg::constant;

TEST("graph/grad_mode_default_on") {
    ASSERT_TRUE(sg::is_grad_enabled());
}

TEST("graph/no_grad_guard_produces_leaves") {
    auto a = constant(2.0), b = constant(3.0);
    {
        sg::NoGradGuard guard;
        ASSERT_TRUE(!sg::is_grad_enabled());
        auto y = sg::relu(sg::sub(sg::mul(a, b), constant(1.0)));
        ASSERT_NEAR(y.value(), 5.0, 0.0);
        ASSERT_TRUE(y.is_leaf());
        ASSERT_TRUE(y.parents().empty());
        y.compute_gradients();
        ASSERT_NEAR(y.grad(), 1.0, 0.0);
        ASSERT_NEAR(a.grad(), 0.0, 0.0);
    }
    ASSERT_TRUE(sg::is_grad_enabled());
    auto z = sg::mul(a, b);
    ASSERT_TRUE(!z.is_leaf());
}

TEST("graph/no_grad_guard_nests") {
    {
        sg::NoGradGuard outer;
        {
            sg::NoGradGuard inner;
            ASSERT_TRUE(!sg::is_grad_enabled());
        }
        // inner restores the outer's setting, not the default
        ASSERT_TRUE(!sg::is_grad_enabled());
    }
    ASSERT_TRUE(sg::is_grad_enabled());
}

TEST("graph/set_grad_enabled_toggles") {
    sg::set_grad_enabled(false);
    auto y = sg::add(constant(1.0), constant(2.0));
    sg::set_grad_enabled(true);
    ASSERT_TRUE(y.is_leaf());
    ASSERT_NEAR(y.value(), 3.0, 0.0);
}

TEST("graph/detach_cuts_the_graph") {
    auto x = constant(4.0);
    auto y = sg::mul(x, x);
    auto d = sg::detach(y);
    ASSERT_TRUE(d.is_leaf());
    ASSERT_TRUE(d.n != y.n);
    ASSERT_NEAR(d.value(), 16.0, 0.0);

    auto z = sg::mul(d, x);
    z.compute_gradients();
    ASSERT_NEAR(x.grad(), 16.0, 0.0);  // only through the direct edge
    ASSERT_NEAR(y.grad(), 0.0, 0.0);

    auto s = sg::stop_gradient(x);
    ASSERT_TRUE(s.is_leaf());
    ASSERT_NEAR(s.value(), 4.0, 0.0);
}

TEST("graph/sum_and_mean") {
    auto a = constant(1.0), b = constant(2.0), c = constant(6.0);
    auto s = sg::sum({a, b, c});
    ASSERT_NEAR(s.value(), 9.0, 0.0);
    auto m = sg::mean({a, b, c});
    ASSERT_NEAR(m.value(), 3.0, 1e-15);
    m.compute_gradients();
    ASSERT_NEAR(a.grad(), 1.0 / 3.0, 1e-15);
    ASSERT_NEAR(c.grad(), 1.0 / 3.0, 1e-15);

    // single element: same handle back
    auto one = sg::sum({a});
    ASSERT_TRUE(one.n == a.n);
}

TEST("graph/sum_is_left_fold") {
    auto a = constant(1.0), b = constant(2.0), c = constant(3.0);
    auto s = sg::sum({a, b, c});
    ASSERT_TRUE(s.op() == sg::Op::Add);
    ASSERT_TRUE(s.parents()[1] == c.n);
    ASSERT_TRUE(s.parents()[0]->parents[0] == a.n);
    ASSERT_TRUE(s.parents()[0]->parents[1] == b.n);
}

TEST("graph/empty_reductions_throw") {
    ASSERT_THROWS((void)sg::sum({}), std::invalid_argument);
    ASSERT_THROWS((void)sg::mean({}), std::invalid_argument);
}
