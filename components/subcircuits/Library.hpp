#pragma once

/**
 * @file Library.hpp
 * @brief Built-in subcircuit templates
 *
 * Registered by ComponentRegistry::WithBuiltins().
 */

#include <philbrick/sim/Subcircuit.hpp>

namespace philbrick {
namespace components {

/**
 * @brief Two-input softmax: out_i = exp(in_i) / (exp(in0) + exp(in1))
 *
 * Three serial stages (Exp -> Summer -> Divider), so outputs settle after
 * three Propagate/Step cycles.
 */
inline SubcircuitTemplate SoftmaxTemplate() {
    SubcircuitTemplate t;
    t.name = "Softmax";
    t.description = "Two-input softmax: exp(x_i) / sum(exp(x_j))";
    t.inputs = {"in0", "in1"};
    t.outputs = {"out0", "out1"};

    ComponentConfig sum{.name = "SUM", .type = "Summer"};
    sum.SetArray("weights", {1.0, 1.0});

    t.components = {
        {.name = "EXP0", .type = "Exp"}, {.name = "EXP1", .type = "Exp"}, sum,
        {.name = "DIV0", .type = "Divider"}, {.name = "DIV1", .type = "Divider"},
    };
    t.patches = {
        {"EXP0.out", "SUM.in0"},  {"EXP1.out", "SUM.in1"},  {"EXP0.out", "DIV0.num"},
        {"SUM.out", "DIV0.den"},  {"EXP1.out", "DIV1.num"}, {"SUM.out", "DIV1.den"},
    };
    t.input_map = {{"in0", "EXP0.in"}, {"in1", "EXP1.in"}};
    t.output_map = {{"out0", "DIV0.out"}, {"out1", "DIV1.out"}};
    return t;
}

/**
 * @brief Single-query attention: out = (q . k) * v for 2-element q and k
 */
inline SubcircuitTemplate AttentionHeadTemplate() {
    SubcircuitTemplate t;
    t.name = "AttentionHead";
    t.description = "Single-query attention: output = (q . k) * v";
    t.inputs = {"q0", "q1", "k0", "k1", "v"};
    t.outputs = {"out"};

    ComponentConfig dot{.name = "DOT", .type = "DotProduct"};
    dot.SetInteger("size", 2);
    ComponentConfig weight{.name = "WEIGHT", .type = "Coefficient"};
    weight.SetScalar("k", 1.0);

    t.components = {dot, weight, {.name = "MUL", .type = "Multiplier"}};
    t.patches = {{"DOT.out", "WEIGHT.in"}, {"WEIGHT.out", "MUL.x"}};
    t.input_map = {
        {"q0", "DOT.a0"}, {"q1", "DOT.a1"}, {"k0", "DOT.b0"}, {"k1", "DOT.b1"}, {"v", "MUL.y"},
    };
    t.output_map = {{"out", "MUL.out"}};
    return t;
}

} // namespace components
} // namespace philbrick
