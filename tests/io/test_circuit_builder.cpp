/**
 * @file test_circuit_builder.cpp
 * @brief Tests for building circuits from declarations
 */

#include <gtest/gtest.h>

#include <philbrick/io/CircuitBuilder.hpp>
#include <philbrick/io/CircuitLoader.hpp>
#include <philbrick/io/LogService.hpp>

#include <cmath>
#include <string>
#include <vector>

namespace philbrick {
namespace {

class CircuitBuilderTest : public ::testing::Test {
  protected:
    void SetUp() override {
        GetLogService().ClearSinks();
        GetLogService().ResetErrorCount();
        GetLogService().AddSink(LogSinks::Collect(log));
    }

    void TearDown() override { GetLogService().ClearSinks(); }

    CircuitErrorKind BuildFailure(const std::string &yaml) {
        auto cfg = CircuitLoader::Parse(yaml);
        try {
            (void)builder.Build(cfg);
        } catch (const CircuitError &e) {
            return e.kind();
        }
        ADD_FAILURE() << "Expected CircuitError";
        return CircuitErrorKind::UnknownType;
    }

    CircuitBuilder builder;
    std::vector<LogEntry> log;
};

// =============================================================================
// Successful builds
// =============================================================================

TEST_F(CircuitBuilderTest, BuildsPrimitivesAndPatches) {
    auto circuit = builder.Build(CircuitLoader::Parse(R"(
name: chain
components:
  - { name: SRC, type: Constant, params: { value: 5 } }
  - { name: C1, type: Coefficient, params: { k: 2 } }
  - { name: C2, type: Coefficient, params: { k: 3 } }
patches:
  - [SRC.out, C1.in]
  - [C1.out, C2.in]
simulation: { dt: 0.1 }
)"));
    EXPECT_EQ(circuit.name, "chain");
    EXPECT_EQ(circuit.machine.Size(), 3u);
    EXPECT_EQ(circuit.patchbay.Size(), 2u);
    EXPECT_DOUBLE_EQ(circuit.machine.Dt(), 0.1);

    circuit.Tick();
    EXPECT_DOUBLE_EQ(circuit.Read("C1.out"), 10.0);
    EXPECT_DOUBLE_EQ(circuit.Read("C2.out"), 0.0);
    circuit.Tick();
    EXPECT_DOUBLE_EQ(circuit.Read("C2.out"), 30.0);
    EXPECT_DOUBLE_EQ(circuit.machine.Time(), 0.2);
}

TEST_F(CircuitBuilderTest, LogsSuccessfulBuild) {
    (void)builder.Build(CircuitLoader::Parse("name: empty\n"));
    ASSERT_FALSE(log.empty());
    EXPECT_NE(log.back().message.find("Built circuit 'empty'"), std::string::npos);
}

TEST_F(CircuitBuilderTest, WriteDrivesInputs) {
    auto circuit = builder.Build(CircuitLoader::Parse(R"(
name: w
components:
  - { name: INV, type: Inverter }
)"));
    circuit.Write("INV.in", 4.0);
    circuit.Tick();
    EXPECT_DOUBLE_EQ(circuit.Read("INV.out"), -4.0);
    EXPECT_DOUBLE_EQ(circuit.Read("INV.in"), 4.0);
    EXPECT_THROW(circuit.Write("INV.out", 1.0), CircuitError);
}

TEST_F(CircuitBuilderTest, BuiltinSubcircuitIsExpanded) {
    auto circuit = builder.Build(CircuitLoader::Parse(R"(
name: soft
components:
  - { name: A, type: Constant, params: { value: 1.0 } }
  - { name: B, type: Constant, params: { value: 2.0 } }
  - { name: SM1, type: Softmax }
patches:
  - [A.out, SM1.in0]
  - [B.out, SM1.in1]
)"));
    EXPECT_EQ(circuit.machine.Size(), 7u);
    EXPECT_EQ(circuit.subcircuits.size(), 1u);
    EXPECT_EQ(circuit.machine.FindComponent("SM1"), nullptr);
    EXPECT_NE(circuit.FindComponent("SM1"), nullptr);

    circuit.Run(5);
    double p0 = circuit.Read("SM1.out0");
    double p1 = circuit.Read("SM1.out1");
    EXPECT_NEAR(p0, 1.0 / (1.0 + std::exp(1.0)), 1e-3);
    EXPECT_NEAR(p0 + p1, 1.0, 1e-3);

    // Flattened internals are addressable too
    EXPECT_NEAR(circuit.Read("SM1.SUM.out"), std::exp(1.0) + std::exp(2.0), 1e-9);
}

TEST_F(CircuitBuilderTest, InlineSubcircuitsAreScopedToCircuit) {
    auto circuit = builder.Build(CircuitLoader::Parse(R"(
name: scoped
subcircuits:
  Negate:
    inputs: [in]
    outputs: [out]
    components:
      - { name: N, type: Inverter }
  Twice:
    inputs: [in]
    outputs: [out]
    components:
      - { name: A, type: Negate }
      - { name: B, type: Negate }
    patches:
      - [A.out, B.in]
    input_map: { in: A.in }
    output_map: { out: B.out }
components:
  - { name: T, type: Twice }
)"));
    EXPECT_TRUE(circuit.registry.IsSubcircuit("Twice"));
    EXPECT_FALSE(builder.Registry().HasType("Twice"));

    EXPECT_EQ(circuit.machine.Size(), 2u);
    EXPECT_NE(circuit.machine.FindComponent("T.A.N"), nullptr);

    // Nested wrappers resolve by their dotted instance name
    Component *inner = circuit.FindComponent("T.A");
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->TypeName(), "Negate");

    circuit.Write("T.in", 3.0);
    circuit.Run(2);
    EXPECT_DOUBLE_EQ(circuit.Read("T.out"), 3.0);
    EXPECT_DOUBLE_EQ(circuit.Read("T.A.out"), -3.0);
}

TEST_F(CircuitBuilderTest, ResetRestoresInitialState) {
    auto circuit = builder.Build(CircuitLoader::Parse(R"(
name: r
components:
  - { name: ONE, type: Constant }
  - { name: INT, type: Integrator, params: { initial: 2.0 } }
patches:
  - [ONE.out, INT.in]
simulation: { dt: 0.5 }
)"));
    circuit.Run(4);
    EXPECT_DOUBLE_EQ(circuit.Read("INT.out"), 4.0);
    circuit.Reset();
    EXPECT_DOUBLE_EQ(circuit.machine.Time(), 0.0);
    EXPECT_DOUBLE_EQ(circuit.Read("INT.out"), 2.0);
}

TEST_F(CircuitBuilderTest, ResolvePortUsesLastDot) {
    auto circuit = builder.Build(CircuitLoader::Parse(R"(
name: r
components:
  - { name: SM1, type: Softmax }
)"));
    Port &exp_out = circuit.ResolvePort("SM1.EXP0.out", PortDirection::Output);
    EXPECT_EQ(exp_out.Owner(), "SM1.EXP0");
    Port &exposed = circuit.ResolvePort("SM1.in0", PortDirection::Input);
    EXPECT_EQ(exposed.FullName(), "SM1.EXP0.in");
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(CircuitBuilderTest, UnknownTypeFails) {
    EXPECT_EQ(BuildFailure("name: x\ncomponents:\n  - { name: A, type: Flux }\n"),
              CircuitErrorKind::UnknownType);
    EXPECT_EQ(GetLogService().ErrorCount(), 1u);
}

TEST_F(CircuitBuilderTest, UnknownComponentInPatchFails) {
    EXPECT_EQ(BuildFailure(R"(
name: x
components:
  - { name: A, type: Inverter }
patches:
  - [A.out, B.in]
)"),
              CircuitErrorKind::UnknownComponent);
}

TEST_F(CircuitBuilderTest, UnknownPortInPatchFails) {
    EXPECT_EQ(BuildFailure(R"(
name: x
components:
  - { name: A, type: Inverter }
  - { name: B, type: Inverter }
patches:
  - [A.out, B.bogus]
)"),
              CircuitErrorKind::UnknownPort);
}

TEST_F(CircuitBuilderTest, InputUsedAsSourceFails) {
    EXPECT_EQ(BuildFailure(R"(
name: x
components:
  - { name: A, type: Inverter }
  - { name: B, type: Inverter }
patches:
  - [A.in, B.in]
)"),
              CircuitErrorKind::UnknownPort);
}

TEST_F(CircuitBuilderTest, MalformedPatchFails) {
    EXPECT_EQ(BuildFailure(R"(
name: x
components:
  - { name: A, type: Inverter }
patches:
  - [Aout, A.in]
)"),
              CircuitErrorKind::MalformedReference);
}

TEST_F(CircuitBuilderTest, BadParameterFails) {
    EXPECT_EQ(BuildFailure(R"(
name: x
components:
  - { name: A, type: Inverter, params: { gain: 2 } }
)"),
              CircuitErrorKind::ParameterMismatch);
}

TEST_F(CircuitBuilderTest, UnresolvableScopeChannelFails) {
    EXPECT_EQ(BuildFailure(R"(
name: x
components:
  - { name: A, type: Inverter }
scope:
  channels: [A.nothing]
)"),
              CircuitErrorKind::UnknownPort);
}

TEST_F(CircuitBuilderTest, CyclicInlineSubcircuitsFail) {
    EXPECT_EQ(BuildFailure(R"(
name: x
subcircuits:
  Ping:
    components: [{ name: P, type: Pong }]
  Pong:
    components: [{ name: P, type: Ping }]
)"),
              CircuitErrorKind::CyclicTemplate);
}

TEST_F(CircuitBuilderTest, SubcircuitShadowingBuiltinFails) {
    EXPECT_EQ(BuildFailure(R"(
name: x
subcircuits:
  Softmax:
    components: [{ name: E, type: Exp }]
)"),
              CircuitErrorKind::DuplicateRegistration);
}

TEST_F(CircuitBuilderTest, SubcircuitInstanceNameClashFails) {
    auto cfg = CircuitLoader::Parse(R"(
name: x
components:
  - { name: SM1, type: Softmax }
)");
    ComponentConfig clash{.name = "SM1", .type = "Inverter"};
    cfg.components.push_back(clash);
    EXPECT_THROW((void)builder.Build(cfg), ConfigError);
}

TEST_F(CircuitBuilderTest, ParamShapeMismatchFails) {
    EXPECT_EQ(BuildFailure(R"(
name: x
components:
  - { name: SUM, type: Summer, params: { weights: 3.0 } }
)"),
              CircuitErrorKind::ParameterMismatch);
    EXPECT_EQ(BuildFailure(R"(
name: x
components:
  - { name: PWL, type: PiecewiseLinear, params: { breakpoints: [0.0, 5.0] } }
)"),
              CircuitErrorKind::ParameterMismatch);
    EXPECT_EQ(BuildFailure(R"(
name: x
components:
  - { name: DOT, type: DotProduct, params: { size: 1e30 } }
)"),
              CircuitErrorKind::ParameterMismatch);
}

TEST_F(CircuitBuilderTest, ExpandedNameTakenByEarlierPrimitiveFails) {
    auto cfg = CircuitLoader::Parse(R"(
name: x
components:
  - { name: SM1.EXP0, type: Constant }
  - { name: SM1, type: Softmax }
)");
    EXPECT_THROW((void)builder.Build(cfg), ConfigError);
}

TEST_F(CircuitBuilderTest, NestedInstanceNameTakenByEarlierPrimitiveFails) {
    auto cfg = CircuitLoader::Parse(R"(
name: x
subcircuits:
  Negate:
    inputs: [in]
    outputs: [out]
    components:
      - { name: N, type: Inverter }
  Twice:
    inputs: [in]
    outputs: [out]
    components:
      - { name: A, type: Negate }
      - { name: B, type: Negate }
    patches:
      - [A.out, B.in]
    input_map: { in: A.in }
    output_map: { out: B.out }
components:
  - { name: T.A, type: Inverter }
  - { name: T, type: Twice }
)");
    EXPECT_THROW((void)builder.Build(cfg), ConfigError);
}

TEST_F(CircuitBuilderTest, CustomBaseRegistry) {
    ComponentRegistry primitives_only;
    CircuitBuilder bare(primitives_only);
    auto cfg = CircuitLoader::Parse("name: x\ncomponents:\n  - { name: SM1, type: Softmax }\n");
    EXPECT_THROW((void)bare.Build(cfg), CircuitError);
}

} // namespace
} // namespace philbrick
