/**
 * @file test_circuit_saver.cpp
 * @brief Tests for writing circuits back to YAML
 */

#include <gtest/gtest.h>

#include <philbrick/io/CircuitBuilder.hpp>
#include <philbrick/io/CircuitLoader.hpp>
#include <philbrick/io/CircuitSaver.hpp>

#include <dynamics/Integrator.hpp>
#include <math/Coefficient.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace philbrick {
namespace {

class CircuitSaverTest : public ::testing::Test {
  protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("philbrick_saver_" +
                 std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                 ".yaml");
    }

    void TearDown() override { std::filesystem::remove(path_); }

    [[nodiscard]] std::string Path() const { return path_.string(); }

  private:
    std::filesystem::path path_;
};

// =============================================================================
// Round trip
// =============================================================================

TEST_F(CircuitSaverTest, SavedCircuitBehavesLikeOriginal) {
    Machine machine(0.5);
    PatchBay bay;
    auto &integ = machine.Add(std::make_unique<components::Integrator>("INT", 1.0, 2.0));
    auto &coef = machine.Add(std::make_unique<components::Coefficient>("COEF", 0.5));
    bay.Connect(coef.Output("out"), integ.Input("in"));

    CircuitSaver::Save(machine, bay, Path(), "roundtrip");

    auto circuit = CircuitBuilder().Build(CircuitLoader::Load(Path()));
    EXPECT_EQ(circuit.name, "roundtrip");
    EXPECT_EQ(circuit.machine.Size(), 2u);
    EXPECT_EQ(circuit.patchbay.Size(), 1u);
    EXPECT_DOUBLE_EQ(circuit.machine.Dt(), 0.5);
    EXPECT_DOUBLE_EQ(circuit.Read("INT.out"), 1.0);

    circuit.Write("COEF.in", 4.0);
    circuit.machine.Step();
    circuit.patchbay.Propagate();
    EXPECT_DOUBLE_EQ(circuit.machine.GetComponent("INT").Input("in").Read(), 2.0);
}

TEST_F(CircuitSaverTest, ParamsSurviveRoundTrip) {
    auto original = CircuitBuilder().Build(CircuitLoader::Parse(R"(
name: params
components:
  - { name: SUM, type: Summer, params: { weights: [1.0, -0.5, 2.0] } }
  - { name: DOT, type: DotProduct, params: { size: 3 } }
  - name: PWL
    type: PiecewiseLinear
    params:
      breakpoints: [[0, 1], [2, 5]]
  - { name: SQ, type: SquareWave, params: { frequency: 50, duty_cycle: 0.1 } }
)"));
    CircuitSaver::Save(CircuitSaver::ToConfig(original), Path());
    auto cfg = CircuitLoader::Load(Path());

    ASSERT_EQ(cfg.components.size(), 4u);
    auto weights = cfg.components[0].Require<std::vector<double>>("weights");
    ASSERT_EQ(weights.size(), 3u);
    EXPECT_DOUBLE_EQ(weights[1], -0.5);
    EXPECT_EQ(cfg.components[1].Require<int>("size"), 3);
    auto table = cfg.components[2].Require<Table>("breakpoints");
    ASSERT_EQ(table.size(), 2u);
    EXPECT_DOUBLE_EQ(table[1].second, 5.0);
    EXPECT_DOUBLE_EQ(cfg.components[3].Require<double>("duty_cycle"), 0.1);

    auto rebuilt = CircuitBuilder().Build(cfg);
    EXPECT_EQ(rebuilt.machine.GetComponent("SUM").Inputs().Size(), 3u);
    EXPECT_EQ(rebuilt.machine.GetComponent("DOT").Inputs().Size(), 6u);
}

TEST_F(CircuitSaverTest, SubcircuitsAreWrittenFlattened) {
    auto original = CircuitBuilder().Build(CircuitLoader::Parse(R"(
name: flat
components:
  - { name: A, type: Constant, params: { value: 1.0 } }
  - { name: B, type: Constant, params: { value: 2.0 } }
  - { name: SM1, type: Softmax }
patches:
  - [A.out, SM1.in0]
  - [B.out, SM1.in1]
scope:
  channels:
    - { source: SM1.DIV0.out, label: p0 }
simulation: { dt: 0.01, steps: 12 }
)"));
    auto cfg = CircuitSaver::ToConfig(original);
    EXPECT_EQ(cfg.components.size(), 7u);
    for (const auto &comp : cfg.components) {
        EXPECT_NE(comp.type, "Softmax");
    }
    // Exposed inputs are written against the internal port
    EXPECT_EQ(cfg.patches.size(), 8u);
    EXPECT_EQ(cfg.patches[6].first, "A.out");
    EXPECT_EQ(cfg.patches[6].second, "SM1.EXP0.in");
    EXPECT_EQ(cfg.simulation.steps, 12);
    ASSERT_EQ(cfg.scope.channels.size(), 1u);

    CircuitSaver::Save(cfg, Path());
    auto reloaded = CircuitBuilder().Build(CircuitLoader::Load(Path()));
    EXPECT_TRUE(reloaded.subcircuits.empty());
    EXPECT_EQ(reloaded.machine.Size(), 7u);

    original.Run(5);
    reloaded.Run(5);
    EXPECT_DOUBLE_EQ(reloaded.Read("SM1.DIV0.out"), original.Read("SM1.out0"));
    EXPECT_DOUBLE_EQ(reloaded.Read("SM1.DIV1.out"), original.Read("SM1.out1"));
}

// =============================================================================
// YAML text
// =============================================================================

TEST_F(CircuitSaverTest, ToYamlHasAllSections) {
    CircuitConfig cfg;
    cfg.name = "text";
    cfg.description = "desc";
    ComponentConfig k{.name = "K", .type = "Coefficient"};
    k.SetScalar("k", 0.25);
    cfg.components.push_back(k);
    cfg.patches.emplace_back("K.out", "K.in");
    cfg.scope.channels.push_back({"K.out", "gain"});

    auto yaml = CircuitSaver::ToYaml(cfg);
    for (const char *needle : {"name: text", "description: desc", "components:", "params:",
                               "k: 0.25", "patches:", "scope:", "label: gain", "simulation:"}) {
        EXPECT_NE(yaml.find(needle), std::string::npos) << needle;
    }

    auto reparsed = CircuitLoader::Parse(yaml);
    EXPECT_EQ(reparsed.name, "text");
    ASSERT_EQ(reparsed.patches.size(), 1u);
    EXPECT_EQ(reparsed.patches[0].second, "K.in");
    EXPECT_EQ(reparsed.scope.channels[0].label, "gain");
}

TEST_F(CircuitSaverTest, ParameterlessComponentHasNoParams) {
    CircuitConfig cfg;
    cfg.name = "bare";
    cfg.components.push_back({.name = "INV", .type = "Inverter"});
    EXPECT_EQ(CircuitSaver::ToYaml(cfg).find("params"), std::string::npos);
}

TEST_F(CircuitSaverTest, UnwritablePathThrows) {
    CircuitConfig cfg;
    cfg.name = "x";
    EXPECT_THROW(CircuitSaver::Save(cfg, "/nonexistent_dir_philbrick/out.yaml"), IOError);
}

} // namespace
} // namespace philbrick
