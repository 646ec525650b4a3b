/**
 * @file oscillator_demo.cpp
 * @brief Damped harmonic oscillator patched by hand
 *
 * x'' = -2*zeta*x' - x, wired the way it would be on a patch panel:
 * two integrators in series with a summing amplifier closing the loop.
 * Saves the patch to YAML and prints the graph summary.
 */

#include <philbrick/philbrick.hpp>

#include <dynamics/Integrator.hpp>
#include <math/Summer.hpp>

#include <iostream>
#include <memory>

using namespace philbrick;
using namespace philbrick::components;

int main(int argc, char *argv[]) {
    std::string save_path = argc > 1 ? argv[1] : "damped_oscillator.yaml";
    const double zeta = 0.1;

    Console console;
    GetLogService().AddSink(LogSinks::ConsoleSink(console));

    try {
        Machine machine(0.001);
        PatchBay bay;

        auto &vel = machine.Add(std::make_unique<Integrator>("VEL", 0.0));
        auto &pos = machine.Add(std::make_unique<Integrator>("POS", 1.0));
        auto &acc = machine.Add(
            std::make_unique<Summer>("ACC", std::vector<double>{-2.0 * zeta, -1.0}));

        bay.Connect(vel.Output("out"), pos.Input("in"));
        bay.Connect(vel.Output("out"), acc.Input("in0"));
        bay.Connect(pos.Output("out"), acc.Input("in1"));
        bay.Connect(acc.Output("out"), vel.Input("in"));

        console.WriteLine(Console::PadLeft("t", 8) + Console::PadLeft("x", 12) +
                          Console::PadLeft("v", 12));
        for (int i = 0; i <= 10000; ++i) {
            if (i % 1000 == 0) {
                const double x = pos.Output("out").Read();
                const double v = vel.Output("out").Read();
                console.WriteLine(Console::PadLeft(Console::FormatNumber(machine.Time(), 2), 8) +
                                  Console::PadLeft(Console::FormatNumber(x), 12) +
                                  Console::PadLeft(Console::FormatNumber(v), 12));
            }
            bay.Propagate();
            machine.Step();
        }

        CircuitSaver::Save(machine, bay, save_path, "damped_oscillator",
                           "x'' = -2*zeta*x' - x with zeta = 0.1");

        auto graph = IntrospectionGraph::Capture(machine, bay, "damped_oscillator").ToJSON();
        console.WriteLine(graph["summary"].dump());
    } catch (const Error &e) {
        console.Error(e.what());
        return 1;
    }
    return 0;
}
