/**
 * @file softmax_demo.cpp
 * @brief Softmax and attention built from the template library in code
 *
 * Shows the programmatic path: registry -> machine + patch bay, with no
 * YAML involved. Sweeps the first logit and prints the settled outputs.
 */

#include <philbrick/philbrick.hpp>

#include <sources/Constant.hpp>

#include <iostream>
#include <memory>

using namespace philbrick;

int main() {
    Console console;
    GetLogService().AddSink(LogSinks::ConsoleSink(console));

    try {
        auto registry = ComponentRegistry::WithBuiltins();

        // =====================================================================
        // Softmax sweep
        // =====================================================================

        console.WriteLine(console.Colorize("Softmax(x, 0)", ansi::kBold));
        console.WriteLine(Console::PadLeft("x", 8) + Console::PadLeft("p0", 12) +
                          Console::PadLeft("p1", 12));

        for (double x = -2.0; x <= 2.0; x += 1.0) {
            Machine machine(0.01);
            PatchBay bay;

            auto &logit0 = machine.Add(std::make_unique<components::Constant>("L0", x));
            auto &logit1 = machine.Add(std::make_unique<components::Constant>("L1", 0.0));
            auto sm = registry.Create({.name = "SM", .type = "Softmax"}, machine, bay);

            bay.Connect(logit0.Output("out"), sm->Input("in0"));
            bay.Connect(logit1.Output("out"), sm->Input("in1"));

            // Exp -> Summer -> Divider needs three cycles to settle
            for (int i = 0; i < 4; ++i) {
                bay.Propagate();
                machine.Step();
            }

            const double p0 = sm->Output("out0").Read();
            const double p1 = sm->Output("out1").Read();
            console.WriteLine(Console::PadLeft(Console::FormatNumber(x, 1), 8) +
                              Console::PadLeft(Console::FormatNumber(p0), 12) +
                              Console::PadLeft(Console::FormatNumber(p1), 12));
        }

        // =====================================================================
        // Attention head
        // =====================================================================

        Machine machine(0.01);
        PatchBay bay;
        auto head = registry.Create({.name = "AH", .type = "AttentionHead"}, machine, bay);

        const double q[2] = {1.0, 0.5};
        const double k[2] = {2.0, -1.0};
        head->Input("q0").Write(q[0]);
        head->Input("q1").Write(q[1]);
        head->Input("k0").Write(k[0]);
        head->Input("k1").Write(k[1]);
        head->Input("v").Write(3.0);

        for (int i = 0; i < 4; ++i) {
            bay.Propagate();
            machine.Step();
        }

        console.WriteLine();
        console.WriteLine(console.Colorize("AttentionHead", ansi::kBold));
        console.WriteLine("  q = (1.0, 0.5), k = (2.0, -1.0), v = 3.0");
        console.WriteLine("  out = " + Console::FormatNumber(head->Output("out").Read()) +
                          " (expected " + Console::FormatNumber((q[0] * k[0] + q[1] * k[1]) * 3.0) +
                          ")");
        console.WriteLine("  internals: " + std::to_string(machine.Size()) + " components, " +
                          std::to_string(bay.Size()) + " patches");
    } catch (const Error &e) {
        console.Error(e.what());
        return 1;
    }
    return 0;
}
