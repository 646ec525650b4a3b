/**
 * @file run_circuit.cpp
 * @brief Batch runner: load a circuit file, run it, report the scope
 *
 * Usage: philbrick_run <circuit.yaml> [--steps N] [--dt S] [--output out.csv]
 *                      [--graph graph.json] [--quiet]
 *
 * Command line parsing is CLI11; --dt and --steps override the file's
 * simulation section.
 *
 * Every scope channel is recorded after each tick. Without --output the
 * run still prints a final/min/max summary per channel.
 */

#include <philbrick/philbrick.hpp>

#include <CLI/CLI.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace philbrick;

namespace {

struct Options {
    std::string circuit_path;
    std::optional<int64_t> steps; ///< unset: use the file's simulation.steps
    std::optional<double> dt;     ///< unset: use the file's simulation.dt
    std::string output_path;
    std::string graph_path;
    bool quiet = false;
};

struct ChannelStats {
    std::string label;
    const Port *port;
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();

    void Sample() {
        double v = port->Read();
        min = std::min(min, v);
        max = std::max(max, v);
    }
};

void PrintSummary(const Console &console, const Circuit &circuit,
                  const std::vector<ChannelStats> &stats) {
    console.WriteLine();
    console.WriteLine(console.Colorize("Circuit: " + circuit.name, ansi::kBold));
    console.WriteLine("  Components: " + std::to_string(circuit.machine.Size()) +
                      "  Patches: " + std::to_string(circuit.patchbay.Size()) +
                      "  Time: " + Console::FormatNumber(circuit.machine.Time()) + " s");

    if (stats.empty()) {
        console.WriteLine("  (no scope channels)");
        return;
    }

    std::size_t width = 8;
    for (const auto &s : stats) {
        width = std::max(width, s.label.size() + 2);
    }

    console.WriteLine(Console::Rule(width + 42));
    console.WriteLine(Console::PadRight("Channel", width) + Console::PadLeft("Final", 14) +
                      Console::PadLeft("Min", 14) + Console::PadLeft("Max", 14));
    console.WriteLine(Console::Rule(width + 42));
    for (const auto &s : stats) {
        console.WriteLine(Console::PadRight(s.label, width) +
                          Console::PadLeft(Console::FormatNumber(s.port->Read()), 14) +
                          Console::PadLeft(Console::FormatNumber(s.min), 14) +
                          Console::PadLeft(Console::FormatNumber(s.max), 14));
    }
    console.WriteLine(Console::Rule(width + 42));
}

} // namespace

int main(int argc, char *argv[]) {
    Options opts;

    CLI::App app{"philbrick_run - patch-programmable analog computer"};
    app.set_version_flag("-V,--version", std::string("philbrick ") + kVersion);
    app.add_option("circuit", opts.circuit_path, "Circuit file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-n,--steps", opts.steps, "Number of ticks (overrides simulation.steps)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--dt", opts.dt, "Time step in seconds (overrides simulation.dt)")
        ->check(CLI::PositiveNumber);
    app.add_option("-o,--output", opts.output_path, "Write scope channels to this CSV file");
    app.add_option("-g,--graph", opts.graph_path, "Write the circuit graph to this JSON file");
    app.add_flag("-q,--quiet", opts.quiet, "Warnings and errors only, no summary");

    CLI11_PARSE(app, argc, argv);

    Console console;
    auto &log = GetLogService();
    log.AddSink(LogSinks::ConsoleSink(console));
    log.SetMinLevel(opts.quiet ? LogLevel::Warning : LogLevel::Info);

    try {
        auto config = CircuitLoader::Load(opts.circuit_path);
        if (opts.dt) {
            config.simulation.dt = *opts.dt;
        }
        if (opts.steps) {
            config.simulation.steps = *opts.steps;
        }

        Circuit circuit = CircuitBuilder().Build(config);

        if (!opts.graph_path.empty()) {
            IntrospectionGraph::Capture(circuit).ToJSONFile(opts.graph_path);
            PHILBRICK_LOG_INFO(0.0, "Wrote circuit graph to " + opts.graph_path);
        }

        std::vector<ChannelStats> stats;
        CsvRecorder recorder;
        for (const auto &channel : circuit.scope.channels) {
            const Port &port = circuit.ResolveAny(channel.source);
            stats.push_back({channel.DisplayLabel(), &port});
            recorder.AddChannel(channel.DisplayLabel(), port);
        }

        bool recording = !opts.output_path.empty();
        if (recording) {
            recorder.Open(opts.output_path);
        }

        PHILBRICK_LOG_EVENT(0.0, "Running " + std::to_string(circuit.simulation.steps) +
                                     " steps at dt = " +
                                     Console::FormatNumber(circuit.machine.Dt(), 6));
        {
            LogService::BufferedScope buffered(log);
            for (int64_t i = 0; i < circuit.simulation.steps; ++i) {
                circuit.Tick();
                for (auto &s : stats) {
                    s.Sample();
                }
                if (recording) {
                    recorder.Record(circuit.machine.Time());
                }
            }
        }

        if (recording) {
            recorder.Close();
            PHILBRICK_LOG_INFO(circuit.machine.Time(),
                               "Wrote " + std::to_string(recorder.RowCount()) + " rows to " +
                                   opts.output_path);
        }

        if (!opts.quiet) {
            PrintSummary(console, circuit, stats);
        }
    } catch (const Error &e) {
        // Load and build failures have already reached the console sink
        if (log.ErrorCount() == 0) {
            console.Error(e.what());
        }
        return 1;
    }

    return 0;
}
