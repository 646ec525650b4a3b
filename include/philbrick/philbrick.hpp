#pragma once

/**
 * @file philbrick.hpp
 * @brief Umbrella header for the Philbrick analog computer kernel
 *
 * Include this header to get access to all Philbrick public APIs.
 */

// Core
#include <philbrick/core/Component.hpp>
#include <philbrick/core/ComponentConfig.hpp>
#include <philbrick/core/ComponentRegistry.hpp>
#include <philbrick/core/Config.hpp>
#include <philbrick/core/Error.hpp>
#include <philbrick/core/ErrorLogging.hpp>
#include <philbrick/core/PortRef.hpp>

// Signal
#include <philbrick/signal/PatchBay.hpp>
#include <philbrick/signal/Port.hpp>
#include <philbrick/signal/Signal.hpp>

// Simulation
#include <philbrick/sim/Machine.hpp>
#include <philbrick/sim/Subcircuit.hpp>

// I/O
#include <philbrick/io/CircuitBuilder.hpp>
#include <philbrick/io/CircuitConfig.hpp>
#include <philbrick/io/CircuitLoader.hpp>
#include <philbrick/io/CircuitSaver.hpp>
#include <philbrick/io/Console.hpp>
#include <philbrick/io/CsvRecorder.hpp>
#include <philbrick/io/LogService.hpp>
#include <philbrick/io/Recorder.hpp>
#include <philbrick/io/data/IntrospectionGraph.hpp>

namespace philbrick {

/// Library version
inline constexpr const char *kVersion = "0.1.0";

} // namespace philbrick
