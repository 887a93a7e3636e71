/**
 * @file irqmon.cpp
 * @brief Live monitor of interrupt and softirq activity per CPU.
 *
 * Every interval: prints per-CPU utilization, the rows of /proc/interrupts and
 * /proc/softirqs whose counters have moved since start (with IRQ affinity for
 * numbered vectors), and running totals for tracked patterns.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/irq/inc/LineMatcher.hpp"
#include "src/monitor/inc/Monitor.hpp"

#include <csignal>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace args = irqmon::helpers::args;
namespace mon = irqmon::monitor;

namespace {

/* ----------------------------- Signal Handling ----------------------------- */

volatile std::sig_atomic_t g_running = 1;

void signalHandler(int /*signum*/) { g_running = 0; }

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_VERSION = 1,
  ARG_EXCLUDE = 2,
  ARG_TRACK = 3,
  ARG_COUNT = 4,
  ARG_MPSTAT = 5,
  ARG_NO_CLEAR = 6,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Live interrupt monitor.\n"
    "Shows per-CPU deltas of /proc/interrupts and /proc/softirqs rows that have\n"
    "changed since start, IRQ affinity, CPU utilization and tracked totals.";

/// Positional synopsis for --help.
constexpr std::string_view POSITIONAL = "[interval]";

/// ANSI home + clear screen.
constexpr std::string_view CLEAR_SCREEN = "\033[H\033[2J";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message", "-h"};
  map[ARG_VERSION] = {"--version", 0, false, "Print version and exit", "-V"};
  map[ARG_EXCLUDE] = {"--exclude", 1, false,
                      "Comma-separated patterns never reported as changed (^ = prefix)"};
  map[ARG_TRACK] = {"--track", 1, false,
                    "Comma-separated patterns whose deltas are totalled (^ = prefix)"};
  map[ARG_COUNT] = {"--count", 1, false, "Number of frames (default: until interrupted)"};
  map[ARG_MPSTAT] = {"--mpstat", 0, false, "Use mpstat for CPU statistics"};
  map[ARG_NO_CLEAR] = {"--no-clear", 0, false, "Do not clear the screen between frames"};
  return map;
}

/// Print error and usage, return exit code.
int usageError(const char* prog, std::string_view msg, const args::ArgMap& map) {
  fmt::print(stderr, "Error: {}\n\n", msg);
  args::printUsage(prog, POSITIONAL, DESCRIPTION, map);
  return 1;
}

/* ----------------------------- Main Loop ----------------------------- */

int runMonitor(mon::MonitorConfig config) {
  const bool CLEAR = config.clearScreen;
  auto cpuStats = mon::makeCpuStatsSource(config);
  mon::Monitor monitor(std::move(config), std::move(cpuStats));

  std::string error;
  if (!monitor.warmUp(error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }

  const auto KEEP_RUNNING = [] { return g_running != 0; };
  const auto PRINT_FRAME = [CLEAR](const std::string& frame) {
    if (CLEAR) {
      fmt::print("{}", CLEAR_SCREEN);
    }
    fmt::print("{}", frame);
    std::fflush(stdout);
  };
  if (!monitor.run(KEEP_RUNNING, PRINT_FRAME, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }

  return 0;
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;
  args::Positionals positionals;
  mon::MonitorConfig config{};

  try {
    std::vector<std::string_view> argList;
    argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
    for (int i = 1; i < argc; ++i) {
      argList.emplace_back(argv[i]);
    }

    std::string error;
    if (!args::parseArgs(argList, ARG_MAP, pargs, positionals, error)) {
      return usageError(argv[0], error, ARG_MAP);
    }

    if (pargs.count(ARG_HELP) != 0) {
      args::printUsage(argv[0], POSITIONAL, DESCRIPTION, ARG_MAP);
      return 0;
    }

    if (pargs.count(ARG_VERSION) != 0) {
      fmt::print("{} {}\n", mon::TOOL_NAME, mon::TOOL_VERSION);
      return 0;
    }

    if (!mon::applyPositionals(positionals, config, error)) {
      return usageError(argv[0], error, ARG_MAP);
    }

    if (pargs.count(ARG_COUNT) != 0) {
      const std::string_view TOK = pargs[ARG_COUNT][0];
      if (!mon::parseCycleCount(TOK, config.maxCycles)) {
        return usageError(argv[0], fmt::format("Invalid count '{}' (must be >= 1)", TOK),
                          ARG_MAP);
      }
    }

    if (pargs.count(ARG_EXCLUDE) != 0) {
      config.exclude = irqmon::irq::parsePatternList(pargs[ARG_EXCLUDE][0]);
    }
    if (pargs.count(ARG_TRACK) != 0) {
      config.tracked = irqmon::irq::parsePatternList(pargs[ARG_TRACK][0]);
    }
    config.useMpstat = (pargs.count(ARG_MPSTAT) != 0);
    config.clearScreen = (pargs.count(ARG_NO_CLEAR) == 0);

    return runMonitor(std::move(config));
  } catch (const std::exception& e) {
    fmt::print(stderr, "Error: {}\n", e.what());
    return 1;
  }
}
