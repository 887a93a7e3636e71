/**
 * @file Monitor.cpp
 * @brief Warm-up and reporting cycle over /proc/interrupts and /proc/softirqs.
 */

#include "src/monitor/inc/Monitor.hpp"

#include "src/helpers/inc/Cpu.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/monitor/inc/Presenter.hpp"

#include <charconv>     // std::from_chars
#include <system_error> // std::errc
#include <utility>      // std::move

#include <fmt/core.h>

namespace irqmon {

namespace monitor {

using irqmon::helpers::cpu::getMonotonicNs;
using irqmon::helpers::cpu::NS_PER_SEC;
using irqmon::helpers::strings::isAllDigits;

/* ----------------------------- Config ----------------------------- */

namespace {

/// All-digit token >= 1.
bool parsePositive(std::string_view tok, std::uint64_t& out) noexcept {
  if (!isAllDigits(tok)) {
    return false;
  }
  std::uint64_t value = 0;
  const char* last = tok.data() + tok.size();
  const auto RES = std::from_chars(tok.data(), last, value);
  if (RES.ec != std::errc{} || RES.ptr != last || value < 1) {
    return false;
  }
  out = value;
  return true;
}

} // namespace

bool parseInterval(std::string_view tok, unsigned& out) noexcept {
  std::uint64_t value = 0;
  if (!parsePositive(tok, value) || value > MAX_INTERVAL_SEC) {
    return false;
  }
  out = static_cast<unsigned>(value);
  return true;
}

bool parseCycleCount(std::string_view tok, std::uint64_t& out) noexcept {
  return parsePositive(tok, out);
}

bool applyPositionals(const std::vector<std::string_view>& positionals, MonitorConfig& config,
                      std::string& error) {
  if (positionals.size() > 1) {
    error = fmt::format("Unexpected argument '{}'", positionals[1]);
    return false;
  }
  if (!positionals.empty() && !parseInterval(positionals[0], config.intervalSec)) {
    error = fmt::format("Invalid interval '{}' (seconds, 1-{})", positionals[0],
                        MAX_INTERVAL_SEC);
    return false;
  }
  return true;
}

std::unique_ptr<cpu::CpuStatsSource> makeCpuStatsSource(const MonitorConfig& config) {
  if (config.useMpstat) {
    return std::make_unique<cpu::MpstatCpuStats>();
  }
  return std::make_unique<cpu::ProcStatCpuStats>();
}

/* ----------------------------- Monitor ----------------------------- */

Monitor::Monitor(MonitorConfig config, std::unique_ptr<cpu::CpuStatsSource> cpuStats)
    : config_(std::move(config)), cpuStats_(std::move(cpuStats)),
      state_(irq::IrqState::withTracked(config_.tracked)),
      toolLabel_(fmt::format("{} {}", TOOL_NAME, TOOL_VERSION)), startNs_(getMonotonicNs()) {}

bool Monitor::collect(bool firstPass, std::string& error) {
  const irq::CollectResult HARD = irq::collectHardIrqsFromFile(
      config_.interruptsPath.c_str(), firstPass, config_.exclude, state_);
  if (!HARD.ok()) {
    error = fmt::format("{}: {}", config_.interruptsPath, HARD.toString());
    return false;
  }

  const irq::CollectResult SOFT = irq::collectSoftIrqsFromFile(
      config_.softirqsPath.c_str(), firstPass, config_.exclude, state_);
  if (!SOFT.ok()) {
    error = fmt::format("{}: {}", config_.softirqsPath, SOFT.toString());
    return false;
  }
  return true;
}

bool Monitor::warmUp(std::string& error) {
  if (!collect(true, error)) {
    return false;
  }
  warm_ = true;
  return true;
}

bool Monitor::cycle(std::string& frame, std::string& error) {
  if (!warm_) {
    error = "cycle before warm-up";
    return false;
  }
  if (cpuStats_ == nullptr) {
    error = "no CPU statistics source";
    return false;
  }

  if (!collect(false, error)) {
    return false;
  }

  const cpu::CpuStatsStatus CPU_STATUS = cpuStats_->sample(config_.intervalSec, cpuLines_);
  if (CPU_STATUS != cpu::CpuStatsStatus::OK) {
    error = fmt::format("cpu stats ({}): {}", cpuStats_->name(), cpu::toString(CPU_STATUS));
    return false;
  }

  FrameInfo info{};
  info.tool = toolLabel_;
  info.intervalSec = config_.intervalSec;
  info.elapsedSec =
      static_cast<double>(getMonotonicNs() - startNs_) / static_cast<double>(NS_PER_SEC);

  const std::string& ROOT = config_.procRoot;
  const AffinityLookup LOOKUP = [&ROOT](std::string_view irqName) {
    return irq::readIrqAffinity(ROOT, irqName);
  };

  frame = renderFrame(state_, cpuLines_, info, LOOKUP);
  ++cycles_;
  return true;
}

bool Monitor::run(const std::function<bool()>& keepRunning,
                  const std::function<void(const std::string&)>& sink, std::string& error) {
  std::string frame;
  while (keepRunning() && !done()) {
    if (!cycle(frame, error)) {
      // A sampler killed by the same signal fails; that is a stop, not an error.
      return !keepRunning();
    }
    if (!keepRunning()) {
      break;
    }
    sink(frame);
  }
  return true;
}

bool Monitor::done() const noexcept {
  return config_.maxCycles != 0 && cycles_ >= config_.maxCycles;
}

} // namespace monitor

} // namespace irqmon
