/**
 * @file Presenter.cpp
 * @brief Text rendering of counter deltas, CPU utilization and totals.
 */

#include "src/monitor/inc/Presenter.hpp"

#include <algorithm> // std::max, std::stable_sort

#include <fmt/core.h>

namespace irqmon {

namespace monitor {

namespace {

/// Minimum width of the row-name column.
inline constexpr std::size_t MIN_NAME_WIDTH = 8;

/// Width of one per-CPU delta column.
inline constexpr std::size_t DELTA_WIDTH = 10;

/// Widest changed-row name across both tables.
std::size_t nameWidthFor(const irq::IrqState& state) noexcept {
  std::size_t width = MIN_NAME_WIDTH;
  for (const irq::CounterTable* table : {&state.hard, &state.soft}) {
    for (const auto& KV : *table) {
      if (KV.second.everChanged) {
        width = std::max(width, KV.first.size() + 1);
      }
    }
  }
  return width;
}

/// Changed rows of both tables merged by name; hardware first on equal names.
std::vector<const irq::CounterRow*> changedRows(const irq::IrqState& state) {
  std::vector<const irq::CounterRow*> rows;
  rows.reserve(state.hard.changedCount() + state.soft.changedCount());
  for (const irq::CounterTable* table : {&state.hard, &state.soft}) {
    for (const auto& KV : *table) {
      if (KV.second.everChanged) {
        rows.push_back(&KV.second);
      }
    }
  }
  std::stable_sort(rows.begin(), rows.end(),
                   [](const irq::CounterRow* a, const irq::CounterRow* b) {
                     return a->name < b->name;
                   });
  return rows;
}

/// Column label for CPU index @p cpu.
std::string cpuLabel(const irq::IrqState& state, std::size_t cpu) {
  if (cpu < state.cpuLabels.size()) {
    return state.cpuLabels[cpu];
  }
  return fmt::format("CPU{}", cpu);
}

} // namespace

/* ----------------------------- Summary ----------------------------- */

TrackedSummary summarizeTracked(std::int64_t total, std::size_t onlineCpus,
                                unsigned intervalSec) noexcept {
  TrackedSummary s{};
  s.total = total;
  const double T = static_cast<double>(total);
  if (onlineCpus != 0) {
    s.perCpu = T / static_cast<double>(onlineCpus);
  }
  if (intervalSec != 0) {
    s.perSec = T / static_cast<double>(intervalSec);
  }
  if (onlineCpus != 0 && intervalSec != 0) {
    s.perSecPerCpu = s.perSec / static_cast<double>(onlineCpus);
  }
  return s;
}

/* ----------------------------- Rendering ----------------------------- */

std::string renderRow(const irq::CounterRow& row, std::size_t nameWidth,
                      std::string_view affinity) {
  std::string out = fmt::format("{:>{}}", row.name + ":", nameWidth);
  for (const std::int64_t D : row.delta) {
    out += fmt::format(" {:>{}}", D, DELTA_WIDTH);
  }
  if (!row.desc.empty()) {
    out += "  ";
    out += row.descText();
  }
  if (!affinity.empty()) {
    out += "  ";
    out += affinity;
  }
  return out;
}

std::string renderCpuTable(const std::vector<cpu::CpuStatsLine>& lines) {
  std::string out = fmt::format("{:>5} {:>7} {:>7} {:>7} {:>7} {:>7} {:>7} {:>7} {:>7} {:>7}\n",
                                "CPU", "%usr", "%nice", "%sys", "%iowait", "%irq", "%soft",
                                "%steal", "%guest", "%idle");
  for (const cpu::CpuStatsLine& L : lines) {
    const cpu::CpuUtilizationPercent& P = L.pct;
    out += fmt::format(
        "{:>5} {:>7.2f} {:>7.2f} {:>7.2f} {:>7.2f} {:>7.2f} {:>7.2f} {:>7.2f} {:>7.2f} {:>7.2f}\n",
        L.cpu, P.user, P.nice, P.system, P.iowait, P.irq, P.softirq, P.steal, P.guest, P.idle);
  }
  return out;
}

std::string renderSummary(const std::vector<irq::TrackedTotal>& tracked, std::size_t onlineCpus,
                          unsigned intervalSec) {
  std::string out;
  for (const irq::TrackedTotal& t : tracked) {
    const TrackedSummary S = summarizeTracked(t.total, onlineCpus, intervalSec);
    out += fmt::format("{}: total={} avg/cpu={:.1f} total/s={:.1f} avg/s/cpu={:.1f}\n",
                       t.pattern.text, S.total, S.perCpu, S.perSec, S.perSecPerCpu);
  }
  return out;
}

std::string renderFrame(const irq::IrqState& state,
                        const std::vector<cpu::CpuStatsLine>& cpuLines, const FrameInfo& info,
                        const AffinityLookup& affinity) {
  std::string out = fmt::format("{}  interval {}s  elapsed {:.0f}s  cpus {}\n\n", info.tool,
                                info.intervalSec, info.elapsedSec, state.onlineCpus);

  out += renderCpuTable(cpuLines);
  out.push_back('\n');

  const std::size_t WIDTH = nameWidthFor(state);
  out += fmt::format("{:>{}}", "", WIDTH);
  for (std::size_t cpu = 0; cpu < state.onlineCpus; ++cpu) {
    out += fmt::format(" {:>{}}", cpuLabel(state, cpu), DELTA_WIDTH);
  }
  out.push_back('\n');

  for (const irq::CounterRow* row : changedRows(state)) {
    std::string aff;
    if (affinity && row->isNumeric()) {
      aff = affinity(row->name).toString();
    }
    out += renderRow(*row, WIDTH, aff);
    out.push_back('\n');
  }

  if (!state.tracked.empty()) {
    out.push_back('\n');
    out += renderSummary(state.tracked, state.onlineCpus, info.intervalSec);
  }
  return out;
}

} // namespace monitor

} // namespace irqmon
