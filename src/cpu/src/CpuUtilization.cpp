/**
 * @file CpuUtilization.cpp
 * @brief Per-core CPU utilization collection from /proc/stat.
 * @note Parses cpuN lines for time breakdown; the aggregate "cpu" line is skipped.
 */

#include "src/cpu/inc/CpuUtilization.hpp"

#include "src/helpers/inc/Cpu.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>    // std::min
#include <array>
#include <charconv>     // std::from_chars
#include <new>          // std::bad_alloc
#include <string>
#include <system_error> // std::errc

namespace irqmon {

namespace cpu {

namespace {

using irqmon::helpers::cpu::getMonotonicNs;
using irqmon::helpers::files::readFileToString;
using irqmon::helpers::strings::splitLines;
using irqmon::helpers::strings::splitWhitespace;
using irqmon::helpers::strings::startsWith;

/// Parse "cpuN user nice system idle iowait irq softirq steal guest guest_nice".
inline bool parseCpuLine(std::string_view line, CpuTimeCounters& out, std::size_t& cpuId) {
  if (!startsWith(line, "cpu") || line.size() < 4 || line[3] < '0' || line[3] > '9') {
    return false;
  }

  const auto TOKS = splitWhitespace(line);
  const std::string_view ID = TOKS[0].substr(3);
  const auto ID_RES = std::from_chars(ID.data(), ID.data() + ID.size(), cpuId);
  if (ID_RES.ec != std::errc{} || ID_RES.ptr != ID.data() + ID.size()) {
    return false;
  }

  // Fewer than 10 fields is OK (older kernels); missing ones stay zero.
  std::array<std::uint64_t, 10> vals{};
  for (std::size_t i = 0; i < vals.size() && i + 1 < TOKS.size(); ++i) {
    const std::string_view TOK = TOKS[i + 1];
    const auto RES = std::from_chars(TOK.data(), TOK.data() + TOK.size(), vals[i]);
    if (RES.ec != std::errc{}) {
      return false;
    }
  }

  out.user = vals[0];
  out.nice = vals[1];
  out.system = vals[2];
  out.idle = vals[3];
  out.iowait = vals[4];
  out.irq = vals[5];
  out.softirq = vals[6];
  out.steal = vals[7];
  out.guest = vals[8];
  out.guestNice = vals[9];
  return true;
}

} // namespace

/* ----------------------------- CpuTimeCounters ----------------------------- */

std::uint64_t CpuTimeCounters::total() const noexcept {
  return user + nice + system + idle + iowait + irq + softirq + steal;
}

/* ----------------------------- API ----------------------------- */

bool parseProcStat(std::string_view text, CpuUtilizationSnapshot& out) noexcept {
  const std::uint64_t TS = out.timestampNs;
  out = CpuUtilizationSnapshot{};
  out.timestampNs = TS;

  try {
    for (const std::string_view LINE : splitLines(text)) {
      CpuTimeCounters counters{};
      std::size_t cpuId = 0;
      if (!parseCpuLine(LINE, counters, cpuId) || cpuId >= STAT_MAX_CPUS) {
        continue;
      }
      out.perCore[cpuId] = counters;
      out.present[cpuId] = true;
      if (cpuId + 1 > out.coreCount) {
        out.coreCount = cpuId + 1;
      }
    }
  } catch (const std::bad_alloc&) {
    return false;
  }

  return out.coreCount > 0;
}

bool getCpuUtilizationSnapshot(const char* path, CpuUtilizationSnapshot& out) noexcept {
  out.timestampNs = getMonotonicNs();
  std::string text;
  if (!readFileToString(path, text)) {
    return false;
  }
  return parseProcStat(text, out);
}

CpuUtilizationPercent computePercent(const CpuTimeCounters& before,
                                     const CpuTimeCounters& after) noexcept {
  CpuUtilizationPercent pct{};

  const std::uint64_t TOTAL_BEFORE = before.total();
  const std::uint64_t TOTAL_AFTER = after.total();
  if (TOTAL_AFTER <= TOTAL_BEFORE) {
    // No time elapsed or counter wrapped
    return pct;
  }

  const double TOTAL_DELTA = static_cast<double>(TOTAL_AFTER - TOTAL_BEFORE);

  auto delta = [&](std::uint64_t b, std::uint64_t a) -> double {
    return (a >= b) ? (static_cast<double>(a - b) * 100.0 / TOTAL_DELTA) : 0.0;
  };

  // mpstat reports %usr and %nice net of guest time.
  const std::uint64_t USER_B = before.user - std::min(before.user, before.guest);
  const std::uint64_t USER_A = after.user - std::min(after.user, after.guest);
  const std::uint64_t NICE_B = before.nice - std::min(before.nice, before.guestNice);
  const std::uint64_t NICE_A = after.nice - std::min(after.nice, after.guestNice);

  pct.user = delta(USER_B, USER_A);
  pct.nice = delta(NICE_B, NICE_A);
  pct.system = delta(before.system, after.system);
  pct.iowait = delta(before.iowait, after.iowait);
  pct.irq = delta(before.irq, after.irq);
  pct.softirq = delta(before.softirq, after.softirq);
  pct.steal = delta(before.steal, after.steal);
  pct.guest = delta(before.guest + before.guestNice, after.guest + after.guestNice);
  pct.idle = delta(before.idle, after.idle);

  return pct;
}

} // namespace cpu

} // namespace irqmon
