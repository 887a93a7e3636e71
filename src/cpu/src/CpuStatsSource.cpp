/**
 * @file CpuStatsSource.cpp
 * @brief /proc/stat and mpstat CPU statistics sources.
 */

#include "src/cpu/inc/CpuStatsSource.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <sys/wait.h> // WIFEXITED, WEXITSTATUS

#include <algorithm> // std::min
#include <array>
#include <chrono>
#include <cstdio>  // popen, pclose, fgets
#include <cstdlib> // strtod, strtoul
#include <memory>  // std::make_unique
#include <thread>
#include <utility> // std::move

#include <fmt/core.h>

namespace irqmon {

namespace cpu {

namespace {

using irqmon::helpers::strings::isAllDigits;
using irqmon::helpers::strings::splitLines;
using irqmon::helpers::strings::splitWhitespace;
using irqmon::helpers::strings::startsWith;

/// Minimum numeric columns after the CPU id (no %gnice column).
inline constexpr std::size_t MPSTAT_MIN_FIELDS = 9;

/// Parse a whole token as a percentage.
inline bool parsePercent(std::string_view tok, double& out) {
  const std::string S(tok);
  char* end = nullptr;
  out = std::strtod(S.c_str(), &end);
  return end != S.c_str() && *end == '\0';
}

/// Parse one mpstat row into a line. Returns false for non-CPU rows.
inline bool parseMpstatRow(std::string_view row, CpuStatsLine& out) {
  if (startsWith(row, "Average") || startsWith(row, "Linux")) {
    return false;
  }

  const auto TOKS = splitWhitespace(row);
  std::size_t idx = 1; // skip time
  if (idx < TOKS.size() && (TOKS[idx] == "AM" || TOKS[idx] == "PM")) {
    ++idx;
  }
  if (idx >= TOKS.size() || !isAllDigits(TOKS[idx])) {
    return false; // header ("CPU"), "all", or blank
  }
  out.cpu = std::strtoul(std::string(TOKS[idx]).c_str(), nullptr, 10);
  ++idx;

  const std::size_t FIELDS = TOKS.size() - idx;
  if (FIELDS != MPSTAT_MIN_FIELDS && FIELDS != MPSTAT_MIN_FIELDS + 1) {
    return false;
  }

  std::array<double, MPSTAT_MIN_FIELDS + 1> v{};
  for (std::size_t i = 0; i < FIELDS; ++i) {
    if (!parsePercent(TOKS[idx + i], v[i])) {
      return false;
    }
  }

  out.pct.user = v[0];
  out.pct.nice = v[1];
  out.pct.system = v[2];
  out.pct.iowait = v[3];
  out.pct.irq = v[4];
  out.pct.softirq = v[5];
  out.pct.steal = v[6];
  out.pct.guest = v[7];
  // %gnice (if present) sits between %guest and %idle; idle is always last.
  out.pct.idle = v[FIELDS - 1];
  return true;
}

/// pclose() deleter for popen() streams.
struct PipeCloser {
  int* status;
  void operator()(std::FILE* f) const noexcept {
    const int RC = ::pclose(f);
    if (status != nullptr) {
      *status = RC;
    }
  }
};

} // namespace

/* ----------------------------- Status ----------------------------- */

const char* toString(CpuStatsStatus status) noexcept {
  switch (status) {
  case CpuStatsStatus::OK:
    return "OK";
  case CpuStatsStatus::SOURCE_UNREADABLE:
    return "SOURCE_UNREADABLE";
  case CpuStatsStatus::COMMAND_FAILED:
    return "COMMAND_FAILED";
  case CpuStatsStatus::NO_DATA:
    return "NO_DATA";
  }
  return "UNKNOWN";
}

/* ----------------------------- Helpers ----------------------------- */

std::string mpstatCommand(unsigned intervalSec) {
  return fmt::format("LC_ALL=C mpstat -P ALL {} 1 2>/dev/null", intervalSec);
}

std::vector<CpuStatsLine> parseMpstatOutput(std::string_view text) {
  std::vector<CpuStatsLine> out;
  for (const std::string_view ROW : splitLines(text)) {
    CpuStatsLine line{};
    if (parseMpstatRow(ROW, line)) {
      out.push_back(line);
    }
  }
  return out;
}

/* ----------------------------- ProcStatCpuStats ----------------------------- */

ProcStatCpuStats::ProcStatCpuStats(std::string path) : path_(std::move(path)) {}

CpuStatsStatus ProcStatCpuStats::sample(unsigned intervalSec, std::vector<CpuStatsLine>& out) {
  out.clear();

  // Heap: each snapshot is ~20 KiB.
  auto before = std::make_unique<CpuUtilizationSnapshot>();
  auto after = std::make_unique<CpuUtilizationSnapshot>();

  if (!getCpuUtilizationSnapshot(path_.c_str(), *before)) {
    return CpuStatsStatus::SOURCE_UNREADABLE;
  }
  std::this_thread::sleep_for(std::chrono::seconds(intervalSec));
  if (!getCpuUtilizationSnapshot(path_.c_str(), *after)) {
    return CpuStatsStatus::SOURCE_UNREADABLE;
  }

  const std::size_t N = std::min(before->coreCount, after->coreCount);
  for (std::size_t i = 0; i < N; ++i) {
    if (before->present[i] && after->present[i]) {
      out.push_back(CpuStatsLine{i, computePercent(before->perCore[i], after->perCore[i])});
    }
  }
  return out.empty() ? CpuStatsStatus::NO_DATA : CpuStatsStatus::OK;
}

/* ----------------------------- MpstatCpuStats ----------------------------- */

CpuStatsStatus MpstatCpuStats::sample(unsigned intervalSec, std::vector<CpuStatsLine>& out) {
  out.clear();

  const std::string CMD = mpstatCommand(intervalSec);
  std::string output;
  int rc = -1;
  {
    std::unique_ptr<std::FILE, PipeCloser> pipe(::popen(CMD.c_str(), "r"), PipeCloser{&rc});
    if (!pipe) {
      return CpuStatsStatus::COMMAND_FAILED;
    }
    std::array<char, 512> buf{};
    while (std::fgets(buf.data(), static_cast<int>(buf.size()), pipe.get()) != nullptr) {
      output += buf.data();
    }
  }

  if (rc == -1 || !WIFEXITED(rc) || WEXITSTATUS(rc) != 0) {
    return CpuStatsStatus::COMMAND_FAILED;
  }

  out = parseMpstatOutput(output);
  return out.empty() ? CpuStatsStatus::NO_DATA : CpuStatsStatus::OK;
}

} // namespace cpu

} // namespace irqmon
