/**
 * @file IrqCollector.cpp
 * @brief /proc/interrupts and /proc/softirqs parsing and delta application.
 * @note Rows are parsed in full before any is applied, so a malformed source
 *       leaves the tables untouched.
 */

#include "src/irq/inc/IrqCollector.hpp"

#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <charconv>     // std::from_chars
#include <cstddef>      // std::ptrdiff_t
#include <system_error> // std::errc
#include <utility>      // std::move

#include <fmt/core.h>

namespace irqmon {

namespace irq {

namespace {

/* ----------------------------- Helpers ----------------------------- */

using irqmon::helpers::files::readFileToString;
using irqmon::helpers::strings::isAllDigits;
using irqmon::helpers::strings::splitLines;
using irqmon::helpers::strings::splitWhitespace;
using irqmon::helpers::strings::startsWith;
using irqmon::helpers::strings::trim;

/// CPU column labels from a header like "           CPU0       CPU1       CPU2"
inline std::vector<std::string_view> parseCpuLabels(std::string_view header) {
  std::vector<std::string_view> labels;
  for (const std::string_view TOK : splitWhitespace(header)) {
    if (!startsWith(TOK, "CPU")) {
      break;
    }
    labels.push_back(TOK);
  }
  return labels;
}

/// Decimal token to counter value.
inline bool parseCount(std::string_view tok, std::uint64_t& out) noexcept {
  const char* last = tok.data() + tok.size();
  const auto RES = std::from_chars(tok.data(), last, out, 10);
  return RES.ec == std::errc{} && RES.ptr == last;
}

/// Parse one row. Format: "<name>: <count> x N [<extra count>...] [desc...]"
inline CollectStatus parseRow(std::string_view line, std::size_t usedCpus,
                              std::size_t extraCols, ParsedRow& out) {
  const std::size_t COLON = line.find(':');
  if (COLON == std::string_view::npos) {
    return CollectStatus::MALFORMED_LINE;
  }
  out.raw = line;
  out.name = trim(line.substr(0, COLON));
  if (out.name.empty()) {
    return CollectStatus::MALFORMED_LINE;
  }

  const std::vector<std::string_view> TOKS = splitWhitespace(line.substr(COLON + 1));
  std::size_t idx = 0;

  out.values.assign(usedCpus, 0);
  std::size_t counts = 0;
  while (counts < usedCpus && idx < TOKS.size() && isAllDigits(TOKS[idx])) {
    if (!parseCount(TOKS[idx], out.values[counts])) {
      return CollectStatus::MALFORMED_LINE;
    }
    ++counts;
    ++idx;
  }

  if (counts < usedCpus) {
    // Kernel-wide counters (ERR:, MIS:) carry one value and nothing else.
    const bool SINGLE_VALUE = (counts == 1 && TOKS.size() == 1);
    if (!SINGLE_VALUE) {
      return CollectStatus::MALFORMED_LINE;
    }
  }

  for (std::size_t skipped = 0;
       skipped < extraCols && idx < TOKS.size() && isAllDigits(TOKS[idx]); ++skipped) {
    ++idx;
  }

  out.desc.assign(TOKS.begin() + static_cast<std::ptrdiff_t>(idx), TOKS.end());
  return CollectStatus::OK;
}

/// Shared body of the two collect functions once the column count is known.
inline CollectResult collectTable(std::string_view text, std::size_t usedCpus, bool firstPass,
                                  const PatternList& exclude, CounterTable& table,
                                  std::vector<TrackedTotal>& tracked) {
  ParsedSource src{};
  const CollectResult RES = parseCounterSource(text, usedCpus, src);
  if (!RES.ok()) {
    return RES;
  }
  applyParsedSource(src, firstPass, exclude, table, tracked);
  return RES;
}

} // namespace

/* ----------------------------- Status ----------------------------- */

const char* toString(CollectStatus status) noexcept {
  switch (status) {
  case CollectStatus::OK:
    return "OK";
  case CollectStatus::SOURCE_UNREADABLE:
    return "SOURCE_UNREADABLE";
  case CollectStatus::MISSING_HEADER:
    return "MISSING_HEADER";
  case CollectStatus::MALFORMED_LINE:
    return "MALFORMED_LINE";
  case CollectStatus::CPU_COUNT_MISMATCH:
    return "CPU_COUNT_MISMATCH";
  case CollectStatus::NO_ONLINE_CPUS:
    return "NO_ONLINE_CPUS";
  }
  return "UNKNOWN";
}

std::string CollectResult::toString() const {
  if (line == 0) {
    return irq::toString(status);
  }
  return fmt::format("{} at line {}", irq::toString(status), line);
}

/* ----------------------------- Parsing ----------------------------- */

CollectResult parseCounterSource(std::string_view text, std::size_t usedCpus,
                                 ParsedSource& out) {
  out = ParsedSource{};

  const std::vector<std::string_view> LINES = splitLines(text);
  if (LINES.empty()) {
    return {CollectStatus::MISSING_HEADER, 1};
  }

  out.headerLabels = parseCpuLabels(LINES[0]);
  out.headerCpus = out.headerLabels.size();
  if (out.headerCpus == 0) {
    return {CollectStatus::MISSING_HEADER, 1};
  }
  if (usedCpus == 0) {
    usedCpus = out.headerCpus;
  }
  if (usedCpus > out.headerCpus) {
    return {CollectStatus::CPU_COUNT_MISMATCH, 1};
  }
  const std::size_t EXTRA = out.headerCpus - usedCpus;

  out.rows.reserve(LINES.size() - 1);
  for (std::size_t i = 1; i < LINES.size(); ++i) {
    if (trim(LINES[i]).empty()) {
      continue;
    }
    ParsedRow row{};
    row.lineNo = i + 1;
    const CollectStatus STATUS = parseRow(LINES[i], usedCpus, EXTRA, row);
    if (STATUS != CollectStatus::OK) {
      return {STATUS, i + 1};
    }
    out.rows.push_back(std::move(row));
  }

  return {};
}

/* ----------------------------- IrqState ----------------------------- */

IrqState IrqState::withTracked(const PatternList& patterns) {
  IrqState state{};
  state.tracked.reserve(patterns.size());
  for (const LinePattern& pat : patterns) {
    state.tracked.push_back(TrackedTotal{pat, 0});
  }
  return state;
}

/* ----------------------------- Collection ----------------------------- */

void applyParsedSource(const ParsedSource& src, bool firstPass, const PatternList& exclude,
                       CounterTable& table, std::vector<TrackedTotal>& tracked) {
  for (const ParsedRow& parsed : src.rows) {
    CounterRow& row = table.row(parsed.name);

    const bool MAY_MARK = !firstPass && !matchesAny(exclude, parsed.raw);
    applySample(row, parsed.values, MAY_MARK);

    row.desc.assign(parsed.desc.begin(), parsed.desc.end());

    // Totals ignore both the warm-up flag and the exclusion list.
    const std::int64_t ROW_DELTA = row.deltaTotal();
    for (TrackedTotal& t : tracked) {
      if (t.pattern.matches(parsed.raw)) {
        t.total += ROW_DELTA;
      }
    }
  }
}

CollectResult collectHardIrqs(std::string_view text, bool firstPass, const PatternList& exclude,
                              IrqState& state) {
  ParsedSource src{};
  const CollectResult RES = parseCounterSource(text, state.onlineCpus, src);
  if (!RES.ok()) {
    return RES;
  }
  if (state.onlineCpus != 0 && src.headerCpus != state.onlineCpus) {
    return {CollectStatus::CPU_COUNT_MISMATCH, 1};
  }
  state.onlineCpus = src.headerCpus;
  state.cpuLabels.assign(src.headerLabels.begin(), src.headerLabels.end());
  applyParsedSource(src, firstPass, exclude, state.hard, state.tracked);
  return RES;
}

CollectResult collectSoftIrqs(std::string_view text, bool firstPass, const PatternList& exclude,
                              IrqState& state) {
  if (state.onlineCpus == 0) {
    return {CollectStatus::NO_ONLINE_CPUS, 0};
  }
  return collectTable(text, state.onlineCpus, firstPass, exclude, state.soft, state.tracked);
}

CollectResult collectHardIrqsFromFile(const char* path, bool firstPass,
                                      const PatternList& exclude, IrqState& state) {
  std::string text;
  if (!readFileToString(path, text)) {
    return {CollectStatus::SOURCE_UNREADABLE, 0};
  }
  return collectHardIrqs(text, firstPass, exclude, state);
}

CollectResult collectSoftIrqsFromFile(const char* path, bool firstPass,
                                      const PatternList& exclude, IrqState& state) {
  std::string text;
  if (!readFileToString(path, text)) {
    return {CollectStatus::SOURCE_UNREADABLE, 0};
  }
  return collectSoftIrqs(text, firstPass, exclude, state);
}

} // namespace irq

} // namespace irqmon
