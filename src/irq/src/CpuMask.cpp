/**
 * @file CpuMask.cpp
 * @brief CPU mask range encoding and CPU list / hex mask parsing.
 */

#include "src/irq/inc/CpuMask.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <array>
#include <charconv>     // std::from_chars
#include <system_error> // std::errc

#include <fmt/core.h>

namespace irqmon {

namespace irq {

namespace {

using irqmon::helpers::strings::trim;

/// Parse a whole field as an unsigned number in the given base.
inline bool parseWhole(std::string_view s, unsigned base, std::uint64_t& out) noexcept {
  if (s.empty()) {
    return false;
  }
  const char* first = s.data();
  const char* last = s.data() + s.size();
  const auto RES = std::from_chars(first, last, out, static_cast<int>(base));
  return RES.ec == std::errc{} && RES.ptr == last;
}

/// Append one run to the output list.
inline void appendRun(std::string& out, unsigned lo, unsigned hi) {
  if (!out.empty()) {
    out.push_back(',');
  }
  if (lo == hi) {
    out += fmt::format("{}", lo);
  } else {
    out += fmt::format("{}-{}", lo, hi);
  }
}

} // namespace

/* ----------------------------- Encode ----------------------------- */

std::string encodeCpuMask(CpuMask mask) {
  if (mask == 0) {
    return std::string(NONE_TOKEN);
  }

  std::string out;
  unsigned bit = 0;
  while (bit < CPU_MASK_BITS) {
    if ((mask & (CpuMask{1} << bit)) == 0) {
      ++bit;
      continue;
    }
    const unsigned LO = bit;
    while (bit + 1 < CPU_MASK_BITS && (mask & (CpuMask{1} << (bit + 1))) != 0) {
      ++bit;
    }
    appendRun(out, LO, bit);
    ++bit;
  }
  return out;
}

/* ----------------------------- Decode ----------------------------- */

std::optional<CpuMask> decodeCpuList(std::string_view list) noexcept {
  list = trim(list);
  if (list.empty() || list == NONE_TOKEN) {
    return CpuMask{0};
  }

  CpuMask mask = 0;
  std::size_t start = 0;
  while (start <= list.size()) {
    std::size_t comma = list.find(',', start);
    if (comma == std::string_view::npos) {
      comma = list.size();
    }
    const std::string_view FIELD = trim(list.substr(start, comma - start));
    start = comma + 1;

    std::uint64_t lo = 0;
    std::uint64_t hi = 0;
    const std::size_t DASH = FIELD.find('-');
    if (DASH == std::string_view::npos) {
      if (!parseWhole(FIELD, 10, lo)) {
        return std::nullopt;
      }
      hi = lo;
    } else if (!parseWhole(FIELD.substr(0, DASH), 10, lo) ||
               !parseWhole(FIELD.substr(DASH + 1), 10, hi) || lo > hi) {
      return std::nullopt;
    }

    for (std::uint64_t cpu = lo; cpu <= hi && cpu < CPU_MASK_BITS; ++cpu) {
      mask |= CpuMask{1} << cpu;
    }
  }
  return mask;
}

/* ----------------------------- Hex Mask ----------------------------- */

std::optional<CpuMask> parseAffinityHint(std::string_view text) noexcept {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  std::array<std::uint64_t, 2> words{}; // [0] = last group, [1] = the one before
  std::size_t groups = 0;
  bool wide = false;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t comma = text.find(',', start);
    if (comma == std::string_view::npos) {
      comma = text.size();
    }
    const std::string_view FIELD = text.substr(start, comma - start);
    std::uint64_t word = 0;
    if (!parseWhole(FIELD, 16, word)) {
      return std::nullopt;
    }
    wide = wide || word > 0xFFFFFFFFULL;
    words[1] = words[0];
    words[0] = word;
    ++groups;
    start = comma + 1;
  }

  // An ungrouped value is a plain 64-bit mask; grouped words are 32 bits each.
  if (groups == 1) {
    return words[0];
  }
  if (wide) {
    return std::nullopt;
  }
  return (words[1] << 32U) | words[0];
}

} // namespace irq

} // namespace irqmon
