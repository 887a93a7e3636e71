/**
 * @file LineMatcher.cpp
 * @brief Substring / prefix pattern matching against raw source lines.
 */

#include "src/irq/inc/LineMatcher.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <utility> // std::move

namespace irqmon {

namespace irq {

using irqmon::helpers::strings::splitList;
using irqmon::helpers::strings::startsWith;
using irqmon::helpers::strings::trim;

/* ----------------------------- MatchKind ----------------------------- */

const char* toString(MatchKind kind) noexcept {
  switch (kind) {
  case MatchKind::SUBSTRING:
    return "SUBSTRING";
  case MatchKind::PREFIX:
    return "PREFIX";
  }
  return "UNKNOWN";
}

/* ----------------------------- LinePattern ----------------------------- */

bool LinePattern::matches(std::string_view line) const noexcept {
  if (text.empty()) {
    return false;
  }
  switch (kind) {
  case MatchKind::SUBSTRING:
    return line.find(text) != std::string_view::npos;
  case MatchKind::PREFIX:
    return startsWith(trim(line), text);
  }
  return false;
}

/* ----------------------------- API ----------------------------- */

bool matchesAny(const PatternList& patterns, std::string_view line) noexcept {
  for (const LinePattern& pat : patterns) {
    if (pat.matches(line)) {
      return true;
    }
  }
  return false;
}

PatternList parsePatternList(std::string_view csv) {
  PatternList out;
  for (std::string& field : splitList(csv, ',')) {
    if (field.front() == '^') {
      if (field.size() > 1) {
        out.push_back(LinePattern{field.substr(1), MatchKind::PREFIX});
      }
    } else {
      out.push_back(LinePattern{std::move(field), MatchKind::SUBSTRING});
    }
  }
  return out;
}

} // namespace irq

} // namespace irqmon
