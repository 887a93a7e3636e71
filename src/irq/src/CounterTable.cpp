/**
 * @file CounterTable.cpp
 * @brief CounterRow delta bookkeeping and the name-ordered row table.
 */

#include "src/irq/inc/CounterTable.hpp"

#include "src/helpers/inc/Strings.hpp"

namespace irqmon {

namespace irq {

using irqmon::helpers::strings::isAllDigits;

/* ----------------------------- CounterRow ----------------------------- */

bool CounterRow::isNumeric() const noexcept { return isAllDigits(name); }

std::int64_t CounterRow::deltaTotal() const noexcept {
  std::int64_t sum = 0;
  for (const std::int64_t D : delta) {
    sum += D;
  }
  return sum;
}

std::string CounterRow::descText() const {
  std::string out;
  for (const std::string& tok : desc) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += tok;
  }
  return out;
}

bool applySample(CounterRow& row, std::span<const std::uint64_t> values, bool mayMarkChanged) {
  const std::size_t N = values.size();
  row.current.resize(N, 0);
  row.delta.resize(N, 0);

  bool anyDelta = false;
  for (std::size_t cpu = 0; cpu < N; ++cpu) {
    // Unsigned subtraction then reinterpretation keeps counter resets signed.
    const std::int64_t D = static_cast<std::int64_t>(values[cpu] - row.current[cpu]);
    row.delta[cpu] = D;
    row.current[cpu] = values[cpu];
    anyDelta = anyDelta || (D != 0);
  }

  if (mayMarkChanged && anyDelta) {
    row.everChanged = true;
  }
  return anyDelta;
}

/* ----------------------------- CounterTable ----------------------------- */

CounterRow& CounterTable::row(std::string_view name) {
  auto it = rows_.find(name);
  if (it == rows_.end()) {
    it = rows_.emplace(std::string(name), CounterRow{}).first;
    it->second.name = it->first;
  }
  return it->second;
}

const CounterRow* CounterTable::find(std::string_view name) const noexcept {
  const auto IT = rows_.find(name);
  return (IT == rows_.end()) ? nullptr : &IT->second;
}

std::size_t CounterTable::changedCount() const noexcept {
  std::size_t n = 0;
  for (const auto& KV : rows_) {
    if (KV.second.everChanged) {
      ++n;
    }
  }
  return n;
}

} // namespace irq

} // namespace irqmon
