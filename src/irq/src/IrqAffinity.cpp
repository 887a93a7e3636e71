/**
 * @file IrqAffinity.cpp
 * @brief Reads /proc/irq/<n>/affinity_hint and smp_affinity_list.
 */

#include "src/irq/inc/IrqAffinity.hpp"

#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <fmt/core.h>

namespace irqmon {

namespace irq {

using irqmon::helpers::files::readFileToString;
using irqmon::helpers::strings::isAllDigits;
using irqmon::helpers::strings::trim;

std::string IrqAffinity::toString() const {
  const std::string HINT = hint ? encodeCpuMask(*hint) : std::string(NONE_TOKEN);
  const std::string_view AFF = list ? std::string_view(*list) : NONE_TOKEN;
  return fmt::format("hint={},aff={}", HINT, AFF);
}

IrqAffinity readIrqAffinity(std::string_view procRoot, std::string_view irqName) {
  IrqAffinity out{};
  if (!isAllDigits(irqName)) {
    return out;
  }

  std::string buf;

  const std::string HINT_PATH = fmt::format("{}/irq/{}/affinity_hint", procRoot, irqName);
  if (readFileToString(HINT_PATH.c_str(), buf)) {
    out.hint = parseAffinityHint(buf);
  }

  const std::string LIST_PATH = fmt::format("{}/irq/{}/smp_affinity_list", procRoot, irqName);
  if (readFileToString(LIST_PATH.c_str(), buf)) {
    const std::string_view TRIMMED = trim(buf);
    if (!TRIMMED.empty()) {
      out.list = std::string(TRIMMED);
    }
  }

  return out;
}

} // namespace irq

} // namespace irqmon
