#ifndef IRQMON_HELPERS_ARGS_HPP
#define IRQMON_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flag parsing with optional short aliases and positional
 * arguments. Unknown flags are an error. Cold-path only.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace irqmon {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Long flag string, e.g. "--count"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
  std::string_view alias{}; ///< Short alias, e.g. "-V" (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/// Arguments that are not flags, in command-line order.
using Positionals = std::vector<std::string_view>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * When a flag (or its alias) is matched, the next nargs tokens are consumed
 * literally as its values. Tokens starting with '-' that match no flag are
 * rejected; any other token is appended to positionals.
 *
 * @param args        Argument list (non-owning views; must outlive the call).
 * @param map         Definitions of accepted flags and their requirements.
 * @param pargs       Output map of parsed values (entries are overwritten per key).
 * @param positionals Output list of non-flag tokens.
 * @param error       Optional error message target (set on failure when provided).
 * @return true on success; false on error (and sets error if provided).
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          Positionals& positionals,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) noexcept {
  try {
    std::unordered_map<std::string_view, std::uint8_t> lut;
    lut.reserve(map.size() * 2);
    for (const auto& KV : map) {
      lut.emplace(KV.second.flag, KV.first);
      if (!KV.second.alias.empty()) {
        lut.emplace(KV.second.alias, KV.first);
      }
    }

    std::bitset<256> seen;
    const std::size_t N = args.size();

    for (std::size_t i = 0; i < N; ++i) {
      const std::string_view TOK = args[i];
      auto it = lut.find(TOK);
      if (it == lut.end()) {
        if (TOK.size() > 1 && TOK.front() == '-') {
          if (error) {
            error->get() = fmt::format("Unknown option '{}'", TOK);
          }
          return false;
        }
        positionals.push_back(TOK);
        continue;
      }

      const std::uint8_t KEY = it->second;
      const ArgDef& DEF = map.at(KEY);

      if (i + static_cast<std::size_t>(DEF.nargs) >= N) {
        if (error) {
          error->get() = fmt::format("Argument out of bounds: expected {} values for flag '{}'",
                                     DEF.nargs, DEF.flag);
        }
        return false;
      }

      auto& out = pargs[KEY];
      out.clear();
      for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
        out.push_back(args[i + 1 + k]);
      }

      seen.set(KEY);
      i += DEF.nargs;
    }

    for (const auto& KV : map) {
      if (KV.second.required && !seen.test(KV.first)) {
        if (error) {
          error->get() = fmt::format("Missing required argument '{}'", KV.second.flag);
        }
        return false;
      }
    }
  } catch (const std::exception& e) {
    if (error) {
      error->get() = e.what();
    }
    return false;
  }

  return true;
}

/**
 * @brief Print usage information for a CLI tool.
 * @param progName    Program name (typically argv[0]).
 * @param positional  Positional synopsis appended after [OPTIONS] (may be empty).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 */
inline void printUsage(const char* progName, std::string_view positional,
                       std::string_view description, const ArgMap& map) {
  if (positional.empty()) {
    fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  } else {
    fmt::print("Usage: {} [OPTIONS] {}\n\n", progName, positional);
  }

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  fmt::print("Options:\n");

  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  std::vector<std::string> flagStrs;
  flagStrs.reserve(entries.size());
  std::size_t width = 16;
  for (const ArgDef* def : entries) {
    std::string s;
    if (!def->alias.empty()) {
      s = fmt::format("{}, {}", def->alias, def->flag);
    } else {
      s = fmt::format("    {}", def->flag);
    }
    if (def->nargs == 1) {
      s += " <value>";
    } else if (def->nargs > 1) {
      s += " <value> ...";
    }
    width = std::max(width, s.size());
    flagStrs.push_back(std::move(s));
  }
  width = std::min<std::size_t>(width, 30);

  for (std::size_t i = 0; i < entries.size(); ++i) {
    fmt::print("  {:<{}}  {}", flagStrs[i], width, entries[i]->desc);
    if (entries[i]->required) {
      fmt::print(" (required)");
    }
    fmt::print("\n");
  }
}

} // namespace args
} // namespace helpers
} // namespace irqmon

#endif // IRQMON_HELPERS_ARGS_HPP
