#ifndef PULSE_HELPERS_ARGS_HPP
#define PULSE_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Command-line flag parsing for pulse tools.
 *
 * Fixed-arity parser: a matched flag consumes the next nargs tokens as its
 * values. Typed getters convert the first value with a fallback default.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <cstdlib> // strtod, strtol
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace pulse {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--threshold"
  std::uint8_t nargs;      ///< Number of values consumed after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output
};

/// Map from key to flag definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse arguments according to a flag map.
 * @param args  Argument list (views must outlive pargs).
 * @param map   Accepted flags.
 * @param pargs Output map; entries are overwritten per key.
 * @param error Set to a message on failure.
 * @return true on success.
 *
 * Unknown tokens are ignored.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::pair<std::uint8_t, const ArgDef*>> byFlag;
  byFlag.reserve(map.size());
  for (const auto& KV : map) {
    byFlag.emplace(KV.second.flag, std::make_pair(KV.first, &KV.second));
  }

  std::bitset<256> seen;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto IT = byFlag.find(args[i]);
    if (IT == byFlag.end()) {
      continue;
    }

    const std::uint8_t KEY = IT->second.first;
    const ArgDef& DEF = *IT->second.second;
    if (i + DEF.nargs >= args.size()) {
      error = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      return false;
    }

    auto& values = pargs[KEY];
    values.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                  args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    seen.set(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      error = fmt::format("Missing required flag '{}'", KV.second.flag);
      return false;
    }
  }
  return true;
}

/// True if the flag was given.
[[nodiscard]] inline bool hasArg(const ParsedArgs& pargs, std::uint8_t key) {
  return pargs.count(key) != 0;
}

/// First value of a flag as a string, or defaultVal.
[[nodiscard]] inline std::string getString(const ParsedArgs& pargs, std::uint8_t key,
                                           std::string_view defaultVal) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::string(defaultVal);
  }
  return std::string(IT->second.front());
}

/// First value of a flag as an integer, or defaultVal if absent or malformed.
[[nodiscard]] inline long getLong(const ParsedArgs& pargs, std::uint8_t key, long defaultVal) {
  const std::string TEXT = getString(pargs, key, "");
  if (TEXT.empty()) {
    return defaultVal;
  }
  char* end = nullptr;
  const long VAL = std::strtol(TEXT.c_str(), &end, 10);
  return (end == TEXT.c_str() || *end != '\0') ? defaultVal : VAL;
}

/// First value of a flag as a double, or defaultVal if absent or malformed.
[[nodiscard]] inline double getDouble(const ParsedArgs& pargs, std::uint8_t key,
                                      double defaultVal) {
  const std::string TEXT = getString(pargs, key, "");
  if (TEXT.empty()) {
    return defaultVal;
  }
  char* end = nullptr;
  const double VAL = std::strtod(TEXT.c_str(), &end);
  return (end == TEXT.c_str() || *end != '\0') ? defaultVal : VAL;
}

/* ----------------------------- Usage ----------------------------- */

/**
 * @brief Print usage for a tool, flags sorted alphabetically.
 * @note Cold-path: Performs I/O.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<const ArgDef*> defs;
  defs.reserve(map.size());
  for (const auto& KV : map) {
    defs.push_back(&KV.second);
  }
  std::sort(defs.begin(), defs.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : defs) {
    const std::string LEFT =
        (def->nargs > 0) ? fmt::format("{} <value>", def->flag) : std::string(def->flag);
    fmt::print("  {:<24}  {}{}\n", LEFT, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace pulse

#endif // PULSE_HELPERS_ARGS_HPP
