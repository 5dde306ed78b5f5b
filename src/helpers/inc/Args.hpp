#ifndef REBIND_HELPERS_ARGS_HPP
#define REBIND_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Fixed-arity CLI argument parsing for the rebind tools.
 *
 * A flag is declared with the number of values it consumes. Unknown "--" flags
 * are rejected.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace rebind {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--device"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse arguments according to a flag map.
 *
 * @param args   Argument list without argv[0] (views must outlive pargs).
 * @param map    Accepted flags.
 * @param pargs  Output; entries are overwritten when a flag repeats.
 * @param error  Set to a message on failure.
 * @return true on success.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) noexcept {
  try {
    std::unordered_map<std::string_view, std::pair<std::uint8_t, const ArgDef*>> lut;
    lut.reserve(map.size());
    for (const auto& KV : map) {
      lut.emplace(KV.second.flag, std::make_pair(KV.first, &KV.second));
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
      const std::string_view TOK = args[i];
      auto it = lut.find(TOK);
      if (it == lut.end()) {
        if (TOK.size() > 2 && TOK.substr(0, 2) == "--") {
          error = fmt::format("Unknown argument '{}'", TOK);
          return false;
        }
        continue;
      }

      const std::uint8_t KEY = it->second.first;
      const ArgDef& DEF = *it->second.second;
      if (i + DEF.nargs >= args.size()) {
        error = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
        return false;
      }

      std::vector<std::string_view>& out = pargs[KEY];
      out.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                 args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
      i += DEF.nargs;
    }

    for (const auto& KV : map) {
      if (KV.second.required && pargs.count(KV.first) == 0) {
        error = fmt::format("Missing required argument '{}'", KV.second.flag);
        return false;
      }
    }
  } catch (const std::exception& e) {
    error = e.what();
    return false;
  }

  return true;
}

/**
 * @brief First value of a parsed flag, if present.
 */
[[nodiscard]] inline std::optional<std::string_view> firstValue(const ParsedArgs& pargs,
                                                                std::uint8_t key) noexcept {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return IT->second.front();
}

/**
 * @brief Print usage generated from the argument map, sorted by flag.
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
    std::string flagStr(def->flag);
    if (def->nargs > 0) {
      flagStr += " <value>";
    }
    fmt::print("  {:<24}  {}{}\n", flagStr, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace rebind

#endif // REBIND_HELPERS_ARGS_HPP
