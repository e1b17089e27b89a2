/*
 * Copyright 2025 Headlamp Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Headlamp Layered Loader - Header
// Merges defaults, HEADLAMP_CONFIG_* environment and command-line flags

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../core/platform.hpp"
#include "config.hpp"
#include "error.hpp"
#include "options.hpp"

namespace headlamp::config {

// ============================================================================
// Literal parsing (shared by flag parsing and decoding)
// ============================================================================

/// 1 t T TRUE true True / 0 f F FALSE false False
[[nodiscard]] std::optional<bool> parse_bool_literal(std::string_view s) noexcept;

/// Unsigned integer with optional 0x / 0o / 0b prefix; a leading 0 means octal
[[nodiscard]] std::optional<uint64_t> parse_uint_literal(std::string_view s) noexcept;

/// Floating point literal; the whole string must be consumed
[[nodiscard]] std::optional<double> parse_float_literal(std::string_view s) noexcept;

// ============================================================================
// Flag parsing
// ============================================================================

/// Command-line flags after parsing
struct ParsedArgs {
    std::map<std::string, std::string> values;  // Option name -> literal (last occurrence wins)
    std::set<std::string> explicit_keys;        // Exactly the options seen on the command line
    std::vector<std::string> positional;        // Arguments after the first non-flag or "--"
};

/// Parser for -name, --name, -name=value, --name=value and -name value
class FlagParser {
public:
    explicit FlagParser(const OptionSchema& schema) : schema_(schema) {}

    /// Parse arguments (program name already removed)
    /// Fails with ParseError carrying the offending token, or HelpRequested.
    [[nodiscard]] std::optional<ParsedArgs> parse(std::span<const std::string> args,
                                                  ConfigError& error_out) const;

private:
    [[nodiscard]] bool check_literal(const OptionSpec& spec, std::string_view token,
                                     std::string_view value, ConfigError& error_out) const;

    [[nodiscard]] std::string unknown_flag_message(std::string_view name) const;

    const OptionSchema& schema_;
};

// ============================================================================
// Layered merge and decode
// ============================================================================

/// Merged key -> value mapping, low to high precedence already applied
struct MergedValues {
    std::map<std::string, std::string> values;
    std::set<std::string> explicit_keys;       // Options supplied on the command line
    std::vector<std::string> ignored_env;      // HEADLAMP_CONFIG_* variables with no matching option
    std::vector<std::string> positional;       // Leftover command-line arguments
};

/// Layered loader: defaults -> environment -> explicit flags -> typed Config
class LayeredLoader {
public:
    explicit LayeredLoader(const OptionSchema& schema) : schema_(schema) {}

    /// Steps 1-4: defaults, parse flags, environment overlay, re-apply explicit flags
    [[nodiscard]] std::optional<MergedValues> load(std::span<const std::string> args,
                                                   const core::Environment& env,
                                                   ConfigError& error_out) const;

    /// Step 5: convert the merged strings into a typed Config
    /// Fails with DecodeError naming the offending key.
    [[nodiscard]] std::optional<Config> decode(const MergedValues& merged,
                                               ConfigError& error_out) const;

    /// Schema defaults; options without a default are absent
    [[nodiscard]] std::map<std::string, std::string> load_defaults() const;

    /// Overlay HEADLAMP_CONFIG_* variables onto values
    /// Returns the variable names that did not map onto a known option.
    std::vector<std::string> overlay_environment(const core::Environment& env,
                                                 std::map<std::string, std::string>& values) const;

    /// Overlay exactly the explicitly supplied flags onto values
    static void apply_explicit(const ParsedArgs& parsed,
                               std::map<std::string, std::string>& values);

private:
    const OptionSchema& schema_;
};

}  // namespace headlamp::config
