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

// Headlamp Configuration Errors - Header
// std::error_code category for configuration resolution failures

#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace headlamp::config {

/// Configuration failure kinds
enum class ConfigErrc {
    HelpRequested = 1,    // -h / --help seen on the command line (not a failure for the CLI)
    ParseError,           // Malformed flag syntax or literal on the command line
    DecodeError,          // Merged string value does not match the option type
    ValidationError,      // Cross-field rule violated
    PathResolutionError,  // No usable directory for a derived path
};

/// Configuration error category for std::error_code
class ConfigErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "config"; }

    [[nodiscard]] std::string message(int ev) const override;
};

/// Get configuration error category instance
[[nodiscard]] const ConfigErrorCategory& config_category() noexcept;

[[nodiscard]] std::error_code make_error_code(ConfigErrc e) noexcept;

/// Failure detail returned through out-parameters alongside std::nullopt
struct ConfigError {
    std::error_code code;
    std::string message;  // Human-readable cause, printed before aborting startup
    std::string key;      // Offending flag token or option name, empty if not applicable

    [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(code); }

    [[nodiscard]] bool is(ConfigErrc e) const noexcept { return code == make_error_code(e); }

    void clear() {
        code.clear();
        message.clear();
        key.clear();
    }
};

/// Build a ConfigError in one expression
[[nodiscard]] ConfigError make_config_error(ConfigErrc e, std::string message,
                                            std::string key = {});

}  // namespace headlamp::config

template <>
struct std::is_error_code_enum<headlamp::config::ConfigErrc> : std::true_type {};
