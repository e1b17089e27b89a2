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

// Headlamp Config Resolver - Header
// Entry point: argument list + environment + platform -> validated Config

#pragma once

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../core/platform.hpp"
#include "config.hpp"
#include "error.hpp"
#include "options.hpp"
#include "validator.hpp"

namespace headlamp::config {

/// Resolves the server configuration once at startup
///
/// Pipeline: defaults -> flags (explicit set recorded) -> HEADLAMP_CONFIG_* environment
/// -> explicit flags re-applied -> decode -> conditional overrides -> validate
/// -> kubeconfig derivation.
///
/// The environment and platform are explicit inputs so resolution can be tested
/// without touching the real process state.
class ConfigResolver {
public:
    /// Builds the option schema, which may create the default plugins directory
    ConfigResolver(core::Environment env, const core::Platform& platform);

    /// Resolve from the full process argument list; argv[0] is the program name and skipped
    /// @param error_out Set on failure; no partial Config is ever returned
    [[nodiscard]] std::optional<Config> resolve(std::span<const std::string> argv,
                                                ConfigError& error_out) const;

    /// Convenience overload for main()
    [[nodiscard]] std::optional<Config> resolve(int argc, const char* const* argv,
                                                ConfigError& error_out) const;

    /// Mode-dependent corrections; never touches explicitly supplied values
    /// In cluster mode, watch-plugins-changes is forced off unless given on the command line.
    static void apply_conditional_overrides(Config& config);

    [[nodiscard]] const OptionSchema& schema() const noexcept { return schema_; }

    /// Warnings from the last successful validation
    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    core::Environment env_;
    const core::Platform& platform_;
    OptionSchema schema_;
    mutable ValidationResult last_validation_;
};

}  // namespace headlamp::config
