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

// Headlamp Config Resolver - Implementation

#include "resolver.hpp"

#include "../core/logging.hpp"
#include "loader.hpp"
#include "paths.hpp"

namespace headlamp::config {

ConfigResolver::ConfigResolver(core::Environment env, const core::Platform& platform)
    : env_(std::move(env)), platform_(platform), schema_(OptionSchema::build(platform)) {}

std::optional<Config> ConfigResolver::resolve(int argc, const char* const* argv,
                                              ConfigError& error_out) const {
    std::vector<std::string> args;
    if (argv != nullptr) {
        args.reserve(static_cast<size_t>(argc > 0 ? argc : 0));
        for (int i = 0; i < argc; ++i) {
            args.emplace_back(argv[i] != nullptr ? argv[i] : "");
        }
    }
    return resolve(args, error_out);
}

std::optional<Config> ConfigResolver::resolve(std::span<const std::string> argv,
                                              ConfigError& error_out) const {
    auto* logger = logging::get_current_logger();

    std::span<const std::string> args = argv.empty() ? argv : argv.subspan(1);

    LayeredLoader loader{schema_};

    auto merged = loader.load(args, env_, error_out);
    if (!merged.has_value()) {
        return std::nullopt;
    }

    auto config = loader.decode(*merged, error_out);
    if (!config.has_value()) {
        return std::nullopt;
    }

    apply_conditional_overrides(*config);

    ValidationResult validation = ConfigValidator::validate(*config);
    if (validation.has_errors()) {
        error_out = make_config_error(ConfigErrc::ValidationError, validation.errors.front(),
                                      validation.failed_option);
        if (logger) {
            LOG_ERROR(logger, "validating config: {}", error_out.message);
        }
        return std::nullopt;
    }

    if (logger) {
        for (const auto& warning : validation.warnings) {
            LOG_WARNING(logger, "config: {}", warning);
        }
    }
    last_validation_ = std::move(validation);

    if (!resolve_kubeconfig(*config, env_, platform_, error_out)) {
        if (logger) {
            LOG_ERROR(logger, "resolving kubeconfig path: {}", error_out.message);
        }
        return std::nullopt;
    }

    return config;
}

void ConfigResolver::apply_conditional_overrides(Config& config) {
    if (config.in_cluster && !config.watch_plugins_changes.is_explicit()) {
        config.watch_plugins_changes.override_default(false);
    }
}

}  // namespace headlamp::config
