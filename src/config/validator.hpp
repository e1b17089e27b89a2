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

// Configuration Validator - Cross-field rules

#pragma once

#include <string>
#include <vector>

#include "config.hpp"

namespace headlamp::config {

/// Configuration validation result
/// At most one error: validation stops at the first violated rule.
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::string failed_option;  // Option named by the violated rule

    void add_error(std::string option, std::string error) {
        valid = false;
        failed_option = std::move(option);
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Cross-field validation of a merged Config
/// Rule order: cluster/OIDC exclusivity, base-url format, tracing checks.
class ConfigValidator {
public:
    /// Validate configuration; pure, no side effects
    [[nodiscard]] static ValidationResult validate(const Config& config);

private:
    /// OIDC client settings are only allowed in cluster mode
    static bool validate_oidc(const Config& config, ValidationResult& result);

    /// base-url is empty or starts with '/'
    static bool validate_base_url(const Config& config, ValidationResult& result);

    /// Service name, exporter and OTLP endpoint requirements when tracing is on
    static bool validate_tracing(const Config& config, ValidationResult& result);

    /// Non-fatal findings, only computed for otherwise valid configs
    static void collect_warnings(const Config& config, ValidationResult& result);
};

}  // namespace headlamp::config
