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

// Config Validator - Implementation

#include "validator.hpp"

#include <sstream>

#include "options.hpp"

namespace headlamp::config {

namespace {

[[nodiscard]] bool non_empty(const std::optional<std::string>& value) {
    return value.has_value() && !value->empty();
}

}  // namespace

ValidationResult ConfigValidator::validate(const Config& config) {
    ValidationResult result;

    if (!validate_oidc(config, result)) {
        return result;
    }

    if (!validate_base_url(config, result)) {
        return result;
    }

    if (!validate_tracing(config, result)) {
        return result;
    }

    collect_warnings(config, result);
    return result;
}

bool ConfigValidator::validate_oidc(const Config& config, ValidationResult& result) {
    if (config.in_cluster || !config.oidc.has_client_settings()) {
        return true;
    }

    result.add_error(std::string{option::OIDC_CLIENT_ID},
                     "oidc-client-id, oidc-client-secret, oidc-idp-issuer-url, "
                     "oidc-validator-client-id, oidc-validator-idp-issuer-url, flags are only "
                     "meant to be used in inCluster mode");
    return false;
}

bool ConfigValidator::validate_base_url(const Config& config, ValidationResult& result) {
    if (config.base_url.empty() || config.base_url.front() == '/') {
        return true;
    }

    result.add_error(std::string{option::BASE_URL},
                     "base-url needs to start with a '/' or be empty");
    return false;
}

bool ConfigValidator::validate_tracing(const Config& config, ValidationResult& result) {
    const auto& telemetry = config.telemetry;

    // Nothing else to check once tracing is known to be off
    if (!telemetry.tracing()) {
        return true;
    }

    if (telemetry.service_name.empty()) {
        result.add_error(std::string{option::SERVICE_NAME},
                         "service-name is required when tracing is enabled");
        return false;
    }

    bool has_exporter = non_empty(telemetry.jaeger_endpoint) ||
                        non_empty(telemetry.otlp_endpoint) ||
                        telemetry.stdout_trace_enabled.value_or(false);
    if (!has_exporter) {
        result.add_error(std::string{option::TRACING_ENABLED},
                         "at least one tracing exporter (jaeger, otlp, or stdout) must be "
                         "configured");
        return false;
    }

    if (telemetry.use_otlp_http.value_or(false) && !non_empty(telemetry.otlp_endpoint)) {
        result.add_error(std::string{option::OTLP_ENDPOINT},
                         "otlp-endpoint must be configured when use-otlp-http is enabled");
        return false;
    }

    return true;
}

void ConfigValidator::collect_warnings(const Config& config, ValidationResult& result) {
    const auto& telemetry = config.telemetry;

    if (telemetry.sampling_rate.has_value() &&
        (*telemetry.sampling_rate < 0.0 || *telemetry.sampling_rate > 1.0)) {
        std::ostringstream msg;
        msg << "sampling-rate " << *telemetry.sampling_rate
            << " is outside [0, 1] and will be clamped by the tracer";
        result.add_warning(msg.str());
    }

    if (config.insecure_ssl && !config.dev_mode) {
        result.add_warning("insecure-ssl disables certificate verification towards clusters");
    }

    if (telemetry.metrics() && telemetry.service_name.empty()) {
        result.add_warning("metrics-enabled without a service-name; metrics will be unlabeled");
    }

    if (!config.oidc.client_id.empty() && config.oidc.idp_issuer_url.empty()) {
        result.add_warning("oidc-client-id is set but oidc-idp-issuer-url is empty");
    }
}

}  // namespace headlamp::config
