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

// Headlamp Configuration - Header
// Resolved server configuration and its JSON representation

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "tracked.hpp"

namespace headlamp::config {

/// Default server port
inline constexpr uint16_t DEFAULT_PORT = 4466;

/// OIDC settings, only meaningful in cluster mode
struct OidcConfig {
    std::string client_id;
    std::string client_secret;
    std::string idp_issuer_url;
    std::string validator_client_id;       // Overrides client_id during token validation
    std::string validator_idp_issuer_url;  // Overrides idp_issuer_url during token validation
    std::string scopes = "profile,email";  // Comma separated
    bool use_access_token = false;         // Pass through access_token instead of id_token

    /// Any of the user/password-style fields set
    [[nodiscard]] bool has_client_settings() const noexcept {
        return !client_id.empty() || !client_secret.empty() || !idp_issuer_url.empty() ||
               !validator_client_id.empty() || !validator_idp_issuer_url.empty();
    }

    [[nodiscard]] std::vector<std::string> scope_list() const;

    bool operator==(const OidcConfig&) const = default;
};

/// Telemetry settings
/// nullopt means "not configured", which validation treats differently from a zero value.
struct TelemetryConfig {
    std::string service_name = "headlamp";
    std::optional<std::string> service_version;
    std::optional<bool> tracing_enabled;
    std::optional<bool> metrics_enabled;
    std::optional<std::string> jaeger_endpoint;
    std::optional<std::string> otlp_endpoint;
    std::optional<bool> use_otlp_http;
    std::optional<bool> stdout_trace_enabled;
    std::optional<double> sampling_rate;

    [[nodiscard]] bool tracing() const noexcept { return tracing_enabled.value_or(false); }
    [[nodiscard]] bool metrics() const noexcept { return metrics_enabled.value_or(false); }

    bool operator==(const TelemetryConfig&) const = default;
};

/// Fully resolved server configuration
/// Built once at startup by ConfigResolver and read-only afterwards.
struct Config {
    // Operational flags
    bool in_cluster = false;
    bool dev_mode = false;
    bool insecure_ssl = false;  // Skip TLS certificate verification towards clusters
    bool enable_helm = false;
    bool enable_dynamic_clusters = false;
    Tracked<bool> watch_plugins_changes;

    // Network
    std::string listen_addr;  // Empty = any address
    uint16_t port = DEFAULT_PORT;

    // Paths and lists
    Tracked<std::string> kubeconfig;
    std::string skipped_kube_contexts;  // Comma separated context names
    std::string static_dir;
    std::string plugins_dir;
    std::string base_url;    // Empty or starts with '/'
    std::string proxy_urls;  // Comma separated

    OidcConfig oidc;
    TelemetryConfig telemetry;

    [[nodiscard]] std::vector<std::string> proxy_url_list() const;
    [[nodiscard]] std::vector<std::string> skipped_kube_context_list() const;

    bool operator==(const Config&) const = default;
};

// ============================================================================
// to_json functions
// ============================================================================

namespace detail {

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    if (!value.has_value()) {
        return nullptr;
    }
    return nlohmann::json(*value);
}

}  // namespace detail

inline void to_json(nlohmann::json& j, const OidcConfig& o) {
    j = nlohmann::json{{"oidc-client-id", o.client_id},
                       {"oidc-client-secret", o.client_secret},
                       {"oidc-idp-issuer-url", o.idp_issuer_url},
                       {"oidc-validator-client-id", o.validator_client_id},
                       {"oidc-validator-idp-issuer-url", o.validator_idp_issuer_url},
                       {"oidc-scopes", o.scopes},
                       {"oidc-use-access-token", o.use_access_token}};
}

inline void to_json(nlohmann::json& j, const TelemetryConfig& t) {
    j = nlohmann::json{{"service-name", t.service_name},
                       {"service-version", detail::optional_to_json(t.service_version)},
                       {"tracing-enabled", detail::optional_to_json(t.tracing_enabled)},
                       {"metrics-enabled", detail::optional_to_json(t.metrics_enabled)},
                       {"jaeger-endpoint", detail::optional_to_json(t.jaeger_endpoint)},
                       {"otlp-endpoint", detail::optional_to_json(t.otlp_endpoint)},
                       {"use-otlp-http", detail::optional_to_json(t.use_otlp_http)},
                       {"stdout-trace-enabled", detail::optional_to_json(t.stdout_trace_enabled)},
                       {"sampling-rate", detail::optional_to_json(t.sampling_rate)}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{{"in-cluster", c.in_cluster},
                       {"dev", c.dev_mode},
                       {"insecure-ssl", c.insecure_ssl},
                       {"enable-helm", c.enable_helm},
                       {"enable-dynamic-clusters", c.enable_dynamic_clusters},
                       {"watch-plugins-changes", c.watch_plugins_changes.value()},
                       {"listen-addr", c.listen_addr},
                       {"port", c.port},
                       {"kubeconfig", c.kubeconfig.value()},
                       {"skipped-kube-contexts", c.skipped_kube_contexts},
                       {"html-static-dir", c.static_dir},
                       {"plugins-dir", c.plugins_dir},
                       {"base-url", c.base_url},
                       {"proxy-urls", c.proxy_urls}};
    j["oidc"] = c.oidc;
    j["telemetry"] = c.telemetry;
}

/// Render the configuration as indented JSON
/// Secrets are masked unless redact_secrets is false.
[[nodiscard]] std::string format_config(const Config& config, bool redact_secrets = true);

}  // namespace headlamp::config
