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

// Headlamp Option Schema - Header
// Registry of every recognized option: name, type, description, default

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/platform.hpp"

namespace headlamp::config {

/// Prefix of environment variables that map onto options
inline constexpr std::string_view ENV_PREFIX = "HEADLAMP_CONFIG_";

/// Option names; flags and HEADLAMP_CONFIG_* suffixes share them
namespace option {
inline constexpr std::string_view IN_CLUSTER = "in-cluster";
inline constexpr std::string_view DEV = "dev";
inline constexpr std::string_view INSECURE_SSL = "insecure-ssl";
inline constexpr std::string_view ENABLE_HELM = "enable-helm";
inline constexpr std::string_view ENABLE_DYNAMIC_CLUSTERS = "enable-dynamic-clusters";
inline constexpr std::string_view WATCH_PLUGINS_CHANGES = "watch-plugins-changes";
inline constexpr std::string_view LISTEN_ADDR = "listen-addr";
inline constexpr std::string_view PORT = "port";
inline constexpr std::string_view KUBECONFIG = "kubeconfig";
inline constexpr std::string_view SKIPPED_KUBE_CONTEXTS = "skipped-kube-contexts";
inline constexpr std::string_view HTML_STATIC_DIR = "html-static-dir";
inline constexpr std::string_view PLUGINS_DIR = "plugins-dir";
inline constexpr std::string_view BASE_URL = "base-url";
inline constexpr std::string_view PROXY_URLS = "proxy-urls";
inline constexpr std::string_view OIDC_CLIENT_ID = "oidc-client-id";
inline constexpr std::string_view OIDC_CLIENT_SECRET = "oidc-client-secret";
inline constexpr std::string_view OIDC_VALIDATOR_CLIENT_ID = "oidc-validator-client-id";
inline constexpr std::string_view OIDC_IDP_ISSUER_URL = "oidc-idp-issuer-url";
inline constexpr std::string_view OIDC_VALIDATOR_IDP_ISSUER_URL = "oidc-validator-idp-issuer-url";
inline constexpr std::string_view OIDC_SCOPES = "oidc-scopes";
inline constexpr std::string_view OIDC_USE_ACCESS_TOKEN = "oidc-use-access-token";
inline constexpr std::string_view SERVICE_NAME = "service-name";
inline constexpr std::string_view SERVICE_VERSION = "service-version";
inline constexpr std::string_view TRACING_ENABLED = "tracing-enabled";
inline constexpr std::string_view METRICS_ENABLED = "metrics-enabled";
inline constexpr std::string_view JAEGER_ENDPOINT = "jaeger-endpoint";
inline constexpr std::string_view OTLP_ENDPOINT = "otlp-endpoint";
inline constexpr std::string_view USE_OTLP_HTTP = "use-otlp-http";
inline constexpr std::string_view STDOUT_TRACE_ENABLED = "stdout-trace-enabled";
inline constexpr std::string_view SAMPLING_RATE = "sampling-rate";
}  // namespace option

/// Value type of an option
enum class OptionType {
    Bool,
    String,
    Uint,
    Float,
};

[[nodiscard]] std::string_view to_string(OptionType type) noexcept;

/// One row of the option table
struct OptionSpec {
    std::string name;
    OptionType type = OptionType::String;
    std::string description;
    std::optional<std::string> default_value;  // nullopt = no default, option starts unset
};

/// Static option table
/// Seeds the first merge pass and drives help text.
class OptionSchema {
public:
    explicit OptionSchema(std::vector<OptionSpec> options) : options_(std::move(options)) {}

    /// Build the full table. Computing the plugins-dir default may create that
    /// directory; failure leaves the default empty.
    [[nodiscard]] static OptionSchema build(const core::Platform& platform);

    /// Lookup by option name, nullptr if not recognized
    [[nodiscard]] const OptionSpec* find(std::string_view name) const noexcept;

    /// All options in declaration order
    [[nodiscard]] const std::vector<OptionSpec>& options() const noexcept { return options_; }

    /// Option names in declaration order
    [[nodiscard]] std::vector<std::string> names() const;

    /// Help text listing every option with its type, default, and environment variable
    [[nodiscard]] std::string usage(std::string_view program) const;

private:
    std::vector<OptionSpec> options_;
};

}  // namespace headlamp::config
