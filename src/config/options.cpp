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

// Headlamp Option Schema - Implementation

#include "options.hpp"

#include <fmt/format.h>

#include "../core/string_utils.hpp"
#include "config.hpp"
#include "paths.hpp"

namespace headlamp::config {

namespace {

OptionSpec make_option(std::string_view name, OptionType type, std::string_view description,
                       std::optional<std::string> default_value) {
    return OptionSpec{std::string{name}, type, std::string{description}, std::move(default_value)};
}

}  // namespace

std::string_view to_string(OptionType type) noexcept {
    switch (type) {
        case OptionType::Bool:
            return "bool";
        case OptionType::String:
            return "string";
        case OptionType::Uint:
            return "uint";
        case OptionType::Float:
            return "float";
    }
    return "string";
}

OptionSchema OptionSchema::build(const core::Platform& platform) {
    using enum OptionType;

    std::vector<OptionSpec> options;
    options.reserve(30);

    // Operational flags
    options.push_back(make_option(option::IN_CLUSTER, Bool,
                                  "Set when running from a k8s cluster", "false"));
    options.push_back(make_option(option::DEV, Bool, "Allow connections from other origins", "false"));
    options.push_back(make_option(option::INSECURE_SSL, Bool,
                                  "Accept/Ignore all server SSL certificates", "false"));
    options.push_back(make_option(option::ENABLE_HELM, Bool, "Enable Helm operations", "false"));
    options.push_back(make_option(
        option::ENABLE_DYNAMIC_CLUSTERS, Bool,
        "Enable dynamic clusters, which stores stateless clusters in the frontend.", "false"));
    // In cluster mode this defaults to false unless given on the command line
    options.push_back(make_option(
        option::WATCH_PLUGINS_CHANGES, Bool,
        "Reloads plugins when there are changes to them or their directory", "true"));

    // Server and paths
    options.push_back(make_option(option::KUBECONFIG, String,
                                  "Absolute path to the kubeconfig file", std::nullopt));
    options.push_back(make_option(option::SKIPPED_KUBE_CONTEXTS, String,
                                  "Context name which should be ignored in kubeconfig file", ""));
    options.push_back(
        make_option(option::HTML_STATIC_DIR, String, "Static HTML directory to serve", ""));
    options.push_back(make_option(option::PLUGINS_DIR, String,
                                  "Specify the plugins directory to build the backend with",
                                  default_plugins_dir(platform)));
    options.push_back(make_option(option::BASE_URL, String, "Base URL path. eg. /headlamp", ""));
    options.push_back(make_option(
        option::LISTEN_ADDR, String,
        "Address to listen on; default is empty, which means listening to any address", ""));
    options.push_back(make_option(option::PORT, Uint, "Port to listen from",
                                  std::to_string(DEFAULT_PORT)));
    options.push_back(
        make_option(option::PROXY_URLS, String, "Allow proxy requests to specified URLs", ""));

    // OIDC
    options.push_back(make_option(option::OIDC_CLIENT_ID, String, "ClientID for OIDC", ""));
    options.push_back(
        make_option(option::OIDC_CLIENT_SECRET, String, "ClientSecret for OIDC", ""));
    options.push_back(make_option(option::OIDC_VALIDATOR_CLIENT_ID, String,
                                  "Override ClientID for OIDC during validation", ""));
    options.push_back(make_option(option::OIDC_IDP_ISSUER_URL, String,
                                  "Identity provider issuer URL for OIDC", ""));
    options.push_back(
        make_option(option::OIDC_VALIDATOR_IDP_ISSUER_URL, String,
                    "Override Identity provider issuer URL for OIDC during validation", ""));
    options.push_back(make_option(option::OIDC_SCOPES, String,
                                  "A comma separated list of scopes needed from the OIDC provider",
                                  "profile,email"));
    options.push_back(
        make_option(option::OIDC_USE_ACCESS_TOKEN, Bool,
                    "Setup oidc to pass through the access_token instead of the default id_token",
                    "false"));

    // Telemetry
    options.push_back(
        make_option(option::SERVICE_NAME, String, "Service name for telemetry", "headlamp"));
    options.push_back(
        make_option(option::SERVICE_VERSION, String, "Service version for telemetry", "0.30.0"));
    options.push_back(
        make_option(option::TRACING_ENABLED, Bool, "Enable distributed tracing", "false"));
    options.push_back(
        make_option(option::METRICS_ENABLED, Bool, "Enable metrics collection", "false"));
    options.push_back(make_option(option::JAEGER_ENDPOINT, String,
                                  "Jaeger collector endpoint for trace export", std::nullopt));
    options.push_back(make_option(option::OTLP_ENDPOINT, String, "OTLP collector endpoint",
                                  "localhost:4317"));
    options.push_back(make_option(option::USE_OTLP_HTTP, Bool,
                                  "Use HTTP instead of gRPC for OTLP export", "false"));
    options.push_back(make_option(option::STDOUT_TRACE_ENABLED, Bool,
                                  "Enable tracing output to stdout", "false"));
    options.push_back(
        make_option(option::SAMPLING_RATE, Float, "Sampling rate for traces", "1.0"));

    return OptionSchema{std::move(options)};
}

const OptionSpec* OptionSchema::find(std::string_view name) const noexcept {
    for (const auto& spec : options_) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

std::vector<std::string> OptionSchema::names() const {
    std::vector<std::string> result;
    result.reserve(options_.size());
    for (const auto& spec : options_) {
        result.push_back(spec.name);
    }
    return result;
}

std::string OptionSchema::usage(std::string_view program) const {
    std::string out = fmt::format("Usage of {}:\n", program);

    for (const auto& spec : options_) {
        // Bool flags take no argument on the command line
        if (spec.type == OptionType::Bool) {
            out += fmt::format("  --{}\n", spec.name);
        } else {
            out += fmt::format("  --{} {}\n", spec.name, to_string(spec.type));
        }

        out += fmt::format("    \t{}", spec.description);

        if (spec.default_value.has_value() && !spec.default_value->empty() &&
            *spec.default_value != "false") {
            if (spec.type == OptionType::String) {
                out += fmt::format(" (default \"{}\")", *spec.default_value);
            } else {
                out += fmt::format(" (default {})", *spec.default_value);
            }
        }

        out += fmt::format(" [env {}{}]\n", ENV_PREFIX, core::option_name_to_env_suffix(spec.name));
    }

    return out;
}

}  // namespace headlamp::config
