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

// Headlamp Layered Loader - Implementation

#include "loader.hpp"

#include <fmt/format.h>

#include <charconv>
#include <limits>
#include <system_error>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace headlamp::config {

namespace {

// Edit distance allowed when suggesting a known flag for a mistyped one
constexpr size_t MAX_SUGGESTION_DISTANCE = 2;

/// Typed view over MergedValues
/// Records the first failure only; later getters become no-ops.
class Decoder {
public:
    Decoder(const MergedValues& merged, ConfigError& error_out)
        : merged_(merged), error_out_(error_out) {}

    [[nodiscard]] bool failed() const noexcept { return failed_; }

    [[nodiscard]] bool is_explicit(std::string_view key) const {
        return merged_.explicit_keys.contains(std::string{key});
    }

    std::optional<std::string> get_string(std::string_view key) {
        const std::string* raw = find(key);
        if (raw == nullptr) {
            return std::nullopt;
        }
        return *raw;
    }

    std::optional<bool> get_bool(std::string_view key) {
        const std::string* raw = find(key);
        if (raw == nullptr) {
            return std::nullopt;
        }
        if (raw->empty()) {
            return false;
        }
        auto value = parse_bool_literal(*raw);
        if (!value.has_value()) {
            fail(key, fmt::format("cannot parse '{}' as bool for '{}'", *raw, key));
        }
        return value;
    }

    std::optional<uint64_t> get_uint(std::string_view key, uint64_t max_value) {
        const std::string* raw = find(key);
        if (raw == nullptr) {
            return std::nullopt;
        }
        if (raw->empty()) {
            return 0;
        }
        auto value = parse_uint_literal(*raw);
        if (!value.has_value()) {
            fail(key, fmt::format("cannot parse '{}' as uint for '{}'", *raw, key));
            return std::nullopt;
        }
        if (*value > max_value) {
            fail(key, fmt::format("value {} out of range for '{}' (max {})", *value, key,
                                  max_value));
            return std::nullopt;
        }
        return value;
    }

    std::optional<double> get_float(std::string_view key) {
        const std::string* raw = find(key);
        if (raw == nullptr) {
            return std::nullopt;
        }
        if (raw->empty()) {
            return 0.0;
        }
        auto value = parse_float_literal(*raw);
        if (!value.has_value()) {
            fail(key, fmt::format("cannot parse '{}' as float for '{}'", *raw, key));
        }
        return value;
    }

    template <typename T>
    Tracked<T> tracked(std::string_view key, const std::optional<T>& value) {
        if (!value.has_value()) {
            return Tracked<T>::unset();
        }
        if (is_explicit(key)) {
            return Tracked<T>::explicit_value(*value);
        }
        return Tracked<T>::defaulted(*value);
    }

private:
    const std::string* find(std::string_view key) const {
        if (failed_) {
            return nullptr;
        }
        auto it = merged_.values.find(std::string{key});
        return it == merged_.values.end() ? nullptr : &it->second;
    }

    void fail(std::string_view key, std::string message) {
        if (failed_) {
            return;
        }
        failed_ = true;
        error_out_ = make_config_error(ConfigErrc::DecodeError,
                                       fmt::format("error unmarshal config: {}", message),
                                       std::string{key});
    }

    const MergedValues& merged_;
    ConfigError& error_out_;
    bool failed_ = false;
};

template <typename T, typename U>
void assign(T& field, const std::optional<U>& value) {
    if (value.has_value()) {
        field = static_cast<T>(*value);
    }
}

}  // namespace

// ============================================================================
// Literal parsing
// ============================================================================

std::optional<bool> parse_bool_literal(std::string_view s) noexcept {
    if (s == "1" || s == "t" || s == "T" || s == "TRUE" || s == "true" || s == "True") {
        return true;
    }
    if (s == "0" || s == "f" || s == "F" || s == "FALSE" || s == "false" || s == "False") {
        return false;
    }
    return std::nullopt;
}

std::optional<uint64_t> parse_uint_literal(std::string_view s) noexcept {
    if (s.empty()) {
        return std::nullopt;
    }

    int base = 10;
    if (s.size() > 1 && s[0] == '0') {
        char prefix = s[1];
        if (prefix == 'x' || prefix == 'X') {
            base = 16;
            s.remove_prefix(2);
        } else if (prefix == 'o' || prefix == 'O') {
            base = 8;
            s.remove_prefix(2);
        } else if (prefix == 'b' || prefix == 'B') {
            base = 2;
            s.remove_prefix(2);
        } else {
            base = 8;
            s.remove_prefix(1);
        }
        if (s.empty()) {
            return std::nullopt;
        }
    }

    uint64_t value = 0;
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value, base);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_float_literal(std::string_view s) noexcept {
    // from_chars rejects an explicit plus sign
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
        if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
            return std::nullopt;
        }
    }
    if (s.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

// ============================================================================
// FlagParser
// ============================================================================

std::optional<ParsedArgs> FlagParser::parse(std::span<const std::string> args,
                                            ConfigError& error_out) const {
    ParsedArgs parsed;

    size_t i = 0;
    while (i < args.size()) {
        const std::string& token = args[i];

        // First non-flag argument ends flag parsing ("-" alone is a non-flag)
        if (token.size() < 2 || token[0] != '-') {
            break;
        }

        size_t num_minuses = 1;
        if (token[1] == '-') {
            num_minuses = 2;
            if (token.size() == 2) {
                ++i;  // "--" terminates the flags and is consumed
                break;
            }
        }

        std::string_view name = std::string_view{token}.substr(num_minuses);
        if (name.empty() || name[0] == '-' || name[0] == '=') {
            error_out = make_config_error(ConfigErrc::ParseError,
                                          fmt::format("bad flag syntax: {}", token), token);
            return std::nullopt;
        }
        ++i;

        bool has_value = false;
        std::string_view value;
        if (size_t eq = name.find('='); eq != std::string_view::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
            has_value = true;
        }

        const OptionSpec* spec = schema_.find(name);
        if (spec == nullptr) {
            if (name == "help" || name == "h") {
                error_out = make_config_error(ConfigErrc::HelpRequested,
                                              "flag: help requested", token);
                return std::nullopt;
            }
            error_out =
                make_config_error(ConfigErrc::ParseError, unknown_flag_message(name), token);
            return std::nullopt;
        }

        if (spec->type == OptionType::Bool) {
            // Bool flags never consume the next argument
            if (!has_value) {
                value = "true";
            }
        } else if (!has_value) {
            if (i >= args.size()) {
                error_out = make_config_error(ConfigErrc::ParseError,
                                              fmt::format("flag needs an argument: -{}", name),
                                              token);
                return std::nullopt;
            }
            value = args[i];
            ++i;
        }

        if (!check_literal(*spec, token, value, error_out)) {
            return std::nullopt;
        }

        parsed.values[spec->name] = std::string{value};
        parsed.explicit_keys.insert(spec->name);
    }

    for (; i < args.size(); ++i) {
        parsed.positional.push_back(args[i]);
    }

    return parsed;
}

bool FlagParser::check_literal(const OptionSpec& spec, std::string_view token,
                               std::string_view value, ConfigError& error_out) const {
    bool ok = true;
    switch (spec.type) {
        case OptionType::Bool:
            if (!parse_bool_literal(value).has_value()) {
                error_out = make_config_error(
                    ConfigErrc::ParseError,
                    fmt::format("invalid boolean value \"{}\" for -{}: parse error", value,
                                spec.name),
                    std::string{token});
                return false;
            }
            return true;
        case OptionType::Uint:
            ok = parse_uint_literal(value).has_value();
            break;
        case OptionType::Float:
            ok = parse_float_literal(value).has_value();
            break;
        case OptionType::String:
            break;
    }

    if (!ok) {
        error_out = make_config_error(
            ConfigErrc::ParseError,
            fmt::format("invalid value \"{}\" for flag -{}: parse error", value, spec.name),
            std::string{token});
    }
    return ok;
}

std::string FlagParser::unknown_flag_message(std::string_view name) const {
    std::string message = fmt::format("flag provided but not defined: -{}", name);

    auto suggestions = core::find_similar_strings(name, schema_.names(), MAX_SUGGESTION_DISTANCE);
    if (!suggestions.empty()) {
        message += fmt::format(" (did you mean --{}?)", suggestions.front());
    }
    return message;
}

// ============================================================================
// LayeredLoader
// ============================================================================

std::map<std::string, std::string> LayeredLoader::load_defaults() const {
    std::map<std::string, std::string> values;
    for (const auto& spec : schema_.options()) {
        if (spec.default_value.has_value()) {
            values[spec.name] = *spec.default_value;
        }
    }
    return values;
}

std::vector<std::string> LayeredLoader::overlay_environment(
    const core::Environment& env, std::map<std::string, std::string>& values) const {
    std::vector<std::string> ignored;

    for (const auto& [var, value] : env.vars()) {
        if (!var.starts_with(ENV_PREFIX)) {
            continue;
        }

        std::string key =
            core::env_suffix_to_option_name(std::string_view{var}.substr(ENV_PREFIX.size()));
        if (schema_.find(key) == nullptr) {
            ignored.push_back(var);
            continue;
        }
        values[key] = value;
    }

    return ignored;
}

void LayeredLoader::apply_explicit(const ParsedArgs& parsed,
                                   std::map<std::string, std::string>& values) {
    // Use the key set captured while parsing, never a re-derived one
    for (const auto& key : parsed.explicit_keys) {
        auto it = parsed.values.find(key);
        if (it != parsed.values.end()) {
            values[key] = it->second;
        }
    }
}

std::optional<MergedValues> LayeredLoader::load(std::span<const std::string> args,
                                                const core::Environment& env,
                                                ConfigError& error_out) const {
    auto* logger = logging::get_current_logger();

    MergedValues merged;

    // 1. Defaults
    merged.values = load_defaults();

    // 2. Flags: parse now, apply after the environment
    FlagParser parser{schema_};
    auto parsed = parser.parse(args, error_out);
    if (!parsed.has_value()) {
        if (logger && !error_out.is(ConfigErrc::HelpRequested)) {
            LOG_ERROR(logger, "parsing flags: {}", error_out.message);
        }
        return std::nullopt;
    }
    merged.explicit_keys = parsed->explicit_keys;
    merged.positional = parsed->positional;

    // 3. Environment overlay: beats defaults, so it also beats flags left at their default
    merged.ignored_env = overlay_environment(env, merged.values);

    // 4. Explicit flags beat everything
    apply_explicit(*parsed, merged.values);

    if (logger) {
        for (const auto& var : merged.ignored_env) {
            std::string key = core::env_suffix_to_option_name(
                std::string_view{var}.substr(ENV_PREFIX.size()));
            auto suggestions =
                core::find_similar_strings(key, schema_.names(), MAX_SUGGESTION_DISTANCE);
            if (suggestions.empty()) {
                LOG_WARNING(logger, "Ignoring environment variable {}: no option named '{}'", var,
                            key);
            } else {
                LOG_WARNING(logger,
                            "Ignoring environment variable {}: no option named '{}' (did you "
                            "mean {}{}?)",
                            var, key, ENV_PREFIX,
                            core::option_name_to_env_suffix(suggestions.front()));
            }
        }
        if (!merged.positional.empty()) {
            LOG_WARNING(logger, "Ignoring {} positional argument(s) starting at '{}'",
                        merged.positional.size(), merged.positional.front());
        }
        LOG_DEBUG(logger, "Merged {} option values ({} explicit)", merged.values.size(),
                  merged.explicit_keys.size());
    }

    return merged;
}

std::optional<Config> LayeredLoader::decode(const MergedValues& merged,
                                            ConfigError& error_out) const {
    Config config;
    Decoder d{merged, error_out};

    assign(config.in_cluster, d.get_bool(option::IN_CLUSTER));
    assign(config.dev_mode, d.get_bool(option::DEV));
    assign(config.insecure_ssl, d.get_bool(option::INSECURE_SSL));
    assign(config.enable_helm, d.get_bool(option::ENABLE_HELM));
    assign(config.enable_dynamic_clusters, d.get_bool(option::ENABLE_DYNAMIC_CLUSTERS));
    config.watch_plugins_changes =
        d.tracked(option::WATCH_PLUGINS_CHANGES, d.get_bool(option::WATCH_PLUGINS_CHANGES));

    assign(config.listen_addr, d.get_string(option::LISTEN_ADDR));
    assign(config.port, d.get_uint(option::PORT, std::numeric_limits<uint16_t>::max()));

    config.kubeconfig = d.tracked(option::KUBECONFIG, d.get_string(option::KUBECONFIG));
    assign(config.skipped_kube_contexts, d.get_string(option::SKIPPED_KUBE_CONTEXTS));
    assign(config.static_dir, d.get_string(option::HTML_STATIC_DIR));
    assign(config.plugins_dir, d.get_string(option::PLUGINS_DIR));
    assign(config.base_url, d.get_string(option::BASE_URL));
    assign(config.proxy_urls, d.get_string(option::PROXY_URLS));

    assign(config.oidc.client_id, d.get_string(option::OIDC_CLIENT_ID));
    assign(config.oidc.client_secret, d.get_string(option::OIDC_CLIENT_SECRET));
    assign(config.oidc.validator_client_id, d.get_string(option::OIDC_VALIDATOR_CLIENT_ID));
    assign(config.oidc.idp_issuer_url, d.get_string(option::OIDC_IDP_ISSUER_URL));
    assign(config.oidc.validator_idp_issuer_url,
           d.get_string(option::OIDC_VALIDATOR_IDP_ISSUER_URL));
    assign(config.oidc.scopes, d.get_string(option::OIDC_SCOPES));
    assign(config.oidc.use_access_token, d.get_bool(option::OIDC_USE_ACCESS_TOKEN));

    auto& telemetry = config.telemetry;
    assign(telemetry.service_name, d.get_string(option::SERVICE_NAME));
    telemetry.service_version = d.get_string(option::SERVICE_VERSION);
    telemetry.tracing_enabled = d.get_bool(option::TRACING_ENABLED);
    telemetry.metrics_enabled = d.get_bool(option::METRICS_ENABLED);
    telemetry.jaeger_endpoint = d.get_string(option::JAEGER_ENDPOINT);
    telemetry.otlp_endpoint = d.get_string(option::OTLP_ENDPOINT);
    telemetry.use_otlp_http = d.get_bool(option::USE_OTLP_HTTP);
    telemetry.stdout_trace_enabled = d.get_bool(option::STDOUT_TRACE_ENABLED);
    telemetry.sampling_rate = d.get_float(option::SAMPLING_RATE);

    if (d.failed()) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "unmarshalling config: {}", error_out.message);
        }
        return std::nullopt;
    }

    return config;
}

}  // namespace headlamp::config
