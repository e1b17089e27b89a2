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

// Headlamp Configuration - Implementation

#include "config.hpp"

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace headlamp::config {

namespace {
constexpr const char* REDACTED = "******";
}

std::vector<std::string> OidcConfig::scope_list() const {
    return core::split_list(scopes);
}

std::vector<std::string> Config::proxy_url_list() const {
    return core::split_list(proxy_urls);
}

std::vector<std::string> Config::skipped_kube_context_list() const {
    return core::split_list(skipped_kube_contexts);
}

std::string format_config(const Config& config, bool redact_secrets) {
    try {
        nlohmann::json j = config;
        if (redact_secrets && !config.oidc.client_secret.empty()) {
            j["oidc"]["oidc-client-secret"] = REDACTED;
        }
        return j.dump(2);
    } catch (const nlohmann::json::exception& e) {
        // Only reachable with invalid UTF-8 in a string option
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "serializing config: {}", e.what());
        }
        return "";
    }
}

}  // namespace headlamp::config
