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

// Headlamp Configuration Errors - Implementation

#include "error.hpp"

namespace headlamp::config {

std::string ConfigErrorCategory::message(int ev) const {
    switch (static_cast<ConfigErrc>(ev)) {
        case ConfigErrc::HelpRequested:
            return "help requested";
        case ConfigErrc::ParseError:
            return "error parsing flags";
        case ConfigErrc::DecodeError:
            return "error decoding config";
        case ConfigErrc::ValidationError:
            return "invalid config";
        case ConfigErrc::PathResolutionError:
            return "error resolving path";
    }
    return "unknown config error";
}

const ConfigErrorCategory& config_category() noexcept {
    static ConfigErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ConfigErrc e) noexcept {
    return {static_cast<int>(e), config_category()};
}

ConfigError make_config_error(ConfigErrc e, std::string message, std::string key) {
    return ConfigError{make_error_code(e), std::move(message), std::move(key)};
}

}  // namespace headlamp::config
