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

// Headlamp Derived Paths - Implementation

#include "paths.hpp"

#include "../core/logging.hpp"

namespace headlamp::config {

std::filesystem::path app_config_subdir(const core::Platform& platform,
                                        const std::filesystem::path& config_root,
                                        std::string_view leaf) {
    std::filesystem::path dir = config_root / APP_DIR_NAME;
    if (platform.is_windows()) {
        dir /= "Config";
    }
    return dir / leaf;
}

std::string default_plugins_dir(const core::Platform& platform) {
    auto* logger = logging::get_current_logger();

    auto config_root = platform.user_config_dir();
    if (!config_root.has_value()) {
        if (logger) {
            LOG_ERROR(logger, "getting user config dir: no user config directory available");
        }
        return "";
    }

    std::filesystem::path plugins_dir = app_config_subdir(platform, *config_root, "plugins");

    std::error_code ec = platform.create_directories(plugins_dir);
    if (ec) {
        if (logger) {
            LOG_ERROR(logger, "creating plugins directory {}: {}", plugins_dir.string(),
                      ec.message());
        }
        return "";
    }

    return plugins_dir.string();
}

std::optional<std::string> default_kubeconfig_path(const core::Platform& platform,
                                                   ConfigError& error_out) {
    auto home = platform.home_dir();
    if (!home.has_value() || home->empty()) {
        error_out = make_config_error(ConfigErrc::PathResolutionError,
                                      "getting current user: home directory not found");
        return std::nullopt;
    }
    return (*home / ".kube" / "config").string();
}

std::optional<std::string> make_kubeconfigs_dir(const core::Platform& platform,
                                                ConfigError& error_out) {
    auto* logger = logging::get_current_logger();

    auto config_root = platform.user_config_dir();
    if (config_root.has_value()) {
        std::filesystem::path dir = app_config_subdir(platform, *config_root, "kubeconfigs");

        std::error_code ec = platform.create_directories(dir);
        if (!ec) {
            return dir.string();
        }
        if (logger) {
            LOG_WARNING(logger, "creating kubeconfigs directory {}: {}", dir.string(),
                        ec.message());
        }
    }

    // Fall back to the directory holding the running executable
    auto exe = platform.executable_path();
    if (exe.has_value() && exe->has_parent_path()) {
        return exe->parent_path().string();
    }

    error_out = make_config_error(ConfigErrc::PathResolutionError,
                                  "failed to get default kubeconfig persistence directory");
    return std::nullopt;
}

std::optional<std::string> default_kubeconfig_file(const core::Platform& platform,
                                                   ConfigError& error_out) {
    auto dir = make_kubeconfigs_dir(platform, error_out);
    if (!dir.has_value()) {
        return std::nullopt;
    }
    return (std::filesystem::path{*dir} / "config").string();
}

bool resolve_kubeconfig(Config& config, const core::Environment& env,
                        const core::Platform& platform, ConfigError& error_out) {
    // An empty value counts as "not specified", wherever it came from
    if (!config.kubeconfig.value().empty()) {
        return true;
    }

    if (config.in_cluster) {
        return true;
    }

    auto from_env = env.get(KUBECONFIG_ENV);
    if (from_env.has_value() && !from_env->empty()) {
        config.kubeconfig = Tracked<std::string>::defaulted(*from_env);
        return true;
    }

    auto default_path = default_kubeconfig_path(platform, error_out);
    if (!default_path.has_value()) {
        return false;
    }
    config.kubeconfig = Tracked<std::string>::defaulted(*default_path);
    return true;
}

}  // namespace headlamp::config
