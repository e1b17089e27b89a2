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

// Headlamp Derived Paths - Header
// Default directories for plugins and kubeconfig files, kubeconfig derivation

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "../core/platform.hpp"
#include "config.hpp"
#include "error.hpp"

namespace headlamp::config {

/// Vendor directory under the user config root
inline constexpr std::string_view APP_DIR_NAME = "Headlamp";

/// Environment variable consulted outside cluster mode
inline constexpr std::string_view KUBECONFIG_ENV = "KUBECONFIG";

/// <config_root>/Headlamp/<leaf>, or <config_root>/Headlamp/Config/<leaf> on Windows
/// (matches the directory layout used by the plugin-management tool)
[[nodiscard]] std::filesystem::path app_config_subdir(const core::Platform& platform,
                                                      const std::filesystem::path& config_root,
                                                      std::string_view leaf);

/// Default plugins directory, created if missing
/// Returns "" on any failure; the error surfaces later when the directory is needed.
[[nodiscard]] std::string default_plugins_dir(const core::Platform& platform);

/// <home>/.kube/config
[[nodiscard]] std::optional<std::string> default_kubeconfig_path(const core::Platform& platform,
                                                                 ConfigError& error_out);

/// Directory for kubeconfig files of clusters added at runtime, created if missing
/// Falls back to the directory of the running executable.
[[nodiscard]] std::optional<std::string> make_kubeconfigs_dir(const core::Platform& platform,
                                                              ConfigError& error_out);

/// make_kubeconfigs_dir()/config
[[nodiscard]] std::optional<std::string> default_kubeconfig_file(const core::Platform& platform,
                                                                 ConfigError& error_out);

/// Finalize config.kubeconfig:
/// explicit kubeconfig option > KUBECONFIG (outside cluster mode) > <home>/.kube/config
/// (outside cluster mode). In cluster mode without an explicit path it stays unset.
[[nodiscard]] bool resolve_kubeconfig(Config& config, const core::Environment& env,
                                      const core::Platform& platform, ConfigError& error_out);

}  // namespace headlamp::config
