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

// Headlamp Server - Main Entry Point
// Resolves the startup configuration and prints the effective settings
#include <cstdio>
#include <cstdlib>
#include <string>

#include "config/config.hpp"
#include "config/resolver.hpp"
#include "core/logging.hpp"
#include "core/platform.hpp"

namespace {

constexpr int EXIT_USAGE = 2;

void log_summary(quill::Logger* logger, const headlamp::config::Config& config) {
    LOG_INFO(logger, "Listening on {}:{}",
             config.listen_addr.empty() ? "*" : config.listen_addr, config.port);
    LOG_INFO(logger, "Mode: in-cluster={}, dev={}, watch-plugins-changes={} ({})",
             config.in_cluster, config.dev_mode, config.watch_plugins_changes.value(),
             headlamp::config::to_string(config.watch_plugins_changes.source()));
    LOG_INFO(logger, "Plugins directory: {}",
             config.plugins_dir.empty() ? "<none>" : config.plugins_dir);
    LOG_INFO(logger, "Kubeconfig: {}",
             config.kubeconfig.value().empty() ? "<in-cluster>" : config.kubeconfig.value());
    if (config.telemetry.tracing()) {
        LOG_INFO(logger, "Tracing enabled for service {}", config.telemetry.service_name);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    const char* program = argc > 0 && argv[0] != nullptr ? argv[0] : "headlamp-server";

    headlamp::logging::init_logging_system();
    quill::Logger* logger = headlamp::logging::init_logger(headlamp::logging::LogConfig{});

    auto env = headlamp::core::Environment::from_process();
    headlamp::core::SystemPlatform platform{env};
    headlamp::config::ConfigResolver resolver{env, platform};

    headlamp::config::ConfigError error;
    auto config = resolver.resolve(argc, argv, error);

    if (!config.has_value()) {
        int status = EXIT_FAILURE;
        if (error.is(headlamp::config::ConfigErrc::HelpRequested)) {
            printf("%s", resolver.schema().usage(program).c_str());
            status = EXIT_SUCCESS;
        } else if (error.is(headlamp::config::ConfigErrc::ParseError)) {
            fprintf(stderr, "Error: %s\n\n%s", error.message.c_str(),
                    resolver.schema().usage(program).c_str());
            status = EXIT_USAGE;
        } else {
            fprintf(stderr, "Error: %s: %s\n", error.code.message().c_str(),
                    error.message.c_str());
        }
        headlamp::logging::shutdown_logging();
        return status;
    }

    if (config->dev_mode) {
        headlamp::logging::set_log_level("debug");
    }

    log_summary(logger, *config);

    std::string json = headlamp::config::format_config(*config);
    if (json.empty()) {
        fprintf(stderr, "Error: configuration could not be serialized\n");
        headlamp::logging::shutdown_logging();
        return EXIT_FAILURE;
    }
    printf("%s\n", json.c_str());

    headlamp::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
