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

// Headlamp Platform - Implementation

#include "platform.hpp"

#include <cerrno>
#include <cstdint>
#include <vector>

#ifndef _WIN32
#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

#ifndef _WIN32
extern char** environ;
#endif

namespace headlamp::core {

namespace {

#ifndef _WIN32
constexpr mode_t DIRECTORY_MODE = 0755;
#endif

// Non-empty variable lookup; empty counts as unset for path variables
std::optional<std::string> non_empty(const Environment& env, std::string_view name) {
    auto value = env.get(name);
    if (!value.has_value() || value->empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

// ============================
// Environment
// ============================

Environment Environment::from_envp(const char* const* envp) {
    Environment env;
    if (envp == nullptr) {
        return env;
    }

    for (const char* const* entry = envp; *entry != nullptr; ++entry) {
        std::string_view kv{*entry};
        size_t eq = kv.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            continue;  // Malformed entry, nothing to key it by
        }
        env.set(std::string{kv.substr(0, eq)}, std::string{kv.substr(eq + 1)});
    }
    return env;
}

Environment Environment::from_process() {
#ifdef _WIN32
    return from_envp(const_cast<const char* const*>(_environ));
#else
    return from_envp(const_cast<const char* const*>(environ));
#endif
}

std::optional<std::string> Environment::get(std::string_view name) const {
    auto it = vars_.find(std::string{name});
    if (it == vars_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================
// SystemPlatform
// ============================

std::optional<std::filesystem::path> SystemPlatform::user_config_dir() const {
#if defined(_WIN32)
    auto appdata = non_empty(env_, "AppData");
    if (!appdata) {
        return std::nullopt;
    }
    return std::filesystem::path{*appdata};
#elif defined(__APPLE__)
    auto home = home_dir();
    if (!home) {
        return std::nullopt;
    }
    return *home / "Library" / "Application Support";
#else
    auto xdg = non_empty(env_, "XDG_CONFIG_HOME");
    if (xdg) {
        std::filesystem::path dir{*xdg};
        // XDG spec: relative paths are invalid and must be ignored
        if (!dir.is_absolute()) {
            return std::nullopt;
        }
        return dir;
    }
    auto home = non_empty(env_, "HOME");
    if (!home) {
        return std::nullopt;
    }
    return std::filesystem::path{*home} / ".config";
#endif
}

std::optional<std::filesystem::path> SystemPlatform::home_dir() const {
#ifdef _WIN32
    auto profile = non_empty(env_, "USERPROFILE");
    if (!profile) {
        return std::nullopt;
    }
    return std::filesystem::path{*profile};
#else
    // Password database first; HOME is only a fallback for users without an entry
    long bufsize = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buf(bufsize > 0 ? static_cast<size_t>(bufsize) : 16384);

    struct passwd pwd {};
    struct passwd* result = nullptr;
    if (getpwuid_r(getuid(), &pwd, buf.data(), buf.size(), &result) == 0 && result != nullptr &&
        result->pw_dir != nullptr && result->pw_dir[0] != '\0') {
        return std::filesystem::path{result->pw_dir};
    }

    auto home = non_empty(env_, "HOME");
    if (!home) {
        return std::nullopt;
    }
    return std::filesystem::path{*home};
#endif
}

std::optional<std::filesystem::path> SystemPlatform::executable_path() const {
#if defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::vector<char> buf(size + 1, '\0');
    if (_NSGetExecutablePath(buf.data(), &size) != 0) {
        return std::nullopt;
    }
    std::error_code ec;
    auto canonical = std::filesystem::canonical(buf.data(), ec);
    if (ec) {
        return std::nullopt;
    }
    return canonical;
#elif defined(__linux__)
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::nullopt;
    }
    return exe;
#else
    return std::nullopt;
#endif
}

std::error_code SystemPlatform::create_directories(const std::filesystem::path& dir) const {
    if (dir.empty()) {
        return std::make_error_code(std::errc::invalid_argument);
    }

#ifdef _WIN32
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec && std::filesystem::is_directory(dir)) {
        ec.clear();
    }
    return ec;
#else
    // Every newly created level gets 0755 (minus umask); EEXIST on a directory is success
    std::filesystem::path current;
    for (const auto& part : dir) {
        current /= part;
        if (part == current.root_path() || part.empty()) {
            continue;
        }

        if (::mkdir(current.c_str(), DIRECTORY_MODE) == 0) {
            continue;
        }

        int err = errno;
        if (err == EEXIST) {
            struct stat st {};
            if (::stat(current.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
                continue;
            }
            return std::make_error_code(std::errc::not_a_directory);
        }
        return std::error_code(err, std::generic_category());
    }
    return {};
#endif
}

bool SystemPlatform::is_windows() const noexcept {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

}  // namespace headlamp::core
