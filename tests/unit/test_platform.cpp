// Headlamp Platform Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include "../../src/core/platform.hpp"

using namespace headlamp::core;

namespace fs = std::filesystem;

TEST_CASE("Environment from envp", "[core][platform]") {
    const char* envp[] = {"HOME=/home/bob", "EMPTY=", "EQ=a=b", "=bad", "NOEQUALS", nullptr};
    auto env = Environment::from_envp(envp);

    REQUIRE(env.get("HOME") == "/home/bob");
    REQUIRE(env.get("EMPTY") == "");
    REQUIRE(env.get("EQ") == "a=b");
    REQUIRE_FALSE(env.get("NOEQUALS").has_value());
    REQUIRE_FALSE(env.get("MISSING").has_value());
    REQUIRE(env.vars().size() == 3);

    REQUIRE(Environment::from_envp(nullptr).vars().empty());
}

TEST_CASE("Environment from the process", "[core][platform]") {
    REQUIRE(::setenv("HEADLAMP_TEST_PLATFORM_VAR", "42", 1) == 0);
    auto env = Environment::from_process();
    REQUIRE(env.get("HEADLAMP_TEST_PLATFORM_VAR") == "42");
    ::unsetenv("HEADLAMP_TEST_PLATFORM_VAR");
}

TEST_CASE("System platform config directory", "[core][platform]") {
#if defined(__linux__)
    SECTION("XDG_CONFIG_HOME when absolute") {
        Environment env;
        env.set("XDG_CONFIG_HOME", "/xdg");
        SystemPlatform platform{env};
        REQUIRE(platform.user_config_dir() == fs::path{"/xdg"});
    }

    SECTION("relative XDG_CONFIG_HOME is ignored") {
        Environment env;
        env.set("XDG_CONFIG_HOME", "relative");
        SystemPlatform platform{env};
        REQUIRE_FALSE(platform.user_config_dir().has_value());
    }

    SECTION("HOME/.config otherwise") {
        Environment env;
        env.set("HOME", "/home/carol");
        SystemPlatform platform{env};
        REQUIRE(platform.user_config_dir() == fs::path{"/home/carol/.config"});
    }

    SECTION("nothing set") {
        SystemPlatform platform{Environment{}};
        REQUIRE_FALSE(platform.user_config_dir().has_value());
    }
#endif
    SystemPlatform platform{Environment{}};
    REQUIRE_FALSE(platform.is_windows());
}

TEST_CASE("System platform executable path", "[core][platform]") {
    SystemPlatform platform{Environment{}};
    auto exe = platform.executable_path();
#if defined(__linux__) || defined(__APPLE__)
    REQUIRE(exe.has_value());
    REQUIRE(exe->is_absolute());
#endif
}

TEST_CASE("System platform create_directories", "[core][platform]") {
    SystemPlatform platform{Environment{}};
    fs::path root =
        fs::temp_directory_path() / ("headlamp_platform_test_" + std::to_string(::getpid()));
    fs::remove_all(root);

    SECTION("creates nested directories") {
        fs::path dir = root / "Headlamp" / "plugins";
        REQUIRE_FALSE(platform.create_directories(dir));
        REQUIRE(fs::is_directory(dir));

        // Existing directory is success
        REQUIRE_FALSE(platform.create_directories(dir));
    }

    SECTION("a file in the way is an error") {
        REQUIRE_FALSE(platform.create_directories(root));
        std::ofstream(root / "file") << "x";
        REQUIRE(platform.create_directories(root / "file" / "sub"));
    }

    SECTION("empty path is rejected") {
        REQUIRE(platform.create_directories(fs::path{}) ==
                std::make_error_code(std::errc::invalid_argument));
    }

    fs::remove_all(root);
}
