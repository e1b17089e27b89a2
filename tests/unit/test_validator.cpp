// Headlamp Configuration Validator Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "../../src/config/validator.hpp"

using namespace headlamp::config;
using Catch::Matchers::ContainsSubstring;

namespace {

// Mirrors the option table defaults after decoding
Config default_config() {
    Config config;
    config.watch_plugins_changes = Tracked<bool>::defaulted(true);
    config.telemetry.service_version = "0.30.0";
    config.telemetry.tracing_enabled = false;
    config.telemetry.metrics_enabled = false;
    config.telemetry.otlp_endpoint = "localhost:4317";
    config.telemetry.use_otlp_http = false;
    config.telemetry.stdout_trace_enabled = false;
    config.telemetry.sampling_rate = 1.0;
    return config;
}

}  // namespace

TEST_CASE("Validation - default config is valid", "[config][validator]") {
    auto result = ConfigValidator::validate(default_config());
    REQUIRE(result.valid);
    REQUIRE_FALSE(result.has_errors());
    REQUIRE(result.warnings.empty());
}

TEST_CASE("Validation - OIDC settings require cluster mode", "[config][validator][oidc]") {
    const std::string expected =
        "oidc-client-id, oidc-client-secret, oidc-idp-issuer-url, oidc-validator-client-id, "
        "oidc-validator-idp-issuer-url, flags are only meant to be used in inCluster mode";

    SECTION("any single OIDC field outside cluster mode is rejected") {
        auto set_field = GENERATE(0, 1, 2, 3, 4);

        Config config = default_config();
        switch (set_field) {
            case 0:
                config.oidc.client_id = "id";
                break;
            case 1:
                config.oidc.client_secret = "secret";
                break;
            case 2:
                config.oidc.idp_issuer_url = "https://issuer";
                break;
            case 3:
                config.oidc.validator_client_id = "vid";
                break;
            default:
                config.oidc.validator_idp_issuer_url = "https://vissuer";
                break;
        }

        auto result = ConfigValidator::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(result.errors.size() == 1);
        REQUIRE(result.errors.front() == expected);
        REQUIRE(result.failed_option == "oidc-client-id");
    }

    SECTION("scopes and use-access-token alone are not client settings") {
        Config config = default_config();
        config.oidc.scopes = "openid";
        config.oidc.use_access_token = true;

        REQUIRE(ConfigValidator::validate(config).valid);
    }

    SECTION("allowed in cluster mode") {
        Config config = default_config();
        config.in_cluster = true;
        config.oidc.client_id = "id";
        config.oidc.client_secret = "secret";
        config.oidc.idp_issuer_url = "https://issuer";

        auto result = ConfigValidator::validate(config);
        REQUIRE(result.valid);
    }
}

TEST_CASE("Validation - base URL", "[config][validator][base_url]") {
    Config config = default_config();

    SECTION("empty and rooted paths are accepted") {
        for (const char* url : {"", "/", "/headlamp", "/a/b/"}) {
            config.base_url = url;
            REQUIRE(ConfigValidator::validate(config).valid);
        }
    }

    SECTION("relative path is rejected") {
        config.base_url = "headlamp";
        auto result = ConfigValidator::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.errors.front() == "base-url needs to start with a '/' or be empty");
        REQUIRE(result.failed_option == "base-url");
    }
}

TEST_CASE("Validation - tracing", "[config][validator][tracing]") {
    Config config = default_config();
    config.telemetry.tracing_enabled = true;

    SECTION("default OTLP endpoint counts as an exporter") {
        REQUIRE(ConfigValidator::validate(config).valid);
    }

    SECTION("service name is required") {
        config.telemetry.service_name = "";
        auto result = ConfigValidator::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.errors.front() == "service-name is required when tracing is enabled");
        REQUIRE(result.failed_option == "service-name");
    }

    SECTION("an exporter is required") {
        config.telemetry.otlp_endpoint = "";
        auto result = ConfigValidator::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE_THAT(result.errors.front(), ContainsSubstring("at least one tracing exporter"));
        REQUIRE(result.failed_option == "tracing-enabled");
    }

    SECTION("unset OTLP endpoint and no other exporter") {
        config.telemetry.otlp_endpoint = std::nullopt;
        REQUIRE_FALSE(ConfigValidator::validate(config).valid);
    }

    SECTION("jaeger alone is enough") {
        config.telemetry.otlp_endpoint = "";
        config.telemetry.jaeger_endpoint = "http://jaeger:14268/api/traces";
        REQUIRE(ConfigValidator::validate(config).valid);
    }

    SECTION("stdout alone is enough") {
        config.telemetry.otlp_endpoint = "";
        config.telemetry.stdout_trace_enabled = true;
        REQUIRE(ConfigValidator::validate(config).valid);
    }

    SECTION("OTLP over HTTP needs an OTLP endpoint") {
        config.telemetry.otlp_endpoint = "";
        config.telemetry.stdout_trace_enabled = true;
        config.telemetry.use_otlp_http = true;

        auto result = ConfigValidator::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.errors.front() ==
                "otlp-endpoint must be configured when use-otlp-http is enabled");
        REQUIRE(result.failed_option == "otlp-endpoint");
    }

    SECTION("OTLP over HTTP with an OTLP endpoint") {
        config.telemetry.service_name = "foo";
        config.telemetry.otlp_endpoint = "collector:4318";
        config.telemetry.use_otlp_http = true;

        auto result = ConfigValidator::validate(config);
        REQUIRE(result.valid);
        REQUIRE(result.errors.empty());
    }

    SECTION("tracing checks are skipped when tracing is off") {
        config.telemetry.tracing_enabled = false;
        config.telemetry.service_name = "";
        config.telemetry.otlp_endpoint = "";
        config.telemetry.use_otlp_http = true;
        REQUIRE(ConfigValidator::validate(config).valid);
    }

    SECTION("tracing unset behaves like off") {
        config.telemetry.tracing_enabled = std::nullopt;
        config.telemetry.service_name = "";
        REQUIRE(ConfigValidator::validate(config).valid);
    }
}

TEST_CASE("Validation - rule order", "[config][validator]") {
    Config config = default_config();
    config.oidc.client_id = "id";
    config.base_url = "relative";
    config.telemetry.tracing_enabled = true;
    config.telemetry.service_name = "";

    auto result = ConfigValidator::validate(config);
    REQUIRE(result.errors.size() == 1);
    REQUIRE(result.failed_option == "oidc-client-id");

    config.oidc.client_id = "";
    result = ConfigValidator::validate(config);
    REQUIRE(result.failed_option == "base-url");

    config.base_url = "";
    result = ConfigValidator::validate(config);
    REQUIRE(result.failed_option == "service-name");
}

TEST_CASE("Validation - warnings", "[config][validator][warnings]") {
    Config config = default_config();

    SECTION("sampling rate outside [0, 1]") {
        config.telemetry.sampling_rate = 1.5;
        auto result = ConfigValidator::validate(config);
        REQUIRE(result.valid);
        REQUIRE(result.warnings.size() == 1);
        REQUIRE_THAT(result.warnings.front(), ContainsSubstring("sampling-rate 1.5"));
    }

    SECTION("insecure SSL outside dev mode") {
        config.insecure_ssl = true;
        REQUIRE(ConfigValidator::validate(config).warnings.size() == 1);

        config.dev_mode = true;
        REQUIRE(ConfigValidator::validate(config).warnings.empty());
    }

    SECTION("metrics without a service name") {
        config.telemetry.metrics_enabled = true;
        config.telemetry.service_name = "";
        auto result = ConfigValidator::validate(config);
        REQUIRE(result.valid);
        REQUIRE(result.warnings.size() == 1);
    }

    SECTION("OIDC client without issuer in cluster mode") {
        config.in_cluster = true;
        config.oidc.client_id = "id";
        auto result = ConfigValidator::validate(config);
        REQUIRE(result.valid);
        REQUIRE(result.warnings.size() == 1);
        REQUIRE_THAT(result.warnings.front(), ContainsSubstring("oidc-idp-issuer-url is empty"));
    }

    SECTION("no warnings on invalid configs") {
        config.insecure_ssl = true;
        config.base_url = "relative";
        auto result = ConfigValidator::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.warnings.empty());
    }
}
