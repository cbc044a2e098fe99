/**
 * @file ConfigTest.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <catch2/catch.hpp>

#include "Config.h"

#include <map>
#include <string>

TEST_CASE("numeric parsers reject junk and leave the output untouched", "[config]") {
    float f = 7.0f;
    CHECK(parseFloat("0.25", f));
    CHECK(f == Approx(0.25f));
    f = 7.0f;
    CHECK_FALSE(parseFloat("abc", f));
    CHECK_FALSE(parseFloat("1.5x", f));
    CHECK_FALSE(parseFloat("", f));
    CHECK_FALSE(parseFloat(nullptr, f));
    CHECK_FALSE(parseFloat("nan", f));
    CHECK(f == 7.0f);

    uint32_t u = 3;
    CHECK(parseUnsigned("42", u));
    CHECK(u == 42u);
    CHECK_FALSE(parseUnsigned("-1", u));
    CHECK_FALSE(parseUnsigned("99999999999", u));
    CHECK(u == 42u);
}

TEST_CASE("defaults match the baseline cell", "[config]") {
    Config cfg;
    CHECK(cfg.params.radiusUm == 12.0f);
    CHECK(cfg.params.gradient == Approx(0.6f));
    CHECK(cfg.params.temperatureC == 25.0f);
    CHECK_FALSE(cfg.headless);
    CHECK_FALSE(cfg.seedSet);
}

TEST_CASE("environment overrides apply and invalid values are ignored", "[config]") {
    std::map<std::string, std::string> env{
        {"DIFFUSION_RADIUS", "20"},
        {"DIFFUSION_GRADIENT", "oops"},
        {"DIFFUSION_TEMPERATURE", "37.5"},
        {"DIFFUSION_SEED", "1234"},
    };
    Config cfg;
    applyEnvironment(cfg, [&](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    });
    CHECK(cfg.params.radiusUm == 20.0f);
    CHECK(cfg.params.gradient == Approx(0.6f));
    CHECK(cfg.params.temperatureC == Approx(37.5f));
    CHECK(cfg.seedSet);
    CHECK(cfg.seed == 1234u);
}

TEST_CASE("command line accepts short, long and = forms", "[config]") {
    const char* argv[] = {"diffusion", "-r", "8", "--gradient=0.9", "--temperature", "40",
                          "--seed=7", "--headless", "--duration", "3", "--dt=0.5", "--bogus"};
    Config cfg;
    ParseOutcome out = parseArguments(cfg, (int)(sizeof(argv) / sizeof(argv[0])), argv);
    CHECK(out == ParseOutcome::Run);
    CHECK(cfg.params.radiusUm == 8.0f);
    CHECK(cfg.params.gradient == Approx(0.9f));
    CHECK(cfg.params.temperatureC == 40.0f);
    CHECK(cfg.seedSet);
    CHECK(cfg.seed == 7u);
    CHECK(cfg.headless);
    CHECK(cfg.durationS == 3.0f);
    CHECK(cfg.dtS == 0.5f);
}

TEST_CASE("command line ignores bad values and reports help", "[config]") {
    const char* bad[] = {"diffusion", "--radius", "huge", "--dt", "-1", "--seed"};
    Config cfg;
    CHECK(parseArguments(cfg, 6, bad) == ParseOutcome::Run);
    CHECK(cfg.params.radiusUm == 12.0f);
    CHECK(cfg.dtS == Approx(1.0f / 60.0f));
    CHECK_FALSE(cfg.seedSet);

    const char* help[] = {"diffusion", "-g", "0.1", "--help"};
    CHECK(parseArguments(cfg, 4, help) == ParseOutcome::Help);
    CHECK(usage("diffusion").find("--gradient") != std::string::npos);
}
