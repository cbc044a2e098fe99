/**
 * @file LoggerTest.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <catch2/catch.hpp>

#include "Logger.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {
std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}
}

TEST_CASE("level names parse case-insensitively", "[logger]") {
    Logger::Level lvl = Logger::Level::Info;
    REQUIRE(Logger::parseLevel("DEBUG", lvl));
    CHECK(lvl == Logger::Level::Debug);
    REQUIRE(Logger::parseLevel("Warning", lvl));
    CHECK(lvl == Logger::Level::Warn);
    REQUIRE(Logger::parseLevel("off", lvl));
    CHECK(lvl == Logger::Level::None);

    lvl = Logger::Level::Error;
    CHECK_FALSE(Logger::parseLevel("verbose", lvl));
    CHECK(lvl == Logger::Level::Error);

    CHECK(std::string(Logger::levelName(Logger::Level::Warn)) == "WARN");
}

TEST_CASE("logging before init is a silent no-op", "[logger]") {
    REQUIRE_FALSE(Logger::isInitialized());
    Logger::info("nobody hears this");
    Logger::error("nor this");
    CHECK_FALSE(Logger::isInitialized());
}

TEST_CASE("file sink honours the level threshold", "[logger]") {
    const std::string path = (std::filesystem::temp_directory_path() / "diffusion_logger_test.log").string();
    std::remove(path.c_str());

    Logger::init(path);
    REQUIRE(Logger::isInitialized());
    Logger::setLevel(Logger::Level::Warn);
    Logger::info("hidden info line");
    Logger::warn("visible warn line");
    Logger::logException("reseed", std::runtime_error("boom"));
    Logger::setLevel(Logger::Level::Info);
    Logger::shutdown();
    Logger::shutdown();
    CHECK_FALSE(Logger::isInitialized());

    std::string text = slurp(path);
    CHECK(text.find("session start") != std::string::npos);
    CHECK(text.find("session end") != std::string::npos);
    CHECK(text.find("[WARN]") != std::string::npos);
    CHECK(text.find("visible warn line") != std::string::npos);
    CHECK(text.find("reseed: boom") != std::string::npos);
    CHECK(text.find("hidden info line") == std::string::npos);
    std::remove(path.c_str());
}
