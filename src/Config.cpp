/**
 * @file Config.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Config.h"
#include "Logger.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>

bool parseFloat(const char* s, float& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || errno != 0 || !std::isfinite(v)) return false;
    out = static_cast<float>(v);
    return true;
}

bool parseUnsigned(const char* s, uint32_t& out) {
    if (!s || !*s || *s == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (end == s || *end != '\0' || errno != 0) return false;
    if (v > std::numeric_limits<uint32_t>::max()) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

void applyEnvironment(Config& cfg, const EnvLookup& lookup) {
    if (!lookup) return;
    auto applyFloat = [&](const char* name, float& dst) {
        const char* v = lookup(name);
        if (!v) return;
        if (!parseFloat(v, dst)) Logger::warn(std::string("ignoring invalid ") + name + "=" + v);
    };
    applyFloat("DIFFUSION_RADIUS", cfg.params.radiusUm);
    applyFloat("DIFFUSION_GRADIENT", cfg.params.gradient);
    applyFloat("DIFFUSION_TEMPERATURE", cfg.params.temperatureC);
    if (const char* v = lookup("DIFFUSION_SEED")) {
        if (parseUnsigned(v, cfg.seed)) cfg.seedSet = true;
        else Logger::warn(std::string("ignoring invalid DIFFUSION_SEED=") + v);
    }
}

void applyEnvironment(Config& cfg) {
    applyEnvironment(cfg, [](const char* name) -> const char* { return std::getenv(name); });
}

ParseOutcome parseArguments(Config& cfg, int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i] ? argv[i] : "");
        auto read_next = [&](int& idx) -> const char* {
            if (idx + 1 < argc) return argv[++idx];
            return nullptr;
        };
        // Accepts "-x v", "--long v" and "--long=v"; returns the value or nullptr if this isn't the option.
        auto valueFor = [&](const char* shortName, const char* longName, bool& matched) -> const char* {
            matched = false;
            std::string eq = std::string(longName) + "=";
            if ((shortName && a == shortName) || a == longName) { matched = true; return read_next(i); }
            if (a.rfind(eq, 0) == 0) { matched = true; return argv[i] + eq.size(); }
            return nullptr;
        };
        auto takeFloat = [&](const char* shortName, const char* longName, float& dst) -> bool {
            bool matched = false;
            const char* v = valueFor(shortName, longName, matched);
            if (!matched) return false;
            float tmp;
            if (parseFloat(v, tmp)) dst = tmp;
            else Logger::warn(std::string("ignoring invalid value for ") + longName);
            return true;
        };

        if (a == "-h" || a == "--help") return ParseOutcome::Help;
        if (a == "--headless") { cfg.headless = true; continue; }
        if (takeFloat("-r", "--radius", cfg.params.radiusUm)) continue;
        if (takeFloat("-g", "--gradient", cfg.params.gradient)) continue;
        if (takeFloat("-t", "--temperature", cfg.params.temperatureC)) continue;

        float positive = 0.0f;
        if (takeFloat(nullptr, "--duration", positive)) {
            if (positive > 0.0f) cfg.durationS = positive;
            else Logger::warn("ignoring non-positive --duration");
            continue;
        }
        positive = 0.0f;
        if (takeFloat(nullptr, "--dt", positive)) {
            if (positive > 0.0f) cfg.dtS = positive;
            else Logger::warn("ignoring non-positive --dt");
            continue;
        }

        bool matched = false;
        const char* seed = valueFor(nullptr, "--seed", matched);
        if (matched) {
            if (parseUnsigned(seed, cfg.seed)) cfg.seedSet = true;
            else Logger::warn("ignoring invalid value for --seed");
            continue;
        }
        Logger::warn("ignoring unknown option: " + a);
    }
    return ParseOutcome::Run;
}

std::string usage(const char* prog) {
    std::string p = prog ? prog : "diffusion";
    return "usage: " + p + " [options]\n"
           "  -r, --radius <um>          cell radius (default 12)\n"
           "  -g, --gradient <0..1>      concentration gradient (default 0.6)\n"
           "  -t, --temperature <C>      temperature (default 25)\n"
           "      --seed <n>             fixed random seed\n"
           "      --headless             print samples instead of drawing\n"
           "      --duration <s>         headless run length (default 10)\n"
           "      --dt <s>               headless step (default 1/60)\n"
           "  -h, --help                 show this help\n"
           "environment: DIFFUSION_RADIUS DIFFUSION_GRADIENT DIFFUSION_TEMPERATURE DIFFUSION_SEED LOG_LEVEL\n";
}
