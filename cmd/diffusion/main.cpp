/**
 * @file main.cpp
 * @brief Membrane diffusion entry: parses configuration, then either runs the ncurses UI loop or a
 *        fixed-step headless run that prints each sample.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <ncurses.h>
#include <chrono>
#include <thread>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include "CellView.h"
#include "Config.h"
#include "DiffusionModel.h"
#include "Logger.h"
#include "MembraneSimulation.h"

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

static bool g_curses_inited = false;
static void atexit_cleanup() {
    if (g_curses_inited) {
        endwin();
        g_curses_inited = false;
    }
}

// Suspend: restore tty, then stop process with default action
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode();
        endwin();
        g_curses_inited = false;
    }
    struct sigaction sa{}; sa.sa_handler = SIG_DFL; sigemptyset(&sa.sa_mask); sa.sa_flags = 0; sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume: restore curses state and redraw
static void handle_sigcont(int) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    reset_prog_mode();
    refresh();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    CellView::initColors();
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
}

static std::unique_ptr<MembraneSimulation> makeSimulation(const Config& cfg) {
    if (cfg.seedSet) {
        return std::make_unique<MembraneSimulation>(
            cfg.params, std::make_unique<MersenneRandomSource>(cfg.seed));
    }
    return std::make_unique<MembraneSimulation>(cfg.params);
}

static double relativeRateFor(const SimulationParameters& p) {
    return computeDiffusionRate({p.radiusUm, p.gradient, p.temperatureC}).relativeRate;
}

/** @brief Fixed-step run without a terminal UI; one stdout line per sampling window. */
static int runHeadless(const Config& cfg) {
    auto sim = makeSimulation(cfg);
    Logger::info("headless run: " + describeParameters(sim->parameters()) +
                 " duration=" + std::to_string(cfg.durationS) + "s dt=" + std::to_string(cfg.dtS) + "s");
    // The occupancy callback of a window fires before its rate callback.
    OccupancySample occ;
    sim->setOccupancyCallback([&occ](const OccupancySample& o) { occ = o; });
    sim->setRateCallback([&](const RateSample& r) {
        std::printf("t=%.2f inside=%zu outside=%zu in_rate=%.2f out_rate=%.2f\n",
                    sim->simulatedSeconds(), occ.insideCount, occ.outsideCount, r.inRate, r.outRate);
    });
    while (!g_stop && sim->simulatedSeconds() + 1e-9 < cfg.durationS) {
        sim->step(cfg.dtS);
    }
    std::fflush(stdout);
    Logger::info("headless run finished: samples=" + std::to_string(sim->sampleCount()));
    return 0;
}

/** @brief Clamp a slider move to the control layer and hand it to the simulation. */
static void applyControl(MembraneSimulation& sim, SimulationParameters p) {
    SimulationParameters applied = sim.configure(clampParameters(p, ControlLimits));
    Logger::info("control: " + describeParameters(applied));
}

static int runInteractive(const Config& cfg) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    struct sigaction sc{}; sc.sa_handler = handle_sigcont; sigemptyset(&sc.sa_mask); sc.sa_flags = 0; sigaction(SIGCONT, &sc, nullptr);

    initscr();
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    CellView::initColors();

    int rows, cols; getmaxyx(stdscr, rows, cols);
    if (rows < 2 || cols < 1) { Logger::error("terminal too small"); endwin(); g_curses_inited = false; return 1; }

    auto sim = makeSimulation(cfg);
    // Sliders only cover the control ranges.
    applyControl(*sim, sim->parameters());
    CellView view(stdscr);
    double relRate = relativeRateFor(sim->parameters());
    bool running = false;

    view.drawAll(*sim);
    view.drawStatusLine(*sim, running, relRate);
    doupdate();

    bool done = false;
    using namespace std::chrono;
    auto lastStep = steady_clock::now();
    while (!done) {
        if (g_stop) done = true;
        if (running) {
            auto now = steady_clock::now();
            float dt = duration_cast<duration<float>>(now - lastStep).count();
            lastStep = now;
            // A stalled terminal must not turn into one huge step.
            if (dt > 0.1f) dt = 0.1f;
            sim->step(dt);
        } else {
            // keep time reference fresh while paused
            lastStep = steady_clock::now();
        }
        view.drawAll(*sim);
        view.drawStatusLine(*sim, running, relRate);
        doupdate();

        SimulationParameters p = sim->parameters();
        bool changed = true;
        int ch = getch();
        switch (ch) {
            case 'q': case 'Q':
                Logger::info("quit requested"); done = true; changed = false; break;
            case 's': case 'S':
                running = !running; Logger::info(std::string("running = ") + (running ? "true" : "false")); changed = false; break;
            case 'p': case 'P':
                running = false; Logger::info("paused"); changed = false; break;
            case 'x': case 'X':
                sim->reseed(); changed = false; break;
            case 'r': p.radiusUm -= 1.0f; break;
            case 'R': p.radiusUm += 1.0f; break;
            case 'g': p.gradient -= 0.05f; break;
            case 'G': p.gradient += 0.05f; break;
            case 't': p.temperatureC -= 1.0f; break;
            case 'T': p.temperatureC += 1.0f; break;
            default:
                changed = false; break;
        }
        if (changed) {
            applyControl(*sim, p);
            relRate = relativeRateFor(sim->parameters());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    endwin();
    g_curses_inited = false;
    return 0;
}

int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "diffusion");
    Logger::info("diffusion starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (diffusion)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (diffusion)"); }
            } else {
                Logger::error("std::terminate (diffusion): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    Config cfg;
    applyEnvironment(cfg);
    if (parseArguments(cfg, argc, argv) == ParseOutcome::Help) {
        std::cout << usage(argc > 0 ? argv[0] : "diffusion");
        Logger::shutdown();
        return 0;
    }

    int rc = cfg.headless ? runHeadless(cfg) : runInteractive(cfg);
    Logger::info("diffusion terminating");
    Logger::shutdown();
    return rc;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (diffusion)", e);
        Logger::shutdown();
        return 2;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("unhandled exception (diffusion)");
        Logger::shutdown();
        return 2;
    }
}
