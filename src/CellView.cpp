/**
 * @file CellView.cpp
 * @brief ncurses drawing of the membrane cell and status line.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "CellView.h"
#include "MembraneSimulation.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace {
constexpr float Pi = 3.14159265358979323846f;
inline int clampi(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }
}

bool CellView::Projection::toCell(const Vec3& p, int& col, int& row) const {
    col = cols / 2 + (int)std::lround(p.x * scaleX);
    row = rows / 2 - (int)std::lround(p.y * scaleY);
    return col >= 0 && col < cols && row >= 0 && row < rows;
}

CellView::Projection CellView::fit(int cols, int rows, float extent) {
    Projection proj;
    proj.cols = std::max(0, cols);
    proj.rows = std::max(0, rows);
    float e = std::max(1e-6f, extent);
    float halfCols = std::max(0.0f, (proj.cols - 1) / 2.0f);
    float halfRows = std::max(0.0f, (proj.rows - 1) / 2.0f);
    proj.scaleY = halfRows / e;
    proj.scaleX = proj.scaleY * 2.0f;
    if (proj.scaleX * e > halfCols) {
        proj.scaleX = halfCols / e;
        proj.scaleY = proj.scaleX / 2.0f;
    }
    return proj;
}

void CellView::initColors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    init_pair(PairInside, COLOR_RED, -1);
    init_pair(PairOutside, COLOR_GREEN, -1);
    init_pair(PairEnter, COLOR_GREEN, -1);
    init_pair(PairExit, COLOR_CYAN, -1);
    init_pair(PairMembrane, COLOR_MAGENTA, -1);
    init_pair(PairStatus, COLOR_YELLOW, -1);
}

void CellView::putCell(int col, int row, chtype ch, short pair, bool bold) {
    if (bold) wattron(win, A_BOLD);
    wattron(win, COLOR_PAIR(pair));
    mvwaddch(win, row, col, ch);
    wattroff(win, COLOR_PAIR(pair));
    if (bold) wattroff(win, A_BOLD);
}

void CellView::drawMembrane(const Projection& proj, float radius) {
    // Enough samples that neighbouring points land in adjacent cells.
    int samples = clampi((int)std::ceil(2.0f * Pi * radius * proj.scaleX) * 2, 16, 2048);
    for (int k = 0; k < samples; ++k) {
        float a = 2.0f * Pi * (float)k / (float)samples;
        int col, row;
        if (proj.toCell(Vec3(radius * std::cos(a), radius * std::sin(a), 0.0f), col, row)) {
            putCell(col, row, '.', PairMembrane, false);
        }
    }
}

void CellView::drawAll(const MembraneSimulation& sim) {
    if (!win) return;
    int rows, cols; getmaxyx(win, rows, cols);
    int drawRows = rows - 1;
    if (drawRows < 1 || cols < 1) return;
    werase(win);

    const float r = sim.sceneRadius();
    Projection proj = fit(cols, drawRows, r * StepEngine::MaxRadiusFraction);
    drawMembrane(proj, r);

    const ParticlePool& pool = sim.particles();
    for (size_t i = 0; i < pool.activeCount(); ++i) {
        const Particle& p = pool[i];
        int col, row;
        if (!proj.toCell(p.position, col, row)) continue;
        putCell(col, row, 'o', p.outside ? PairOutside : PairInside, false);
    }

    // Bursts on top; younger bursts drawn last.
    for (const CrossingEvent& e : sim.crossingEvents().items()) {
        int col, row;
        if (!proj.toCell(e.position, col, row)) continue;
        bool enter = e.kind == CrossingEvent::Kind::Enter;
        putCell(col, row, '*', enter ? PairEnter : PairExit, enter);
    }
    wnoutrefresh(win);
}

void CellView::drawStatusLine(const MembraneSimulation& sim, bool running, double relativeRate) {
    if (!win) return;
    int rows, cols; getmaxyx(win, rows, cols);
    int y = rows - 1;
    if (y < 0) return;
    wmove(win, y, 0); wclrtoeol(win);

    // Cache legend across frames for given width
    if (legendCacheCols != cols) {
        legendCache = "o in  o out  * enter  * exit ";
        legendCacheCols = cols;
    }
    mvwprintw(win, y, 0, "%s", legendCache.c_str());
    putCell(0, y, 'o', PairInside, false);
    putCell(6, y, 'o', PairOutside, false);
    putCell(13, y, '*', PairEnter, true);
    putCell(22, y, '*', PairExit, false);
    int x = (int)legendCache.size();

    const SimulationParameters& p = sim.parameters();
    const OccupancySample& occ = sim.lastOccupancySample();
    const RateSample& rate = sim.lastRateSample();
    char status[256];
    snprintf(status, sizeof(status),
             "| R %.0fum dC %.2f T %.0fC | in %zu out %zu | in/s %.1f out/s %.1f | rel %.2fx | %s"
             " | [s]tart/[p]ause r/R g/G t/T [x]reseed [q]uit",
             p.radiusUm, p.gradient, p.temperatureC, occ.insideCount, occ.outsideCount,
             rate.inRate, rate.outRate, relativeRate, running ? "RUNNING" : "PAUSED");
    if (x + (int)strlen(status) < cols) {
        mvwprintw(win, y, x, "%s%*s", status, cols - x - (int)strlen(status), "");
    } else {
        mvwprintw(win, y, x, "%s", status);
    }
    wnoutrefresh(win);
}
