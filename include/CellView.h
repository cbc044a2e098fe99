/**
 * @file CellView.h
 * @brief ncurses renderer: orthographic x/y projection of the particle cloud, membrane outline,
 *        crossing bursts and a one-line status read-out.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <ncurses.h>
#include <string>

#include "Vec3.h"

class MembraneSimulation;

/**
 * @class CellView
 * @brief Draws a MembraneSimulation into a window; the bottom row is reserved for the status line.
 */
class CellView {
public:
    /** @brief Color pair ids initialised by initColors(). */
    enum ColorPair : short {
        PairInside = 1,   /**< particle inside the membrane (red) */
        PairOutside = 2,  /**< particle outside the membrane (green) */
        PairEnter = 3,    /**< enter burst (green, bold) */
        PairExit = 4,     /**< exit burst (cyan) */
        PairMembrane = 5, /**< membrane outline (magenta) */
        PairStatus = 6    /**< status line highlights (yellow) */
    };

    /** @brief Screen mapping for one frame. Columns are scaled 2x to compensate for tall cells. */
    struct Projection {
        int cols{0};
        int rows{0};
        float scaleX{1.0f};
        float scaleY{1.0f};
        /** @brief Map scene (x,y) to a cell; false if it falls outside the drawable area. */
        bool toCell(const Vec3& p, int& col, int& row) const;
    };

    /** @brief Fit a square of half-size @p extent (scene units) into a cols x rows area. */
    static Projection fit(int cols, int rows, float extent);

    /** @brief Define the color pairs; safe to call again after SIGCONT. */
    static void initColors();

    explicit CellView(WINDOW* w = nullptr) : win(w) {}

    /** @brief Erase and redraw membrane, particles and bursts (status line excluded). */
    void drawAll(const MembraneSimulation& sim);
    /** @brief Redraw the bottom status line; @p relativeRate comes from the analytic model. */
    void drawStatusLine(const MembraneSimulation& sim, bool running, double relativeRate);

private:
    void drawMembrane(const Projection& proj, float radius);
    void putCell(int col, int row, chtype ch, short pair, bool bold);

    WINDOW* win{nullptr};
    int legendCacheCols{-1};
    std::string legendCache;
};
