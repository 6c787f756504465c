#pragma once
/**
 * @file
 * @brief Lightweight SVG visualizer for rover grids, travelled paths and poses.
 *
 * Header-only helper to export simple SVG figures that show:
 *  - the grid cells (one square per valid coordinate),
 *  - the travelled path through cell centres,
 *  - start/final poses as triangles pointing along the heading, and
 *  - a cross on the final pose when the rover was lost.
 *
 * The visualizer auto-fits the world extents into a square canvas and flips
 * the Y axis for SVG (world Y up).
 */

#include <marsrover.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace marsrover::utils
{
    using marsrover::core::Heading;
    using marsrover::core::RoverState;
    using marsrover::geometry::GridBounds;

    /**
     * @brief Simple color palette for the SVG output.
     */
    struct Palette
    {
        std::string canvasBackground = "#ffffff"; ///< Canvas background.
        std::string cellFill = "#e9fef2";         ///< Fill color for grid cells.
        std::string cellStroke = "#a7adba";       ///< Stroke color for cell outlines.
        std::string border = "#4f5b66";           ///< Stroke color for the grid border.
        std::string path = "#88d8b0";             ///< Stroke color for the travelled path.
        std::string startPose = "#462ac7";        ///< Fill color for the start pose marker.
        std::string finalPose = "#20b255";        ///< Fill color for the final pose marker.
        std::string lost = "#d0342c";             ///< Color of the lost marker.
    };

    /**
     * @brief SVG visualizer that auto-fits world geometry to a square canvas.
     *
     * Typical usage:
     * @code
     *   Visualizer viz("out.svg");
     *   viz.drawGrid(grid);
     *   viz.drawPath(trace.states);
     *   viz.drawStartPose(trace.states.front());
     *   viz.drawFinalPose(trace.states.back());
     *   // viz.finish(); // optional; destructor will close the file as well
     * @endcode
     *
     * World extents are taken from the first element drawn after construction
     * (normally the grid), so draw the largest geometry first.
     */
    class Visualizer
    {
      public:
        /**
         * @brief Construct a visualizer bound to an output file.
         * @param filename   Target SVG file path.
         * @param canvasPx   Square canvas size in pixels (width = height = canvasPx).
         * @param palette    Optional color palette (defaults provided).
         * @throws std::invalid_argument if canvasPx <= 0.
         * @throws std::runtime_error if the file cannot be opened.
         */
        explicit Visualizer (std::string_view filename, int canvasPx = 800, Palette palette = {})
            : canvasPx_ (canvasPx), palette_ (std::move (palette)), out_ (std::string (filename), std::ios::trunc)
        {
            if (canvasPx_ <= 0)
                throw std::invalid_argument ("Visualizer: canvasPx must be positive");
            if (!out_)
                throw std::runtime_error ("Visualizer: cannot open " + std::string (filename));
            resetWorldExtents ();
        }

        /// @brief Flush and close the SVG file if still open.
        ~Visualizer () { finish (); }

        Visualizer (const Visualizer &) = delete;
        Visualizer &operator= (const Visualizer &) = delete;

        /**
         * @brief Draw the grid: one square per cell, then the outer border.
         *
         * Grids larger than @p maxCells are drawn as a single filled rectangle
         * so that the SVG size stays bounded.
         *
         * @param grid         Grid bounds (ignored if invalid).
         * @param strokeWidth  Stroke width of cell outlines in pixels.
         * @param maxCells     Largest cell count drawn cell by cell.
         */
        void drawGrid (const GridBounds &grid, double strokeWidth = 0.6, long long maxCells = 10'000)
        {
            if (!grid.isValid ())
                return;

            const double xMax = static_cast<double> (grid.edgeX ()) + 0.5;
            const double yMax = static_cast<double> (grid.edgeY ()) + 0.5;

            trackWorld (-0.5, -0.5);
            trackWorld (xMax, yMax);
            ensureHeader ();

            if (grid.cellCount () <= maxCells)
            {
                for (long long x = 0; x <= grid.edgeX (); ++x)
                    for (long long y = 0; y <= grid.edgeY (); ++y)
                    {
                        const double cx = static_cast<double> (x);
                        const double cy = static_cast<double> (y);
                        rectWorld (cx - 0.5, cy - 0.5, cx + 0.5, cy + 0.5, palette_.cellFill, palette_.cellStroke, strokeWidth);
                    }
                rectWorld (-0.5, -0.5, xMax, yMax, "none", palette_.border, 2.0 * strokeWidth);
            }
            else
            {
                rectWorld (-0.5, -0.5, xMax, yMax, palette_.cellFill, palette_.border, 2.0 * strokeWidth);
            }
        }

        /**
         * @brief Draw a polyline through the cell centres of consecutive states.
         * @param states Visited states (repeated positions from turns are harmless).
         * @param stroke Stroke width in pixels.
         */
        void drawPath (std::span<const RoverState> states, double stroke = 3.0)
        {
            if (states.empty ())
                return;

            for (const auto &s : states)
                trackWorld (s.x, s.y);
            ensureHeader ();

            out_ << R"(  <polyline fill="none" stroke=")" << palette_.path << R"(" stroke-width=")" << stroke << R"(" stroke-linejoin="round" points=")";
            for (const auto &s : states)
            {
                const auto [x, y] = toSvg (s.x, s.y);
                out_ << x << ',' << y << ' ';
            }
            out_ << "\"/>\n";
        }

        /**
         * @brief Draw a triangular pose marker pointing along @p s.heading.
         * @param s      Pose to draw.
         * @param rPx    Marker size (approximate radius in pixels).
         * @param color  Fill color for the marker.
         */
        void drawPose (const RoverState &s, double rPx, const std::string &color)
        {
            trackWorld (s.x, s.y);
            ensureHeader ();

            const auto [cx, cy] = toSvg (s.x, s.y);
            const auto d = marsrover::core::headingDelta (s.heading);
            const double dx = d.dx * rPx;
            const double dy = -d.dy * rPx; // flip Y for SVG

            const double ax = cx + dx;
            const double ay = cy + dy;
            const double bx = cx - 0.5 * dx + 0.6 * dy;
            const double by = cy - 0.5 * dy - 0.6 * dx;
            const double cx2 = cx - 0.5 * dx - 0.6 * dy;
            const double cy2 = cy - 0.5 * dy + 0.6 * dx;

            out_ << "  <polygon fill=\"" << color << "\" points=\"" << ax << ',' << ay << ' ' << bx << ',' << by << ' ' << cx2 << ',' << cy2 << "\"/>\n";
        }

        /// @brief Start pose with the palette's start color.
        void drawStartPose (const RoverState &s, double rPx = 9.0) { drawPose (s, rPx, palette_.startPose); }

        /**
         * @brief Final pose; a lost rover also gets a cross on its last known cell.
         * @param s    Final state.
         * @param rPx  Marker size in pixels.
         */
        void drawFinalPose (const RoverState &s, double rPx = 9.0)
        {
            drawPose (s, rPx, s.lost ? palette_.lost : palette_.finalPose);
            if (s.lost)
                crossWorld (s.x, s.y, 1.4 * rPx, palette_.lost, 2.0);
        }

        /// @brief Finalize the SVG (idempotent). Called automatically by the destructor.
        void finish ()
        {
            if (out_.is_open ())
            {
                ensureHeader ();
                out_ << " </g>\n</svg>\n";
                out_.close ();
            }
        }

      private:
        /// @brief Reset world extents to ±∞ sentinels.
        void resetWorldExtents ()
        {
            xMinWorld_ = std::numeric_limits<double>::infinity ();
            xMaxWorld_ = -xMinWorld_;
            yMinWorld_ = xMinWorld_;
            yMaxWorld_ = -xMinWorld_;
        }

        /// @brief Expand stored world extents to include (x,y).
        void trackWorld (double x, double y)
        {
            if (svgOpen_)
                return; // layout is frozen once the header is written
            xMinWorld_ = std::min (xMinWorld_, x);
            xMaxWorld_ = std::max (xMaxWorld_, x);
            yMinWorld_ = std::min (yMinWorld_, y);
            yMaxWorld_ = std::max (yMaxWorld_, y);
        }

        /*──────────────────── low-level SVG helpers ────────────────────*/
        void rectWorld (double x0, double y0, double x1, double y1, const std::string &fill, const std::string &stroke, double strokeWidth)
        {
            const auto [sx0, sy0] = toSvg (x0, y1); // top-left in canvas space
            const auto [sx1, sy1] = toSvg (x1, y0);
            out_ << "  <rect x=\"" << sx0 << "\" y=\"" << sy0 << "\" width=\"" << (sx1 - sx0) << "\" height=\"" << (sy1 - sy0) << "\" fill=\"" << fill << "\" stroke=\"" << stroke
                 << "\" stroke-width=\"" << strokeWidth << "\"/>\n";
        }

        void crossWorld (double x, double y, double rPx, const std::string &color, double width)
        {
            const auto [cx, cy] = toSvg (x, y);
            lineSvg (cx - rPx, cy - rPx, cx + rPx, cy + rPx, color, width);
            lineSvg (cx - rPx, cy + rPx, cx + rPx, cy - rPx, color, width);
        }

        void lineSvg (double x0, double y0, double x1, double y1, const std::string &color, double width)
        {
            out_ << "  <line x1=\"" << x0 << "\" y1=\"" << y0 << "\" x2=\"" << x1 << "\" y2=\"" << y1 << "\" stroke=\"" << color << "\" stroke-width=\"" << width << "\"/>\n";
        }

        /*──────────────────── header & transforms ──────────────────────*/
        /// @brief Ensure the SVG header/group has been written (runs auto-fit first if needed).
        void ensureHeader ()
        {
            if (svgOpen_)
                return;
            autoFit ();
            beginSvg ();
        }

        /// @brief Compute scale/offset so that the tracked world extents fill the canvas.
        void autoFit ()
        {
            if (!std::isfinite (xMinWorld_))
                return;

            const double dx = xMaxWorld_ - xMinWorld_;
            const double dy = yMaxWorld_ - yMinWorld_;
            const double half = std::max (dx, dy) / 2.0;
            if (half < 1e-9)
                return; // degenerate

            scale_ = (1.0 - margin_) * canvasPx_ / (2.0 * half);
            offsetX_ = -(xMinWorld_ + xMaxWorld_) / 2.0;
            offsetY_ = -(yMinWorld_ + yMaxWorld_) / 2.0;
        }

        /// @brief Begin the SVG document and open a root <g> group.
        void beginSvg ()
        {
            out_ << R"(<?xml version="1.0"?>)"
                 << "\n<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << canvasPx_ << "\" height=\"" << canvasPx_ << "\" viewBox=\"0 0 " << canvasPx_ << ' ' << canvasPx_
                 << "\">\n"
                 << "  <rect width=\"" << canvasPx_ << "\" height=\"" << canvasPx_ << "\" fill=\"" << palette_.canvasBackground << "\"/>\n"
                 << " <g>\n";
            svgOpen_ = true;
        }

        /**
         * @brief Convert world coordinates to canvas (SVG) coordinates.
         * @param xw  World X.
         * @param yw  World Y.
         * @return Pair {xCanvas, yCanvas}. Y is flipped for SVG.
         */
        [[nodiscard]] std::pair<double, double> toSvg (double xw, double yw) const
        {
            const double x = (xw + offsetX_) * scale_ + canvasPx_ / 2.0;
            const double y = (yw + offsetY_) * scale_ + canvasPx_ / 2.0;
            return {x, canvasPx_ - y};
        }

        /*────────────────────────── data ───────────────────────────────*/
        int canvasPx_;      ///< Canvas size (square) in pixels.
        Palette palette_;   ///< Active color palette.
        std::ofstream out_; ///< Output SVG stream.

        double xMinWorld_{};
        double xMaxWorld_{};
        double yMinWorld_{};
        double yMaxWorld_{};

        double scale_ = 1.0;   ///< Pixels per world unit.
        double offsetX_ = 0.0; ///< World X offset applied before scaling.
        double offsetY_ = 0.0; ///< World Y offset applied before scaling.
        double margin_ = 0.05; ///< Fractional margin for auto-fit.

        bool svgOpen_ = false; ///< Whether the SVG header/group is open.
    };

} // namespace marsrover::utils
