#pragma once
/**
 * @file    grid.hpp
 * @brief   Inclusive axis-aligned grid anchored at the origin.
 *
 * The valid cells are x ∈ [0, edgeX], y ∈ [0, edgeY]. A 1×1 grid (both edges 0)
 * is legal. Negative edges are representable so that callers can validate them
 * (see @ref GridBounds::isValid); the grid itself never throws.
 */

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/point_xy.hpp>

namespace marsrover::geometry
{
    namespace bg = boost::geometry;

    /// Integer grid cell (x,y).
    using Cell = bg::model::d2::point_xy<int>;
    /// Axis-aligned rectangle of cells, borders included.
    using CellBox = bg::model::box<Cell>;

    /**
     * @brief Rectangle of valid rover coordinates shared read-only across a run.
     */
    class GridBounds final
    {
      public:
        /**
         * @brief Construct the rectangle [0, edgeX] × [0, edgeY].
         * @param edgeX Largest valid x.
         * @param edgeY Largest valid y.
         */
        constexpr GridBounds (int edgeX, int edgeY) noexcept : edgeX_ (edgeX), edgeY_ (edgeY) {}

        [[nodiscard]] constexpr int edgeX () const noexcept { return edgeX_; }
        [[nodiscard]] constexpr int edgeY () const noexcept { return edgeY_; }

        /// @brief Both edges are non-negative.
        [[nodiscard]] constexpr bool isValid () const noexcept { return edgeX_ >= 0 && edgeY_ >= 0; }

        /// @brief The rectangle as a Boost.Geometry box (min corner at the origin).
        [[nodiscard]] CellBox box () const { return CellBox{Cell{0, 0}, Cell{edgeX_, edgeY_}}; }

        /**
         * @brief Test if a cell lies inside the grid.
         * @param x X coordinate.
         * @param y Y coordinate.
         * @return True if (x,y) is inside or on the border of the rectangle.
         */
        [[nodiscard]] bool contains (int x, int y) const
        {
            if (!isValid ())
                return false;
            return bg::covered_by (Cell{x, y}, box ());
        }

        /// @brief Number of cells, 0 for an invalid grid.
        [[nodiscard]] constexpr long long cellCount () const noexcept
        {
            return isValid () ? static_cast<long long> (edgeX_ + 1LL) * static_cast<long long> (edgeY_ + 1LL) : 0LL;
        }

        friend constexpr bool operator== (const GridBounds &, const GridBounds &) = default;

      private:
        int edgeX_;
        int edgeY_;
    };

} // namespace marsrover::geometry
