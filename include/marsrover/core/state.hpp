#pragma once
/**
 * @file   state.hpp
 * @brief  Immutable rover pose on the grid plus the lost flag.
 */

#include <marsrover/core/heading.hpp>

#include <type_traits>

namespace marsrover::core
{
    /**
     * @struct RoverState
     * @brief  Rover position, heading and lost flag at one instant.
     *
     * Treated as a value: transitions build a new state with the helpers below
     * instead of assigning fields. Once @ref lost is set, x, y and heading hold
     * the last in-bounds pose.
     */
    struct RoverState
    {
        int x{};                         ///< Column.
        int y{};                         ///< Row.
        Heading heading{Heading::North}; ///< Facing direction.
        bool lost{false};                ///< Rover left the grid.

        /// @brief Copy of this state moved to (nx, ny).
        [[nodiscard]] constexpr RoverState withPosition (int nx, int ny) const noexcept { return {nx, ny, heading, lost}; }

        /// @brief Copy of this state facing @p h.
        [[nodiscard]] constexpr RoverState withHeading (Heading h) const noexcept { return {x, y, h, lost}; }

        /// @brief Copy of this state flagged as lost; pose unchanged.
        [[nodiscard]] constexpr RoverState markedLost () const noexcept { return {x, y, heading, true}; }

        friend constexpr bool operator== (const RoverState &, const RoverState &) = default;
    };

    static_assert (std::is_trivially_copyable_v<RoverState>, "RoverState must remain trivially copyable");

} // namespace marsrover::core
