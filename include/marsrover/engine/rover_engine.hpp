#pragma once
/**
 * @file rover_engine.hpp
 * @brief Pure state-transition engine: one action at a time, or a whole command sequence.
 *
 * Two implicit modes:
 *  - active: the rover turns and moves inside the grid;
 *  - lost:   a forward move would have left the grid. The state freezes at the
 *            last in-bounds pose and no further action is applied.
 *
 * Every function is a pure function of its arguments; nothing here throws or
 * keeps global state, so independent runs may execute concurrently.
 */

#include <marsrover/core/action.hpp>
#include <marsrover/core/heading.hpp>
#include <marsrover/core/state.hpp>
#include <marsrover/geometry/grid.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace marsrover::engine
{
    using namespace marsrover::core;
    using marsrover::geometry::GridBounds;

    /**
     * @brief Optional diagnostics filled by @ref run when requested.
     */
    struct RunTrace
    {
        std::vector<RoverState> states;    ///< Initial state followed by each produced state.
        std::size_t applied{0};            ///< Actions actually applied (remaining ones are skipped once lost).
        std::optional<std::size_t> lostAt; ///< Index of the action that lost the rover, if any.

        /// @brief Reset to an empty trace.
        void clear ()
        {
            states.clear ();
            applied = 0;
            lostAt.reset ();
        }
    };

    /**
     * @brief  Candidate state one cell ahead. No bounds check.
     *
     * The shifted coordinate must be representable as int; @ref step only
     * calls this once the target cell is known to lie inside the grid.
     *
     * @param state Current state.
     * @return Same heading and lost flag, position shifted by @ref headingDelta.
     */
    [[nodiscard]] constexpr RoverState applyForward (const RoverState &state) noexcept
    {
        const GridDelta d = headingDelta (state.heading);
        return state.withPosition (state.x + d.dx, state.y + d.dy);
    }

    /// @brief Same position, heading turned 90° counter-clockwise.
    [[nodiscard]] constexpr RoverState applyRotateLeft (const RoverState &state) noexcept { return state.withHeading (rotateLeft (state.heading)); }

    /// @brief Same position, heading turned 90° clockwise.
    [[nodiscard]] constexpr RoverState applyRotateRight (const RoverState &state) noexcept { return state.withHeading (rotateRight (state.heading)); }

    /**
     * @brief  Axis bounds test.
     * @param coordinate Coordinate on one axis.
     * @param edge       Largest valid coordinate on that axis.
     * @return True iff coordinate < 0 or coordinate > edge.
     */
    [[nodiscard]] constexpr bool isOutOfBounds (long long coordinate, long long edge) noexcept { return coordinate < 0 || coordinate > edge; }

    /**
     * @brief  Single transition.
     *
     * Rotations always succeed. A forward move that would leave the grid
     * returns the *pre-move* state with lost=true; the out-of-bounds
     * coordinate is never stored.
     *
     * A lost state is returned unchanged for every action. The target cell
     * is computed in long long, so a border at INT_MAX cannot overflow.
     *
     * @param grid   Grid bounds.
     * @param state  Current state.
     * @param action Action to apply.
     * @return Next state.
     */
    [[nodiscard]] constexpr RoverState step (const GridBounds &grid, const RoverState &state, Action action) noexcept
    {
        if (state.lost)
            return state;

        switch (action)
        {
            case Action::RotateLeft:
                return applyRotateLeft (state);
            case Action::RotateRight:
                return applyRotateRight (state);
            case Action::Forward:
            {
                const GridDelta d = headingDelta (state.heading);
                const long long nx = static_cast<long long> (state.x) + d.dx;
                const long long ny = static_cast<long long> (state.y) + d.dy;
                if (isOutOfBounds (nx, grid.edgeX ()) || isOutOfBounds (ny, grid.edgeY ()))
                    return state.markedLost ();
                return applyForward (state);
            }
        }
        return state;
    }

    /**
     * @brief  Fold @p actions over @p initial, left to right.
     *
     * Stops as soon as the accumulated state is lost; the remaining actions are
     * not evaluated. Iterative, so stack usage does not grow with the input.
     *
     * @param grid    Grid bounds.
     * @param initial Initial state (returned unchanged for an empty sequence or if already lost).
     * @param actions Ordered actions.
     * @param trace   Optional diagnostics output (may be nullptr).
     * @return Final state.
     */
    [[nodiscard]] inline RoverState run (const GridBounds &grid, const RoverState &initial, std::span<const Action> actions, RunTrace *trace)
    {
        if (trace)
        {
            trace->clear ();
            trace->states.reserve (actions.size () + 1);
            trace->states.push_back (initial);
        }

        RoverState current = initial;
        for (std::size_t i = 0; i < actions.size (); ++i)
        {
            if (current.lost)
                break;

            current = step (grid, current, actions[i]);

            if (trace)
            {
                trace->states.push_back (current);
                trace->applied = i + 1;
                if (current.lost)
                    trace->lostAt = i;
            }
        }
        return current;
    }

    /// @brief Same as the tracing overload without diagnostics.
    [[nodiscard]] constexpr RoverState run (const GridBounds &grid, const RoverState &initial, std::span<const Action> actions) noexcept
    {
        RoverState current = initial;
        for (const Action action : actions)
        {
            if (current.lost)
                return current;
            current = step (grid, current, action);
        }
        return current;
    }

} // namespace marsrover::engine
