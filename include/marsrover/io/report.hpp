#pragma once
/**
 * @file   report.hpp
 * @brief  Textual rendering of rover states.
 */

#include <marsrover/core/constants.hpp>
#include <marsrover/core/heading.hpp>
#include <marsrover/core/state.hpp>

#include <ostream>
#include <string>

namespace marsrover::io
{
    using namespace marsrover::core;

    /**
     * @brief  Final report line.
     * @param state Rover state.
     * @return "(x, y, H)" followed by " LOST" when the rover left the grid.
     */
    [[nodiscard]] inline std::string formatReport (const RoverState &state)
    {
        std::string out = "(" + std::to_string (state.x) + ", " + std::to_string (state.y) + ", " + headingCode (state.heading) + ")";
        if (state.lost)
            out += LOST_SUFFIX;
        return out;
    }

} // namespace marsrover::io

namespace marsrover::core
{
    inline std::ostream &operator<< (std::ostream &os, Heading h) { return os << headingCode (h); }

    /// @brief Diagnostic form, e.g. "RoverState{x=1, y=0, heading=E, lost=true}".
    inline std::ostream &operator<< (std::ostream &os, const RoverState &s)
    {
        return os << "RoverState{x=" << s.x << ", y=" << s.y << ", heading=" << s.heading << ", lost=" << (s.lost ? "true" : "false") << '}';
    }

} // namespace marsrover::core
