#pragma once
/**
 * @file   constants.hpp
 * @brief  Project-wide constants: textual codes, report layout and tool exit codes.
 *
 * Keep every literal that crosses the text boundary (command letters, heading
 * letters, report suffix) in one place so the decoder and the formatter agree.
 */

#include <string_view>

namespace marsrover::core
{
    /*────────────────────────── Command letters ──────────────────────────*/

    /// Move one cell along the current heading.
    inline constexpr char FORWARD_CODE = 'F';

    /// Rotate 90° counter-clockwise in place.
    inline constexpr char ROTATE_LEFT_CODE = 'L';

    /// Rotate 90° clockwise in place.
    inline constexpr char ROTATE_RIGHT_CODE = 'R';

    /*────────────────────────── Heading letters ──────────────────────────*/

    inline constexpr char NORTH_CODE = 'N';
    inline constexpr char EAST_CODE = 'E';
    inline constexpr char SOUTH_CODE = 'S';
    inline constexpr char WEST_CODE = 'W';

    /// Number of distinct headings (rotation group order).
    inline constexpr int HEADING_COUNT = 4;

    /*────────────────────────────── Report ───────────────────────────────*/

    /// Suffix appended to a report when the rover left the grid.
    inline constexpr std::string_view LOST_SUFFIX = " LOST";

    /*──────────────────────────── Tool exit codes ────────────────────────*/

    inline constexpr int EXIT_OK = 0;
    inline constexpr int EXIT_USAGE = 1;   ///< Bad command line or malformed argument.
    inline constexpr int EXIT_MISSION = 2; ///< Mission rejected (validation or decoding).

} // namespace marsrover::core
