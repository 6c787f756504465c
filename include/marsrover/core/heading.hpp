#pragma once
/**
 * @file   heading.hpp
 * @brief  Compass heading, rotation mappings and unit grid steps.
 */

#include <marsrover/core/constants.hpp>

#include <cstdint>
#include <optional>

namespace marsrover::core
{
    /**
     * @enum Heading
     * @brief Compass direction the rover faces. Closed set.
     */
    enum class Heading : std::uint8_t
    {
        North, ///< +y
        East,  ///< +x
        South, ///< −y
        West   ///< −x
    };

    /**
     * @struct GridDelta
     * @brief  Integer displacement of one forward step.
     */
    struct GridDelta
    {
        int dx{}; ///< Change in x.
        int dy{}; ///< Change in y.

        friend constexpr bool operator== (const GridDelta &, const GridDelta &) = default;
    };

    /**
     * @brief  Heading after a 90° counter-clockwise turn.
     * @param h Current heading.
     * @return N→W, W→S, S→E, E→N.
     */
    [[nodiscard]] constexpr Heading rotateLeft (Heading h) noexcept
    {
        switch (h)
        {
            case Heading::North:
                return Heading::West;
            case Heading::East:
                return Heading::North;
            case Heading::South:
                return Heading::East;
            case Heading::West:
                return Heading::South;
        }
        return h; // unreachable for valid enumerators
    }

    /**
     * @brief  Heading after a 90° clockwise turn.
     * @param h Current heading.
     * @return N→E, E→S, S→W, W→N.
     */
    [[nodiscard]] constexpr Heading rotateRight (Heading h) noexcept
    {
        switch (h)
        {
            case Heading::North:
                return Heading::East;
            case Heading::East:
                return Heading::South;
            case Heading::South:
                return Heading::West;
            case Heading::West:
                return Heading::North;
        }
        return h;
    }

    /**
     * @brief  Unit displacement of a forward move along @p h.
     * @param h Heading.
     * @return {0,+1} for North, {+1,0} for East, {0,−1} for South, {−1,0} for West.
     */
    [[nodiscard]] constexpr GridDelta headingDelta (Heading h) noexcept
    {
        switch (h)
        {
            case Heading::North:
                return {0, 1};
            case Heading::East:
                return {1, 0};
            case Heading::South:
                return {0, -1};
            case Heading::West:
                return {-1, 0};
        }
        return {};
    }

    /// @brief Single-letter code used in reports ('N', 'E', 'S', 'W').
    [[nodiscard]] constexpr char headingCode (Heading h) noexcept
    {
        switch (h)
        {
            case Heading::North:
                return NORTH_CODE;
            case Heading::East:
                return EAST_CODE;
            case Heading::South:
                return SOUTH_CODE;
            case Heading::West:
                return WEST_CODE;
        }
        return '?';
    }

    /**
     * @brief  Inverse of @ref headingCode.
     * @param c Heading letter (upper case).
     * @return The heading, or std::nullopt for any other character.
     */
    [[nodiscard]] constexpr std::optional<Heading> headingFromCode (char c) noexcept
    {
        switch (c)
        {
            case NORTH_CODE:
                return Heading::North;
            case EAST_CODE:
                return Heading::East;
            case SOUTH_CODE:
                return Heading::South;
            case WEST_CODE:
                return Heading::West;
            default:
                return std::nullopt;
        }
    }

    static_assert (rotateLeft (rotateRight (Heading::North)) == Heading::North, "left/right must be inverse turns");
    static_assert (rotateRight (rotateRight (rotateRight (rotateRight (Heading::West)))) == Heading::West, "four right turns are a full revolution");

} // namespace marsrover::core
