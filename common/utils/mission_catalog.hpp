#pragma once
/**
 * @file   mission_catalog.hpp
 * @brief  Small library of reproducible missions for tools and tests.
 *
 * Each entry carries the mission and the report it is known to produce.
 */

#include <marsrover.hpp>

#include <random>
#include <string>
#include <vector>

namespace marsrover::utils
{
    using marsrover::core::Heading;
    using marsrover::core::RoverState;
    using marsrover::geometry::GridBounds;
    using marsrover::mission::Mission;

    /**
     * @brief Named mission with its expected report line.
     */
    struct CatalogEntry
    {
        std::string name;
        Mission mission;
        std::string expectedReport;
    };

    /**
     * @brief Reference missions (inclusive grid edges, origin at (0,0)).
     * @return Entries covering survivals, losses on every border and full loops.
     */
    inline std::vector<CatalogEntry> sampleMissions ()
    {
        return {
            {"east_detour", {GridBounds{4, 8}, RoverState{2, 3, Heading::East}, "LFRFF"}, "(4, 4, E)"},
            {"west_wall", {GridBounds{4, 8}, RoverState{0, 2, Heading::North}, "FFLFRFF"}, "(0, 4, W) LOST"},
            {"u_turn", {GridBounds{4, 8}, RoverState{2, 3, Heading::North}, "FLLFR"}, "(2, 3, W)"},
            {"south_wall", {GridBounds{4, 8}, RoverState{1, 0, Heading::South}, "FFRLF"}, "(1, 0, S) LOST"},
            {"staircase", {GridBounds{5, 6}, RoverState{5, 5, Heading::West}, "FFLFFRFFLLL"}, "(1, 3, N)"},
            {"perimeter_loop", {GridBounds{5, 5}, RoverState{0, 0, Heading::North}, "FFFFRFFFFRFFFFRFFFFR"}, "(0, 0, N)"},
            {"north_wall", {GridBounds{5, 5}, RoverState{0, 0, Heading::North}, "FFFFFFRRFF"}, "(0, 5, N) LOST"},
        };
    }

    /**
     * @brief Random command string over {F, L, R}.
     * @param rng    PRNG used for reproducibility.
     * @param length Number of letters.
     * @return Command string.
     */
    inline std::string randomCommands (std::mt19937 &rng, std::size_t length)
    {
        static constexpr char letters[] = {marsrover::core::FORWARD_CODE, marsrover::core::ROTATE_LEFT_CODE, marsrover::core::ROTATE_RIGHT_CODE};
        std::uniform_int_distribution<int> pick (0, 2);

        std::string out;
        out.reserve (length);
        for (std::size_t i = 0; i < length; ++i)
            out.push_back (letters[pick (rng)]);
        return out;
    }

    /**
     * @brief Random valid mission on a grid up to @p maxEdge in each direction.
     * @param rng      PRNG used for reproducibility.
     * @param maxEdge  Largest edge value drawn.
     * @param length   Command length.
     * @return Mission whose start lies inside its grid.
     */
    inline Mission randomMission (std::mt19937 &rng, int maxEdge, std::size_t length)
    {
        std::uniform_int_distribution<int> edge (0, maxEdge);
        std::uniform_int_distribution<int> heading (0, marsrover::core::HEADING_COUNT - 1);

        const int ex = edge (rng);
        const int ey = edge (rng);
        std::uniform_int_distribution<int> ux (0, ex);
        std::uniform_int_distribution<int> uy (0, ey);

        const RoverState start{ux (rng), uy (rng), static_cast<Heading> (heading (rng))};
        return Mission{GridBounds{ex, ey}, start, randomCommands (rng, length)};
    }

} // namespace marsrover::utils
