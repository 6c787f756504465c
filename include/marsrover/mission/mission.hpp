#pragma once
/**
 * @file mission.hpp
 * @brief Caller-side layer: mission configuration, validation, decoding and report generation.
 *
 * Pipeline for one mission:
 *  - validate the grid and the start pose;
 *  - decode the command string (fail-fast);
 *  - run the engine and optionally format the report.
 *
 * Independent missions share nothing, so @ref executeBatch may spread them
 * over OpenMP threads when the project is built with OpenMP.
 */

#include <marsrover/core/state.hpp>
#include <marsrover/engine/rover_engine.hpp>
#include <marsrover/geometry/grid.hpp>
#include <marsrover/io/action_decoder.hpp>
#include <marsrover/io/report.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(_OPENMP)
    #include <omp.h>
#endif

namespace marsrover::mission
{
    using namespace marsrover::core;
    using marsrover::geometry::GridBounds;

    /// Why a mission was rejected.
    enum class MissionError : std::uint8_t
    {
        NegativeGridEdge,
        StartOutOfBounds,
        StartAlreadyLost,
        UnsupportedAction
    };

    /**
     * @brief Rejection reason plus a message suitable for the command line.
     */
    struct MissionFailure
    {
        MissionError error{};
        std::string message;
    };

    /**
     * @brief One rover run: grid, start pose and raw command letters.
     */
    struct Mission
    {
        GridBounds grid{0, 0};
        RoverState start{};
        std::string commands;
    };

    /**
     * @brief  Reject configurations the engine does not expect.
     * @param m Mission to check.
     * @return Nothing on success; otherwise the first problem found.
     */
    [[nodiscard]] inline std::expected<void, MissionFailure> validate (const Mission &m)
    {
        if (!m.grid.isValid ())
            return std::unexpected (MissionFailure{MissionError::NegativeGridEdge,
                                                   "grid edges must be non-negative (got " + std::to_string (m.grid.edgeX ()) + ", " + std::to_string (m.grid.edgeY ()) + ")"});

        if (!m.grid.contains (m.start.x, m.start.y))
            return std::unexpected (MissionFailure{MissionError::StartOutOfBounds, "start position (" + std::to_string (m.start.x) + ", " + std::to_string (m.start.y) +
                                                                                       ") lies outside the grid"});

        if (m.start.lost)
            return std::unexpected (MissionFailure{MissionError::StartAlreadyLost, "start state is already lost"});

        return {};
    }

    /**
     * @brief  Validate, decode and run a mission.
     * @param m Mission.
     * @return Final rover state or the reason the mission was rejected.
     */
    [[nodiscard]] inline std::expected<RoverState, MissionFailure> execute (const Mission &m)
    {
        if (auto ok = validate (m); !ok)
            return std::unexpected (std::move (ok.error ()));

        auto actions = io::decodeActions (m.commands);
        if (!actions)
            return std::unexpected (MissionFailure{MissionError::UnsupportedAction, io::describe (actions.error ())});

        return engine::run (m.grid, m.start, *actions);
    }

    /**
     * @brief  Run a mission and render its final report.
     * @param edgeX    Largest valid x.
     * @param edgeY    Largest valid y.
     * @param start    Initial state.
     * @param commands Command letters.
     * @return Report such as "(4, 4, E)" or "(0, 4, W) LOST", or the rejection reason.
     */
    [[nodiscard]] inline std::expected<std::string, MissionFailure> runWithReport (int edgeX, int edgeY, const RoverState &start, std::string_view commands)
    {
        auto result = execute (Mission{GridBounds{edgeX, edgeY}, start, std::string (commands)});
        if (!result)
            return std::unexpected (std::move (result.error ()));
        return io::formatReport (*result);
    }

    /**
     * @brief  Execute independent missions.
     * @param missions Missions to run.
     * @return One result per mission, in input order.
     */
    [[nodiscard]] inline std::vector<std::expected<RoverState, MissionFailure>> executeBatch (std::span<const Mission> missions)
    {
        std::vector<std::expected<RoverState, MissionFailure>> results (missions.size (), std::unexpected (MissionFailure{}));

        const auto count = static_cast<std::ptrdiff_t> (missions.size ());

#if defined(_OPENMP)
    #pragma omp parallel for schedule(dynamic)
#endif
        for (std::ptrdiff_t i = 0; i < count; ++i)
            results[static_cast<std::size_t> (i)] = execute (missions[static_cast<std::size_t> (i)]);

        return results;
    }

} // namespace marsrover::mission
