/**
 * @file mission_tests.cpp
 * @brief Tests for mission validation, execution, report generation and batches.
 */

#include <marsrover/mission/mission.hpp>

#include <utils/mission_catalog.hpp>

#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

using namespace marsrover::core;
using namespace marsrover::mission;
using marsrover::geometry::GridBounds;

/*──────────────────────────── report scenarios ────────────────────────────*/

/// @brief One reference scenario: grid, start, commands and expected report.
struct ReportCase
{
    GridBounds grid;
    RoverState start;
    std::string commands;
    std::string expected;
};

class ReportScenarioTest : public ::testing::TestWithParam<ReportCase>
{
};

TEST_P (ReportScenarioTest, ProducesExpectedReport)
{
    const auto &c = GetParam ();
    const auto report = runWithReport (c.grid.edgeX (), c.grid.edgeY (), c.start, c.commands);
    ASSERT_TRUE (report.has_value ()) << report.error ().message;
    EXPECT_EQ (*report, c.expected);
}

INSTANTIATE_TEST_SUITE_P (ReferenceMissions, ReportScenarioTest,
                          ::testing::Values (ReportCase{{4, 8}, {2, 3, Heading::East}, "LFRFF", "(4, 4, E)"},
                                             ReportCase{{4, 8}, {0, 2, Heading::North}, "FFLFRFF", "(0, 4, W) LOST"},
                                             ReportCase{{4, 8}, {2, 3, Heading::North}, "FLLFR", "(2, 3, W)"},
                                             ReportCase{{4, 8}, {1, 0, Heading::South}, "FFRLF", "(1, 0, S) LOST"},
                                             ReportCase{{5, 6}, {5, 5, Heading::West}, "FFLFFRFFLLL", "(1, 3, N)"},
                                             ReportCase{{5, 5}, {0, 0, Heading::North}, "FFFFRFFFFRFFFFRFFFFR", "(0, 0, N)"},
                                             ReportCase{{5, 5}, {0, 0, Heading::North}, "FFFFFFRRFF", "(0, 5, N) LOST"},
                                             ReportCase{{0, 0}, {0, 0, Heading::East}, "", "(0, 0, E)"},
                                             ReportCase{{0, 0}, {0, 0, Heading::East}, "R", "(0, 0, S)"},
                                             ReportCase{{0, 0}, {0, 0, Heading::East}, "F", "(0, 0, E) LOST"}));

/// @brief The catalogue shipped with the tools agrees with its own expectations.
TEST (MissionTests, CatalogReports)
{
    for (const auto &entry : marsrover::utils::sampleMissions ())
    {
        const auto result = execute (entry.mission);
        ASSERT_TRUE (result.has_value ()) << entry.name;
        EXPECT_EQ (marsrover::io::formatReport (*result), entry.expectedReport) << entry.name;
    }
}

/*────────────────────────────── validation ────────────────────────────────*/

TEST (MissionTests, ValidMission)
{
    EXPECT_TRUE (validate (Mission{GridBounds{0, 0}, RoverState{0, 0, Heading::East}, ""}).has_value ());
    EXPECT_TRUE (validate (Mission{GridBounds{4, 8}, RoverState{4, 8, Heading::South}, "FFF"}).has_value ());
}

TEST (MissionTests, RejectsNegativeEdges)
{
    const auto result = validate (Mission{GridBounds{-1, 5}, RoverState{0, 0, Heading::North}, "F"});
    ASSERT_FALSE (result.has_value ());
    EXPECT_EQ (result.error ().error, MissionError::NegativeGridEdge);
}

TEST (MissionTests, RejectsStartOutsideGrid)
{
    const auto result = validate (Mission{GridBounds{4, 8}, RoverState{5, 0, Heading::North}, "F"});
    ASSERT_FALSE (result.has_value ());
    EXPECT_EQ (result.error ().error, MissionError::StartOutOfBounds);
    EXPECT_EQ (result.error ().message, "start position (5, 0) lies outside the grid");
}

TEST (MissionTests, RejectsLostStart)
{
    const auto result = validate (Mission{GridBounds{4, 8}, RoverState{1, 1, Heading::North, true}, "F"});
    ASSERT_FALSE (result.has_value ());
    EXPECT_EQ (result.error ().error, MissionError::StartAlreadyLost);
}

/*──────────────────────────────── execution ───────────────────────────────*/

/// @brief A bad letter anywhere rejects the mission, even after a fatal move.
TEST (MissionTests, UnsupportedActionIsFatal)
{
    const auto result = runWithReport (0, 0, {0, 0, Heading::East}, "FLx");
    ASSERT_FALSE (result.has_value ());
    EXPECT_EQ (result.error ().error, MissionError::UnsupportedAction);
    EXPECT_EQ (result.error ().message, "unsupported rover action 'x' at position 2");
}

TEST (MissionTests, ValidationRunsBeforeDecoding)
{
    const auto result = execute (Mission{GridBounds{-3, -3}, RoverState{}, "???"});
    ASSERT_FALSE (result.has_value ());
    EXPECT_EQ (result.error ().error, MissionError::NegativeGridEdge);
}

/*───────────────────────────────── batches ────────────────────────────────*/

/// @brief Batch results match one-by-one execution, in input order.
TEST (MissionTests, BatchPreservesOrder)
{
    std::mt19937 rng (7);
    std::vector<Mission> missions;
    for (int i = 0; i < 64; ++i)
        missions.push_back (marsrover::utils::randomMission (rng, 6, 30));
    missions.push_back (Mission{GridBounds{2, 2}, RoverState{}, "FZ"});
    missions.push_back (Mission{GridBounds{2, 2}, RoverState{9, 9, Heading::North}, "F"});

    const auto results = executeBatch (missions);
    ASSERT_EQ (results.size (), missions.size ());

    for (std::size_t i = 0; i < missions.size (); ++i)
    {
        const auto expected = execute (missions[i]);
        ASSERT_EQ (results[i].has_value (), expected.has_value ()) << "mission " << i;
        if (expected)
        {
            EXPECT_EQ (*results[i], *expected) << "mission " << i;
        }
        else
        {
            EXPECT_EQ (results[i].error ().error, expected.error ().error) << "mission " << i;
        }
    }

    EXPECT_EQ (results[64].error ().error, MissionError::UnsupportedAction);
    EXPECT_EQ (results[65].error ().error, MissionError::StartOutOfBounds);
}

TEST (MissionTests, EmptyBatch)
{
    const std::vector<Mission> none;
    EXPECT_TRUE (executeBatch (none).empty ());
}
