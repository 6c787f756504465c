/**
 * @file visualizer_tests.cpp
 * @brief Smoke tests for the SVG visualizer: output is produced and well-formed.
 */

#include <utils/mission_catalog.hpp>
#include <utils/visualizer.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace marsrover::core;
using marsrover::engine::RunTrace;
using marsrover::geometry::GridBounds;
using marsrover::utils::Visualizer;

namespace
{
    /// SVGs go to <ctest workdir>/renders/visualizer, created on first use.
    std::filesystem::path svgPath (const std::string &name)
    {
        const auto dir = std::filesystem::current_path () / "renders" / "visualizer";
        std::filesystem::create_directories (dir);
        return dir / (name + ".svg");
    }

    std::string readFile (const std::filesystem::path &p)
    {
        std::ifstream in (p);
        std::stringstream ss;
        ss << in.rdbuf ();
        return ss.str ();
    }

    std::size_t countOf (const std::string &haystack, const std::string &needle)
    {
        std::size_t n = 0;
        for (auto pos = haystack.find (needle); pos != std::string::npos; pos = haystack.find (needle, pos + needle.size ()))
            ++n;
        return n;
    }
} // namespace

/// @brief Every catalogue mission renders to a closed SVG document.
TEST (VisualizerTests, RendersCatalog)
{
    for (const auto &entry : marsrover::utils::sampleMissions ())
    {
        const auto &m = entry.mission;
        auto actions = marsrover::io::decodeActions (m.commands);
        ASSERT_TRUE (actions.has_value ());

        RunTrace trace;
        const RoverState end = marsrover::engine::run (m.grid, m.start, *actions, &trace);

        const auto file = svgPath (entry.name);
        {
            Visualizer viz (file.string ());
            viz.drawGrid (m.grid);
            viz.drawPath (trace.states);
            viz.drawStartPose (m.start);
            viz.drawFinalPose (end);
        }

        ASSERT_TRUE (std::filesystem::exists (file));
        const std::string svg = readFile (file);
        EXPECT_EQ (svg.rfind ("<?xml", 0), 0u) << entry.name;
        EXPECT_NE (svg.find ("</svg>"), std::string::npos) << entry.name;
        EXPECT_EQ (countOf (svg, "<polyline"), 1u) << entry.name;

        // One rect per cell + grid border + canvas background.
        EXPECT_EQ (countOf (svg, "<rect"), static_cast<std::size_t> (m.grid.cellCount ()) + 2u) << entry.name;

        // A lost rover gets a cross (two lines) on its last cell.
        EXPECT_EQ (countOf (svg, "<line"), end.lost ? 2u : 0u) << entry.name;
    }
}

/// @brief finish() is idempotent and an empty drawing still yields a valid document.
TEST (VisualizerTests, EmptyDocument)
{
    const auto file = svgPath ("empty");
    {
        Visualizer viz (file.string ());
        viz.finish ();
        viz.finish ();
    }
    const std::string svg = readFile (file);
    EXPECT_EQ (countOf (svg, "</svg>"), 1u);
}

TEST (VisualizerTests, RejectsBadCanvas)
{
    const auto file = svgPath ("bad");
    EXPECT_THROW (Visualizer (file.string (), 0), std::invalid_argument);
}

/// @brief Huge grids collapse to one rectangle instead of one per cell.
TEST (VisualizerTests, LargeGridDrawsOutlineOnly)
{
    constexpr int MAX = std::numeric_limits<int>::max ();
    const auto file = svgPath ("int_max_grid");
    {
        Visualizer viz (file.string ());
        viz.drawGrid (GridBounds{MAX, MAX});
        viz.drawFinalPose (RoverState{MAX, MAX, Heading::East, true});
    }
    const std::string svg = readFile (file);
    EXPECT_EQ (countOf (svg, "<rect"), 2u); // canvas background + grid outline
    EXPECT_EQ (countOf (svg, "<line"), 2u);
    EXPECT_EQ (countOf (svg, "</svg>"), 1u);
}

/// @brief The cell threshold is configurable; at the limit cells are still drawn.
TEST (VisualizerTests, CellThreshold)
{
    const GridBounds grid{9, 9}; // 100 cells
    {
        Visualizer viz (svgPath ("threshold_cells").string ());
        viz.drawGrid (grid, 0.6, 100);
    }
    {
        Visualizer viz (svgPath ("threshold_outline").string ());
        viz.drawGrid (grid, 0.6, 99);
    }
    EXPECT_EQ (countOf (readFile (svgPath ("threshold_cells")), "<rect"), 102u);
    EXPECT_EQ (countOf (readFile (svgPath ("threshold_outline")), "<rect"), 2u);
}
