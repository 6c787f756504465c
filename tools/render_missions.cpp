/**
 * @file render_missions.cpp
 * @brief Standalone tool that renders every catalogue mission to an SVG (grid, path, start/final pose).
 *
 * Usage: render_missions [outDir]   (default: ./renders)
 */

#include <marsrover.hpp>

#include <utils/mission_catalog.hpp>
#include <utils/visualizer.hpp>

#include <filesystem>
#include <iostream>
#include <string>

using namespace marsrover::core;
using marsrover::engine::RunTrace;
using marsrover::utils::Visualizer;

namespace fs = std::filesystem;

int main (int argc, char **argv)
{
    try
    {
        const fs::path outDir = argc > 1 ? fs::path (argv[1]) : fs::current_path () / "renders";
        fs::create_directories (outDir);

        const auto catalog = marsrover::utils::sampleMissions ();
        std::cout << "[Visualizer] Rendering " << catalog.size () << " missions into " << outDir << "..." << std::endl;

        int failures = 0;
        for (const auto &entry : catalog)
        {
            const auto &m = entry.mission;
            if (auto ok = marsrover::mission::validate (m); !ok)
            {
                std::cerr << "[Visualizer] Skipping " << entry.name << ": " << ok.error ().message << std::endl;
                ++failures;
                continue;
            }

            auto actions = marsrover::io::decodeActions (m.commands);
            if (!actions)
            {
                std::cerr << "[Visualizer] Skipping " << entry.name << ": " << marsrover::io::describe (actions.error ()) << std::endl;
                ++failures;
                continue;
            }

            RunTrace trace;
            const RoverState finalState = marsrover::engine::run (m.grid, m.start, *actions, &trace);
            const std::string report = marsrover::io::formatReport (finalState);

            const fs::path file = outDir / (entry.name + ".svg");
            {
                Visualizer viz (file.string ());
                viz.drawGrid (m.grid);
                viz.drawPath (trace.states);
                viz.drawStartPose (m.start);
                viz.drawFinalPose (finalState);
            }

            std::cout << "[Visualizer] " << entry.name << " → " << report << " (" << trace.applied << '/' << actions->size () << " actions applied)";
            if (report != entry.expectedReport)
            {
                std::cout << " MISMATCH, expected " << entry.expectedReport;
                ++failures;
            }
            std::cout << std::endl;
        }

        std::cout << "[Visualizer] Done." << std::endl;
        return failures == 0 ? EXIT_OK : EXIT_MISSION;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Error] Uncaught exception: " << e.what () << std::endl;
        return 1;
    }
}
