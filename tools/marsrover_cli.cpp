/**
 * @file marsrover_cli.cpp
 * @brief Run a single rover mission given on the command line and print its report.
 *
 * Usage: marsrover_cli <edgeX> <edgeY> <x> <y> <heading> <commands>
 *   e.g. marsrover_cli 4 8 2 3 E LFRFF   →   (4, 4, E)
 */

#include <marsrover.hpp>

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

using namespace marsrover::core;
using marsrover::geometry::GridBounds;
using marsrover::mission::Mission;

namespace
{
    constexpr int ARG_COUNT = 6;

    void printUsage (std::ostream &os, std::string_view prog)
    {
        os << "Usage: " << prog << " <edgeX> <edgeY> <x> <y> <heading> <commands>\n"
           << "  edgeX, edgeY  largest valid coordinates of the grid (origin at 0,0)\n"
           << "  x, y          start cell\n"
           << "  heading       one of N, E, S, W\n"
           << "  commands      sequence of F (forward), L (turn left), R (turn right)\n";
    }

    /// Whole-token integer parse; rejects signs-only, trailing junk and overflow.
    std::optional<int> parseInt (std::string_view token)
    {
        int value = 0;
        const auto [ptr, ec] = std::from_chars (token.data (), token.data () + token.size (), value);
        if (ec != std::errc{} || ptr != token.data () + token.size ())
            return std::nullopt;
        return value;
    }

    int usageError (std::string_view prog, const std::string &what)
    {
        std::cerr << "[marsrover] error: " << what << '\n';
        printUsage (std::cerr, prog);
        return EXIT_USAGE;
    }
} // namespace

int main (int argc, char **argv)
{
    try
    {
        const std::string_view prog = argc > 0 ? argv[0] : "marsrover_cli";

        if (argc == 2 && (std::string_view (argv[1]) == "--help" || std::string_view (argv[1]) == "-h"))
        {
            printUsage (std::cout, prog);
            return EXIT_OK;
        }

        if (argc != ARG_COUNT + 1)
            return usageError (prog, "expected " + std::to_string (ARG_COUNT) + " arguments, got " + std::to_string (argc - 1));

        const auto edgeX = parseInt (argv[1]);
        const auto edgeY = parseInt (argv[2]);
        const auto x = parseInt (argv[3]);
        const auto y = parseInt (argv[4]);
        if (!edgeX || !edgeY || !x || !y)
            return usageError (prog, "grid edges and start position must be integers");

        const std::string_view headingArg = argv[5];
        const auto heading = headingArg.size () == 1 ? headingFromCode (headingArg.front ()) : std::nullopt;
        if (!heading)
            return usageError (prog, "heading must be one of N, E, S, W (got '" + std::string (headingArg) + "')");

        const Mission mission{GridBounds{*edgeX, *edgeY}, RoverState{*x, *y, *heading}, argv[6]};

        const auto result = marsrover::mission::execute (mission);
        if (!result)
        {
            std::cerr << "[marsrover] error: " << result.error ().message << '\n';
            return EXIT_MISSION;
        }

        std::cout << marsrover::io::formatReport (*result) << '\n';
        return EXIT_OK;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Error] Uncaught exception: " << e.what () << std::endl;
        return EXIT_MISSION;
    }
}
