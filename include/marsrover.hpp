#pragma once
/**
 * @file   marsrover.hpp
 * @brief  Umbrella header – include the full marsrover public interface.
 *
 * Include this single header in a translation unit to access the entire API:
 *  - Core primitives (heading, action, rover state, constants)
 *  - Grid bounds
 *  - Transition engine (step / run)
 *  - Text I/O (action decoder, report formatter)
 *  - Mission layer (validation, execution, batches)
 */

/*──────────────────────────── Core ────────────────────────────*/
#include <marsrover/core/action.hpp>
#include <marsrover/core/constants.hpp>
#include <marsrover/core/heading.hpp>
#include <marsrover/core/state.hpp>

/*────────────────────────── Geometry ──────────────────────────*/
#include <marsrover/geometry/grid.hpp>

/*─────────────────────────── Engine ───────────────────────────*/
#include <marsrover/engine/rover_engine.hpp>

/*──────────────────────────── I/O ─────────────────────────────*/
#include <marsrover/io/action_decoder.hpp> // 'F'/'L'/'R' → Action, fail-fast
#include <marsrover/io/report.hpp>         // "(x, y, H)[ LOST]"

/*────────────────────────── Mission ───────────────────────────*/
#include <marsrover/mission/mission.hpp>
