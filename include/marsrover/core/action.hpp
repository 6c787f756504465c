#pragma once
/**
 * @file   action.hpp
 * @brief  Atomic rover commands.
 */

#include <marsrover/core/constants.hpp>

#include <cstdint>

namespace marsrover::core
{
    /**
     * @enum Action
     * @brief One command: move one cell forward or turn 90° in place.
     */
    enum class Action : std::uint8_t
    {
        Forward,    ///< 'F'
        RotateLeft, ///< 'L'
        RotateRight ///< 'R'
    };

    /// @brief Command letter of @p a ('F', 'L', 'R').
    [[nodiscard]] constexpr char actionCode (Action a) noexcept
    {
        switch (a)
        {
            case Action::Forward:
                return FORWARD_CODE;
            case Action::RotateLeft:
                return ROTATE_LEFT_CODE;
            case Action::RotateRight:
                return ROTATE_RIGHT_CODE;
        }
        return '?';
    }

} // namespace marsrover::core
