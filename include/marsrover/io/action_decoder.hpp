#pragma once
/**
 * @file   action_decoder.hpp
 * @brief  Text → @ref marsrover::core::Action conversion with fail-fast error reporting.
 */

#include <marsrover/core/action.hpp>
#include <marsrover/core/constants.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace marsrover::io
{
    using namespace marsrover::core;

    /**
     * @brief Failure categories of the decoder.
     */
    enum class DecodeErrorKind : std::uint8_t
    {
        UnsupportedAction ///< Character is not one of 'F', 'L', 'R'.
    };

    /**
     * @brief Decoding failure carrying the offending character.
     */
    struct DecodeError
    {
        DecodeErrorKind kind{DecodeErrorKind::UnsupportedAction};
        char offending{};       ///< Character that could not be decoded.
        std::size_t position{}; ///< Index of that character in the command string (0 for single characters).

        friend bool operator== (const DecodeError &, const DecodeError &) = default;
    };

    /// @brief Human-readable description, e.g. "unsupported rover action 'X' at position 3".
    [[nodiscard]] inline std::string describe (const DecodeError &err)
    {
        switch (err.kind)
        {
            case DecodeErrorKind::UnsupportedAction:
                return "unsupported rover action '" + std::string (1, err.offending) + "' at position " + std::to_string (err.position);
        }
        return "unknown decode error";
    }

    /**
     * @brief  Decode one command letter.
     * @param c Command letter (case-sensitive).
     * @return The action, or an UnsupportedAction error carrying @p c.
     */
    [[nodiscard]] constexpr std::expected<Action, DecodeError> decodeAction (char c) noexcept
    {
        switch (c)
        {
            case FORWARD_CODE:
                return Action::Forward;
            case ROTATE_LEFT_CODE:
                return Action::RotateLeft;
            case ROTATE_RIGHT_CODE:
                return Action::RotateRight;
            default:
                return std::unexpected (DecodeError{DecodeErrorKind::UnsupportedAction, c, 0});
        }
    }

    /**
     * @brief  Decode a whole command string.
     *
     * Stops at the first unsupported character; no action is skipped or
     * replaced by a default.
     *
     * @param commands Command letters, e.g. "LFRFF".
     * @return Actions in input order, or the first decoding error with its position.
     */
    [[nodiscard]] inline std::expected<std::vector<Action>, DecodeError> decodeActions (std::string_view commands)
    {
        std::vector<Action> actions;
        actions.reserve (commands.size ());

        for (std::size_t i = 0; i < commands.size (); ++i)
        {
            auto action = decodeAction (commands[i]);
            if (!action)
            {
                DecodeError err = action.error ();
                err.position = i;
                return std::unexpected (err);
            }
            actions.push_back (*action);
        }
        return actions;
    }

} // namespace marsrover::io
