#pragma once

/// @file input.hpp
/// @brief SDL2 input state tracker for the chart viewer: drag, wheel, cursor, keys.
///
/// Input only records state. The Application reads it each frame and turns it
/// into Camera and chart-option changes.

#include "core/types.hpp"

#include <SDL2/SDL.h>

#include <unordered_set>

namespace skychart::core
{
    /// @brief Per-frame input state built from SDL2 events.
    ///
    /// Each frame: new_frame(), then process_event() for every polled event,
    /// then query.
    class Input
    {
    public:
        Input() = default;
        ~Input() = default;

        Input(const Input&) = delete;
        Input& operator=(const Input&) = delete;
        Input(Input&&) = delete;
        Input& operator=(Input&&) = delete;

        void process_event(const SDL_Event& event);

        /// @brief Reset per-frame deltas and key presses.
        void new_frame();

        // -----------------------------------------------------------------
        // Mouse
        // -----------------------------------------------------------------

        /// @brief True while the left button is held and the mouse has moved.
        [[nodiscard]] bool is_mouse_dragging() const { return m_mouse_dragging; }

        /// @brief Drag this frame in window pixels (+x right, +y down).
        [[nodiscard]] Vec2f get_mouse_drag_delta() const { return m_mouse_drag_delta; }

        /// @brief Wheel clicks this frame, positive away from the user.
        [[nodiscard]] f32 get_scroll_delta() const { return m_scroll_delta; }

        /// @brief Last known cursor position in window pixels.
        [[nodiscard]] Vec2f get_mouse_position() const { return m_mouse_pos; }

        /// @brief True if the cursor moved this frame.
        [[nodiscard]] bool has_mouse_moved() const { return m_mouse_moved; }

        // -----------------------------------------------------------------
        // Keyboard
        // -----------------------------------------------------------------

        /// @brief Key went down this frame (repeats ignored). For toggles.
        [[nodiscard]] bool is_key_pressed(SDL_Scancode key) const;

        /// @brief Key is currently down. For continuous actions.
        [[nodiscard]] bool is_key_held(SDL_Scancode key) const;

    private:
        Vec2f m_mouse_drag_delta = {0.0f, 0.0f};
        Vec2f m_mouse_pos = {0.0f, 0.0f};
        f32 m_scroll_delta = 0.0f;
        bool m_mouse_dragging = false;
        bool m_mouse_moved = false;
        bool m_left_button_down = false;

        std::unordered_set<SDL_Scancode> m_keys_pressed;    ///< This frame only
        std::unordered_set<SDL_Scancode> m_keys_held;
    };

} // namespace skychart::core
