/// @file input.cpp
/// @brief SDL2 event to input state.

#include "core/input.hpp"

namespace skychart::core
{

void Input::new_frame()
{
    m_mouse_drag_delta = {0.0f, 0.0f};
    m_scroll_delta = 0.0f;
    m_mouse_moved = false;
    m_keys_pressed.clear();
}

void Input::process_event(const SDL_Event& event)
{
    switch (event.type)
    {
        case SDL_MOUSEBUTTONDOWN:
        {
            if (event.button.button == SDL_BUTTON_LEFT)
            {
                m_left_button_down = true;
                m_mouse_pos = {static_cast<f32>(event.button.x), static_cast<f32>(event.button.y)};
            }
            break;
        }

        case SDL_MOUSEBUTTONUP:
        {
            if (event.button.button == SDL_BUTTON_LEFT)
            {
                m_left_button_down = false;
                m_mouse_dragging = false;
            }
            break;
        }

        case SDL_MOUSEMOTION:
        {
            const Vec2f current = {static_cast<f32>(event.motion.x), static_cast<f32>(event.motion.y)};
            if (m_left_button_down)
            {
                m_mouse_drag_delta += current - m_mouse_pos;
                m_mouse_dragging = true;
            }
            m_mouse_pos = current;
            m_mouse_moved = true;
            break;
        }

        case SDL_MOUSEWHEEL:
        {
            // Flipped wheels report inverted y
            const f32 clicks = static_cast<f32>(event.wheel.y);
            m_scroll_delta += (event.wheel.direction == SDL_MOUSEWHEEL_FLIPPED) ? -clicks : clicks;
            break;
        }

        case SDL_KEYDOWN:
        {
            if (event.key.repeat == 0)
            {
                m_keys_pressed.insert(event.key.keysym.scancode);
            }
            m_keys_held.insert(event.key.keysym.scancode);
            break;
        }

        case SDL_KEYUP:
        {
            m_keys_held.erase(event.key.keysym.scancode);
            break;
        }

        default:
            break;
    }
}

bool Input::is_key_pressed(SDL_Scancode key) const
{
    return m_keys_pressed.contains(key);
}

bool Input::is_key_held(SDL_Scancode key) const
{
    return m_keys_held.contains(key);
}

} // namespace skychart::core
