/// @file input.cpp
/// @brief SDL2 input state tracker implementation.

#include "core/input.hpp"

namespace latentsky::core
{

void Input::new_frame()
{
    m_rotate_delta = {0.0f, 0.0f};
    m_pan_delta = {0.0f, 0.0f};
    m_scroll_delta = 0.0f;
    m_keys_pressed.clear();
}

void Input::process_event(const SDL_Event& event)
{
    switch (event.type)
    {
        // -----------------------------------------------------------------
        // Mouse buttons
        // -----------------------------------------------------------------
        case SDL_MOUSEBUTTONDOWN:
        {
            if (event.button.button == SDL_BUTTON_LEFT)
            {
                m_rotate_button_down = true;
            }
            else if (event.button.button == SDL_BUTTON_RIGHT || event.button.button == SDL_BUTTON_MIDDLE)
            {
                m_pan_button_down = true;
            }
            m_last_mouse_pos = {static_cast<f32>(event.button.x), static_cast<f32>(event.button.y)};
            break;
        }

        case SDL_MOUSEBUTTONUP:
        {
            if (event.button.button == SDL_BUTTON_LEFT)
            {
                m_rotate_button_down = false;
            }
            else if (event.button.button == SDL_BUTTON_RIGHT || event.button.button == SDL_BUTTON_MIDDLE)
            {
                m_pan_button_down = false;
            }
            break;
        }

        case SDL_MOUSEMOTION:
        {
            accumulate_motion({static_cast<f32>(event.motion.x), static_cast<f32>(event.motion.y)});
            break;
        }

        case SDL_MOUSEWHEEL:
        {
            f32 steps = static_cast<f32>(event.wheel.y);
            if (event.wheel.direction == SDL_MOUSEWHEEL_FLIPPED)
            {
                steps = -steps;
            }
            m_scroll_delta += steps;
            break;
        }

        // -----------------------------------------------------------------
        // Keyboard
        // -----------------------------------------------------------------
        case SDL_KEYDOWN:
        {
            if (event.key.repeat == 0)
            {
                m_keys_pressed.insert(event.key.keysym.scancode);
            }
            break;
        }

        default:
            break;
    }
}

void Input::accumulate_motion(const Vec2f& position)
{
    const Vec2f delta = position - m_last_mouse_pos;
    m_last_mouse_pos = position;

    // Left wins when both are held, as a single gesture
    if (m_rotate_button_down)
    {
        m_rotate_delta += delta;
    }
    else if (m_pan_button_down)
    {
        m_pan_delta += delta;
    }
}

bool Input::is_key_pressed(SDL_Scancode key) const
{
    return m_keys_pressed.contains(key);
}

} // namespace latentsky::core
