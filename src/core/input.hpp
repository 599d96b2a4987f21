#pragma once

/// @file input.hpp
/// @brief SDL2 input state tracker: orbit drag, pan drag, scroll, keyboard.
///
/// Input only tracks state; it does not move the camera. The renderer reads
/// the per-frame deltas and feeds them to its OrbitControls.

#include "core/types.hpp"

#include <SDL2/SDL.h>

#include <unordered_set>

namespace latentsky::core
{
    /// @brief Tracks per-frame input state from SDL2 events.
    ///
    /// Usage pattern each frame:
    ///   1. new_frame() resets per-frame deltas
    ///   2. process_event() for each SDL_Event from Window::poll_events()
    ///   3. Query: get_rotate_delta(), get_pan_delta(), get_scroll_delta(), keys
    ///
    /// Left drag rotates, right or middle drag pans, the wheel dollies.
    class Input
    {
    public:
        Input() = default;
        ~Input() = default;

        Input(const Input&) = delete;
        Input& operator=(const Input&) = delete;
        Input(Input&&) = delete;
        Input& operator=(Input&&) = delete;

        /// @brief Process a single SDL event.
        void process_event(const SDL_Event& event);

        /// @brief Reset per-frame state. Call before processing the frame's events.
        void new_frame();

        // -----------------------------------------------------------------
        // Mouse state
        // -----------------------------------------------------------------

        /// @brief Left-button drag this frame in pixels (x right, y down).
        [[nodiscard]] Vec2f get_rotate_delta() const { return m_rotate_delta; }

        /// @brief Right/middle-button drag this frame in pixels (x right, y down).
        [[nodiscard]] Vec2f get_pan_delta() const { return m_pan_delta; }

        /// @brief Wheel steps this frame. Positive = away from the user (zoom in).
        [[nodiscard]] f32 get_scroll_delta() const { return m_scroll_delta; }

        // -----------------------------------------------------------------
        // Keyboard state
        // -----------------------------------------------------------------

        /// @brief True if the key went down this frame (repeats excluded).
        [[nodiscard]] bool is_key_pressed(SDL_Scancode key) const;

    private:
        void accumulate_motion(const Vec2f& position);

        Vec2f m_rotate_delta = {0.0f, 0.0f};
        Vec2f m_pan_delta = {0.0f, 0.0f};
        f32 m_scroll_delta = 0.0f;
        bool m_rotate_button_down = false;
        bool m_pan_button_down = false;
        Vec2f m_last_mouse_pos = {0.0f, 0.0f};

        std::unordered_set<SDL_Scancode> m_keys_pressed;    ///< This frame only
    };

} // namespace latentsky::core
