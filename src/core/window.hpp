#pragma once

/// @file window.hpp
/// @brief SDL2 window presenting software-rendered chart images.

#include "core/logger.hpp"
#include "core/types.hpp"
#include "raster/raster_buffer.hpp"

#include <SDL2/SDL.h>

#include <functional>
#include <string>

namespace skychart::core
{
    /// @brief Configuration for window creation.
    /// Use designated initializers: Window w({.title = "skychart", .width = 1280});
    struct WindowConfig
    {
        std::string title = "skychart";
        u32 width = 1280;
        u32 height = 720;
        bool fullscreen = false;
        bool resizable = true;
        bool vsync = true;
    };

    /// @brief Callback type for receiving raw SDL events from the window.
    using EventCallback = std::function<void(const SDL_Event&)>;

    /// @brief SDL2 window with an accelerated renderer and one streaming ARGB texture.
    ///
    /// Owns the SDL_Window, SDL_Renderer and SDL_Texture lifetimes. Each frame
    /// the chart Image is uploaded to the texture and stretched over the window.
    /// Non-copyable: exactly one window instance should exist.
    class Window
    {
    public:
        explicit Window(const WindowConfig& config);
        ~Window();

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;
        Window(Window&&) = delete;
        Window& operator=(Window&&) = delete;

        /// @brief False when SDL, the window or its renderer could not be created.
        [[nodiscard]] bool is_valid() const;

        [[nodiscard]] bool should_close() const;
        void request_close();

        /// @brief Poll all pending SDL events.
        /// Updates close and resize state, then forwards every event to the callback.
        void poll_events();

        /// @brief Set a callback to receive all SDL events during poll_events(), or nullptr to clear.
        void set_event_callback(EventCallback callback);

        /// @brief Upload image to the streaming texture and show it.
        ///
        /// The texture is recreated when the image size changes. Returns false
        /// (and logs) when SDL rejects the upload.
        bool present(const raster::Image& image);

        /// @brief Update the title bar (mode and projection readout).
        void set_title(const std::string& title);

        [[nodiscard]] SDL_Window* get_native_handle() const;
        [[nodiscard]] u32 get_width() const;
        [[nodiscard]] u32 get_height() const;

        /// @brief True if the window was resized since the last call. Resets the flag.
        [[nodiscard]] bool was_resized();

    private:
        bool ensure_texture(i32 width, i32 height);

        SDL_Window* m_window = nullptr;
        SDL_Renderer* m_renderer = nullptr;
        SDL_Texture* m_texture = nullptr;
        i32 m_texture_width = 0;
        i32 m_texture_height = 0;
        u32 m_width = 0;
        u32 m_height = 0;
        bool m_sdl_initialized = false;
        bool m_should_close = false;
        bool m_was_resized = false;
        EventCallback m_event_callback;
    };

} // namespace skychart::core
