/// @file window.cpp
/// @brief SDL2 window, renderer and streaming texture.

#include "core/window.hpp"

#include <utility>

namespace skychart::core
{

Window::Window(const WindowConfig& config)
    : m_width{config.width}
    , m_height{config.height}
{
    // -----------------------------------------------------------------
    // Tell SDL we manage our own entry point (no SDL_main hijack)
    // -----------------------------------------------------------------
    SDL_SetMainReady();

    if (SDL_Init(SDL_INIT_VIDEO) != 0)
    {
        SKC_CORE_CRITICAL("SDL_Init failed: {}", SDL_GetError());
        return;
    }
    m_sdl_initialized = true;

    // -----------------------------------------------------------------
    // Assemble window flags
    // -----------------------------------------------------------------
    u32 flags = SDL_WINDOW_SHOWN;

    if (config.resizable)
    {
        flags |= SDL_WINDOW_RESIZABLE;
    }

    if (config.fullscreen)
    {
        flags |= SDL_WINDOW_FULLSCREEN_DESKTOP;
    }

    m_window = SDL_CreateWindow(
        config.title.c_str(),
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        static_cast<int>(config.width),
        static_cast<int>(config.height),
        flags);

    if (m_window == nullptr)
    {
        SKC_CORE_CRITICAL("SDL_CreateWindow failed: {}", SDL_GetError());
        return;
    }

    // If fullscreen, query the actual pixel dimensions
    if (config.fullscreen)
    {
        int w = 0;
        int h = 0;
        SDL_GetWindowSize(m_window, &w, &h);
        m_width = static_cast<u32>(w);
        m_height = static_cast<u32>(h);
    }

    // -----------------------------------------------------------------
    // Renderer: accelerated when available, software otherwise
    // -----------------------------------------------------------------
    const u32 renderer_flags = config.vsync ? SDL_RENDERER_PRESENTVSYNC : 0u;
    m_renderer = SDL_CreateRenderer(m_window, -1, SDL_RENDERER_ACCELERATED | renderer_flags);
    if (m_renderer == nullptr)
    {
        SKC_CORE_WARN("Accelerated renderer unavailable ({}), falling back to software", SDL_GetError());
        m_renderer = SDL_CreateRenderer(m_window, -1, SDL_RENDERER_SOFTWARE);
    }

    if (m_renderer == nullptr)
    {
        SKC_CORE_CRITICAL("SDL_CreateRenderer failed: {}", SDL_GetError());
        return;
    }

    SKC_CORE_INFO("Window created: \"{}\" ({}x{}) [{}{}]",
                  config.title,
                  m_width,
                  m_height,
                  config.resizable ? "resizable" : "fixed",
                  config.fullscreen ? " | fullscreen" : "");
}

Window::~Window()
{
    if (m_texture != nullptr)
    {
        SDL_DestroyTexture(m_texture);
    }

    if (m_renderer != nullptr)
    {
        SDL_DestroyRenderer(m_renderer);
    }

    if (m_window != nullptr)
    {
        SDL_DestroyWindow(m_window);
        SKC_CORE_INFO("Window destroyed");
    }

    if (m_sdl_initialized)
    {
        SDL_Quit();
    }
}

bool Window::is_valid() const
{
    return m_window != nullptr && m_renderer != nullptr;
}

bool Window::should_close() const
{
    return m_should_close;
}

void Window::request_close()
{
    m_should_close = true;
}

void Window::set_event_callback(EventCallback callback)
{
    m_event_callback = std::move(callback);
}

void Window::set_title(const std::string& title)
{
    if (m_window != nullptr)
    {
        SDL_SetWindowTitle(m_window, title.c_str());
    }
}

void Window::poll_events()
{
    SDL_Event event{};
    while (SDL_PollEvent(&event) != 0)
    {
        switch (event.type)
        {
            case SDL_QUIT:
            {
                m_should_close = true;
                break;
            }

            case SDL_WINDOWEVENT:
            {
                switch (event.window.event)
                {
                    case SDL_WINDOWEVENT_CLOSE:
                    {
                        m_should_close = true;
                        break;
                    }

                    case SDL_WINDOWEVENT_SIZE_CHANGED:
                    {
                        m_width = static_cast<u32>(event.window.data1);
                        m_height = static_cast<u32>(event.window.data2);
                        m_was_resized = true;
                        SKC_CORE_TRACE("Window resized: {}x{}", m_width, m_height);
                        break;
                    }

                    case SDL_WINDOWEVENT_MINIMIZED:
                    {
                        m_width = 0;
                        m_height = 0;
                        m_was_resized = true;
                        SKC_CORE_TRACE("Window minimized");
                        break;
                    }

                    case SDL_WINDOWEVENT_RESTORED:
                    {
                        int w = 0;
                        int h = 0;
                        SDL_GetWindowSize(m_window, &w, &h);
                        m_width = static_cast<u32>(w);
                        m_height = static_cast<u32>(h);
                        m_was_resized = true;
                        SKC_CORE_TRACE("Window restored: {}x{}", m_width, m_height);
                        break;
                    }

                    default:
                        break;
                }
                break;
            }

            default:
                break;
        }

        if (m_event_callback)
        {
            m_event_callback(event);
        }
    }
}

// -----------------------------------------------------------------
// Presentation
// -----------------------------------------------------------------

bool Window::ensure_texture(i32 width, i32 height)
{
    if (m_texture != nullptr && width == m_texture_width && height == m_texture_height)
    {
        return true;
    }

    if (m_texture != nullptr)
    {
        SDL_DestroyTexture(m_texture);
        m_texture = nullptr;
    }

    // Image pixels are packed 0xAARRGGBB, which is SDL's ARGB8888
    m_texture = SDL_CreateTexture(m_renderer, SDL_PIXELFORMAT_ARGB8888, SDL_TEXTUREACCESS_STREAMING, width, height);
    if (m_texture == nullptr)
    {
        SKC_CORE_ERROR("SDL_CreateTexture {}x{} failed: {}", width, height, SDL_GetError());
        return false;
    }

    m_texture_width = width;
    m_texture_height = height;
    SKC_CORE_TRACE("Streaming texture created: {}x{}", width, height);
    return true;
}

bool Window::present(const raster::Image& image)
{
    if (!is_valid() || image.empty())
    {
        return false;
    }

    if (!ensure_texture(image.width(), image.height()))
    {
        return false;
    }

    const int pitch = image.width() * static_cast<int>(sizeof(u32));
    if (SDL_UpdateTexture(m_texture, nullptr, image.pixels().data(), pitch) != 0)
    {
        SKC_CORE_ERROR("SDL_UpdateTexture failed: {}", SDL_GetError());
        return false;
    }

    SDL_RenderClear(m_renderer);
    SDL_RenderCopy(m_renderer, m_texture, nullptr, nullptr);
    SDL_RenderPresent(m_renderer);
    return true;
}

// -----------------------------------------------------------------
// Getters
// -----------------------------------------------------------------

SDL_Window* Window::get_native_handle() const
{
    return m_window;
}

u32 Window::get_width() const
{
    return m_width;
}

u32 Window::get_height() const
{
    return m_height;
}

bool Window::was_resized()
{
    const bool resized = m_was_resized;
    m_was_resized = false;
    return resized;
}

} // namespace skychart::core
