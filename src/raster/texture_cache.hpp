#pragma once

/// @file texture_cache.hpp
/// @brief Bounded LRU cache of decoded images shared between chart renders.

#include "core/types.hpp"
#include "raster/raster_buffer.hpp"

#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace skychart::raster
{
    struct TextureCacheConfig
    {
        std::size_t max_bytes = 64u * 1024u * 1024u;
        std::size_t max_entries = 256;
    };

    struct TextureCacheStats
    {
        u64 hits = 0;
        u64 misses = 0;
        u64 evictions = 0;
        u64 load_failures = 0;
    };

    /// @brief Least-recently-used image cache with byte and entry budgets.
    ///
    /// Owned by the application and handed to renderers by reference; there is
    /// no process-wide instance. Images are shared as immutable shared_ptrs, so
    /// an evicted image stays alive for as long as a renderer still holds it.
    /// All members are safe to call from several render threads.
    class TextureCache
    {
    public:
        using ImagePtr = std::shared_ptr<const Image>;
        using Loader = std::function<std::optional<Image>(const std::string& key)>;

        explicit TextureCache(const TextureCacheConfig& config = {});

        /// @brief Cached image for key, marking it most recently used.
        [[nodiscard]] ImagePtr get(const std::string& key);

        /// @brief Insert or replace key, then evict the oldest entries over budget.
        ///
        /// The entry just inserted is never evicted, even when it alone exceeds
        /// the byte budget.
        ImagePtr insert(const std::string& key, Image image);

        /// @brief Cached image, or the loader's result inserted under key.
        ///
        /// The loader runs without the cache lock held. A loader returning
        /// nullopt is logged and counted; nothing is cached for it.
        [[nodiscard]] ImagePtr get_or_load(const std::string& key, const Loader& loader);

        /// @brief Remove key. Returns false when it was not cached.
        bool erase(const std::string& key);

        void clear();

        [[nodiscard]] bool contains(const std::string& key) const;
        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] std::size_t bytes_used() const;
        [[nodiscard]] TextureCacheStats get_stats() const;
        [[nodiscard]] const TextureCacheConfig& get_config() const { return m_config; }

        /// @brief Memory charged for one image.
        [[nodiscard]] static std::size_t byte_size(const Image& image);

    private:
        struct Entry
        {
            std::string key;
            ImagePtr image;
            std::size_t bytes;
        };

        using EntryList = std::list<Entry>;

        void evict_over_budget();

        TextureCacheConfig m_config;
        mutable std::mutex m_mutex;
        EntryList m_entries;    ///< Front = most recently used
        std::unordered_map<std::string, EntryList::iterator> m_index;
        std::size_t m_bytes = 0;
        TextureCacheStats m_stats;
    };

} // namespace skychart::raster
