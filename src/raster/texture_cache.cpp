/// @file texture_cache.cpp
/// @brief LRU bookkeeping for TextureCache.

#include "raster/texture_cache.hpp"

#include "core/logger.hpp"

#include <utility>

namespace skychart::raster
{

TextureCache::TextureCache(const TextureCacheConfig& config)
    : m_config(config)
{
    if (m_config.max_entries == 0)
    {
        SKC_CORE_WARN("Texture cache entry budget of 0 raised to 1");
        m_config.max_entries = 1;
    }
}

std::size_t TextureCache::byte_size(const Image& image)
{
    return image.pixels().size() * sizeof(u32);
}

TextureCache::ImagePtr TextureCache::get(const std::string& key)
{
    std::lock_guard lock(m_mutex);

    const auto it = m_index.find(key);
    if (it == m_index.end())
    {
        ++m_stats.misses;
        return nullptr;
    }

    ++m_stats.hits;
    m_entries.splice(m_entries.begin(), m_entries, it->second);
    return it->second->image;
}

TextureCache::ImagePtr TextureCache::insert(const std::string& key, Image image)
{
    const std::size_t bytes = byte_size(image);
    auto shared = std::make_shared<const Image>(std::move(image));

    std::lock_guard lock(m_mutex);

    if (const auto it = m_index.find(key); it != m_index.end())
    {
        m_bytes -= it->second->bytes;
        m_entries.erase(it->second);
        m_index.erase(it);
    }

    m_entries.push_front(Entry{.key = key, .image = shared, .bytes = bytes});
    m_index.emplace(key, m_entries.begin());
    m_bytes += bytes;

    if (bytes > m_config.max_bytes)
    {
        SKC_CORE_WARN("Texture '{}' ({} bytes) exceeds the cache budget of {} bytes", key, bytes, m_config.max_bytes);
    }

    evict_over_budget();
    return shared;
}

TextureCache::ImagePtr TextureCache::get_or_load(const std::string& key, const Loader& loader)
{
    if (auto cached = get(key))
    {
        return cached;
    }

    std::optional<Image> loaded = loader(key);
    if (!loaded)
    {
        SKC_CORE_ERROR("Failed to load texture '{}'", key);
        std::lock_guard lock(m_mutex);
        ++m_stats.load_failures;
        return nullptr;
    }

    return insert(key, std::move(*loaded));
}

bool TextureCache::erase(const std::string& key)
{
    std::lock_guard lock(m_mutex);

    const auto it = m_index.find(key);
    if (it == m_index.end())
    {
        return false;
    }

    m_bytes -= it->second->bytes;
    m_entries.erase(it->second);
    m_index.erase(it);
    return true;
}

void TextureCache::clear()
{
    std::lock_guard lock(m_mutex);
    m_entries.clear();
    m_index.clear();
    m_bytes = 0;
}

bool TextureCache::contains(const std::string& key) const
{
    std::lock_guard lock(m_mutex);
    return m_index.contains(key);
}

std::size_t TextureCache::size() const
{
    std::lock_guard lock(m_mutex);
    return m_entries.size();
}

std::size_t TextureCache::bytes_used() const
{
    std::lock_guard lock(m_mutex);
    return m_bytes;
}

TextureCacheStats TextureCache::get_stats() const
{
    std::lock_guard lock(m_mutex);
    return m_stats;
}

// Caller holds m_mutex
void TextureCache::evict_over_budget()
{
    while (m_entries.size() > 1
           && (m_bytes > m_config.max_bytes || m_entries.size() > m_config.max_entries))
    {
        const Entry& oldest = m_entries.back();
        SKC_CORE_TRACE("Evicting texture '{}' ({} bytes)", oldest.key, oldest.bytes);
        m_bytes -= oldest.bytes;
        m_index.erase(oldest.key);
        m_entries.pop_back();
        ++m_stats.evictions;
    }
}

} // namespace skychart::raster
