/**
 * @file EmbeddingCache.hpp
 * @brief Persistence for semantic embeddings.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trekplanner::infrastructure {

/**
 * @class EmbeddingCache
 * @brief JSON-file cache of embeddings keyed by id, valid while the content hash matches.
 */
class EmbeddingCache {
public:
    explicit EmbeddingCache(const std::string& cacheFile);

    /** @brief Updates or adds an embedding to the cache. */
    void update(const std::string& id, const std::string& contentHash, const std::vector<float>& embedding);

    /** @brief Retrieves an embedding if the hash matches. */
    std::optional<std::vector<float>> get(const std::string& id, const std::string& contentHash) const;

    size_t size() const { return m_entries.size(); }

    /** @brief Writes the cache file, creating its directory if needed. */
    void persist();

    /** @brief Loads the cache file; a missing or corrupt file leaves the cache empty. */
    void load();

private:
    std::string m_cacheFile;
    struct CacheEntry {
        std::string hash;
        std::vector<float> vector;
    };
    std::map<std::string, CacheEntry> m_entries;
};

} // namespace trekplanner::infrastructure
