/**
 * @file EmbeddingCache.cpp
 * @brief Implementation of EmbeddingCache.
 */

#include "infrastructure/EmbeddingCache.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace trekplanner::infrastructure {

EmbeddingCache::EmbeddingCache(const std::string& cacheFile) : m_cacheFile(cacheFile) {}

void EmbeddingCache::update(const std::string& id, const std::string& contentHash, const std::vector<float>& embedding) {
    m_entries[id] = {contentHash, embedding};
}

std::optional<std::vector<float>> EmbeddingCache::get(const std::string& id, const std::string& contentHash) const {
    auto it = m_entries.find(id);
    if (it != m_entries.end() && it->second.hash == contentHash) {
        return it->second.vector;
    }
    return std::nullopt;
}

void EmbeddingCache::persist() {
    if (m_cacheFile.empty()) return;
    fs::path p(m_cacheFile);

    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            std::cerr << "[EmbeddingCache] Cannot create " << p.parent_path() << ": " << ec.message() << std::endl;
            return;
        }
    }

    json j = json::object();
    for (const auto& [id, entry] : m_entries) {
        j[id] = { {"hash", entry.hash}, {"vector", entry.vector} };
    }

    std::ofstream ofs(p);
    if (!ofs.is_open()) {
        std::cerr << "[EmbeddingCache] Cannot write " << p << std::endl;
        return;
    }
    ofs << j.dump(4);
}

void EmbeddingCache::load() {
    if (m_cacheFile.empty()) return;
    fs::path p(m_cacheFile);
    if (!fs::exists(p)) return;

    try {
        std::ifstream f(p);
        if (!f.is_open()) return;

        json j = json::parse(f);
        m_entries.clear();
        for (auto it = j.begin(); it != j.end(); ++it) {
            const std::string id = it.key();
            if (it.value().contains("hash") && it.value().contains("vector")) {
                std::string hash = it.value()["hash"];
                std::vector<float> vec = it.value()["vector"];
                m_entries[id] = {hash, vec};
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[EmbeddingCache] Ignoring unreadable cache " << p << ": " << e.what() << std::endl;
        m_entries.clear();
    }
}

} // namespace trekplanner::infrastructure
