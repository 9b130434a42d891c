/**
 * @file EmbeddingCache.cpp
 * @brief Implementation of EmbeddingCache.
 */

#include "infrastructure/EmbeddingCache.hpp"
#include "domain/Errors.hpp"
#include "domain/TextUtils.hpp"
#include <chrono>
#include <fstream>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace agentrouter::infrastructure {

EmbeddingCache::EmbeddingCache(std::shared_ptr<domain::EmbeddingProvider> provider, EmbeddingCacheOptions options)
    : m_provider(std::move(provider)), m_options(options) {}

std::string EmbeddingCache::normalizeInput(const std::string& text) const {
    if (text.size() <= m_options.maxChars) return text;
    return domain::TextUtils::Utf8Prefix(text, m_options.headChars) + kTruncationMarker +
           domain::TextUtils::Utf8Suffix(text, m_options.tailChars);
}

std::string EmbeddingCache::keyFor(const std::string& normalized) {
    return domain::TextUtils::Fnv1aHex(normalized);
}

std::optional<std::vector<float>> EmbeddingCache::get(const std::string& text) const {
    const std::string key = keyFor(normalizeInput(text));
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<float> EmbeddingCache::getOrCompute(const std::string& text) {
    const std::string normalized = normalizeInput(text);
    const std::string key = keyFor(normalized);

    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(key);
        if (it != m_entries.end()) {
            return it->second;
        }
    }

    if (!m_provider) {
        throw domain::EmbeddingProviderError("No embedding provider configured");
    }

    // Provider call happens outside the lock; a concurrent miss on the same
    // text may compute twice, the first insert wins.
    std::vector<float> vec = m_provider->embed(normalized);
    if (vec.empty()) {
        throw domain::EmbeddingProviderError("Embedding provider returned an empty vector");
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto inserted = m_entries.emplace(key, std::move(vec));
    return inserted.first->second;
}

std::size_t EmbeddingCache::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.size();
}

bool EmbeddingCache::persist(const std::string& path) const {
    if (path.empty()) return false;

    json j = json::object();
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (const auto& [hash, vec] : m_entries) {
            j[hash] = vec;
        }
    }

    fs::path finalPath = path;
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[EmbeddingCache] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[EmbeddingCache] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << j.dump();
        if (ofs.fail()) {
            std::cerr << "[EmbeddingCache] Write failed: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[EmbeddingCache] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

bool EmbeddingCache::load(const std::string& path) {
    if (path.empty() || !fs::exists(path)) return false;

    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[EmbeddingCache] Cannot open " << path << std::endl;
        return false;
    }

    json j = json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        std::cerr << "[EmbeddingCache] Ignoring corrupt cache file " << path << std::endl;
        return false;
    }

    std::size_t loaded = 0;
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_array() || it.value().empty()) continue;
        try {
            auto vec = it.value().get<std::vector<float>>();
            if (m_entries.emplace(it.key(), std::move(vec)).second) ++loaded;
        } catch (const json::exception& e) {
            std::cerr << "[EmbeddingCache] Skipping entry " << it.key() << ": " << e.what() << std::endl;
        }
    }
    std::cerr << "[EmbeddingCache] Loaded " << loaded << " embeddings from " << path << std::endl;
    return true;
}

} // namespace agentrouter::infrastructure
