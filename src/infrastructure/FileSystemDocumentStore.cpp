/**
 * @file FileSystemDocumentStore.cpp
 * @brief Implementation of FileSystemDocumentStore.
 */

#include "infrastructure/FileSystemDocumentStore.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace agentrouter::infrastructure {

FileSystemDocumentStore::FileSystemDocumentStore(const std::string& rootDir)
    : m_rootDir(rootDir) {}

std::vector<domain::StoredObject> FileSystemDocumentStore::listDocuments(const std::string& prefix) {
    std::error_code ec;
    if (m_rootDir.empty() || !fs::is_directory(m_rootDir, ec)) {
        throw domain::CorpusUnavailableError("Corpus directory not found: " + m_rootDir);
    }

    std::vector<domain::StoredObject> objects;
    try {
        for (const auto& entry : fs::recursive_directory_iterator(m_rootDir)) {
            if (!entry.is_regular_file()) continue;

            std::string ext = entry.path().extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
            if (ext != ".json") continue;

            std::string relative = fs::relative(entry.path(), m_rootDir).generic_string();
            if (relative.compare(0, prefix.size(), prefix) != 0) continue;

            std::ifstream file(entry.path(), std::ios::binary);
            if (!file.is_open()) {
                std::cerr << "[FileSystemDocumentStore] Cannot open " << entry.path() << std::endl;
                continue;
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            objects.push_back({relative, buffer.str()});
        }
    } catch (const fs::filesystem_error& e) {
        throw domain::CorpusUnavailableError(std::string("Listing failed: ") + e.what());
    }

    // Directory iteration order is unspecified; keep corpus order stable across refreshes.
    std::sort(objects.begin(), objects.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
    return objects;
}

} // namespace agentrouter::infrastructure
