/**
 * @file FileSystemDocumentStore.hpp
 * @brief DocumentStore backed by a directory of JSON files.
 */

#pragma once
#include <string>
#include "domain/DocumentStore.hpp"

namespace agentrouter::infrastructure {

/**
 * @class FileSystemDocumentStore
 * @brief Lists `*.json` files under a root directory; object ids are root-relative paths.
 */
class FileSystemDocumentStore : public domain::DocumentStore {
public:
    explicit FileSystemDocumentStore(const std::string& rootDir);

    std::vector<domain::StoredObject> listDocuments(const std::string& prefix) override;

private:
    std::string m_rootDir;
};

} // namespace agentrouter::infrastructure
