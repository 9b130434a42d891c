/**
 * @file DocumentStore.hpp
 * @brief Interface for the external blob store holding ingested documents.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Document.hpp"

namespace agentrouter::domain {

class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    /**
     * @brief Lists every stored object under a key prefix.
     * @throws CorpusUnavailableError when the store cannot be read.
     */
    virtual std::vector<StoredObject> listDocuments(const std::string& prefix) = 0;
};

} // namespace agentrouter::domain
