/**
 * @file AgentRegistry.hpp
 * @brief Registry of downstream agents, built from defaults plus an external collection.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Routing.hpp"

namespace agentrouter::infrastructure {

/**
 * @class AgentRegistry
 * @brief Ordered id -> AgentDescriptor map. Read-only once the engine is wired.
 *
 * Collection entries override defaults field by field; agents missing from
 * the collection keep their defaults.
 */
class AgentRegistry {
public:
    /** @brief Built-in agents: fiscalite, comptabilite, ressources_humaines, juridique, aides. */
    static AgentRegistry WithDefaults();

    /** @brief Adds an agent, or replaces the one with the same id in place. */
    void add(domain::AgentDescriptor agent);

    /**
     * @brief Applies a collection: object `{id: {...}}` or array `[{"id": ..., ...}]`.
     *
     * Unknown ids are added only when they carry an endpoint. Malformed
     * entries are logged and skipped.
     */
    void applyCollection(const nlohmann::json& collection);

    /** @brief Reads a collection from a JSON file. @return false if the file was missing or unreadable. */
    bool loadCollectionFile(const std::string& path);

    const domain::AgentDescriptor* find(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }

    /** @brief Agent ids in registration order. */
    std::vector<std::string> ids() const;

    const std::vector<domain::AgentDescriptor>& agents() const { return m_agents; }

private:
    bool applyEntry(const std::string& id, const nlohmann::json& entry);

    std::vector<domain::AgentDescriptor> m_agents;
};

} // namespace agentrouter::infrastructure
