/**
 * @file AgentRegistry.cpp
 * @brief Implementation of AgentRegistry and the built-in agent table.
 */

#include "infrastructure/AgentRegistry.hpp"
#include "domain/TextUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace agentrouter::infrastructure {

namespace {

// Strong, unambiguous markers weigh 1.0; generic words weigh less so that
// they alone never skip the classifier.
constexpr double kStrong = 1.0;
constexpr double kWeak = 0.5;

domain::AgentDescriptor MakeAgent(const std::string& id,
                                  const std::string& endpoint,
                                  const std::string& description,
                                  const std::string& payloadKey,
                                  std::map<std::string, double> keywords) {
    domain::AgentDescriptor agent;
    agent.id = id;
    agent.endpointUrl = endpoint;
    agent.description = description;
    agent.payloadKey = payloadKey;
    agent.keywords = std::move(keywords);
    return agent;
}

template <typename T>
bool ReadField(const json& entry, std::initializer_list<const char*> keys, T& out, const std::string& id) {
    for (const char* key : keys) {
        auto it = entry.find(key);
        if (it == entry.end() || it->is_null()) continue;
        try {
            out = it->get<T>();
            return true;
        } catch (const json::exception& e) {
            std::cerr << "[AgentRegistry] Agent '" << id << "': bad value for '" << key << "': " << e.what() << std::endl;
            return false;
        }
    }
    return false;
}

} // namespace

AgentRegistry AgentRegistry::WithDefaults() {
    AgentRegistry registry;
    registry.add(MakeAgent("fiscalite", "http://localhost:8080/agent-fiscal",
        "Questions sur la fiscalité (TVA, IS, IR, CFE, taxes, impôts, déclarations fiscales)", "question",
        {{"tva", kStrong}, {"cfe", kStrong}, {"cvae", kStrong}, {"impôt", kStrong}, {"impot", kStrong},
         {"impôts", kStrong}, {"impots", kStrong}, {"impôt sur les sociétés", kStrong},
         {"impôt sur le revenu", kStrong}, {"crédit d impôt", kStrong}, {"taxe", kWeak}, {"taxes", kWeak},
         {"fiscal", kWeak}, {"fiscale", kWeak}, {"fiscalité", kStrong}, {"fiscalite", kStrong},
         {"déclaration fiscale", kStrong}}));
    registry.add(MakeAgent("comptabilite", "",
        "Comptabilité, bilans, comptes, écritures comptables", "question",
        {{"comptabilité", kStrong}, {"comptabilite", kStrong}, {"comptable", kWeak}, {"bilan", kStrong},
         {"bilans", kStrong}, {"compte de résultat", kStrong}, {"écriture comptable", kStrong},
         {"amortissement", kStrong}, {"liasse", kWeak}}));
    registry.add(MakeAgent("ressources_humaines", "",
        "RH, contrats de travail, paie, congés, droit du travail", "question",
        {{"contrat de travail", kStrong}, {"salarié", kWeak}, {"salariés", kWeak}, {"salarie", kWeak},
         {"paie", kStrong}, {"bulletin de paie", kStrong}, {"congés", kWeak}, {"conges", kWeak},
         {"licenciement", kStrong}, {"embauche", kWeak}, {"urssaf", kStrong}, {"rh", kWeak}}));
    registry.add(MakeAgent("juridique", "",
        "Droit des sociétés, contrats commerciaux, RGPD, aspects juridiques", "user_query",
        {{"juridique", kStrong}, {"statuts", kStrong}, {"sas", kWeak}, {"sarl", kWeak}, {"société", kWeak},
         {"droit des sociétés", kStrong}, {"rgpd", kStrong}, {"cnil", kStrong},
         {"contrat commercial", kStrong}, {"kbis", kStrong}}));
    registry.add(MakeAgent("aides", "",
        "Aides publiques, subventions et financements pour entreprises", "user_query",
        {{"aide", kWeak}, {"aides", kWeak}, {"subvention", kStrong}, {"subventions", kStrong},
         {"financement", kWeak}, {"bpifrance", kStrong}, {"bpi", kStrong}, {"prêt d honneur", kStrong}}));
    return registry;
}

void AgentRegistry::add(domain::AgentDescriptor agent) {
    for (auto& existing : m_agents) {
        if (existing.id == agent.id) {
            existing = std::move(agent);
            return;
        }
    }
    m_agents.push_back(std::move(agent));
}

const domain::AgentDescriptor* AgentRegistry::find(const std::string& id) const {
    for (const auto& agent : m_agents) {
        if (agent.id == id) return &agent;
    }
    return nullptr;
}

std::vector<std::string> AgentRegistry::ids() const {
    std::vector<std::string> result;
    result.reserve(m_agents.size());
    for (const auto& agent : m_agents) result.push_back(agent.id);
    return result;
}

bool AgentRegistry::applyEntry(const std::string& id, const json& entry) {
    if (id.empty() || !entry.is_object()) {
        std::cerr << "[AgentRegistry] Ignoring malformed collection entry '" << id << "'" << std::endl;
        return false;
    }

    domain::AgentDescriptor agent;
    const domain::AgentDescriptor* existing = find(id);
    if (existing) {
        agent = *existing;
    } else {
        agent.id = id;
    }

    ReadField(entry, {"endpointUrl", "endpoint", "url"}, agent.endpointUrl, id);
    ReadField(entry, {"requiresAuth", "requires_auth"}, agent.requiresAuth, id);
    ReadField(entry, {"needsExtraContext", "needs_extra_context"}, agent.needsExtraContext, id);
    ReadField(entry, {"enabled"}, agent.enabled, id);
    ReadField(entry, {"description"}, agent.description, id);
    ReadField(entry, {"payloadKey", "payload_key"}, agent.payloadKey, id);

    auto kw = entry.find("keywords");
    if (kw != entry.end()) {
        std::map<std::string, double> keywords;
        if (kw->is_object()) {
            for (auto it = kw->begin(); it != kw->end(); ++it) {
                if (it.value().is_number()) {
                    keywords[domain::TextUtils::ToLowerAscii(it.key())] = it.value().get<double>();
                }
            }
        } else if (kw->is_array()) {
            for (const auto& item : *kw) {
                if (item.is_string()) keywords[domain::TextUtils::ToLowerAscii(item.get<std::string>())] = 1.0;
            }
        }
        agent.keywords = std::move(keywords);
    }

    if (!existing && agent.endpointUrl.empty()) {
        std::cerr << "[AgentRegistry] Unknown agent '" << id << "' has no endpoint, ignored." << std::endl;
        return false;
    }
    add(std::move(agent));
    return true;
}

void AgentRegistry::applyCollection(const json& collection) {
    if (collection.is_object()) {
        for (auto it = collection.begin(); it != collection.end(); ++it) {
            applyEntry(it.key(), it.value());
        }
    } else if (collection.is_array()) {
        for (const auto& entry : collection) {
            std::string id;
            if (entry.is_object() && entry.contains("id") && entry["id"].is_string()) {
                id = entry["id"].get<std::string>();
            }
            applyEntry(id, entry);
        }
    } else {
        std::cerr << "[AgentRegistry] Agent collection must be an object or an array." << std::endl;
    }
}

bool AgentRegistry::loadCollectionFile(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        return false;
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[AgentRegistry] Cannot open " << path << ", keeping defaults." << std::endl;
        return false;
    }
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "[AgentRegistry] " << path << " is not valid JSON, keeping defaults." << std::endl;
        return false;
    }
    applyCollection(j);
    return true;
}

} // namespace agentrouter::infrastructure
