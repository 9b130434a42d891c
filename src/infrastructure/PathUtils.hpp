// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace agentrouter::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();

    /** @brief $XDG_CONFIG_HOME/AgentRouter/settings.json */
    static std::filesystem::path GetSettingsPath();

    /** @brief $XDG_CACHE_HOME/AgentRouter/embeddings.json */
    static std::filesystem::path GetEmbeddingCachePath();
};

} // namespace agentrouter::infrastructure
