#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace agentrouter::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path FromEnvOrHome(const char* xdgVar, const char* homeSuffix) {
    const char* xdg = std::getenv(xdgVar);
    if (xdg && *xdg) {
        return fs::path(xdg);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeSuffix;
    }
    return fs::current_path(); // Fallback
}

} // namespace

fs::path PathUtils::GetConfigHome() {
    return FromEnvOrHome("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetCacheHome() {
    return FromEnvOrHome("XDG_CACHE_HOME", ".cache");
}

fs::path PathUtils::GetSettingsPath() {
    return GetConfigHome() / "AgentRouter" / "settings.json";
}

fs::path PathUtils::GetEmbeddingCachePath() {
    return GetCacheHome() / "AgentRouter" / "embeddings.json";
}

} // namespace agentrouter::infrastructure
