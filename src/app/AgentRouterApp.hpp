/**
 * @file AgentRouterApp.hpp
 * @brief Command-line application wrapping the routing and retrieval engine.
 */

#pragma once

#include <optional>
#include <string>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace agentrouter::app {

/**
 * @class AgentRouterApp
 * @brief Parses the command line, wires the services and runs one command.
 *
 * Commands: ask, answer, route, retrieve. Exit codes: 0 success, 1 usage
 * or configuration error, 2 when the result carries an error.
 */
class AgentRouterApp {
public:
    int Run(int argc, char** argv);

private:
    struct CliOptions {
        std::string command;
        std::string question;
        std::string contextFile;
        std::string configPath;
    };

    static std::optional<CliOptions> ParseArgs(int argc, char** argv);
    static void PrintUsage();

    /** @brief Loads configuration and builds the service graph (composition root). */
    bool Init(const std::string& configPath);

    /** @brief Saves the warm embedding cache when a cache file is configured. */
    void Shutdown();

    int RunAsk(const CliOptions& options);
    int RunAnswer(const CliOptions& options);
    int RunRoute(const CliOptions& options);
    int RunRetrieve(const CliOptions& options);

    infrastructure::EngineConfig m_config;
    application::AppServices m_services;
};

} // namespace agentrouter::app
