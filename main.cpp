#include "app/AgentRouterApp.hpp"

int main(int argc, char** argv) {
    agentrouter::app::AgentRouterApp app;
    return app.Run(argc, argv);
}
