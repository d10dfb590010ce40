#include "AgentConfig.h"
#include "AugurExceptions.h"
#include "MemoryStore.h"
#include "RunOrchestrator.h"

#include <iostream>

int main(int argc, char* argv[]) {
    AgentConfig config;
    try {
        config = AgentConfig::fromArgs(argc, argv);
    } catch (const Augur::AugurException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << AgentConfig::usage() << "\n";
        return 1;
    }

    if (config.showHelp) {
        std::cout << AgentConfig::usage() << "\n";
        return 0;
    }

    try {
        MemoryStore memory(config.memoryPath);
        RunOrchestrator orchestrator = RunOrchestrator::withDefaultPolicies(memory, config.plot, !config.quiet);
        const std::string outputDir = orchestrator.run(config.dataPath,
                                                       config.target,
                                                       config.outputRoot,
                                                       config.seed,
                                                       config.testSize,
                                                       config.maxReplans);
        std::cout << outputDir << std::endl;
    } catch (const Augur::AugurException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
