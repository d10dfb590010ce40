#pragma once
#include <string>

struct PlotConfig {
    std::string format = "png";
    int width = 900;
    int height = 700;
};

struct AgentConfig {
    std::string dataPath;
    std::string target;
    std::string outputRoot = "outputs";
    std::string memoryPath = "agent_memory.json";
    int seed = 42;
    double testSize = 0.2;
    int maxReplans = 1;
    bool quiet = false;
    bool showHelp = false;
    PlotConfig plot;

    /**
     * @brief Parses command-line flags; --config values act as defaults for explicit flags.
     * @throws Augur::ConfigurationException on unknown flags, missing values or invalid values.
     */
    static AgentConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads a lightweight key: value config (YAML-ish or JSON-ish) on top of base.
     */
    static AgentConfig fromFile(const std::string& configPath, const AgentConfig& base);

    static std::string usage();

    void validate() const;
};
