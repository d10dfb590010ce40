#include "AgentConfig.h"
#include "AugurExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <fstream>
#include <vector>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Augur::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Augur::AugurException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Augur::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    const int parsed = parseNumericStrict<int>(
        CommonUtils::trim(value),
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Augur::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<double>(
        CommonUtils::trim(value),
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Augur::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }
    const size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') out.erase(lastNonSpace, 1);
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') inQuotes = !inQuotes;
        else if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeKey(std::string key) {
    key = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(key.begin(), key.end(), '-', '_');
    return key;
}

void assignKeyValue(AgentConfig& config, const std::string& key, const std::string& value) {
    if (key == "data") config.dataPath = value;
    else if (key == "target") config.target = value;
    else if (key == "output_root") config.outputRoot = value;
    else if (key == "memory_path") config.memoryPath = value;
    else if (key == "seed") config.seed = parseIntStrict(value, key, 0);
    else if (key == "test_size") config.testSize = parseDoubleStrict(value, key);
    else if (key == "max_replans") config.maxReplans = parseIntStrict(value, key, 0);
    else if (key == "quiet") config.quiet = parseBoolStrict(value, key);
    else if (key == "plot_format") config.plot.format = CommonUtils::toLower(CommonUtils::trim(value));
    else if (key == "plot_width") config.plot.width = parseIntStrict(value, key, 1);
    else if (key == "plot_height") config.plot.height = parseIntStrict(value, key, 1);
    else throw Augur::ConfigurationException("Unknown option: " + key);
}
} // namespace

std::string AgentConfig::usage() {
    return "Usage: augur --data <file.csv> --target <column|auto> [--output_root dir] [--seed N] "
           "[--test_size 0..1] [--max_replans N] [--memory_path file] [--config file] [--quiet] [--help]";
}

AgentConfig AgentConfig::fromArgs(int argc, char* argv[]) {
    struct Flag {
        std::string key;
        std::string value;
        bool hasValue = false;
    };

    std::vector<Flag> flags;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw Augur::ConfigurationException("Unexpected argument: " + arg + "\n" + usage());
        }
        Flag flag;
        const size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            flag.key = normalizeKey(arg.substr(2, eq - 2));
            flag.value = arg.substr(eq + 1);
            flag.hasValue = true;
        } else {
            flag.key = normalizeKey(arg.substr(2));
            if (flag.key != "quiet" && flag.key != "help") {
                if (i + 1 >= argc) throw Augur::ConfigurationException("Missing value for --" + flag.key);
                flag.value = argv[++i];
                flag.hasValue = true;
            }
        }
        flags.push_back(std::move(flag));
    }

    AgentConfig config;
    for (const auto& flag : flags) {
        if (flag.key == "help") config.showHelp = true;
        if (flag.key == "config") config = fromFile(flag.value, config);
    }
    if (config.showHelp) return config;

    for (const auto& flag : flags) {
        if (flag.key == "config" || flag.key == "help") continue;
        if (flag.key == "quiet") {
            config.quiet = flag.hasValue ? parseBoolStrict(flag.value, "--quiet") : true;
            continue;
        }
        assignKeyValue(config, flag.key, flag.value);
    }

    config.validate();
    return config;
}

AgentConfig AgentConfig::fromFile(const std::string& configPath, const AgentConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Augur::ConfigurationException("Could not open config file: " + configPath);

    AgentConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            assignKeyValue(config, key, value);
        } catch (const Augur::AugurException& ex) {
            throw Augur::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void AgentConfig::validate() const {
    if (dataPath.empty()) throw Augur::ConfigurationException("--data is required");
    if (target.empty()) throw Augur::ConfigurationException("--target is required (a column name or 'auto')");
    if (!(testSize > 0.0 && testSize < 1.0)) {
        throw Augur::ConfigurationException("test_size must be strictly between 0 and 1");
    }
    if (maxReplans < 0) throw Augur::ConfigurationException("max_replans must be >= 0");
    if (seed < 0) throw Augur::ConfigurationException("seed must be >= 0");
    if (plot.format != "png" && plot.format != "svg") {
        throw Augur::ConfigurationException("plot_format must be one of: png, svg");
    }
    if (plot.width <= 0 || plot.height <= 0) {
        throw Augur::ConfigurationException("plot_width and plot_height must be > 0");
    }
}
