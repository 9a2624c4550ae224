#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <map>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include "utils/ReadOptimizerConfiguration.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"

static void trimLine(std::string& line) {
    line.erase(0, line.find_first_not_of(" \t\n\r\f\v"));
    line.erase(line.find_last_not_of(" \t\n\r\f\v") + 1);
}

// Reads `name value...` lines into a map of raw tokens. Later duplicates overwrite earlier ones.
static std::map<std::string, std::vector<std::string>> readKeyValueFile(const std::string& filename, const std::string& calling_function_name) {
    std::map<std::string, std::vector<std::string>> entries;
    std::ifstream file(filename);
    if (!file.is_open()) {
        metaopt::Logger::getInstance().error("ReadOptimizerConfiguration::" + calling_function_name, "Error opening settings file: " + filename);
        throw metaopt::FileIOException(calling_function_name, "Error opening settings file: " + filename);
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        trimLine(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string name;
        iss >> name;
        std::vector<std::string> values;
        std::string token;
        while (iss >> token) {
            if (token[0] == '#') break;
            values.push_back(token);
        }
        if (values.empty()) {
            metaopt::Logger::getInstance().error("ReadOptimizerConfiguration::" + calling_function_name, "Missing value in settings file (line " + std::to_string(line_number) + "): " + line);
            throw metaopt::DataFormatException(calling_function_name, "Missing value on line " + std::to_string(line_number) + ": " + line);
        }
        if (entries.count(name)) {
            metaopt::Logger::getInstance().warning("ReadOptimizerConfiguration::" + calling_function_name, "Setting '" + name + "' repeated on line " + std::to_string(line_number) + ", keeping the last value");
        }
        entries[name] = values;
    }
    file.close();
    return entries;
}

double parseDoubleSetting(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::invalid_argument&) {
        THROW_TYPE_ERROR("parseDoubleSetting", "`" + name + "` should be a float or integer, got '" + value + "'");
    } catch (const std::out_of_range&) {
        THROW_TYPE_ERROR("parseDoubleSetting", "`" + name + "` is out of the range of a double: '" + value + "'");
    }
    if (consumed != value.size()) {
        THROW_TYPE_ERROR("parseDoubleSetting", "`" + name + "` should be a float or integer, got '" + value + "'");
    }
    return parsed;
}

int parseIntSetting(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::invalid_argument&) {
        THROW_TYPE_ERROR("parseIntSetting", "`" + name + "` should be an integer, got '" + value + "'");
    } catch (const std::out_of_range&) {
        THROW_TYPE_ERROR("parseIntSetting", "`" + name + "` is out of the range of an integer: '" + value + "'");
    }
    if (consumed != value.size()) {
        THROW_TYPE_ERROR("parseIntSetting", "`" + name + "` should be an integer, got '" + value + "'");
    }
    return parsed;
}

bool parseBoolSetting(const std::string& name, const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") return true;
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") return false;
    THROW_TYPE_ERROR("parseBoolSetting", "`" + name + "` should be a boolean, got '" + value + "'");
}

std::map<std::string, std::string> readOptimizerSettings(const std::string& filename) {
    const auto entries = readKeyValueFile(filename, "readOptimizerSettings");

    std::map<std::string, std::string> settings;
    for (const auto& [name, values] : entries) {
        if (values.size() != 1) {
            metaopt::Logger::getInstance().error("ReadOptimizerConfiguration::readOptimizerSettings", "Too many values for setting '" + name + "' in " + filename);
            throw metaopt::DataFormatException("readOptimizerSettings", "Too many values for setting '" + name + "'");
        }
        settings[name] = values.front();
    }
    metaopt::Logger::getInstance().info("ReadOptimizerConfiguration::readOptimizerSettings", "Successfully read " + std::to_string(settings.size()) + " settings from " + filename);
    return settings;
}

static const std::string& singleValue(const std::string& name, const std::vector<std::string>& values) {
    if (values.size() != 1) {
        metaopt::Logger::getInstance().error("ReadOptimizerConfiguration::readTaskConfiguration", "Expected one value for '" + name + "', got " + std::to_string(values.size()));
        throw metaopt::DataFormatException("readTaskConfiguration", "Expected one value for '" + name + "', got " + std::to_string(values.size()));
    }
    return values.front();
}

static std::vector<double> parseBoundList(const std::string& name, const std::vector<std::string>& values) {
    std::vector<double> bounds;
    bounds.reserve(values.size());
    for (const auto& value : values) {
        bounds.push_back(parseDoubleSetting(name, value));
    }
    return bounds;
}

static void validateTaskConfiguration(metaopt::TaskConfiguration& task) {
    const std::string F_NAME = "readTaskConfiguration";
    if (task.n_agents <= 0) THROW_INVALID_PARAM(F_NAME, "n_agents should be > 0");
    if (task.n_variables <= 0) THROW_INVALID_PARAM(F_NAME, "n_variables should be > 0");
    if (task.n_dimensions <= 0) THROW_INVALID_PARAM(F_NAME, "n_dimensions should be > 0");
    if (task.n_iterations <= 0) THROW_INVALID_PARAM(F_NAME, "n_iterations should be > 0");
    if (task.checkpoint_frequency < 0) THROW_INVALID_PARAM(F_NAME, "checkpoint_frequency should be >= 0");

    if (task.lower_bound.empty()) task.lower_bound.assign(task.n_variables, -10.0);
    if (task.upper_bound.empty()) task.upper_bound.assign(task.n_variables, 10.0);

    if (static_cast<int>(task.lower_bound.size()) != task.n_variables ||
        static_cast<int>(task.upper_bound.size()) != task.n_variables) {
        THROW_INVALID_PARAM(F_NAME, "lower_bound and upper_bound should have n_variables = " +
            std::to_string(task.n_variables) + " values each");
    }
    for (size_t j = 0; j < task.lower_bound.size(); ++j) {
        if (task.lower_bound[j] > task.upper_bound[j]) {
            THROW_INVALID_PARAM(F_NAME, "lower_bound[" + std::to_string(j) + "] should be <= upper_bound[" + std::to_string(j) + "]");
        }
    }

    metaopt::LogLevel level;
    if (!metaopt::parseLogLevel(task.log_level, level)) {
        THROW_INVALID_PARAM(F_NAME, "log_level should be one of DEBUG, INFO, WARNING, ERROR, FATAL, got '" + task.log_level + "'");
    }
}

metaopt::TaskConfiguration readTaskConfiguration(const std::string& filename) {
    const auto entries = readKeyValueFile(filename, "readTaskConfiguration");

    metaopt::TaskConfiguration task;
    for (const auto& [name, values] : entries) {
        if      (name == "algorithm")            task.algorithm = singleValue(name, values);
        else if (name == "n_agents")             task.n_agents = parseIntSetting(name, singleValue(name, values));
        else if (name == "n_variables")          task.n_variables = parseIntSetting(name, singleValue(name, values));
        else if (name == "n_dimensions")         task.n_dimensions = parseIntSetting(name, singleValue(name, values));
        else if (name == "lower_bound")          task.lower_bound = parseBoundList(name, values);
        else if (name == "upper_bound")          task.upper_bound = parseBoundList(name, values);
        else if (name == "n_iterations")         task.n_iterations = parseIntSetting(name, singleValue(name, values));
        else if (name == "store_only_best")      task.store_only_best = parseBoolSetting(name, singleValue(name, values));
        else if (name == "checkpoint_frequency") task.checkpoint_frequency = parseIntSetting(name, singleValue(name, values));
        else if (name == "checkpoint_file")      task.checkpoint_file = singleValue(name, values);
        else if (name == "log_level")            task.log_level = singleValue(name, values);
        else if (name == "log_file")             task.log_file = singleValue(name, values);
        else if (name == "seed") {
            const int seed = parseIntSetting(name, singleValue(name, values));
            if (seed < 0) THROW_INVALID_PARAM("readTaskConfiguration", "seed should be >= 0");
            task.seed = static_cast<unsigned int>(seed);
            task.has_seed = true;
        } else {
            metaopt::Logger::getInstance().error("ReadOptimizerConfiguration::readTaskConfiguration", "Unknown key '" + name + "' in " + filename);
            throw metaopt::DataFormatException("readTaskConfiguration", "Unknown key '" + name + "'");
        }
    }

    validateTaskConfiguration(task);
    metaopt::Logger::getInstance().info("ReadOptimizerConfiguration::readTaskConfiguration", "Successfully read task '" + task.algorithm + "' from " + filename);
    return task;
}
