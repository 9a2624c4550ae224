#include "optimizers/OptimizerFactory.hpp"
#include "optimizers/evolutionary/EP.hpp"
#include "optimizers/swarm/PSO.hpp"
#include "optimizers/swarm/FA.hpp"
#include "optimizers/science/ES.hpp"
#include "utils/ReadOptimizerConfiguration.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <functional>

namespace metaopt {

namespace {

using Settings = std::map<std::string, std::string>;
using Builder = std::function<std::unique_ptr<Optimizer>(const Settings&)>;

[[noreturn]] void unknownParameter(const std::string& algorithm, const std::string& key) {
    THROW_INVALID_PARAM("OptimizerFactory::create", "unknown parameter '" + key + "' for " + algorithm);
}

std::unique_ptr<Optimizer> buildEP(const Settings& settings) {
    EPParams params;
    for (const auto& [key, value] : settings) {
        if      (key == "bout_size")  params.bout_size = parseDoubleSetting(key, value);
        else if (key == "clip_ratio") params.clip_ratio = parseDoubleSetting(key, value);
        else if (key != "use_parallel") unknownParameter("EP", key);
    }
    return std::make_unique<EP>(params);
}

std::unique_ptr<Optimizer> buildPSO(const Settings& settings) {
    PSOParams params;
    for (const auto& [key, value] : settings) {
        if      (key == "w")  params.w = parseDoubleSetting(key, value);
        else if (key == "c1") params.c1 = parseDoubleSetting(key, value);
        else if (key == "c2") params.c2 = parseDoubleSetting(key, value);
        else if (key != "use_parallel") unknownParameter("PSO", key);
    }
    return std::make_unique<PSO>(params);
}

std::unique_ptr<Optimizer> buildFA(const Settings& settings) {
    FAParams params;
    for (const auto& [key, value] : settings) {
        if      (key == "alpha") params.alpha = parseDoubleSetting(key, value);
        else if (key == "beta")  params.beta = parseDoubleSetting(key, value);
        else if (key == "gamma") params.gamma = parseDoubleSetting(key, value);
        else if (key != "use_parallel") unknownParameter("FA", key);
    }
    return std::make_unique<FA>(params);
}

std::unique_ptr<Optimizer> buildES(const Settings& settings) {
    ESParams params;
    for (const auto& [key, value] : settings) {
        if (key == "n_electrons") params.n_electrons = parseIntSetting(key, value);
        else if (key != "use_parallel") unknownParameter("ES", key);
    }
    return std::make_unique<ES>(params);
}

const std::map<std::string, Builder>& registry() {
    static const std::map<std::string, Builder> builders = {
        {"EP", buildEP},
        {"ES", buildES},
        {"FA", buildFA},
        {"PSO", buildPSO},
    };
    return builders;
}

} // namespace

std::unique_ptr<Optimizer> OptimizerFactory::create(const std::string& algorithm,
                                                    const Settings& settings) {
    Logger& logger = Logger::getInstance();
    const std::string F_NAME = "OptimizerFactory::create";

    const auto it = registry().find(algorithm);
    if (it == registry().end()) {
        logger.error(F_NAME, "Unknown algorithm: " + algorithm);
        THROW_INVALID_PARAM(F_NAME, "unknown algorithm '" + algorithm + "'");
    }

    try {
        std::unique_ptr<Optimizer> optimizer = it->second(settings);
        const auto parallel = settings.find("use_parallel");
        if (parallel != settings.end()) {
            optimizer->setUseParallel(parseBoolSetting(parallel->first, parallel->second));
        }
        return optimizer;
    } catch (const MetaOptException& e) {
        logger.error(F_NAME, "Failed to create " + algorithm + ": " + e.what());
        throw;
    }
}

std::vector<std::string> OptimizerFactory::availableAlgorithms() {
    std::vector<std::string> names;
    for (const auto& entry : registry()) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace metaopt
