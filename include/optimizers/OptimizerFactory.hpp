#ifndef OPTIMIZER_FACTORY_HPP
#define OPTIMIZER_FACTORY_HPP

#include "core/Optimizer.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace metaopt {

/**
 * @class OptimizerFactory
 * @brief Builds optimizers by name from a text settings map.
 *
 * This is the only place where hyperparameters arrive as strings; they are
 * parsed into the strategy's parameter struct and validated by its build().
 * Every algorithm accepts the boolean `use_parallel` flag in addition to its
 * own parameters.
 */
class OptimizerFactory {
public:
    /**
     * @brief Creates and builds the named optimizer.
     *
     * @param algorithm Registered name ("EP", "PSO", "FA", "ES").
     * @param settings  Parameter names mapped to raw values; missing names keep their defaults.
     * @return std::unique_ptr<Optimizer> Built optimizer.
     *
     * @throws InvalidParameterException for an unknown algorithm, an unknown parameter
     *         name or a value out of range.
     * @throws ParameterTypeException if a value cannot be parsed as the expected type.
     */
    static std::unique_ptr<Optimizer> create(const std::string& algorithm,
                                             const std::map<std::string, std::string>& settings = {});

    /** @brief Names accepted by create(), sorted. */
    static std::vector<std::string> availableAlgorithms();
};

} // namespace metaopt

#endif // OPTIMIZER_FACTORY_HPP
