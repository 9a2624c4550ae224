#ifndef OPTIMIZER_HPP
#define OPTIMIZER_HPP

#include "interfaces/IOptimizer.hpp"
#include "core/Agent.hpp"
#include <string>
#include <vector>

namespace metaopt {

/**
 * @class Optimizer
 * @brief Base class of every strategy: carries the algorithm name, the build flag
 *        and the shared evaluation protocol.
 *
 * Concrete strategies validate their parameter struct in build(), then call
 * markBuilt(). The default evaluate() computes every agent's fitness (in
 * parallel when enabled) and then scans the population in index order,
 * replacing the best agent with a copy of any agent that strictly improves it.
 */
class Optimizer : public IOptimizer {
public:
    explicit Optimizer(std::string algorithm);
    ~Optimizer() override = default;

    const std::string& getAlgorithm() const override { return algorithm_; }
    bool isBuilt() const override { return built_; }

    /** @brief Default: no auxiliary state. */
    void compile(const Space& space, RandomGenerator& rng) override;

    void evaluate(Space& space, const Function& function) override;

    /**
     * @brief Enables OpenMP evaluation of the objective. The objective must then be thread-safe.
     */
    void setUseParallel(bool use_parallel);
    bool usesParallel() const { return use_parallel_; }

protected:
    /**
     * @brief Computes function(position) for every agent without touching the agents.
     *
     * An exception thrown by the objective on a worker thread is rethrown
     * on the calling thread after the loop.
     */
    std::vector<double> computeFitness(const std::vector<Agent>& agents, const Function& function) const;

    /**
     * @brief Copies `position` and `fit` into the best agent if `fit` is strictly lower.
     * @return bool True if the best agent changed.
     */
    static bool updateBestAgent(Space& space, const Eigen::MatrixXd& position, double fit);

    /**
     * @brief Sets the build flag and logs the configuration summary.
     */
    void markBuilt(const std::string& summary);

    /**
     * @brief Throws InvalidParameterException if build() has not been called.
     */
    void requireBuilt(const std::string& function_name) const;

    std::string algorithm_;
    std::string logger_source_id_;
    bool built_ = false;
    bool use_parallel_ = false;
};

} // namespace metaopt

#endif // OPTIMIZER_HPP
