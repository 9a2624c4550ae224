#ifndef I_OPTIMIZER_HPP
#define I_OPTIMIZER_HPP

#include <string>

namespace metaopt {

// Forward declarations
class Space;
class Function;
class RandomGenerator;

/**
 * @brief Per-iteration information handed to IOptimizer::update.
 */
struct IterationContext {
    int iteration;         ///< Current iteration (1-based, cumulative across runs).
    int n_iterations;      ///< Number of iterations requested for the current run.
    RandomGenerator& rng;  ///< Shared random state.
};

/**
 * @brief Interface for the population-based strategies driven by OptimizationRunner.
 */
class IOptimizer {
public:
    virtual ~IOptimizer() = default;

    /** @brief Name of the algorithm, e.g. "EP". */
    virtual const std::string& getAlgorithm() const = 0;

    /** @brief True once the hyperparameters have been validated and attached. */
    virtual bool isBuilt() const = 0;

    /**
     * @brief Prepares auxiliary per-agent state from the space. Called once per run.
     */
    virtual void compile(const Space& space, RandomGenerator& rng) = 0;

    /**
     * @brief Evaluates every agent and refreshes the best-agent record.
     */
    virtual void evaluate(Space& space, const Function& function) = 0;

    /**
     * @brief Applies one population transition. Must leave exactly n_agents agents.
     */
    virtual void update(Space& space, const Function& function, const IterationContext& context) = 0;
};

} // namespace metaopt

#endif // I_OPTIMIZER_HPP
