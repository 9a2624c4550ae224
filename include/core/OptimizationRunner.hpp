#ifndef OPTIMIZATION_RUNNER_HPP
#define OPTIMIZATION_RUNNER_HPP

#include "interfaces/IOptimizer.hpp"
#include "core/Space.hpp"
#include "core/Function.hpp"
#include "core/History.hpp"
#include "callbacks/Callback.hpp"
#include "math/RandomGenerator.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace metaopt {

/**
 * @class OptimizationRunner
 * @brief Drives an optimizer over a space and records the run in a History.
 *
 * Each iteration runs update, clipping, evaluation and recording, with the
 * callback hooks in between. The runner owns the History; calling start()
 * again resumes the same run, so the History and the iteration counter keep
 * growing.
 */
class OptimizationRunner {
public:
    /** @brief Called right before every evaluation of the space. */
    using PreEvaluateHook = std::function<void(IOptimizer&, Space&, const Function&)>;

    /**
     * @brief Validates the components and compiles the optimizer against the space.
     *
     * @param space           Built search space.
     * @param optimizer       Built optimizer.
     * @param function        Objective to minimize.
     * @param rng             Random state used by compile() and update(); must outlive the runner.
     * @param store_only_best Keep only the best agent in each history snapshot.
     *
     * @throws InvalidParameterException if the space or the optimizer is null or not built.
     */
    OptimizationRunner(std::shared_ptr<Space> space,
                       std::shared_ptr<IOptimizer> optimizer,
                       Function function,
                       RandomGenerator& rng,
                       bool store_only_best = false);

    /**
     * @brief Runs `n_iterations` iterations.
     *
     * @param n_iterations Number of iterations, must be positive.
     * @param callbacks    Callbacks invoked in order at every hook.
     * @param pre_evaluate Optional hook run before every evaluation.
     * @return const History& The history of the whole run so far.
     *
     * @throws InvalidParameterException if n_iterations <= 0 or a callback is null.
     * Exceptions from the objective, the optimizer or a callback abort the run.
     */
    const History& start(int n_iterations,
                         const std::vector<std::shared_ptr<Callback>>& callbacks = {},
                         const PreEvaluateHook& pre_evaluate = {});

    const Space& getSpace() const { return *space_; }
    const IOptimizer& getOptimizer() const { return *optimizer_; }
    const Function& getFunction() const { return function_; }
    const History& getHistory() const { return history_; }

    /** @brief Iterations run across all calls to start(). */
    int getTotalIterations() const { return total_iterations_; }

private:
    void evaluateSpace(const PreEvaluateHook& pre_evaluate);

    std::shared_ptr<Space> space_;
    std::shared_ptr<IOptimizer> optimizer_;
    Function function_;
    RandomGenerator& rng_;
    History history_;
    int total_iterations_ = 0;
};

} // namespace metaopt

#endif // OPTIMIZATION_RUNNER_HPP
