#include "core/OptimizationRunner.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <sstream>
#include <utility>

namespace metaopt {

OptimizationRunner::OptimizationRunner(std::shared_ptr<Space> space,
                                       std::shared_ptr<IOptimizer> optimizer,
                                       Function function,
                                       RandomGenerator& rng,
                                       bool store_only_best)
    : space_(std::move(space)),
      optimizer_(std::move(optimizer)),
      function_(std::move(function)),
      rng_(rng),
      history_(store_only_best)
{
    if (!space_) {
        THROW_INVALID_PARAM("OptimizationRunner", "Space cannot be null.");
    }
    if (!optimizer_) {
        THROW_INVALID_PARAM("OptimizationRunner", "Optimizer cannot be null.");
    }
    if (!space_->isBuilt()) {
        THROW_INVALID_PARAM("OptimizationRunner", "Space has not been built.");
    }
    if (!optimizer_->isBuilt()) {
        THROW_INVALID_PARAM("OptimizationRunner", optimizer_->getAlgorithm() + " has not been built.");
    }

    optimizer_->compile(*space_, rng_);
    Logger::getInstance().debug("OptimizationRunner", optimizer_->getAlgorithm() + " compiled against a space of " +
        std::to_string(space_->getNumAgents()) + " agents.");
}

void OptimizationRunner::evaluateSpace(const PreEvaluateHook& pre_evaluate) {
    if (pre_evaluate) {
        pre_evaluate(*optimizer_, *space_, function_);
    }
    optimizer_->evaluate(*space_, function_);
}

const History& OptimizationRunner::start(int n_iterations,
                                         const std::vector<std::shared_ptr<Callback>>& callbacks,
                                         const PreEvaluateHook& pre_evaluate) {
    if (n_iterations <= 0) {
        THROW_INVALID_PARAM("OptimizationRunner::start", "n_iterations should be > 0");
    }
    CallbackVessel vessel(callbacks);
    Logger& logger = Logger::getInstance();

    logger.info("OptimizationRunner", "Starting " + optimizer_->getAlgorithm() + " on '" + function_.getName() +
        "' for " + std::to_string(n_iterations) + " iterations.");

    vessel.onTaskBegin(*space_);
    evaluateSpace(pre_evaluate);

    for (int t = 0; t < n_iterations; ++t) {
        const int iteration = ++total_iterations_;
        const IterationContext context{iteration, n_iterations, rng_};

        vessel.onIterationBegin(iteration, *space_);

        vessel.onUpdateBefore(iteration, *space_);
        optimizer_->update(*space_, function_, context);
        vessel.onUpdateAfter(iteration, *space_);

        if (static_cast<int>(space_->getAgents().size()) != space_->getNumAgents()) {
            THROW_INVALID_PARAM("OptimizationRunner::start", optimizer_->getAlgorithm() + " left " +
                std::to_string(space_->getAgents().size()) + " agents, expected " +
                std::to_string(space_->getNumAgents()));
        }

        space_->clipByBound();

        if (pre_evaluate) {
            pre_evaluate(*optimizer_, *space_, function_);
        }
        vessel.onEvaluateBefore(iteration, *space_);
        optimizer_->evaluate(*space_, function_);
        vessel.onEvaluateAfter(iteration, *space_);

        history_.dump(iteration, space_->getAgents(), space_->getBestAgent());

        vessel.onIterationEnd(iteration, *space_, history_);

        if (logger.isEnabled(LogLevel::DEBUG)) {
            std::ostringstream msg;
            msg << "Iteration " << (t + 1) << "/" << n_iterations
                << " | Fitness: " << space_->getBestAgent().getFitness();
            logger.debug("OptimizationRunner", msg.str());
        }
    }

    vessel.onTaskEnd(*space_, history_);
    logger.info("OptimizationRunner", "Finished " + optimizer_->getAlgorithm() + ". Best fitness: " +
        std::to_string(space_->getBestAgent().getFitness()));
    return history_;
}

} // namespace metaopt
