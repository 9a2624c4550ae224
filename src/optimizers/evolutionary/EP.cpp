#include "optimizers/evolutionary/EP.hpp"
#include "core/Space.hpp"
#include "core/Function.hpp"
#include "exceptions/Exceptions.hpp"

#include <algorithm>
#include <numeric>
#include <sstream>
#include <string>
#include <utility>

namespace metaopt {

EP::EP() : EP(EPParams{}) {}

EP::EP(const EPParams& params) : Optimizer("EP") {
    build(params);
}

void EP::setBoutSize(double bout_size) {
    if (bout_size < 0.0 || bout_size > 1.0) {
        THROW_INVALID_PARAM("EP::setBoutSize", "bout_size should be between 0 and 1");
    }
    params_.bout_size = bout_size;
}

void EP::setClipRatio(double clip_ratio) {
    if (clip_ratio < 0.0 || clip_ratio > 1.0) {
        THROW_INVALID_PARAM("EP::setClipRatio", "clip_ratio should be between 0 and 1");
    }
    params_.clip_ratio = clip_ratio;
}

void EP::build(const EPParams& params) {
    setBoutSize(params.bout_size);
    setClipRatio(params.clip_ratio);

    std::ostringstream summary;
    summary << "Parameters: bout_size = " << params_.bout_size
            << ", clip_ratio = " << params_.clip_ratio;
    markBuilt(summary.str());
}

void EP::compile(const Space& space, RandomGenerator& rng) {
    const Eigen::VectorXd& lb = space.getLowerBound();
    const Eigen::VectorXd& ub = space.getUpperBound();
    const int n_variables = space.getNumVariables();
    const int n_dimensions = space.getNumDimensions();

    strategy_.assign(space.getNumAgents(), Eigen::MatrixXd::Zero(n_variables, n_dimensions));
    for (auto& strategy : strategy_) {
        for (int j = 0; j < n_variables; ++j) {
            strategy.row(j) = 0.05 * rng.uniformMatrix(1, n_dimensions, 0.0, ub(j) - lb(j));
        }
    }
}

Agent EP::mutateParent(const Agent& parent, const Eigen::MatrixXd& strategy, RandomGenerator& rng) const {
    Agent child = parent;
    const double r1 = rng.gaussian();
    child.position() += strategy * r1;
    child.clipByBound();
    return child;
}

Eigen::MatrixXd EP::updateStrategy(const Eigen::MatrixXd& strategy,
                                   const Eigen::VectorXd& lower_bound,
                                   const Eigen::VectorXd& upper_bound,
                                   RandomGenerator& rng) const {
    const Eigen::MatrixXd r1 = rng.gaussianMatrix(static_cast<int>(strategy.rows()), static_cast<int>(strategy.cols()));
    Eigen::MatrixXd new_strategy = strategy + r1.cwiseProduct(strategy.cwiseAbs().cwiseSqrt());

    for (Eigen::Index j = 0; j < new_strategy.rows(); ++j) {
        new_strategy.row(j) = new_strategy.row(j)
                                  .cwiseMax(lower_bound(j))
                                  .cwiseMin(upper_bound(j)) * params_.clip_ratio;
    }
    return new_strategy;
}

void EP::update(Space& space, const Function& function, const IterationContext& context) {
    requireBuilt("EP::update");
    const int n_agents = space.getNumAgents();
    if (static_cast<int>(strategy_.size()) != n_agents) {
        THROW_INVALID_PARAM("EP::update", "strategy holds " + std::to_string(strategy_.size()) +
            " entries but the space has " + std::to_string(n_agents) + " agents; call compile() first");
    }

    const std::vector<Agent>& parents = space.getAgents();
    std::vector<Agent> children;
    children.reserve(parents.size());

    for (int i = 0; i < n_agents; ++i) {
        children.push_back(mutateParent(parents[i], strategy_[i], context.rng));
        strategy_[i] = updateStrategy(strategy_[i], parents[i].getLowerBound(), parents[i].getUpperBound(), context.rng);
    }

    const std::vector<double> child_fits = computeFitness(children, function);
    for (size_t i = 0; i < children.size(); ++i) {
        children[i].setFitness(child_fits[i]);
    }

    // Pool order is parents first, then children.
    std::vector<Agent> pool(parents.begin(), parents.end());
    pool.insert(pool.end(), children.begin(), children.end());
    const int pool_size = static_cast<int>(pool.size());

    const int n_individuals = static_cast<int>(n_agents * params_.bout_size);
    std::vector<int> wins(pool.size(), 0);
    for (int i = 0; i < pool_size; ++i) {
        for (int k = 0; k < n_individuals; ++k) {
            const int index = context.rng.integer(0, pool_size);
            if (pool[i].getFitness() < pool[index].getFitness()) {
                ++wins[i];
            }
        }
    }

    std::vector<size_t> order(pool.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&wins](size_t a, size_t b) { return wins[a] > wins[b]; });

    std::vector<Agent> selected;
    selected.reserve(n_agents);
    for (int k = 0; k < n_agents; ++k) {
        selected.push_back(std::move(pool[order[k]]));
    }
    space.setAgents(std::move(selected));
}

} // namespace metaopt
