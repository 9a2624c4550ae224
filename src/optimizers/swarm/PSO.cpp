#include "optimizers/swarm/PSO.hpp"
#include "core/Space.hpp"
#include "core/Function.hpp"
#include "exceptions/Exceptions.hpp"

#include <sstream>

namespace metaopt {

PSO::PSO() : PSO(PSOParams{}) {}

PSO::PSO(const PSOParams& params) : Optimizer("PSO") {
    build(params);
}

void PSO::build(const PSOParams& params) {
    if (params.w < 0.0) THROW_INVALID_PARAM("PSO::build", "w should be >= 0");
    if (params.c1 < 0.0) THROW_INVALID_PARAM("PSO::build", "c1 should be >= 0");
    if (params.c2 < 0.0) THROW_INVALID_PARAM("PSO::build", "c2 should be >= 0");
    params_ = params;

    std::ostringstream summary;
    summary << "Parameters: w = " << params_.w
            << ", c1 = " << params_.c1
            << ", c2 = " << params_.c2;
    markBuilt(summary.str());
}

void PSO::compile(const Space& space, RandomGenerator& /*rng*/) {
    const std::vector<Agent>& agents = space.getAgents();
    local_position_.clear();
    local_position_.reserve(agents.size());
    for (const auto& agent : agents) {
        local_position_.push_back(agent.getPosition());
    }
    velocity_.assign(agents.size(), Eigen::MatrixXd::Zero(space.getNumVariables(), space.getNumDimensions()));
}

void PSO::checkCompiled(const Space& space, const std::string& function_name) const {
    if (static_cast<int>(local_position_.size()) != space.getNumAgents()) {
        THROW_INVALID_PARAM(function_name, "PSO state does not match the space; call compile() first");
    }
}

void PSO::evaluate(Space& space, const Function& function) {
    checkCompiled(space, "PSO::evaluate");
    std::vector<Agent>& agents = space.agents();
    const std::vector<double> fits = computeFitness(agents, function);

    for (size_t i = 0; i < agents.size(); ++i) {
        if (fits[i] < agents[i].getFitness()) {
            agents[i].setFitness(fits[i]);
            local_position_[i] = agents[i].getPosition();
        }
        updateBestAgent(space, local_position_[i], agents[i].getFitness());
    }
}

void PSO::update(Space& space, const Function& /*function*/, const IterationContext& context) {
    requireBuilt("PSO::update");
    checkCompiled(space, "PSO::update");

    std::vector<Agent>& agents = space.agents();
    const Eigen::MatrixXd& best_position = space.getBestAgent().getPosition();

    for (size_t i = 0; i < agents.size(); ++i) {
        const double r1 = context.rng.uniform();
        const double r2 = context.rng.uniform();
        Eigen::MatrixXd& x = agents[i].position();

        velocity_[i] = params_.w * velocity_[i]
                     + params_.c1 * r1 * (local_position_[i] - x)
                     + params_.c2 * r2 * (best_position - x);
        x += velocity_[i];
    }
}

} // namespace metaopt
