#include "optimizers/swarm/FA.hpp"
#include "core/Space.hpp"
#include "core/Function.hpp"
#include "exceptions/Exceptions.hpp"

#include <cmath>
#include <sstream>

namespace metaopt {

FA::FA() : FA(FAParams{}) {}

FA::FA(const FAParams& params) : Optimizer("FA") {
    build(params);
}

void FA::build(const FAParams& params) {
    if (params.alpha < 0.0) THROW_INVALID_PARAM("FA::build", "alpha should be >= 0");
    if (params.beta < 0.0) THROW_INVALID_PARAM("FA::build", "beta should be >= 0");
    if (params.gamma < 0.0) THROW_INVALID_PARAM("FA::build", "gamma should be >= 0");
    params_ = params;
    current_alpha_ = params_.alpha;

    std::ostringstream summary;
    summary << "Parameters: alpha = " << params_.alpha
            << ", beta = " << params_.beta
            << ", gamma = " << params_.gamma;
    markBuilt(summary.str());
}

void FA::compile(const Space& /*space*/, RandomGenerator& /*rng*/) {
    current_alpha_ = params_.alpha;
}

void FA::update(Space& space, const Function& /*function*/, const IterationContext& context) {
    requireBuilt("FA::update");

    const double delta = 1.0 - std::pow(1e-4 / 0.9, 1.0 / context.n_iterations);
    current_alpha_ *= (1.0 - delta);

    std::vector<Agent>& agents = space.agents();
    const std::vector<Agent> previous = agents;
    const int n_variables = space.getNumVariables();
    const int n_dimensions = space.getNumDimensions();

    for (auto& agent : agents) {
        for (const auto& other : previous) {
            // Brighter means lower fitness.
            if (other.getFitness() < agent.getFitness()) {
                Eigen::MatrixXd& x = agent.position();
                const double distance = (x - other.getPosition()).norm();
                const double attraction = params_.beta * std::exp(-params_.gamma * distance);
                const Eigen::MatrixXd r = context.rng.uniformMatrix(n_variables, n_dimensions, 0.0, 1.0);

                x += attraction * (other.getPosition() - x)
                   + current_alpha_ * (r.array() - 0.5).matrix();
            }
        }
    }
}

} // namespace metaopt
