#include "spaces/SearchSpace.hpp"

namespace metaopt {

SearchSpace::SearchSpace(int n_agents, int n_variables,
                         const std::vector<double>& lower_bound,
                         const std::vector<double>& upper_bound,
                         RandomGenerator& rng,
                         int n_dimensions)
    : Space(n_agents, n_variables, lower_bound, upper_bound, n_dimensions)
{
    build(rng);
}

void SearchSpace::initializeAgents(RandomGenerator& rng) {
    for (auto& agent : agents_) {
        agent.fillWithUniform(rng);
    }
}

} // namespace metaopt
