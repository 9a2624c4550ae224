#ifndef SEARCH_SPACE_HPP
#define SEARCH_SPACE_HPP

#include "core/Space.hpp"
#include "math/RandomGenerator.hpp"
#include <vector>

namespace metaopt {

/**
 * @class SearchSpace
 * @brief Continuous box-bounded space whose agents start uniformly inside the bounds.
 *
 * The space is fully built on construction.
 */
class SearchSpace : public Space {
public:
    /**
     * @param n_agents     Number of agents.
     * @param n_variables  Number of decision variables.
     * @param lower_bound  Lower bound per variable.
     * @param upper_bound  Upper bound per variable.
     * @param rng          Generator used for the initial positions.
     * @param n_dimensions Number of dimensions per variable.
     *
     * @throws InvalidParameterException on invalid counts or bounds.
     */
    SearchSpace(int n_agents, int n_variables,
                const std::vector<double>& lower_bound,
                const std::vector<double>& upper_bound,
                RandomGenerator& rng,
                int n_dimensions = 1);

protected:
    void initializeAgents(RandomGenerator& rng) override;
};

} // namespace metaopt

#endif // SEARCH_SPACE_HPP
