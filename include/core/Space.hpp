#ifndef SPACE_HPP
#define SPACE_HPP

#include "core/Agent.hpp"
#include "math/RandomGenerator.hpp"
#include <Eigen/Dense>
#include <vector>

namespace metaopt {

/**
 * @class Space
 * @brief Population container: owns the agents and the best-agent record.
 *
 * A space is created once before the run. Its agents are replaced or mutated
 * every iteration by the optimizer's update step, while the best agent is only
 * touched by the evaluation step. The best agent is an owned copy, never a
 * reference into the population.
 *
 * Concrete spaces decide how agents are initialised by overriding
 * initializeAgents().
 */
class Space {
public:
    /**
     * @brief Validates and stores the space metadata. Agents are created by build().
     *
     * @param n_agents     Number of agents, must be positive.
     * @param n_variables  Number of decision variables, must be positive.
     * @param lower_bound  Lower bound per variable (size n_variables).
     * @param upper_bound  Upper bound per variable (size n_variables).
     * @param n_dimensions Number of dimensions per variable, must be positive.
     *
     * @throws InvalidParameterException on any invalid count or bound.
     */
    Space(int n_agents, int n_variables,
          const std::vector<double>& lower_bound,
          const std::vector<double>& upper_bound,
          int n_dimensions = 1);

    virtual ~Space() = default;

    /**
     * @brief Creates the agents and the best-agent record, then initialises the agents.
     * @param rng Generator used by initializeAgents().
     */
    void build(RandomGenerator& rng);

    bool isBuilt() const { return built_; }

    int getNumAgents() const { return n_agents_; }
    int getNumVariables() const { return n_variables_; }
    int getNumDimensions() const { return n_dimensions_; }

    const Eigen::VectorXd& getLowerBound() const { return lb_; }
    const Eigen::VectorXd& getUpperBound() const { return ub_; }

    const std::vector<Agent>& getAgents() const { return agents_; }
    std::vector<Agent>& agents() { return agents_; }

    /**
     * @brief Replaces the whole population.
     * @throws InvalidParameterException if the population size is not n_agents
     *         or an agent has the wrong shape
     *         or bounds different from the space's.
     */
    void setAgents(std::vector<Agent> agents);

    const Agent& getBestAgent() const { return best_agent_; }
    Agent& bestAgent() { return best_agent_; }

    /**
     * @brief Clips every agent to its bounds.
     */
    void clipByBound();

protected:
    /**
     * @brief Initialises the positions of freshly created agents.
     */
    virtual void initializeAgents(RandomGenerator& rng) = 0;

    int n_agents_;
    int n_variables_;
    int n_dimensions_;
    Eigen::VectorXd lb_;
    Eigen::VectorXd ub_;
    std::vector<Agent> agents_;
    Agent best_agent_;
    bool built_ = false;
};

} // namespace metaopt

#endif // SPACE_HPP
