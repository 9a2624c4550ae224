#ifndef AGENT_HPP
#define AGENT_HPP

#include "math/RandomGenerator.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <limits>
#include <vector>

namespace metaopt {

/**
 * @class Agent
 * @brief A single candidate solution of the search space.
 *
 * The position is stored as an `n_variables x n_dimensions` matrix: one row per
 * decision variable, each holding `n_dimensions` components. Every row has its
 * own lower and upper bound. Agents are value types, so copying an agent
 * produces an independent snapshot of its position and fitness.
 */
class Agent {
public:
    /**
     * @brief Constructs an agent with a zero position and the worst possible fitness.
     *
     * @param n_variables  Number of decision variables (rows), must be positive.
     * @param n_dimensions Number of dimensions per variable (columns), must be positive.
     * @param lower_bound  Lower bound of every variable (size n_variables).
     * @param upper_bound  Upper bound of every variable (size n_variables).
     *
     * @throws InvalidParameterException if a count is not positive, a bound vector
     *         has the wrong size, or a lower bound exceeds its upper bound.
     */
    Agent(int n_variables, int n_dimensions,
          const Eigen::VectorXd& lower_bound,
          const Eigen::VectorXd& upper_bound);

    /** @brief Number of decision variables. */
    int getNumVariables() const { return static_cast<int>(position_.rows()); }

    /** @brief Number of dimensions per decision variable. */
    int getNumDimensions() const { return static_cast<int>(position_.cols()); }

    const Eigen::MatrixXd& getPosition() const { return position_; }
    Eigen::MatrixXd& position() { return position_; }

    /**
     * @brief Replaces the position.
     * @throws InvalidParameterException if the shape differs from n_variables x n_dimensions.
     */
    void setPosition(const Eigen::MatrixXd& position);

    double getFitness() const { return fit_; }
    void setFitness(double fit) { fit_ = fit; }

    const Eigen::VectorXd& getLowerBound() const { return lb_; }
    const Eigen::VectorXd& getUpperBound() const { return ub_; }

    /** @brief Seconds since epoch of the last improvement (best-agent record only). */
    std::int64_t getTimestamp() const { return ts_; }
    void setTimestamp(std::int64_t ts) { ts_ = ts; }

    /**
     * @brief Pulls every component of variable j into [lb_j, ub_j].
     *
     * Idempotent: applying it twice leaves the position unchanged.
     */
    void clipByBound();

    /**
     * @brief Fills variable j with uniform numbers in [lb_j, ub_j).
     */
    void fillWithUniform(RandomGenerator& rng);

    /**
     * @brief Sets every component of variable j to values[j].
     * @throws InvalidParameterException if values has the wrong size.
     */
    void fillWithStatic(const Eigen::VectorXd& values);

    /** @brief Sentinel fitness used before the first evaluation. */
    static constexpr double worstFitness() { return std::numeric_limits<double>::max(); }

private:
    Eigen::MatrixXd position_;
    Eigen::VectorXd lb_;
    Eigen::VectorXd ub_;
    double fit_ = worstFitness();
    std::int64_t ts_ = 0;
};

} // namespace metaopt

#endif // AGENT_HPP
