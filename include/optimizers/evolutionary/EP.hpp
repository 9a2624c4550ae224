#ifndef EP_HPP
#define EP_HPP

#include "core/Optimizer.hpp"
#include <Eigen/Dense>
#include <vector>

namespace metaopt {

/**
 * @brief Hyperparameters of Evolutionary Programming.
 */
struct EPParams {
    double bout_size = 0.1;    ///< Fraction of the population faced in each tournament, in [0, 1].
    double clip_ratio = 0.05;  ///< Scale applied to the clipped strategy, in [0, 1].
};

/**
 * @class EP
 * @brief Evolutionary Programming with self-adaptive mutation strategies.
 *
 * Every agent owns a strategy matrix that scales its gaussian mutation. One
 * iteration mutates each parent into a child, adapts the strategies, merges
 * parents and children and keeps the `n_agents` members with the most
 * tournament wins.
 *
 * Reference: X. Yao, Y. Liu, G. Lin. Evolutionary programming made faster.
 * IEEE Transactions on Evolutionary Computation (1999).
 */
class EP : public Optimizer {
public:
    /** @brief Builds the optimizer with default parameters. */
    EP();

    /**
     * @brief Builds the optimizer with the given parameters.
     * @throws InvalidParameterException if a parameter is out of range.
     */
    explicit EP(const EPParams& params);

    /**
     * @brief Validates and attaches the parameters.
     * @throws InvalidParameterException if a parameter is out of range.
     */
    void build(const EPParams& params);

    const EPParams& getParams() const { return params_; }

    /** @throws InvalidParameterException if bout_size is outside [0, 1]. */
    void setBoutSize(double bout_size);

    /** @throws InvalidParameterException if clip_ratio is outside [0, 1]. */
    void setClipRatio(double clip_ratio);

    /**
     * @brief Initialises one strategy per agent to 0.05 * U(0, ub_j - lb_j) on every row j.
     */
    void compile(const Space& space, RandomGenerator& rng) override;

    /**
     * @brief Mutation, strategy adaptation and tournament selection over parents and children.
     * @throws InvalidParameterException if compile() has not been run for this space.
     */
    void update(Space& space, const Function& function, const IterationContext& context) override;

    const std::vector<Eigen::MatrixXd>& getStrategy() const { return strategy_; }

private:
    Agent mutateParent(const Agent& parent, const Eigen::MatrixXd& strategy, RandomGenerator& rng) const;

    Eigen::MatrixXd updateStrategy(const Eigen::MatrixXd& strategy,
                                   const Eigen::VectorXd& lower_bound,
                                   const Eigen::VectorXd& upper_bound,
                                   RandomGenerator& rng) const;

    EPParams params_;
    std::vector<Eigen::MatrixXd> strategy_;
};

} // namespace metaopt

#endif // EP_HPP
