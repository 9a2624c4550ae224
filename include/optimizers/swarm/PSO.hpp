#ifndef PSO_HPP
#define PSO_HPP

#include "core/Optimizer.hpp"
#include <Eigen/Dense>
#include <vector>

namespace metaopt {

/**
 * @brief Hyperparameters of Particle Swarm Optimization.
 */
struct PSOParams {
    double w = 0.7;   ///< Inertia weight, >= 0.
    double c1 = 1.7;  ///< Cognitive constant, >= 0.
    double c2 = 1.7;  ///< Social constant, >= 0.
};

/**
 * @class PSO
 * @brief Global-best Particle Swarm Optimization.
 *
 * Every particle keeps a velocity and the best position it has visited
 * (its local position). The agent fitness stored in the space is the fitness
 * of that local position, so it only ever decreases.
 *
 * Reference: J. Kennedy, R. C. Eberhart. Swarm intelligence (2001).
 */
class PSO : public Optimizer {
public:
    PSO();

    /** @throws InvalidParameterException if a parameter is negative. */
    explicit PSO(const PSOParams& params);

    /** @throws InvalidParameterException if a parameter is negative. */
    void build(const PSOParams& params);

    const PSOParams& getParams() const { return params_; }

    /** @brief Creates zero velocities and copies the current positions as local positions. */
    void compile(const Space& space, RandomGenerator& rng) override;

    /**
     * @brief Replaces an agent's fitness and local position only when the new fitness improves it,
     *        then refreshes the best agent from the local positions.
     */
    void evaluate(Space& space, const Function& function) override;

    /**
     * @brief v = w v + c1 r1 (local - x) + c2 r2 (best - x); x = x + v.
     */
    void update(Space& space, const Function& function, const IterationContext& context) override;

    const std::vector<Eigen::MatrixXd>& getLocalPositions() const { return local_position_; }
    const std::vector<Eigen::MatrixXd>& getVelocities() const { return velocity_; }

private:
    void checkCompiled(const Space& space, const std::string& function_name) const;

    PSOParams params_;
    std::vector<Eigen::MatrixXd> local_position_;
    std::vector<Eigen::MatrixXd> velocity_;
};

} // namespace metaopt

#endif // PSO_HPP
