#ifndef FUNCTION_HPP
#define FUNCTION_HPP

#include <Eigen/Dense>
#include <functional>
#include <string>
#include <vector>

namespace metaopt {

/**
 * @brief Direction of the optimization. The core always minimizes; MAXIMIZE
 *        flips the sign of the objective.
 */
enum class ObjectiveSense {
    MINIMIZE,
    MAXIMIZE
};

/**
 * @class Function
 * @brief Immutable wrapper around the user objective.
 *
 * Calling the function evaluates the objective on an agent position, applies
 * the optimization sense and penalises every violated constraint with
 * `fitness += penalty * |fitness|`.
 */
class Function {
public:
    using Objective = std::function<double(const Eigen::MatrixXd&)>;
    /** @brief Returns true when the position satisfies the constraint. */
    using Constraint = std::function<bool(const Eigen::MatrixXd&)>;

    /**
     * @param objective   Callable mapping a position to a scalar.
     * @param constraints Optional constraints.
     * @param penalty     Penalty factor applied per violated constraint, must be >= 0.
     * @param name        Name used in logs; defaults to "Function".
     * @param sense       Whether the objective is minimized or maximized.
     *
     * @throws ParameterTypeException if the objective or a constraint is empty.
     * @throws InvalidParameterException if penalty is negative.
     */
    explicit Function(Objective objective,
                      std::vector<Constraint> constraints = {},
                      double penalty = 0.0,
                      std::string name = "Function",
                      ObjectiveSense sense = ObjectiveSense::MINIMIZE);

    /**
     * @brief Evaluates the (penalised, sign-adjusted) objective.
     *
     * Exceptions thrown by the objective propagate unchanged.
     * @throws EvaluationException if the objective returns NaN.
     */
    double operator()(const Eigen::MatrixXd& position) const;

    const std::string& getName() const { return name_; }
    double getPenalty() const { return penalty_; }
    size_t getNumConstraints() const { return constraints_.size(); }
    ObjectiveSense getSense() const { return sense_; }

private:
    Objective objective_;
    std::vector<Constraint> constraints_;
    double penalty_;
    std::string name_;
    ObjectiveSense sense_;
};

} // namespace metaopt

#endif // FUNCTION_HPP
