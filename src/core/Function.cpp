#include "core/Function.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <utility>

namespace metaopt {

Function::Function(Objective objective,
                   std::vector<Constraint> constraints,
                   double penalty,
                   std::string name,
                   ObjectiveSense sense)
    : objective_(std::move(objective)),
      constraints_(std::move(constraints)),
      penalty_(penalty),
      name_(std::move(name)),
      sense_(sense)
{
    if (!objective_) {
        THROW_TYPE_ERROR("Function::Function", "objective should be a callable");
    }
    for (size_t i = 0; i < constraints_.size(); ++i) {
        if (!constraints_[i]) {
            THROW_TYPE_ERROR("Function::Function", "constraints[" + std::to_string(i) + "] should be a callable");
        }
    }
    if (penalty_ < 0) {
        THROW_INVALID_PARAM("Function::Function", "penalty should be >= 0, got " + std::to_string(penalty_));
    }

    Logger::getInstance().debug("Function::Function",
        "Function: " + name_ + " | Constraints: " + std::to_string(constraints_.size()) +
        " | Penalty: " + std::to_string(penalty_) +
        " | Sense: " + (sense_ == ObjectiveSense::MINIMIZE ? "minimize" : "maximize"));
}

double Function::operator()(const Eigen::MatrixXd& position) const {
    double fitness = objective_(position);
    if (std::isnan(fitness)) {
        throw EvaluationException("Function::operator()", "objective '" + name_ + "' returned NaN");
    }
    if (sense_ == ObjectiveSense::MAXIMIZE) {
        fitness = -fitness;
    }

    for (const auto& constraint : constraints_) {
        if (!constraint(position)) {
            fitness += penalty_ * std::abs(fitness);
        }
    }
    return fitness;
}

} // namespace metaopt
