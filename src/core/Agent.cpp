#include "core/Agent.hpp"
#include "exceptions/Exceptions.hpp"
#include <string>

namespace metaopt {

Agent::Agent(int n_variables, int n_dimensions,
             const Eigen::VectorXd& lower_bound,
             const Eigen::VectorXd& upper_bound)
    : lb_(lower_bound), ub_(upper_bound)
{
    if (n_variables <= 0) {
        THROW_INVALID_PARAM("Agent::Agent", "n_variables should be > 0, got " + std::to_string(n_variables));
    }
    if (n_dimensions <= 0) {
        THROW_INVALID_PARAM("Agent::Agent", "n_dimensions should be > 0, got " + std::to_string(n_dimensions));
    }
    if (lb_.size() != n_variables) {
        THROW_INVALID_PARAM("Agent::Agent", "lower_bound should have size equal to n_variables (" +
            std::to_string(n_variables) + "), got " + std::to_string(lb_.size()));
    }
    if (ub_.size() != n_variables) {
        THROW_INVALID_PARAM("Agent::Agent", "upper_bound should have size equal to n_variables (" +
            std::to_string(n_variables) + "), got " + std::to_string(ub_.size()));
    }
    if ((lb_.array() > ub_.array()).any()) {
        THROW_INVALID_PARAM("Agent::Agent", "lower_bound should be <= upper_bound for every variable");
    }
    position_ = Eigen::MatrixXd::Zero(n_variables, n_dimensions);
}

void Agent::setPosition(const Eigen::MatrixXd& position) {
    if (position.rows() != position_.rows() || position.cols() != position_.cols()) {
        THROW_INVALID_PARAM("Agent::setPosition", "position should have shape " +
            std::to_string(position_.rows()) + "x" + std::to_string(position_.cols()) + ", got " +
            std::to_string(position.rows()) + "x" + std::to_string(position.cols()));
    }
    position_ = position;
}

void Agent::clipByBound() {
    for (int j = 0; j < position_.rows(); ++j) {
        position_.row(j) = position_.row(j).cwiseMax(lb_(j)).cwiseMin(ub_(j));
    }
}

void Agent::fillWithUniform(RandomGenerator& rng) {
    for (int j = 0; j < position_.rows(); ++j) {
        for (int k = 0; k < position_.cols(); ++k) {
            position_(j, k) = rng.uniform(lb_(j), ub_(j));
        }
    }
}

void Agent::fillWithStatic(const Eigen::VectorXd& values) {
    if (values.size() != position_.rows()) {
        THROW_INVALID_PARAM("Agent::fillWithStatic", "values should have size equal to n_variables (" +
            std::to_string(position_.rows()) + "), got " + std::to_string(values.size()));
    }
    for (int j = 0; j < position_.rows(); ++j) {
        position_.row(j).setConstant(values(j));
    }
}

} // namespace metaopt
