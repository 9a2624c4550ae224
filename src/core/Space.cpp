#include "core/Space.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <string>
#include <utility>

namespace metaopt {

namespace {

Eigen::VectorXd toVector(const std::vector<double>& values) {
    return Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

// Runs before best_agent_ is constructed so that count errors are reported
// with the space's own message instead of the agent's.
int checkedVariables(int n_agents, int n_variables, int n_dimensions,
                     const std::vector<double>& lower_bound,
                     const std::vector<double>& upper_bound) {
    if (n_agents <= 0) {
        THROW_INVALID_PARAM("Space::Space", "n_agents should be > 0, got " + std::to_string(n_agents));
    }
    if (n_variables <= 0) {
        THROW_INVALID_PARAM("Space::Space", "n_variables should be > 0, got " + std::to_string(n_variables));
    }
    if (n_dimensions <= 0) {
        THROW_INVALID_PARAM("Space::Space", "n_dimensions should be > 0, got " + std::to_string(n_dimensions));
    }
    if (static_cast<int>(lower_bound.size()) != n_variables) {
        THROW_INVALID_PARAM("Space::Space", "lower_bound should have size equal to n_variables (" +
            std::to_string(n_variables) + "), got " + std::to_string(lower_bound.size()));
    }
    if (static_cast<int>(upper_bound.size()) != n_variables) {
        THROW_INVALID_PARAM("Space::Space", "upper_bound should have size equal to n_variables (" +
            std::to_string(n_variables) + "), got " + std::to_string(upper_bound.size()));
    }
    for (int j = 0; j < n_variables; ++j) {
        if (lower_bound[j] > upper_bound[j]) {
            THROW_INVALID_PARAM("Space::Space", "lower_bound[" + std::to_string(j) +
                "] should be <= upper_bound[" + std::to_string(j) + "]");
        }
    }
    return n_variables;
}

} // namespace

Space::Space(int n_agents, int n_variables,
             const std::vector<double>& lower_bound,
             const std::vector<double>& upper_bound,
             int n_dimensions)
    : n_agents_(n_agents),
      n_variables_(checkedVariables(n_agents, n_variables, n_dimensions, lower_bound, upper_bound)),
      n_dimensions_(n_dimensions),
      lb_(toVector(lower_bound)),
      ub_(toVector(upper_bound)),
      best_agent_(n_variables, n_dimensions, lb_, ub_) {}

void Space::build(RandomGenerator& rng) {
    agents_.clear();
    agents_.reserve(n_agents_);
    for (int i = 0; i < n_agents_; ++i) {
        agents_.emplace_back(n_variables_, n_dimensions_, lb_, ub_);
    }
    best_agent_ = Agent(n_variables_, n_dimensions_, lb_, ub_);

    initializeAgents(rng);
    built_ = true;

    Logger::getInstance().debug("Space::build",
        "Agents: " + std::to_string(n_agents_) +
        " | Size: (" + std::to_string(n_variables_) + ", " + std::to_string(n_dimensions_) + ")" +
        " | Built: true");
}

void Space::setAgents(std::vector<Agent> agents) {
    if (static_cast<int>(agents.size()) != n_agents_) {
        THROW_INVALID_PARAM("Space::setAgents", "population size should be equal to n_agents (" +
            std::to_string(n_agents_) + "), got " + std::to_string(agents.size()));
    }
    for (const auto& agent : agents) {
        if (agent.getNumVariables() != n_variables_ || agent.getNumDimensions() != n_dimensions_) {
            THROW_INVALID_PARAM("Space::setAgents", "agent shape should be " +
                std::to_string(n_variables_) + "x" + std::to_string(n_dimensions_));
        }
        if (agent.getLowerBound() != lb_ || agent.getUpperBound() != ub_) {
            THROW_INVALID_PARAM("Space::setAgents", "agent bounds should match the space bounds");
        }
    }
    agents_ = std::move(agents);
}

void Space::clipByBound() {
    for (auto& agent : agents_) {
        agent.clipByBound();
    }
}

} // namespace metaopt
