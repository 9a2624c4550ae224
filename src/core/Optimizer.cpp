#include "core/Optimizer.hpp"
#include "core/Space.hpp"
#include "core/Function.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <ctime>
#include <exception>
#include <utility>
#include <omp.h>

namespace metaopt {

Optimizer::Optimizer(std::string algorithm)
    : algorithm_(std::move(algorithm)),
      logger_source_id_(algorithm_) {}

void Optimizer::compile(const Space& /*space*/, RandomGenerator& /*rng*/) {}

void Optimizer::setUseParallel(bool use_parallel) {
    use_parallel_ = use_parallel;
    if (use_parallel_) {
        Logger::getInstance().info(logger_source_id_,
            "Parallel evaluation enabled with " + std::to_string(omp_get_max_threads()) + " threads");
    }
}

std::vector<double> Optimizer::computeFitness(const std::vector<Agent>& agents, const Function& function) const {
    const int n_agents = static_cast<int>(agents.size());
    std::vector<double> fits(agents.size(), Agent::worstFitness());
    std::exception_ptr first_error = nullptr;

    #pragma omp parallel for if(use_parallel_)
    for (int i = 0; i < n_agents; ++i) {
        try {
            fits[i] = function(agents[i].getPosition());
        } catch (...) {
            #pragma omp critical(metaopt_evaluate_error)
            {
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return fits;
}

bool Optimizer::updateBestAgent(Space& space, const Eigen::MatrixXd& position, double fit) {
    Agent& best = space.bestAgent();
    if (fit < best.getFitness()) {
        best.setPosition(position);
        best.setFitness(fit);
        best.setTimestamp(static_cast<std::int64_t>(std::time(nullptr)));
        return true;
    }
    return false;
}

void Optimizer::evaluate(Space& space, const Function& function) {
    std::vector<Agent>& agents = space.agents();
    const std::vector<double> fits = computeFitness(agents, function);

    for (size_t i = 0; i < agents.size(); ++i) {
        agents[i].setFitness(fits[i]);
        updateBestAgent(space, agents[i].getPosition(), fits[i]);
    }
}

void Optimizer::markBuilt(const std::string& summary) {
    built_ = true;
    Logger& logger = Logger::getInstance();
    logger.info(logger_source_id_, algorithm_ + " built.");
    logger.debug(logger_source_id_, summary);
}

void Optimizer::requireBuilt(const std::string& function_name) const {
    if (!built_) {
        THROW_INVALID_PARAM(function_name, algorithm_ + " has not been built");
    }
}

} // namespace metaopt
