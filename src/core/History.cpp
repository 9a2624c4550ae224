#include "core/History.hpp"
#include "exceptions/Exceptions.hpp"

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>

#include <string>

namespace metaopt {

namespace acc = boost::accumulators;

namespace {

FitnessStatistics summarize(const std::vector<Agent>& agents) {
    acc::accumulator_set<double, acc::stats<acc::tag::mean, acc::tag::variance, acc::tag::min, acc::tag::max>> fits;
    for (const auto& agent : agents) {
        fits(agent.getFitness());
    }

    FitnessStatistics stats;
    if (!agents.empty()) {
        stats.mean = acc::mean(fits);
        stats.variance = acc::variance(fits);
        stats.min = acc::min(fits);
        stats.max = acc::max(fits);
    }
    return stats;
}

} // namespace

History::History(bool store_only_best)
    : store_only_best_(store_only_best) {}

void History::dump(int iteration, const std::vector<Agent>& agents, const Agent& best_agent) {
    IterationSnapshot snapshot;
    snapshot.iteration = iteration;
    snapshot.best_agent = AgentRecord{best_agent.getPosition(), best_agent.getFitness()};
    snapshot.statistics = summarize(agents);

    if (!store_only_best_) {
        snapshot.agents.reserve(agents.size());
        for (const auto& agent : agents) {
            snapshot.agents.push_back(AgentRecord{agent.getPosition(), agent.getFitness()});
        }
    }
    snapshots_.push_back(std::move(snapshot));
}

const IterationSnapshot& History::at(size_t index) const {
    if (index >= snapshots_.size()) {
        THROW_OUT_OF_RANGE("History::at", "index " + std::to_string(index) +
            " out of range for history of size " + std::to_string(snapshots_.size()));
    }
    return snapshots_[index];
}

std::vector<double> History::getBestFitnessCurve() const {
    std::vector<double> curve;
    curve.reserve(snapshots_.size());
    for (const auto& snapshot : snapshots_) {
        curve.push_back(snapshot.best_agent.fit);
    }
    return curve;
}

std::vector<Eigen::MatrixXd> History::getBestPositionCurve() const {
    std::vector<Eigen::MatrixXd> curve;
    curve.reserve(snapshots_.size());
    for (const auto& snapshot : snapshots_) {
        curve.push_back(snapshot.best_agent.position);
    }
    return curve;
}

std::vector<double> History::getAgentFitnessCurve(size_t agent_index) const {
    if (store_only_best_) {
        THROW_OUT_OF_RANGE("History::getAgentFitnessCurve", "population is not stored (store_only_best is set)");
    }
    std::vector<double> curve;
    curve.reserve(snapshots_.size());
    for (const auto& snapshot : snapshots_) {
        if (agent_index >= snapshot.agents.size()) {
            THROW_OUT_OF_RANGE("History::getAgentFitnessCurve", "agent index " + std::to_string(agent_index) +
                " out of range for population of size " + std::to_string(snapshot.agents.size()));
        }
        curve.push_back(snapshot.agents[agent_index].fit);
    }
    return curve;
}

} // namespace metaopt
