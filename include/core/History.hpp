#ifndef HISTORY_HPP
#define HISTORY_HPP

#include "core/Agent.hpp"
#include <Eigen/Dense>
#include <vector>

namespace metaopt {

/**
 * @brief Position and fitness of one agent at the moment it was recorded.
 */
struct AgentRecord {
    Eigen::MatrixXd position;
    double fit = Agent::worstFitness();
};

/**
 * @brief Summary of the population fitness values of one iteration.
 */
struct FitnessStatistics {
    double mean = 0.0;
    double variance = 0.0;
    double min = 0.0;
    double max = 0.0;
};

/**
 * @brief Everything recorded for one iteration of the run.
 */
struct IterationSnapshot {
    int iteration = 0;                ///< 1-based iteration index (cumulative across start() calls).
    AgentRecord best_agent;           ///< Best agent found so far.
    std::vector<AgentRecord> agents;  ///< Whole population, empty when only the best agent is stored.
    FitnessStatistics statistics;     ///< Population fitness statistics.
};

/**
 * @class History
 * @brief Append-only audit trail of a run, used for convergence analysis and checkpoints.
 *
 * Each call to dump() appends one snapshot; snapshots are never modified
 * afterwards.
 */
class History {
public:
    /**
     * @param store_only_best If true, snapshots keep the best agent only, not the population.
     */
    explicit History(bool store_only_best = false);

    /**
     * @brief Appends a snapshot of the population and the best agent.
     * @param iteration  Iteration index recorded with the snapshot.
     * @param agents     Current population.
     * @param best_agent Current best agent.
     */
    void dump(int iteration, const std::vector<Agent>& agents, const Agent& best_agent);

    bool storesOnlyBest() const { return store_only_best_; }
    size_t size() const { return snapshots_.size(); }
    bool empty() const { return snapshots_.empty(); }

    /**
     * @brief Snapshot at position `index`.
     * @throws OutOfRangeException if index >= size().
     */
    const IterationSnapshot& at(size_t index) const;

    const std::vector<IterationSnapshot>& getSnapshots() const { return snapshots_; }

    /** @brief Best fitness of every snapshot, in recording order. */
    std::vector<double> getBestFitnessCurve() const;

    /** @brief Best position of every snapshot, in recording order. */
    std::vector<Eigen::MatrixXd> getBestPositionCurve() const;

    /**
     * @brief Fitness of agent `agent_index` in every snapshot.
     * @throws OutOfRangeException if populations are not stored or the index is invalid.
     */
    std::vector<double> getAgentFitnessCurve(size_t agent_index) const;

private:
    bool store_only_best_;
    std::vector<IterationSnapshot> snapshots_;
};

} // namespace metaopt

#endif // HISTORY_HPP
