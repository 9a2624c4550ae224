#include "gtest/gtest.h"
#include "core/History.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <vector>

using namespace metaopt;

class HistoryTest : public ::testing::Test {
protected:
    Eigen::VectorXd lb = Eigen::VectorXd::Constant(2, -5.0);
    Eigen::VectorXd ub = Eigen::VectorXd::Constant(2, 5.0);
    std::vector<Agent> agents;
    Agent best{2, 1, lb, ub};

    void SetUp() override {
        const double fits[] = {4.0, 2.0, 6.0};
        for (double fit : fits) {
            Agent agent(2, 1, lb, ub);
            agent.position().setConstant(fit / 2.0);
            agent.setFitness(fit);
            agents.push_back(agent);
        }
        best = agents[1];
    }
};

TEST_F(HistoryTest, DumpRecordsPopulationAndStatistics) {
    History history;
    history.dump(1, agents, best);

    ASSERT_EQ(history.size(), 1u);
    const IterationSnapshot& snapshot = history.at(0);
    EXPECT_EQ(snapshot.iteration, 1);
    EXPECT_DOUBLE_EQ(snapshot.best_agent.fit, 2.0);
    EXPECT_TRUE(snapshot.best_agent.position.isApprox(best.getPosition()));
    ASSERT_EQ(snapshot.agents.size(), 3u);
    EXPECT_DOUBLE_EQ(snapshot.agents[2].fit, 6.0);

    EXPECT_DOUBLE_EQ(snapshot.statistics.mean, 4.0);
    EXPECT_NEAR(snapshot.statistics.variance, 8.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(snapshot.statistics.min, 2.0);
    EXPECT_DOUBLE_EQ(snapshot.statistics.max, 6.0);
}

TEST_F(HistoryTest, SnapshotsAreIndependentOfLaterChanges) {
    History history;
    history.dump(1, agents, best);
    agents[0].position().setConstant(100.0);
    best.setFitness(-1.0);
    EXPECT_DOUBLE_EQ(history.at(0).agents[0].position(0, 0), 2.0);
    EXPECT_DOUBLE_EQ(history.at(0).best_agent.fit, 2.0);
}

TEST_F(HistoryTest, StoreOnlyBestSkipsPopulation) {
    History history(true);
    EXPECT_TRUE(history.storesOnlyBest());
    history.dump(1, agents, best);
    EXPECT_TRUE(history.at(0).agents.empty());
    EXPECT_DOUBLE_EQ(history.at(0).statistics.max, 6.0);
    EXPECT_THROW(history.getAgentFitnessCurve(0), OutOfRangeException);
}

TEST_F(HistoryTest, Curves) {
    History history;
    history.dump(1, agents, best);
    best.setFitness(1.0);
    agents[0].setFitness(3.0);
    history.dump(2, agents, best);

    EXPECT_EQ(history.getBestFitnessCurve(), (std::vector<double>{2.0, 1.0}));
    EXPECT_EQ(history.getAgentFitnessCurve(0), (std::vector<double>{4.0, 3.0}));
    EXPECT_EQ(history.getBestPositionCurve().size(), 2u);
    EXPECT_THROW(history.getAgentFitnessCurve(3), OutOfRangeException);
}

TEST_F(HistoryTest, AtOutOfRange) {
    History history;
    EXPECT_TRUE(history.empty());
    EXPECT_THROW(history.at(0), OutOfRangeException);
}
