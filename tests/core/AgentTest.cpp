#include "gtest/gtest.h"
#include "core/Agent.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>

using namespace metaopt;
using namespace Eigen;

class AgentTest : public ::testing::Test {
protected:
    VectorXd lb;
    VectorXd ub;

    void SetUp() override {
        lb.resize(2); lb << -1.0, 0.0;
        ub.resize(2); ub << 1.0, 10.0;
    }
};

TEST_F(AgentTest, ConstructionDefaults) {
    Agent agent(2, 3, lb, ub);
    EXPECT_EQ(agent.getNumVariables(), 2);
    EXPECT_EQ(agent.getNumDimensions(), 3);
    EXPECT_TRUE(agent.getPosition().isZero());
    EXPECT_EQ(agent.getFitness(), Agent::worstFitness());
    EXPECT_EQ(agent.getTimestamp(), 0);
}

TEST_F(AgentTest, ConstructionFailures) {
    EXPECT_THROW(Agent(0, 1, lb, ub), InvalidParameterException);
    EXPECT_THROW(Agent(2, 0, lb, ub), InvalidParameterException);
    EXPECT_THROW(Agent(3, 1, lb, ub), InvalidParameterException);

    VectorXd bad_ub(2); bad_ub << -2.0, 10.0;
    EXPECT_THROW(Agent(2, 1, lb, bad_ub), InvalidParameterException);
}

TEST_F(AgentTest, ClipByBoundPullsToNearestBound) {
    Agent agent(2, 2, lb, ub);
    MatrixXd position(2, 2);
    position << -5.0, 0.5,
                11.0, 3.0;
    agent.setPosition(position);
    agent.clipByBound();

    MatrixXd expected(2, 2);
    expected << -1.0, 0.5,
                10.0, 3.0;
    EXPECT_TRUE(agent.getPosition().isApprox(expected));

    agent.clipByBound();
    EXPECT_TRUE(agent.getPosition().isApprox(expected));
}

TEST_F(AgentTest, SetPositionRejectsWrongShape) {
    Agent agent(2, 1, lb, ub);
    EXPECT_THROW(agent.setPosition(MatrixXd::Zero(3, 1)), InvalidParameterException);
    EXPECT_THROW(agent.setPosition(MatrixXd::Zero(2, 2)), InvalidParameterException);
}

TEST_F(AgentTest, FillWithUniformRespectsRowBounds) {
    RandomGenerator rng(5);
    Agent agent(2, 50, lb, ub);
    agent.fillWithUniform(rng);
    EXPECT_TRUE((agent.getPosition().row(0).array() >= -1.0).all());
    EXPECT_TRUE((agent.getPosition().row(0).array() <= 1.0).all());
    EXPECT_TRUE((agent.getPosition().row(1).array() >= 0.0).all());
    EXPECT_TRUE((agent.getPosition().row(1).array() <= 10.0).all());
    EXPECT_FALSE(agent.getPosition().isZero());
}

TEST_F(AgentTest, FillWithStatic) {
    Agent agent(2, 3, lb, ub);
    VectorXd values(2); values << 0.25, 7.0;
    agent.fillWithStatic(values);
    EXPECT_TRUE((agent.getPosition().row(0).array() == 0.25).all());
    EXPECT_TRUE((agent.getPosition().row(1).array() == 7.0).all());

    EXPECT_THROW(agent.fillWithStatic(VectorXd::Zero(3)), InvalidParameterException);
}

TEST_F(AgentTest, CopiesAreIndependent) {
    Agent agent(2, 1, lb, ub);
    agent.setFitness(3.0);
    Agent copy = agent;
    agent.position()(0, 0) = 0.5;
    agent.setFitness(1.0);
    EXPECT_DOUBLE_EQ(copy.getPosition()(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(copy.getFitness(), 3.0);
}
