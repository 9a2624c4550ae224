#include "gtest/gtest.h"
#include "optimizers/swarm/PSO.hpp"
#include "spaces/SearchSpace.hpp"
#include "core/Function.hpp"
#include "exceptions/Exceptions.hpp"
#include <memory>
#include <vector>

using namespace metaopt;

namespace {
double sphere(const Eigen::MatrixXd& x) { return x.squaredNorm(); }
}

class PSOTest : public ::testing::Test {
protected:
    RandomGenerator rng{7};
    std::unique_ptr<SearchSpace> space;
    Function f{sphere};

    void SetUp() override {
        space = std::make_unique<SearchSpace>(6, 3, std::vector<double>(3, -4.0), std::vector<double>(3, 4.0), rng);
    }
};

TEST_F(PSOTest, DefaultsAndValidation) {
    PSO pso;
    EXPECT_EQ(pso.getAlgorithm(), "PSO");
    EXPECT_DOUBLE_EQ(pso.getParams().w, 0.7);
    EXPECT_DOUBLE_EQ(pso.getParams().c1, 1.7);
    EXPECT_DOUBLE_EQ(pso.getParams().c2, 1.7);

    EXPECT_THROW(PSO(PSOParams{-0.1, 1.7, 1.7}), InvalidParameterException);
    EXPECT_THROW(PSO(PSOParams{0.7, -1.0, 1.7}), InvalidParameterException);
    EXPECT_THROW(PSO(PSOParams{0.7, 1.7, -1.0}), InvalidParameterException);
}

TEST_F(PSOTest, CompileCreatesZeroVelocitiesAndLocalPositions) {
    PSO pso;
    pso.compile(*space, rng);
    ASSERT_EQ(pso.getVelocities().size(), 6u);
    ASSERT_EQ(pso.getLocalPositions().size(), 6u);
    for (size_t i = 0; i < 6; ++i) {
        EXPECT_TRUE(pso.getVelocities()[i].isZero());
        EXPECT_TRUE(pso.getLocalPositions()[i].isApprox(space->getAgents()[i].getPosition()));
    }
}

TEST_F(PSOTest, EvaluateKeepsPersonalBest) {
    PSO pso;
    pso.compile(*space, rng);
    pso.evaluate(*space, f);
    const Eigen::MatrixXd local = pso.getLocalPositions()[0];
    const double fit = space->getAgents()[0].getFitness();

    // Worse position: fitness and local position stay.
    space->agents()[0].position().setConstant(4.0);
    pso.evaluate(*space, f);
    EXPECT_DOUBLE_EQ(space->getAgents()[0].getFitness(), fit);
    EXPECT_TRUE(pso.getLocalPositions()[0].isApprox(local));

    // Better position: both follow, and so does the best agent.
    space->agents()[0].position().setZero();
    pso.evaluate(*space, f);
    EXPECT_DOUBLE_EQ(space->getAgents()[0].getFitness(), 0.0);
    EXPECT_TRUE(pso.getLocalPositions()[0].isZero());
    EXPECT_DOUBLE_EQ(space->getBestAgent().getFitness(), 0.0);
    EXPECT_TRUE(space->getBestAgent().getPosition().isZero());
}

TEST_F(PSOTest, ZeroCoefficientsFreezeParticles) {
    PSO pso(PSOParams{0.0, 0.0, 0.0});
    pso.compile(*space, rng);
    pso.evaluate(*space, f);
    const std::vector<Agent> before = space->getAgents();

    IterationContext context{1, 1, rng};
    pso.update(*space, f, context);
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_TRUE(space->getAgents()[i].getPosition().isApprox(before[i].getPosition()));
    }
}

TEST_F(PSOTest, SocialTermPullsTowardBest) {
    PSO pso(PSOParams{0.0, 0.0, 1.0});
    pso.compile(*space, rng);
    pso.evaluate(*space, f);
    const std::vector<Agent> before = space->getAgents();
    const Eigen::MatrixXd best = space->getBestAgent().getPosition();

    IterationContext context{1, 1, rng};
    pso.update(*space, f, context);
    for (size_t i = 0; i < before.size(); ++i) {
        const Eigen::MatrixXd step = space->getAgents()[i].getPosition() - before[i].getPosition();
        const Eigen::MatrixXd to_best = best - before[i].getPosition();
        EXPECT_LE((best - space->getAgents()[i].getPosition()).norm(), to_best.norm() + 1e-12);
        EXPECT_TRUE(pso.getVelocities()[i].isApprox(step) || step.isZero());
    }
}

TEST_F(PSOTest, UpdateWithoutCompileThrows) {
    PSO pso;
    IterationContext context{1, 1, rng};
    EXPECT_THROW(pso.update(*space, f, context), InvalidParameterException);
    EXPECT_THROW(pso.evaluate(*space, f), InvalidParameterException);
}
