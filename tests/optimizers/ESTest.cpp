#include "gtest/gtest.h"
#include "optimizers/science/ES.hpp"
#include "spaces/SearchSpace.hpp"
#include "core/OptimizationRunner.hpp"
#include "exceptions/Exceptions.hpp"
#include <memory>
#include <vector>

using namespace metaopt;

namespace {
double sphere(const Eigen::MatrixXd& x) { return x.squaredNorm(); }
}

class ESTest : public ::testing::Test {
protected:
    RandomGenerator rng{5};
    Function f{sphere};
};

TEST_F(ESTest, DefaultsAndValidation) {
    ES es;
    EXPECT_EQ(es.getAlgorithm(), "ES");
    EXPECT_EQ(es.getParams().n_electrons, 5);
    EXPECT_THROW(ES(ESParams{0}), InvalidParameterException);
    EXPECT_THROW(ES(ESParams{-2}), InvalidParameterException);
}

TEST_F(ESTest, AtomsNeverGetWorse) {
    SearchSpace space(8, 3, std::vector<double>(3, -5.0), std::vector<double>(3, 5.0), rng);
    ES es;
    es.compile(space, rng);
    es.evaluate(space, f);

    std::vector<double> before;
    for (const auto& agent : space.getAgents()) before.push_back(agent.getFitness());

    IterationContext context{1, 1, rng};
    es.update(space, f, context);
    ASSERT_EQ(space.getAgents().size(), 8u);
    for (size_t i = 0; i < before.size(); ++i) {
        const Agent& atom = space.getAgents()[i];
        EXPECT_LE(atom.getFitness(), before[i]);
        EXPECT_DOUBLE_EQ(atom.getFitness(), sphere(atom.getPosition()));
        EXPECT_TRUE((atom.getPosition().array() >= -5.0).all());
        EXPECT_TRUE((atom.getPosition().array() <= 5.0).all());
    }
}

TEST_F(ESTest, MinimizesSphereThroughRunner) {
    auto space = std::make_shared<SearchSpace>(10, 2, std::vector<double>{-10.0, -10.0},
                                               std::vector<double>{10.0, 10.0}, rng);
    OptimizationRunner runner(space, std::make_shared<ES>(), f, rng);
    const History& history = runner.start(50);
    EXPECT_LT(history.getBestFitnessCurve().back(), 1.0);
    EXPECT_LE(history.getBestFitnessCurve().back(), history.getBestFitnessCurve().front());
}
