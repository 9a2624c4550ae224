#include "gtest/gtest.h"
#include "optimizers/OptimizerFactory.hpp"
#include "optimizers/evolutionary/EP.hpp"
#include "optimizers/swarm/PSO.hpp"
#include "optimizers/swarm/FA.hpp"
#include "optimizers/science/ES.hpp"
#include "exceptions/Exceptions.hpp"
#include <map>
#include <memory>
#include <string>

using namespace metaopt;

TEST(OptimizerFactoryTest, AvailableAlgorithms) {
    EXPECT_EQ(OptimizerFactory::availableAlgorithms(),
              (std::vector<std::string>{"EP", "ES", "FA", "PSO"}));
}

TEST(OptimizerFactoryTest, CreatesEveryAlgorithmWithDefaults) {
    for (const auto& name : OptimizerFactory::availableAlgorithms()) {
        std::unique_ptr<Optimizer> optimizer = OptimizerFactory::create(name);
        ASSERT_NE(optimizer, nullptr);
        EXPECT_EQ(optimizer->getAlgorithm(), name);
        EXPECT_TRUE(optimizer->isBuilt());
        EXPECT_FALSE(optimizer->usesParallel());
    }
}

TEST(OptimizerFactoryTest, ParsesSettings) {
    auto ep = OptimizerFactory::create("EP", {{"bout_size", "0.3"}, {"clip_ratio", "0.1"}});
    auto* as_ep = dynamic_cast<EP*>(ep.get());
    ASSERT_NE(as_ep, nullptr);
    EXPECT_DOUBLE_EQ(as_ep->getParams().bout_size, 0.3);
    EXPECT_DOUBLE_EQ(as_ep->getParams().clip_ratio, 0.1);

    auto pso = OptimizerFactory::create("PSO", {{"w", "0.5"}, {"c1", "2"}, {"c2", "1e0"}, {"use_parallel", "true"}});
    auto* as_pso = dynamic_cast<PSO*>(pso.get());
    ASSERT_NE(as_pso, nullptr);
    EXPECT_DOUBLE_EQ(as_pso->getParams().w, 0.5);
    EXPECT_DOUBLE_EQ(as_pso->getParams().c1, 2.0);
    EXPECT_DOUBLE_EQ(as_pso->getParams().c2, 1.0);
    EXPECT_TRUE(pso->usesParallel());

    auto fa = OptimizerFactory::create("FA", {{"alpha", "0.25"}, {"gamma", "2"}});
    EXPECT_DOUBLE_EQ(dynamic_cast<FA*>(fa.get())->getParams().alpha, 0.25);
    EXPECT_DOUBLE_EQ(dynamic_cast<FA*>(fa.get())->getParams().gamma, 2.0);

    auto es = OptimizerFactory::create("ES", {{"n_electrons", "9"}});
    EXPECT_EQ(dynamic_cast<ES*>(es.get())->getParams().n_electrons, 9);
}

TEST(OptimizerFactoryTest, WrongTypeRaisesParameterTypeException) {
    EXPECT_THROW(OptimizerFactory::create("EP", {{"bout_size", "x"}}), ParameterTypeException);
    EXPECT_THROW(OptimizerFactory::create("PSO", {{"w", "0.7abc"}}), ParameterTypeException);
    EXPECT_THROW(OptimizerFactory::create("ES", {{"n_electrons", "2.5"}}), ParameterTypeException);
    EXPECT_THROW(OptimizerFactory::create("FA", {{"use_parallel", "maybe"}}), ParameterTypeException);
}

TEST(OptimizerFactoryTest, OutOfRangeRaisesInvalidParameterException) {
    EXPECT_THROW(OptimizerFactory::create("EP", {{"bout_size", "1.5"}}), InvalidParameterException);
    EXPECT_THROW(OptimizerFactory::create("ES", {{"n_electrons", "0"}}), InvalidParameterException);
}

TEST(OptimizerFactoryTest, UnknownNamesRaiseInvalidParameterException) {
    EXPECT_THROW(OptimizerFactory::create("GA"), InvalidParameterException);
    EXPECT_THROW(OptimizerFactory::create("EP", {{"w", "0.7"}}), InvalidParameterException);
}
