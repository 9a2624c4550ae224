#include "gtest/gtest.h"
#include "math/RandomGenerator.hpp"
#include "exceptions/Exceptions.hpp"

using namespace metaopt;

TEST(RandomGeneratorTest, SameSeedSameSequence) {
    RandomGenerator a(42);
    RandomGenerator b(42);
    for (int i = 0; i < 10; ++i) {
        EXPECT_DOUBLE_EQ(a.uniform(), b.uniform());
        EXPECT_DOUBLE_EQ(a.gaussian(), b.gaussian());
        EXPECT_EQ(a.integer(0, 100), b.integer(0, 100));
    }
}

TEST(RandomGeneratorTest, ReseedRestartsSequence) {
    RandomGenerator rng(7);
    const double first = rng.uniform();
    const double first_gauss = rng.gaussian();
    rng.seed(7);
    EXPECT_DOUBLE_EQ(rng.uniform(), first);
    EXPECT_DOUBLE_EQ(rng.gaussian(), first_gauss);
}

TEST(RandomGeneratorTest, UniformStaysInRange) {
    RandomGenerator rng(1);
    for (int i = 0; i < 1000; ++i) {
        const double value = rng.uniform(-2.0, 3.0);
        EXPECT_GE(value, -2.0);
        EXPECT_LT(value, 3.0);
    }
    Eigen::MatrixXd m = rng.uniformMatrix(4, 3, 5.0, 6.0);
    EXPECT_EQ(m.rows(), 4);
    EXPECT_EQ(m.cols(), 3);
    EXPECT_TRUE((m.array() >= 5.0).all());
    EXPECT_TRUE((m.array() < 6.0).all());
}

TEST(RandomGeneratorTest, IntegerIsHalfOpen) {
    RandomGenerator rng(3);
    bool saw_low = false;
    for (int i = 0; i < 500; ++i) {
        const int value = rng.integer(2, 5);
        EXPECT_GE(value, 2);
        EXPECT_LT(value, 5);
        saw_low = saw_low || value == 2;
    }
    EXPECT_TRUE(saw_low);
}

TEST(RandomGeneratorTest, InvalidRangesThrow) {
    RandomGenerator rng(3);
    EXPECT_THROW(rng.uniform(1.0, 0.0), InvalidParameterException);
    EXPECT_THROW(rng.integer(5, 5), InvalidParameterException);
}

TEST(RandomGeneratorTest, GaussianMatrixHasRoughlyStandardMoments) {
    RandomGenerator rng(11);
    Eigen::MatrixXd m = rng.gaussianMatrix(200, 50);
    EXPECT_NEAR(m.mean(), 0.0, 0.05);
    const double variance = (m.array() - m.mean()).square().mean();
    EXPECT_NEAR(variance, 1.0, 0.05);
}
