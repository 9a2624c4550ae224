#ifndef RANDOM_GENERATOR_HPP
#define RANDOM_GENERATOR_HPP

#include <Eigen/Dense>
#include <random>

namespace metaopt {

/**
 * @class RandomGenerator
 * @brief Explicit random-number state shared by a space, its optimizer and the run loop.
 *
 * Wraps a Mersenne Twister engine together with the uniform and normal
 * distributions used by the optimizers. A single instance is created by the
 * caller and handed down to every component that draws random numbers, so a
 * fixed seed reproduces a whole run.
 */
class RandomGenerator {
public:
    /**
     * @brief Creates a generator seeded from std::random_device.
     */
    RandomGenerator();

    /**
     * @brief Creates a generator with a fixed seed.
     * @param seed Seed for the underlying engine.
     */
    explicit RandomGenerator(unsigned int seed);

    RandomGenerator(const RandomGenerator&) = delete;
    RandomGenerator& operator=(const RandomGenerator&) = delete;

    /**
     * @brief Re-seeds the engine and resets the distributions' cached state.
     * @param seed New seed.
     */
    void seed(unsigned int seed);

    /** @brief Uniform number in [0, 1). */
    double uniform();

    /**
     * @brief Uniform number in [low, high).
     * @throws InvalidParameterException if high < low.
     */
    double uniform(double low, double high);

    /**
     * @brief Matrix of independent uniform numbers in [low, high).
     */
    Eigen::MatrixXd uniformMatrix(int rows, int cols, double low, double high);

    /** @brief Gaussian number with the given mean and standard deviation. */
    double gaussian(double mean = 0.0, double stddev = 1.0);

    /** @brief Matrix of independent standard normal numbers. */
    Eigen::MatrixXd gaussianMatrix(int rows, int cols);

    /**
     * @brief Uniform integer in [low, high).
     * @throws InvalidParameterException if high <= low.
     */
    int integer(int low, int high);

    /** @brief Direct access to the engine, for std algorithms such as std::shuffle. */
    std::mt19937& engine() { return engine_; }

private:
    std::mt19937 engine_;
    std::uniform_real_distribution<> uniform_dist_{0.0, 1.0};
    std::normal_distribution<> normal_dist_{0.0, 1.0};
};

} // namespace metaopt

#endif // RANDOM_GENERATOR_HPP
