#include "math/RandomGenerator.hpp"
#include "exceptions/Exceptions.hpp"
#include <string>

namespace metaopt {

RandomGenerator::RandomGenerator()
    : engine_{std::random_device{}()} {}

RandomGenerator::RandomGenerator(unsigned int seed)
    : engine_{seed} {}

void RandomGenerator::seed(unsigned int seed) {
    engine_.seed(seed);
    uniform_dist_.reset();
    normal_dist_.reset();
}

double RandomGenerator::uniform() {
    return uniform_dist_(engine_);
}

double RandomGenerator::uniform(double low, double high) {
    if (high < low) {
        THROW_INVALID_PARAM("RandomGenerator::uniform",
            "high (" + std::to_string(high) + ") should not be smaller than low (" + std::to_string(low) + ")");
    }
    return low + (high - low) * uniform_dist_(engine_);
}

Eigen::MatrixXd RandomGenerator::uniformMatrix(int rows, int cols, double low, double high) {
    Eigen::MatrixXd m(rows, cols);
    for (int i = 0; i < rows; ++i) {
        for (int j = 0; j < cols; ++j) {
            m(i, j) = uniform(low, high);
        }
    }
    return m;
}

double RandomGenerator::gaussian(double mean, double stddev) {
    return mean + stddev * normal_dist_(engine_);
}

Eigen::MatrixXd RandomGenerator::gaussianMatrix(int rows, int cols) {
    Eigen::MatrixXd m(rows, cols);
    for (int i = 0; i < rows; ++i) {
        for (int j = 0; j < cols; ++j) {
            m(i, j) = normal_dist_(engine_);
        }
    }
    return m;
}

int RandomGenerator::integer(int low, int high) {
    if (high <= low) {
        THROW_INVALID_PARAM("RandomGenerator::integer",
            "high (" + std::to_string(high) + ") should be greater than low (" + std::to_string(low) + ")");
    }
    std::uniform_int_distribution<int> dist(low, high - 1);
    return dist(engine_);
}

} // namespace metaopt
