#ifndef FA_HPP
#define FA_HPP

#include "core/Optimizer.hpp"

namespace metaopt {

/**
 * @brief Hyperparameters of the Firefly Algorithm.
 */
struct FAParams {
    double alpha = 0.5;  ///< Initial randomization factor, >= 0.
    double beta = 0.2;   ///< Attraction at distance zero, >= 0.
    double gamma = 1.0;  ///< Light absorption coefficient, >= 0.
};

/**
 * @class FA
 * @brief Firefly Algorithm: every firefly moves toward all brighter ones.
 *
 * Reference: X.-S. Yang. Firefly algorithms for multimodal optimization.
 * International Symposium on Stochastic Algorithms (2009).
 */
class FA : public Optimizer {
public:
    FA();

    /** @throws InvalidParameterException if a parameter is negative. */
    explicit FA(const FAParams& params);

    /** @throws InvalidParameterException if a parameter is negative. */
    void build(const FAParams& params);

    const FAParams& getParams() const { return params_; }

    /** @brief Resets the working randomization factor to params.alpha. */
    void compile(const Space& space, RandomGenerator& rng) override;

    void update(Space& space, const Function& function, const IterationContext& context) override;

    /** @brief Randomization factor after the decays applied so far. */
    double getCurrentAlpha() const { return current_alpha_; }

private:
    FAParams params_;
    double current_alpha_ = 0.0;
};

} // namespace metaopt

#endif // FA_HPP
