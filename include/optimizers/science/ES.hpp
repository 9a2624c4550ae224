#ifndef ES_HPP
#define ES_HPP

#include "core/Optimizer.hpp"

namespace metaopt {

/**
 * @brief Hyperparameters of Electro-Search.
 */
struct ESParams {
    int n_electrons = 5;  ///< Electrons generated around each nucleus, > 0.
};

/**
 * @class ES
 * @brief Electro-Search: atoms explore with orbiting electrons, then relocate their nucleus.
 *
 * Each agent is an atom. Its electrons are sampled on an orbit whose radius
 * shrinks with a random quantum level n in {2, ..., 5}; the best electron
 * replaces the nucleus when it is better. The nucleus is then pulled toward
 * the best agent and its best electron, keeping the move only if it improves.
 *
 * Reference: A. Tabari, A. Ahmad. A new optimization method: Electro-Search
 * algorithm. Computers & Chemical Engineering (2017).
 */
class ES : public Optimizer {
public:
    ES();

    /** @throws InvalidParameterException if n_electrons is not positive. */
    explicit ES(const ESParams& params);

    /** @throws InvalidParameterException if n_electrons is not positive. */
    void build(const ESParams& params);

    const ESParams& getParams() const { return params_; }

    void update(Space& space, const Function& function, const IterationContext& context) override;

private:
    ESParams params_;
};

} // namespace metaopt

#endif // ES_HPP
