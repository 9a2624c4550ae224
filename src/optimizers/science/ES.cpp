#include "optimizers/science/ES.hpp"
#include "core/Space.hpp"
#include "core/Function.hpp"
#include "exceptions/Exceptions.hpp"

#include <algorithm>
#include <string>

namespace metaopt {

ES::ES() : ES(ESParams{}) {}

ES::ES(const ESParams& params) : Optimizer("ES") {
    build(params);
}

void ES::build(const ESParams& params) {
    if (params.n_electrons <= 0) {
        THROW_INVALID_PARAM("ES::build", "n_electrons should be > 0");
    }
    params_ = params;
    markBuilt("Parameters: n_electrons = " + std::to_string(params_.n_electrons));
}

void ES::update(Space& space, const Function& function, const IterationContext& context) {
    requireBuilt("ES::update");

    const int n_variables = space.getNumVariables();
    const int n_dimensions = space.getNumDimensions();
    const Eigen::VectorXd half_range = (space.getUpperBound() - space.getLowerBound()) / 2.0;
    const Eigen::MatrixXd best_position = space.getBestAgent().getPosition();

    for (auto& atom : space.agents()) {
        std::vector<Agent> electrons(params_.n_electrons, atom);
        for (auto& electron : electrons) {
            const int level = context.rng.integer(2, 6);
            const double orbit = 1.0 - 1.0 / (level * level);
            const Eigen::MatrixXd r = context.rng.uniformMatrix(n_variables, n_dimensions, 0.0, 1.0);

            Eigen::MatrixXd step = (2.0 * r.array() - 1.0).matrix() * orbit;
            step = half_range.asDiagonal() * step;
            electron.position() += step;
            electron.clipByBound();
        }

        const std::vector<double> fits = computeFitness(electrons, function);
        const size_t best_index = static_cast<size_t>(
            std::min_element(fits.begin(), fits.end()) - fits.begin());
        const Eigen::MatrixXd best_electron = electrons[best_index].getPosition();

        if (fits[best_index] < atom.getFitness()) {
            atom.setPosition(best_electron);
            atom.setFitness(fits[best_index]);
        }

        // Nucleus relocation.
        const double r1 = context.rng.uniform();
        const double r2 = context.rng.uniform();
        Agent relocated = atom;
        relocated.position() += r1 * (best_position - atom.getPosition())
                              + r2 * (best_electron - atom.getPosition());
        relocated.clipByBound();

        const double relocated_fit = function(relocated.getPosition());
        if (relocated_fit < atom.getFitness()) {
            atom.setPosition(relocated.getPosition());
            atom.setFitness(relocated_fit);
        }
    }
}

} // namespace metaopt
