#include "callbacks/PeriodicCallback.hpp"
#include "exceptions/Exceptions.hpp"

namespace metaopt {

PeriodicCallback::PeriodicCallback(int frequency) : frequency_(frequency) {
    if (frequency_ <= 0) {
        THROW_INVALID_PARAM("PeriodicCallback::PeriodicCallback", "frequency should be > 0");
    }
}

void PeriodicCallback::onIterationEnd(int iteration, const Space& space, const History& history) {
    if (iteration % frequency_ == 0) {
        onPeriod(iteration, space, history);
    }
}

} // namespace metaopt
