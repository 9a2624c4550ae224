#ifndef PERIODIC_CALLBACK_HPP
#define PERIODIC_CALLBACK_HPP

#include "callbacks/Callback.hpp"

namespace metaopt {

/**
 * @class PeriodicCallback
 * @brief Calls onPeriod() at the end of every iteration divisible by the frequency.
 *
 * Over a run of n iterations it fires floor(n / frequency) times.
 */
class PeriodicCallback : public Callback {
public:
    /**
     * @param frequency Number of iterations between two calls.
     * @throws InvalidParameterException if frequency <= 0.
     */
    explicit PeriodicCallback(int frequency);

    int getFrequency() const { return frequency_; }

    void onIterationEnd(int iteration, const Space& space, const History& history) override;

protected:
    virtual void onPeriod(int iteration, const Space& space, const History& history) = 0;

private:
    int frequency_;
};

} // namespace metaopt

#endif // PERIODIC_CALLBACK_HPP
