#ifndef CALLBACK_HPP
#define CALLBACK_HPP

#include <memory>
#include <vector>

namespace metaopt {

class Space;
class History;

/**
 * @class Callback
 * @brief Observer of an optimization run. Every hook is a no-op by default.
 *
 * Iteration indices are 1-based and keep counting when a run is resumed
 * with another call to OptimizationRunner::start().
 */
class Callback {
public:
    virtual ~Callback() = default;

    virtual void onTaskBegin(const Space& /*space*/) {}
    virtual void onTaskEnd(const Space& /*space*/, const History& /*history*/) {}

    virtual void onIterationBegin(int /*iteration*/, const Space& /*space*/) {}
    virtual void onIterationEnd(int /*iteration*/, const Space& /*space*/, const History& /*history*/) {}

    virtual void onUpdateBefore(int /*iteration*/, const Space& /*space*/) {}
    virtual void onUpdateAfter(int /*iteration*/, const Space& /*space*/) {}

    virtual void onEvaluateBefore(int /*iteration*/, const Space& /*space*/) {}
    virtual void onEvaluateAfter(int /*iteration*/, const Space& /*space*/) {}
};

/**
 * @class CallbackVessel
 * @brief Ordered set of callbacks; each hook is forwarded in registration order.
 */
class CallbackVessel {
public:
    /**
     * @param callbacks Callbacks to invoke. An empty list is valid.
     * @throws InvalidParameterException if an entry is null.
     */
    explicit CallbackVessel(std::vector<std::shared_ptr<Callback>> callbacks = {});

    size_t size() const { return callbacks_.size(); }

    void onTaskBegin(const Space& space);
    void onTaskEnd(const Space& space, const History& history);
    void onIterationBegin(int iteration, const Space& space);
    void onIterationEnd(int iteration, const Space& space, const History& history);
    void onUpdateBefore(int iteration, const Space& space);
    void onUpdateAfter(int iteration, const Space& space);
    void onEvaluateBefore(int iteration, const Space& space);
    void onEvaluateAfter(int iteration, const Space& space);

private:
    std::vector<std::shared_ptr<Callback>> callbacks_;
};

} // namespace metaopt

#endif // CALLBACK_HPP
