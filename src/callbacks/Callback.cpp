#include "callbacks/Callback.hpp"
#include "exceptions/Exceptions.hpp"

#include <string>
#include <utility>

namespace metaopt {

CallbackVessel::CallbackVessel(std::vector<std::shared_ptr<Callback>> callbacks)
    : callbacks_(std::move(callbacks)) {
    for (size_t i = 0; i < callbacks_.size(); ++i) {
        if (!callbacks_[i]) {
            THROW_INVALID_PARAM("CallbackVessel::CallbackVessel", "callback at position " + std::to_string(i) + " is null");
        }
    }
}

void CallbackVessel::onTaskBegin(const Space& space) {
    for (auto& callback : callbacks_) callback->onTaskBegin(space);
}

void CallbackVessel::onTaskEnd(const Space& space, const History& history) {
    for (auto& callback : callbacks_) callback->onTaskEnd(space, history);
}

void CallbackVessel::onIterationBegin(int iteration, const Space& space) {
    for (auto& callback : callbacks_) callback->onIterationBegin(iteration, space);
}

void CallbackVessel::onIterationEnd(int iteration, const Space& space, const History& history) {
    for (auto& callback : callbacks_) callback->onIterationEnd(iteration, space, history);
}

void CallbackVessel::onUpdateBefore(int iteration, const Space& space) {
    for (auto& callback : callbacks_) callback->onUpdateBefore(iteration, space);
}

void CallbackVessel::onUpdateAfter(int iteration, const Space& space) {
    for (auto& callback : callbacks_) callback->onUpdateAfter(iteration, space);
}

void CallbackVessel::onEvaluateBefore(int iteration, const Space& space) {
    for (auto& callback : callbacks_) callback->onEvaluateBefore(iteration, space);
}

void CallbackVessel::onEvaluateAfter(int iteration, const Space& space) {
    for (auto& callback : callbacks_) callback->onEvaluateAfter(iteration, space);
}

} // namespace metaopt
