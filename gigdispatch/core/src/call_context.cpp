#include <gigdispatch/core/call_context.hpp>

#include <gigdispatch/core/clock.hpp>
#include <gigdispatch/core/error.hpp>

#include <string>

namespace gigdispatch::core {

bool CallContext::cancelled(const Clock& clock) const {
    if (stop.stop_requested()) {
        return true;
    }
    return deadline.has_value() && clock.now() > *deadline;
}

void CallContext::check(const Clock& clock, const char* where) const {
    if (stop.stop_requested()) {
        throw CancelledError(std::string("cancelled during ") + where);
    }
    if (deadline && clock.now() > *deadline) {
        throw CancelledError(std::string("deadline exceeded during ") + where);
    }
}

} // namespace gigdispatch::core
