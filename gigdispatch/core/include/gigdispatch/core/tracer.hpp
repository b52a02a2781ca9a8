#pragma once

#include <gigdispatch/core/clock.hpp>
#include <gigdispatch/core/trace_writer.hpp>

#include <mutex>
#include <string_view>
#include <utility>

namespace gigdispatch::core {

/// @brief Thread-safe front end over an optional TraceWriter.
///
/// Holds a non-owning writer pointer and the clock used to stamp records.
/// When no writer is installed the overhead of emit() is a single
/// null-pointer check and the callback is never invoked.
///
/// @code
/// tracer.emit("offer_created", [&](TraceWriter& w) {
///     w.field("offer_id", offer.id);
/// });
/// @endcode
///
/// @ingroup core
class Tracer {
public:
    /// @param clock   Time source for record timestamps (must outlive the tracer).
    /// @param writer  Destination, or nullptr to disable tracing.
    explicit Tracer(const Clock& clock, TraceWriter* writer = nullptr) noexcept
        : clock_(clock)
        , writer_(writer) {}

    Tracer(const Tracer&) = delete;
    Tracer& operator=(const Tracer&) = delete;

    /// @brief Replace the writer. Pass nullptr to disable tracing.
    void set_writer(TraceWriter* writer) noexcept {
        std::lock_guard lock(mutex_);
        writer_ = writer;
    }

    /// @brief Write one record of type @p type whose fields come from @p fill.
    /// @tparam F Callable with signature void(TraceWriter&).
    template<typename F>
    void emit(std::string_view type, F&& fill) {
        std::lock_guard lock(mutex_);
        if (writer_ == nullptr) {
            return;
        }
        writer_->begin(clock_.now());
        writer_->type(type);
        std::forward<F>(fill)(*writer_);
        writer_->end();
    }

    /// @brief Write a record with no fields.
    void emit(std::string_view type) {
        emit(type, [](TraceWriter&) {});
    }

private:
    const Clock& clock_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::mutex mutex_;
    TraceWriter* writer_;
};

} // namespace gigdispatch::core
