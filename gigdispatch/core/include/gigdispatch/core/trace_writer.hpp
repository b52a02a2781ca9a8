#pragma once

#include <gigdispatch/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace gigdispatch::core {

/// @brief Abstract interface for recording dispatch events.
/// @ingroup core
///
/// Implementations of TraceWriter serialise engine events to a specific
/// format (JSON, text, memory buffer, etc.). Each record is built
/// incrementally:
///   1. begin() -- opens a new record at a given wall-clock time
///   2. type()  -- sets the event type name
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// Writers are not required to be thread-safe; the Tracer serialises
/// access when the engine runs work on several threads.
///
/// @see Tracer
class TraceWriter {
public:
    /// @brief Virtual destructor for safe polymorphic deletion.
    virtual ~TraceWriter() = default;

    /// @brief Begin a new trace record at the given time.
    virtual void begin(TimePoint time) = 0;

    /// @brief Set the event type name for the current record.
    /// @param name A short identifier for the event category
    ///        (e.g. `"offer_created"`, `"offer_accepted"`).
    virtual void type(std::string_view name) = 0;

    /// @brief Add a floating-point field to the current record.
    virtual void field(std::string_view key, double value) = 0;

    /// @brief Add an unsigned integer field to the current record.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Add a string field to the current record.
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief End the current record and flush if needed.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace gigdispatch::core
