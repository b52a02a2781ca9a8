#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for dispatch traces.
///
/// Provides a no-op writer, a streaming JSON writer, an in-memory buffer
/// used by tests and metrics, and a human-readable textual writer with
/// optional ANSI colour.
///
/// @ingroup io_writers

#include <gigdispatch/core/trace_writer.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace gigdispatch::io {

/// @brief Trace writer that discards every record.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Trace writer that streams a JSON array to an output stream.
///
/// Each record becomes one object `{"time": <seconds>, "type": ..., ...}`.
/// Call finalize() to close the array; the destructor does it otherwise.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter, compute_metrics_from_file
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;

    /// @brief Add a string field; @p value is JSON-escaped.
    void field(std::string_view key, std::string_view value) override;

    void end() override;

    /// @brief Write the closing bracket of the array. Idempotent.
    void finalize();

private:
    static std::string escape(std::string_view str);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool first_record_{true};
    bool finalized_{false};
};

/// @brief Trace writer that forwards every call to two other writers.
///
/// Lets a run stream its trace to a file while keeping a MemoryTraceWriter
/// for metrics.
///
/// @ingroup io_writers
class TeeTraceWriter : public core::TraceWriter {
public:
    /// @param first   First destination (must outlive this writer).
    /// @param second  Second destination (must outlive this writer).
    TeeTraceWriter(core::TraceWriter& first, core::TraceWriter& second) noexcept;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    core::TraceWriter& first_;   // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    core::TraceWriter& second_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

/// @brief Value of one trace field.
using FieldValue = std::variant<double, uint64_t, std::string>;

/// @brief A single trace record kept in memory.
/// @ingroup io_writers
struct TraceRecord {
    double time{0.0};   ///< Clock time of the record in seconds since the epoch.
    std::string type;   ///< Event type (e.g. "offer_accepted").
    std::unordered_map<std::string, FieldValue> fields;

    /// @brief Integer field @p key, converting from double if needed.
    [[nodiscard]] std::optional<uint64_t> get_uint(const std::string& key) const;

    /// @brief Numeric field @p key as a double.
    [[nodiscard]] std::optional<double> get_double(const std::string& key) const;

    /// @brief String field @p key.
    [[nodiscard]] std::optional<std::string> get_string(const std::string& key) const;
};

/// @brief Trace writer that buffers every record as a TraceRecord.
///
/// Used by the tests to observe engine behaviour and by the simulator to
/// compute metrics without a round trip through a file.
///
/// @ingroup io_writers
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Records of type @p type, in emission order.
    [[nodiscard]] std::vector<TraceRecord> of_type(std::string_view type) const;

    /// @brief Number of records of type @p type.
    [[nodiscard]] std::size_t count(std::string_view type) const;

    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable trace writer with optional ANSI colour.
///
/// One aligned line per record:
/// @code
/// [    12.00000] (+   2.00000)                 offer_accepted: offer_id = 3, task_id = 1
/// @endcode
/// With colour enabled, failures are printed in red, offer outcomes in green
/// and re-allocation records in yellow.
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @param output         Destination stream (must outlive this writer).
    /// @param color_enabled  Emit ANSI escape codes.
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    struct FieldEntry {
        std::string key;
        std::string value;
    };

    [[nodiscard]] std::string_view color_for(std::string_view type) const noexcept;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    double current_time_{0.0};
    std::optional<double> prev_time_;
    std::string current_type_;
    std::vector<FieldEntry> current_fields_;
};

} // namespace gigdispatch::io
