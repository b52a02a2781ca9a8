#pragma once

/// @file metrics.hpp
/// @brief Dispatch metrics derived from traces.
///
/// Metrics are computed after the fact from the records the engine emits,
/// either held in memory or read back from a JSON trace file, so the engine
/// itself carries no counters beyond EngineStats.
///
/// @ingroup io_metrics

#include <gigdispatch/io/trace_writers.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace gigdispatch::io {

/// @brief Aggregated counters and timings of one dispatch trace.
/// @ingroup io_metrics
/// @see compute_metrics, compute_metrics_from_file
struct DispatchMetrics {
    // -- Allocation ----------------------------------------------------------

    uint64_t allocations{0};             ///< `allocation_started` records.
    uint64_t successful_allocations{0};  ///< `allocation_completed` records.
    uint64_t failed_allocations{0};      ///< `allocation_failed` records.
    uint64_t no_eligible_workers{0};     ///< Failures caused by an empty candidate list.
    uint64_t reallocations{0};           ///< `reallocation_scheduled` records.

    // -- Candidates ----------------------------------------------------------

    uint64_t candidates_rejected{0};
    /// @brief Rejections per reason (e.g. "too_far" -> 3).
    std::map<std::string, uint64_t> rejections_by_reason;

    // -- Offers --------------------------------------------------------------

    uint64_t offers_created{0};
    uint64_t offer_create_failures{0};
    uint64_t offers_accepted{0};
    uint64_t offers_declined{0};
    uint64_t offers_expired{0};
    uint64_t offers_cancelled{0};

    // -- Timings -------------------------------------------------------------

    /// @brief Per task, seconds from its first allocation to its acceptance.
    std::map<uint64_t, double> time_to_accept_per_task;

    /// @brief Seconds between offer creation and acceptance, per accepted offer.
    std::vector<double> response_times;

    /// @brief Share of created offers that were accepted, in [0, 1].
    [[nodiscard]] double acceptance_ratio() const noexcept {
        return offers_created == 0 ? 0.0
                                   : static_cast<double>(offers_accepted) /
                                         static_cast<double>(offers_created);
    }
};

/// @brief Compute metrics from in-memory trace records.
/// @param traces  Records in emission order (typically MemoryTraceWriter::records()).
DispatchMetrics compute_metrics(const std::vector<TraceRecord>& traces);

/// @brief Read a JSON trace written by JsonTraceWriter and compute its metrics.
/// @throws LoaderError if the file cannot be read or is not a JSON array.
DispatchMetrics compute_metrics_from_file(const std::filesystem::path& path);

/// @brief Read the records of a JSON trace file.
/// @throws LoaderError if the file cannot be read or is not a JSON array.
std::vector<TraceRecord> read_trace_file(const std::filesystem::path& path);

/// @brief Summary of a sample of durations.
/// @ingroup io_metrics
struct TimingSummary {
    std::size_t count{0};
    double min{0.0};
    double max{0.0};
    double mean{0.0};
    double median{0.0};
    double percentile_95{0.0};
};

/// @brief Summarise @p samples (seconds). An empty sample gives all zeros.
TimingSummary summarize_timings(std::vector<double> samples);

/// @brief Write @p metrics as a JSON object.
void write_metrics_to_stream(const DispatchMetrics& metrics, std::ostream& out);

} // namespace gigdispatch::io
