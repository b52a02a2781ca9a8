#include <gigdispatch/io/metrics.hpp>
#include <gigdispatch/io/error.hpp>

#include "json_fields.hpp"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <algorithm>
#include <cmath>
#include <ostream>
#include <unordered_map>

namespace gigdispatch::io {

DispatchMetrics compute_metrics(const std::vector<TraceRecord>& traces) {
    DispatchMetrics metrics;

    // First allocation time per task, for time-to-accept
    std::unordered_map<uint64_t, double> first_allocation;

    for (const auto& record : traces) {
        if (record.type == "allocation_started") {
            metrics.allocations++;
            if (auto tid = record.get_uint("task_id")) {
                first_allocation.try_emplace(*tid, record.time);
            }
        }
        else if (record.type == "allocation_completed") {
            metrics.successful_allocations++;
        }
        else if (record.type == "allocation_failed") {
            metrics.failed_allocations++;
            if (record.get_string("reason") == "no_eligible_workers") {
                metrics.no_eligible_workers++;
            }
        }
        else if (record.type == "reallocation_scheduled") {
            metrics.reallocations++;
        }
        else if (record.type == "candidate_rejected") {
            metrics.candidates_rejected++;
            metrics.rejections_by_reason[record.get_string("reason").value_or("unknown")]++;
        }
        else if (record.type == "offer_created") {
            metrics.offers_created++;
        }
        else if (record.type == "offer_create_failed") {
            metrics.offer_create_failures++;
        }
        else if (record.type == "offer_accepted") {
            metrics.offers_accepted++;
            if (auto response = record.get_double("response_time")) {
                metrics.response_times.push_back(*response);
            }
            if (auto tid = record.get_uint("task_id")) {
                auto it = first_allocation.find(*tid);
                if (it != first_allocation.end()) {
                    metrics.time_to_accept_per_task[*tid] = record.time - it->second;
                }
            }
        }
        else if (record.type == "offer_declined") {
            metrics.offers_declined++;
        }
        else if (record.type == "offer_expired") {
            metrics.offers_expired++;
        }
        else if (record.type == "offer_cancelled") {
            metrics.offers_cancelled++;
        }
    }

    return metrics;
}

std::vector<TraceRecord> read_trace_file(const std::filesystem::path& path) {
    std::string json = detail::read_file(path);

    rapidjson::Document doc;
    detail::parse_document(doc, json);

    if (!doc.IsArray()) {
        throw LoaderError("trace file must be a JSON array", path.string());
    }

    std::vector<TraceRecord> traces;
    traces.reserve(doc.Size());

    for (rapidjson::SizeType idx = 0; idx < doc.Size(); ++idx) {
        const auto& obj = doc[idx];
        if (!obj.IsObject()) {
            throw LoaderError("trace record must be an object",
                              path.string() + "[" + std::to_string(idx) + "]");
        }

        TraceRecord record;
        for (auto iter = obj.MemberBegin(); iter != obj.MemberEnd(); ++iter) {
            std::string key(iter->name.GetString(), iter->name.GetStringLength());
            const auto& value = iter->value;

            if (key == "time") {
                record.time = value.IsNumber() ? value.GetDouble() : 0.0;
            } else if (key == "type") {
                record.type = value.IsString() ? value.GetString() : "";
            } else if (value.IsUint64()) {
                record.fields[key] = value.GetUint64();
            } else if (value.IsNumber()) {
                record.fields[key] = value.GetDouble();
            } else if (value.IsString()) {
                record.fields[key] = std::string(value.GetString(), value.GetStringLength());
            }
        }
        traces.push_back(std::move(record));
    }

    return traces;
}

DispatchMetrics compute_metrics_from_file(const std::filesystem::path& path) {
    return compute_metrics(read_trace_file(path));
}

TimingSummary summarize_timings(std::vector<double> samples) {
    TimingSummary summary;
    if (samples.empty()) {
        return summary;
    }

    std::sort(samples.begin(), samples.end());

    summary.count = samples.size();
    summary.min = samples.front();
    summary.max = samples.back();

    double sum = 0.0;
    for (double sample : samples) {
        sum += sample;
    }
    summary.mean = sum / static_cast<double>(samples.size());

    std::size_t mid = samples.size() / 2;
    summary.median = samples.size() % 2 == 0 ? (samples[mid - 1] + samples[mid]) / 2.0 : samples[mid];

    // Nearest-rank percentile
    auto rank = static_cast<std::size_t>(std::ceil(0.95 * static_cast<double>(samples.size())));
    summary.percentile_95 = samples[std::max<std::size_t>(rank, 1) - 1];

    return summary;
}

void write_metrics_to_stream(const DispatchMetrics& metrics, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);

    auto counter = [&writer](const char* key, uint64_t value) {
        writer.Key(key);
        writer.Uint64(value);
    };

    writer.StartObject();
    counter("allocations", metrics.allocations);
    counter("successful_allocations", metrics.successful_allocations);
    counter("failed_allocations", metrics.failed_allocations);
    counter("no_eligible_workers", metrics.no_eligible_workers);
    counter("reallocations", metrics.reallocations);
    counter("candidates_rejected", metrics.candidates_rejected);
    counter("offers_created", metrics.offers_created);
    counter("offer_create_failures", metrics.offer_create_failures);
    counter("offers_accepted", metrics.offers_accepted);
    counter("offers_declined", metrics.offers_declined);
    counter("offers_expired", metrics.offers_expired);
    counter("offers_cancelled", metrics.offers_cancelled);

    writer.Key("acceptance_ratio");
    writer.Double(metrics.acceptance_ratio());

    writer.Key("rejections_by_reason");
    writer.StartObject();
    for (const auto& [reason, count] : metrics.rejections_by_reason) {
        writer.Key(reason.c_str());
        writer.Uint64(count);
    }
    writer.EndObject();

    std::vector<double> accept_times;
    for (const auto& [task_id, seconds] : metrics.time_to_accept_per_task) {
        accept_times.push_back(seconds);
    }

    auto summary = [&writer](const char* key, const TimingSummary& s) {
        writer.Key(key);
        writer.StartObject();
        writer.Key("count");
        writer.Uint64(s.count);
        writer.Key("min");
        writer.Double(s.min);
        writer.Key("max");
        writer.Double(s.max);
        writer.Key("mean");
        writer.Double(s.mean);
        writer.Key("median");
        writer.Double(s.median);
        writer.Key("p95");
        writer.Double(s.percentile_95);
        writer.EndObject();
    };
    summary("time_to_accept", summarize_timings(std::move(accept_times)));
    summary("response_time", summarize_timings(metrics.response_times));

    writer.EndObject();
    out << buffer.GetString() << "\n";
}

} // namespace gigdispatch::io
