#include <gigdispatch/io/config_loader.hpp>
#include <gigdispatch/io/error.hpp>

#include <gigdispatch/algo/error.hpp>

#include "json_fields.hpp"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <string>

namespace gigdispatch::io {

algo::AllocationConfig load_config(const std::filesystem::path& path) {
    const std::string json = detail::read_file(path);
    try {
        return load_config_from_string(json);
    } catch (const LoaderError& e) {
        throw LoaderError(e.what(), path.string());
    }
}

algo::AllocationConfig load_config_from_string(std::string_view json) {
    using namespace detail;

    rapidjson::Document doc;
    parse_document(doc, json);

    const std::string ctx = "config";
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", ctx);
    }

    algo::AllocationConfig config;

    config.offer_timeout_seconds =
        get_double_or(doc, "offer_timeout_seconds", config.offer_timeout_seconds, ctx);
    config.max_concurrent_offers = static_cast<std::size_t>(
        get_uint64_or(doc, "max_concurrent_offers", config.max_concurrent_offers, ctx));

    config.distance_weight = get_double_or(doc, "distance_weight", config.distance_weight, ctx);
    config.rating_weight = get_double_or(doc, "rating_weight", config.rating_weight, ctx);
    config.experience_weight = get_double_or(doc, "experience_weight", config.experience_weight, ctx);
    config.acceptance_rate_weight =
        get_double_or(doc, "acceptance_rate_weight", config.acceptance_rate_weight, ctx);
    config.on_time_rate_weight =
        get_double_or(doc, "on_time_rate_weight", config.on_time_rate_weight, ctx);
    config.load_balance_weight =
        get_double_or(doc, "load_balance_weight", config.load_balance_weight, ctx);

    config.max_worker_distance_km =
        get_double_or(doc, "max_worker_distance_km", config.max_worker_distance_km, ctx);
    config.min_worker_rating = get_double_or(doc, "min_worker_rating", config.min_worker_rating, ctx);
    config.max_tasks_per_worker = static_cast<std::size_t>(
        get_uint64_or(doc, "max_tasks_per_worker", config.max_tasks_per_worker, ctx));

    config.enable_ai_optimization =
        get_bool_or(doc, "enable_ai_optimization", config.enable_ai_optimization, ctx);
    config.heartbeat_timeout_seconds =
        get_double_or(doc, "heartbeat_timeout_seconds", config.heartbeat_timeout_seconds, ctx);

    try {
        algo::validate_config(config);
    } catch (const algo::ConfigError& e) {
        throw LoaderError(e.what(), ctx);
    }
    return config;
}

void write_config_to_stream(const algo::AllocationConfig& config, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("offer_timeout_seconds");
    writer.Double(config.offer_timeout_seconds);
    writer.Key("max_concurrent_offers");
    writer.Uint64(config.max_concurrent_offers);
    writer.Key("distance_weight");
    writer.Double(config.distance_weight);
    writer.Key("rating_weight");
    writer.Double(config.rating_weight);
    writer.Key("experience_weight");
    writer.Double(config.experience_weight);
    writer.Key("acceptance_rate_weight");
    writer.Double(config.acceptance_rate_weight);
    writer.Key("on_time_rate_weight");
    writer.Double(config.on_time_rate_weight);
    writer.Key("load_balance_weight");
    writer.Double(config.load_balance_weight);
    writer.Key("max_worker_distance_km");
    writer.Double(config.max_worker_distance_km);
    writer.Key("min_worker_rating");
    writer.Double(config.min_worker_rating);
    writer.Key("max_tasks_per_worker");
    writer.Uint64(config.max_tasks_per_worker);
    writer.Key("enable_ai_optimization");
    writer.Bool(config.enable_ai_optimization);
    writer.Key("heartbeat_timeout_seconds");
    writer.Double(config.heartbeat_timeout_seconds);
    writer.EndObject();

    out << buffer.GetString() << "\n";
}

} // namespace gigdispatch::io
