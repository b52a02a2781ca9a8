#include <gigdispatch/io/scenario_loader.hpp>
#include <gigdispatch/io/error.hpp>

#include "json_fields.hpp"

#include <algorithm>
#include <array>
#include <unordered_set>
#include <utility>

namespace gigdispatch::io {

namespace {

using namespace gigdispatch::core;
using namespace gigdispatch::io::detail;

constexpr std::array<std::pair<WorkerResponse, std::string_view>, 3> RESPONSE_NAMES{{
    {WorkerResponse::Accept, "accept"},
    {WorkerResponse::Decline, "decline"},
    {WorkerResponse::Ignore, "ignore"},
}};

// Parse an enum field through its parse_* function, reporting unknown names.
template<typename Parser>
auto get_enum(const rapidjson::Value& obj, const char* name, const std::string& context,
              Parser parse) {
    std::string text = get_string(obj, name, context);
    auto value = parse(text);
    if (!value) {
        throw LoaderError(std::string("unknown ") + name + " '" + text + "'", context);
    }
    return *value;
}

GeoPoint parse_point(const rapidjson::Value& obj, const std::string& context) {
    GeoPoint point{
        .latitude = get_double(obj, "lat", context),
        .longitude = get_double(obj, "lon", context),
    };
    if (!point.valid()) {
        throw LoaderError("coordinates out of range", context);
    }
    return point;
}

Address parse_address(const rapidjson::Value& obj, const std::string& context) {
    return Address{
        .label = get_string_or(obj, "label", "", context),
        .location = parse_point(obj, context),
    };
}

double get_rate(const rapidjson::Value& obj, const char* name, double default_val,
                const std::string& context) {
    double rate = get_double_or(obj, name, default_val, context);
    if (rate < 0.0 || rate > 1.0) {
        throw LoaderError(std::string("field '") + name + "' must be within [0, 1]", context);
    }
    return rate;
}

ScenarioWorker parse_worker(const rapidjson::Value& obj, const std::string& ctx) {
    ScenarioWorker worker;
    GigWorker& profile = worker.profile;

    profile.id = get_uint64(obj, "id", ctx);
    profile.type = get_enum(obj, "type", ctx, parse_worker_type);
    profile.status = obj.HasMember("status") ? get_enum(obj, "status", ctx, parse_worker_status)
                                             : WorkerStatus::Active;
    profile.verification_status = obj.HasMember("verification")
                                      ? get_enum(obj, "verification", ctx, parse_verification_status)
                                      : VerificationStatus::Approved;

    profile.rating = get_double_or(obj, "rating", 5.0, ctx);
    if (profile.rating < 0.0 || profile.rating > 5.0) {
        throw LoaderError("rating must be within [0, 5]", ctx);
    }
    profile.completed_tasks = get_uint64_or(obj, "completed_tasks", 0, ctx);
    profile.acceptance_rate = get_rate(obj, "acceptance_rate", 1.0, ctx);
    profile.on_time_rate = get_rate(obj, "on_time_rate", 1.0, ctx);

    if (obj.HasMember("vehicle")) {
        const auto& vehicle = get_object(obj, "vehicle", ctx);
        std::string vctx = ctx + ".vehicle";
        profile.vehicle = Vehicle{
            .type = get_string(vehicle, "type", vctx),
            .capacity_kg = get_double(vehicle, "capacity_kg", vctx),
        };
        if (profile.vehicle->capacity_kg < 0.0) {
            throw LoaderError("capacity_kg must not be negative", vctx);
        }
    }

    if (obj.HasMember("preferences")) {
        const auto& prefs = get_object(obj, "preferences", ctx);
        std::string pctx = ctx + ".preferences";
        if (prefs.HasMember("task_types")) {
            const auto& types = get_array(prefs, "task_types", pctx);
            for (rapidjson::SizeType idx = 0; idx < types.Size(); ++idx) {
                if (!types[idx].IsString()) {
                    throw LoaderError("task_types entries must be strings", pctx);
                }
                auto type = parse_task_type(types[idx].GetString());
                if (!type) {
                    throw LoaderError(std::string("unknown task type '") + types[idx].GetString() + "'",
                                      pctx);
                }
                profile.preferences.preferred_types.push_back(*type);
            }
        }
        profile.preferences.accept_cod = get_bool_or(prefs, "accept_cod", false, pctx);
    }

    worker.location = parse_point(get_object(obj, "location", ctx), ctx + ".location");
    if (obj.HasMember("availability")) {
        worker.availability = get_enum(obj, "availability", ctx, parse_worker_availability);
    }
    if (obj.HasMember("response")) {
        worker.response = get_enum(obj, "response", ctx, parse_worker_response);
    }

    double delay = get_double_or(obj, "response_delay", 5.0, ctx);
    if (delay < 0.0) {
        throw LoaderError("response_delay must not be negative", ctx);
    }
    worker.response_delay = duration_from_seconds(delay);
    worker.decline_reason = get_string_or(obj, "decline_reason", worker.decline_reason, ctx);

    return worker;
}

ScenarioTask parse_task(const rapidjson::Value& obj, const std::string& ctx) {
    ScenarioTask entry;
    Task& task = entry.task;

    task.id = get_uint64(obj, "id", ctx);
    task.type = get_enum(obj, "type", ctx, parse_task_type);
    task.status = TaskStatus::Pending;

    if (obj.HasMember("pickup")) {
        task.pickup = parse_address(get_object(obj, "pickup", ctx), ctx + ".pickup");
    }
    task.dropoff = parse_address(get_object(obj, "dropoff", ctx), ctx + ".dropoff");

    task.total_weight_kg = get_double_or(obj, "weight_kg", 0.0, ctx);
    if (task.total_weight_kg < 0.0) {
        throw LoaderError("weight_kg must not be negative", ctx);
    }
    task.collection_amount =
        Money{static_cast<int64_t>(get_uint64_or(obj, "collection_amount", 0, ctx))};

    double release = get_double_or(obj, "release", 0.0, ctx);
    if (release < 0.0) {
        throw LoaderError("release must not be negative", ctx);
    }
    entry.release = time_from_seconds(release);

    if (obj.HasMember("strategy")) {
        entry.strategy = get_enum(obj, "strategy", ctx, algo::parse_strategy);
    }
    return entry;
}

void parse_scenario_impl(ScenarioData& result, const rapidjson::Document& doc) {
    if (doc.HasMember("workers")) {
        const auto& workers = get_array(doc, "workers", "scenario");
        std::unordered_set<WorkerId> seen;
        for (rapidjson::SizeType idx = 0; idx < workers.Size(); ++idx) {
            std::string ctx = "workers[" + std::to_string(idx) + "]";
            auto worker = parse_worker(workers[idx], ctx);
            if (!seen.insert(worker.profile.id).second) {
                throw LoaderError("duplicate worker id " + std::to_string(worker.profile.id), ctx);
            }
            result.workers.push_back(std::move(worker));
        }
    }

    if (doc.HasMember("tasks")) {
        const auto& tasks = get_array(doc, "tasks", "scenario");
        std::unordered_set<TaskId> seen;
        for (rapidjson::SizeType idx = 0; idx < tasks.Size(); ++idx) {
            std::string ctx = "tasks[" + std::to_string(idx) + "]";
            auto task = parse_task(tasks[idx], ctx);
            if (!seen.insert(task.task.id).second) {
                throw LoaderError("duplicate task id " + std::to_string(task.task.id), ctx);
            }
            result.tasks.push_back(std::move(task));
        }

        std::sort(result.tasks.begin(), result.tasks.end(),
                  [](const ScenarioTask& lhs, const ScenarioTask& rhs) {
                      if (lhs.release != rhs.release) {
                          return lhs.release < rhs.release;
                      }
                      return lhs.task.id < rhs.task.id;
                  });
    }
}

} // anonymous namespace

std::string_view to_string(WorkerResponse response) noexcept {
    for (const auto& [key, name] : RESPONSE_NAMES) {
        if (key == response) {
            return name;
        }
    }
    return "unknown";
}

std::optional<WorkerResponse> parse_worker_response(std::string_view name) {
    for (const auto& [key, entry] : RESPONSE_NAMES) {
        if (entry == name) {
            return key;
        }
    }
    return std::nullopt;
}

ScenarioData load_scenario(const std::filesystem::path& path) {
    return load_scenario_from_string(detail::read_file(path));
}

ScenarioData load_scenario_from_string(std::string_view json) {
    rapidjson::Document doc;
    detail::parse_document(doc, json);

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "scenario");
    }

    ScenarioData result;
    parse_scenario_impl(result, doc);
    return result;
}

} // namespace gigdispatch::io
