#include <gigdispatch/core/call_context.hpp>
#include <gigdispatch/core/clock.hpp>
#include <gigdispatch/core/error.hpp>
#include <gigdispatch/core/types.hpp>
#include <gigdispatch/core/worker_state_registry.hpp>

#include <gigdispatch/algo/allocation_engine.hpp>
#include <gigdispatch/algo/config.hpp>
#include <gigdispatch/algo/strategy.hpp>

#include <gigdispatch/store/earning_calculator.hpp>
#include <gigdispatch/store/geo_service.hpp>
#include <gigdispatch/store/notifier.hpp>
#include <gigdispatch/store/offer_repository.hpp>
#include <gigdispatch/store/task_repository.hpp>
#include <gigdispatch/store/worker_repository.hpp>

#include <gigdispatch/io/config_loader.hpp>
#include <gigdispatch/io/error.hpp>
#include <gigdispatch/io/metrics.hpp>
#include <gigdispatch/io/scenario_loader.hpp>
#include <gigdispatch/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace {

namespace core = gigdispatch::core;
namespace algo = gigdispatch::algo;
namespace store = gigdispatch::store;
namespace io = gigdispatch::io;

struct Config {
    std::string scenario_file;
    std::string config_file;
    std::string strategy{"broadcast"};
    double service_time{600.0};
    double duration{0.0};  // 0 = until no event is left
    std::string output_file{"-"};
    std::string format{"json"};
    bool color{false};
    bool metrics{false};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("gigdispatch-sim", "Gig task dispatch simulator");

    options.add_options()
        ("i,input", "Scenario file (JSON)", cxxopts::value<std::string>())
        ("c,config", "Allocation config (JSON, default: built-in defaults)", cxxopts::value<std::string>())
        ("s,strategy", "Strategy: nearest|broadcast|ai_optimized (default: broadcast)",
         cxxopts::value<std::string>()->default_value("broadcast"))
        ("service-time", "Seconds from acceptance to completion (default: 600)",
         cxxopts::value<double>()->default_value("600"))
        ("d,duration", "Simulated duration in seconds (default: until idle)",
         cxxopts::value<double>()->default_value("0"))
        ("o,output", "Trace output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Format: json|text|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("color", "Colour textual output")
        ("metrics", "Print metrics to stderr")
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("input") == 0U) {
        std::cerr << "Error: --input is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.scenario_file = result["input"].as<std::string>();
    if (result.count("config") != 0U) {
        config.config_file = result["config"].as<std::string>();
    }
    config.strategy = result["strategy"].as<std::string>();
    config.service_time = result["service-time"].as<double>();
    config.duration = result["duration"].as<double>();
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    config.color = result.count("color") != 0U;
    config.metrics = result.count("metrics") != 0U;
    config.verbose = result.count("verbose") != 0U;

    return config;
}

// Simulation events, ordered by time then by insertion
struct ReleaseTask {
    core::TaskId task_id;
    algo::Strategy strategy;
};

struct RespondToOffer {
    core::OfferId offer_id;
    core::WorkerId worker_id;
    io::WorkerResponse response;
    std::string reason;
};

struct SweepOffers {};

struct CompleteTask {
    core::TaskId task_id;
    core::WorkerId worker_id;
};

using Event = std::variant<ReleaseTask, RespondToOffer, SweepOffers, CompleteTask>;

class Simulation {
public:
    Simulation(const Config& config, algo::AllocationConfig allocation,
               const io::ScenarioData& scenario, core::TraceWriter* writer)
        : config_(config)
        , workers_(registry_, geo_)
        , engine_(allocation, clock_, registry_,
                  algo::EngineCollaborators{
                      .workers = workers_,
                      .tasks = tasks_,
                      .offers = offers_,
                      .geo = geo_,
                      .earnings = earnings_,
                      .notifier = notifier_,
                  },
                  writer) {
        auto default_strategy = algo::parse_strategy(config.strategy);
        if (!default_strategy) {
            throw io::LoaderError("unknown strategy '" + config.strategy + "'", "--strategy");
        }

        for (const auto& worker : scenario.workers) {
            workers_.upsert(worker.profile);
            engine_.update_worker_location(worker.profile.id, worker.location);
            engine_.set_worker_availability(worker.profile.id, worker.availability);
            behaviour_.emplace(worker.profile.id, &worker);
        }

        for (const auto& entry : scenario.tasks) {
            tasks_.upsert(entry.task);
            schedule(entry.release,
                     ReleaseTask{entry.task.id, entry.strategy.value_or(*default_strategy)});
        }
    }

    void run() {
        const bool bounded = config_.duration > 0.0;
        const core::TimePoint horizon = core::time_from_seconds(config_.duration);

        while (!events_.empty()) {
            auto it = events_.begin();
            if (bounded && it->first.first > horizon) {
                break;
            }
            core::TimePoint when = it->first.first;
            Event event = std::move(it->second);
            events_.erase(it);

            clock_.set(when);
            std::visit([this](auto& e) { handle(e); }, event);

            // Re-allocations run in the background; settle them at this instant
            engine_.wait_for_background();
            deliver_notifications();
        }
    }

    [[nodiscard]] const algo::AllocationEngine& engine() const noexcept { return engine_; }
    [[nodiscard]] uint64_t rejected_responses() const noexcept { return rejected_responses_; }
    [[nodiscard]] std::vector<core::Task> tasks() const { return tasks_.all(); }

private:
    void schedule(core::TimePoint when, Event event) {
        events_.emplace(std::make_pair(when, sequence_++), std::move(event));
    }

    void handle(ReleaseTask& e) {
        auto result = engine_.allocate_task(ctx_, e.task_id, e.strategy);
        if (config_.verbose) {
            std::cerr << "[" << core::time_to_seconds(clock_.now()) << "] task " << e.task_id
                      << ": " << result.message << std::endl;
        }
    }

    void handle(RespondToOffer& e) {
        try {
            if (e.response == io::WorkerResponse::Accept) {
                auto task = engine_.accept_offer(ctx_, e.offer_id, e.worker_id);
                schedule(clock_.now() + core::duration_from_seconds(config_.service_time),
                         CompleteTask{task.id, e.worker_id});
            } else {
                engine_.decline_offer(ctx_, e.offer_id, e.worker_id, e.reason);
            }
        } catch (const core::DispatchError& err) {
            // Late answers lose to a sibling acceptance or to expiry
            ++rejected_responses_;
            if (config_.verbose) {
                std::cerr << "[" << core::time_to_seconds(clock_.now()) << "] worker "
                          << e.worker_id << " response to offer " << e.offer_id
                          << " rejected: " << err.what() << std::endl;
            }
        }
    }

    void handle(SweepOffers& /*e*/) {
        engine_.expire_stale_offers(ctx_);
    }

    void handle(CompleteTask& e) {
        tasks_.set_status(e.task_id, core::TaskStatus::Completed);
        engine_.release_worker(e.task_id, e.worker_id);
    }

    void deliver_notifications() {
        const core::Duration timeout =
            core::duration_from_seconds(engine_.config().offer_timeout_seconds);

        for (auto& note : notifier_.drain()) {
            if (note.kind != store::Notification::Kind::Offer) {
                continue;
            }

            // Sweep just after this offer's expiry
            schedule(clock_.now() + timeout + core::duration_from_seconds(1.0), SweepOffers{});

            auto it = behaviour_.find(note.worker_id);
            if (it == behaviour_.end() || it->second->response == io::WorkerResponse::Ignore) {
                continue;
            }
            const auto& worker = *it->second;
            schedule(clock_.now() + worker.response_delay,
                     RespondToOffer{note.offer_id, note.worker_id, worker.response,
                                    worker.decline_reason});
        }
    }

    const Config& config_;
    core::ManualClock clock_;
    core::WorkerStateRegistry registry_;
    store::HaversineGeoService geo_;
    store::FlatRateEarningCalculator earnings_;
    store::RecordingNotifier notifier_;
    store::InMemoryTaskRepository tasks_;
    store::InMemoryOfferRepository offers_;
    store::InMemoryWorkerRepository workers_;
    algo::AllocationEngine engine_;
    core::CallContext ctx_{};

    std::unordered_map<core::WorkerId, const io::ScenarioWorker*> behaviour_;
    std::map<std::pair<core::TimePoint, uint64_t>, Event> events_;
    uint64_t sequence_{0};
    uint64_t rejected_responses_{0};
};

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.verbose) {
            if (!config.config_file.empty()) {
                std::cerr << "Loading config from: " << config.config_file << std::endl;
            }
            std::cerr << "Loading scenario from: " << config.scenario_file << std::endl;
        }

        // 1. Load inputs
        algo::AllocationConfig allocation;
        if (!config.config_file.empty()) {
            allocation = io::load_config(config.config_file);
        }
        auto scenario = io::load_scenario(config.scenario_file);

        // 2. Setup trace writer
        std::unique_ptr<core::TraceWriter> writer;
        std::ofstream outfile;
        std::ostream* out = &std::cout;

        if (config.output_file != "-" && config.format != "null") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            out = &outfile;
        }

        if (config.format == "null") {
            writer = std::make_unique<io::NullTraceWriter>();
        } else if (config.format == "text") {
            writer = std::make_unique<io::TextualTraceWriter>(*out, config.color);
        } else if (config.format == "json") {
            writer = std::make_unique<io::JsonTraceWriter>(*out);
        } else {
            std::cerr << "Error: unknown format: " << config.format << std::endl;
            return 64;
        }

        // 3. Keep records in memory as well when metrics are requested
        io::MemoryTraceWriter memory;
        std::unique_ptr<io::TeeTraceWriter> tee;
        core::TraceWriter* active = writer.get();
        if (config.metrics) {
            tee = std::make_unique<io::TeeTraceWriter>(*writer, memory);
            active = tee.get();
        }

        if (config.verbose) {
            std::cerr << "Starting simulation with " << scenario.workers.size() << " workers and "
                      << scenario.tasks.size() << " tasks..." << std::endl;
        }

        // 4. Run
        Simulation simulation(config, allocation, scenario, active);
        simulation.run();

        // 5. Finalize output
        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        if (config.verbose) {
            auto stats = simulation.engine().stats();
            std::cerr << "Allocations: " << stats.allocations << " ("
                      << stats.successful_allocations << " successful), rejected responses: "
                      << simulation.rejected_responses() << std::endl;
            for (const auto& task : simulation.tasks()) {
                std::cerr << "  task " << task.id << ": " << core::to_string(task.status) << std::endl;
            }
        }

        if (config.metrics) {
            io::write_metrics_to_stream(io::compute_metrics(memory.records()), std::cerr);
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const algo::ConfigError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::DispatchError& e) {
        std::cerr << "Dispatch error: " << e.what() << std::endl;
        return 2;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
