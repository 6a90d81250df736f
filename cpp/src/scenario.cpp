/**
 * @file scenario.cpp
 * @brief Scenario building, replications and the worker pool
 */

#include "pathsim/scenario.hpp"
#include "pathsim/errors.hpp"
#include "pathsim/logger.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

namespace pathsim {

std::map<int, std::vector<AdmissionRecord>> group_by_cluster(
    const std::vector<AdmissionRecord>& admissions
) {
    std::map<int, std::vector<AdmissionRecord>> clusters;
    for (const auto& record : admissions) {
        clusters[record.cluster].push_back(record);
    }
    return clusters;
}

SimulationConfig build_simulation_config(
    const std::vector<AdmissionRecord>& admissions,
    const std::vector<double>& props,
    double sigma,
    int num_servers,
    std::uint32_t seed,
    double max_time,
    const EstimatorOptions& options
) {
    auto clusters = group_by_cluster(admissions);
    if (clusters.empty()) {
        throw InsufficientDataError("no admissions to build classes from");
    }
    if (props.size() != clusters.size()) {
        std::ostringstream oss;
        oss << "props has " << props.size() << " entries but the data has "
            << clusters.size() << " clusters";
        throw InvalidParameter(oss.str());
    }

    SimulationConfig config;
    config.num_servers = num_servers;
    config.max_time = max_time;
    config.seed = seed;

    std::size_t i = 0;
    for (const auto& cluster : clusters) {
        QueueParams params = estimate_queue_params(
            cluster.second, props[i++], sigma, cluster.first, options);

        config.classes.push_back(CustomerClass{
            cluster.first,
            Distribution::exponential(params.arrival_rate),
            Distribution::shifted_exponential(params.service_rate, params.minimum_shift)
        });

        std::ostringstream oss;
        oss << "class " << cluster.first << " (" << cluster.second.size() << " records): "
            << "arrival " << config.classes.back().arrival.describe()
            << ", service " << config.classes.back().service.describe();
        log_debug("scenario", oss.str());
    }

    return config;
}

ScenarioResult run_scenario(const Scenario& scenario) {
    QueueSimulator sim(scenario.config);
    SimulationRun run = sim.run();

    ScenarioResult result;
    result.utilisations = utilisation_table(run, scenario.tags);
    result.system_times = system_time_table(run.records, scenario.config.max_time, scenario.tags);
    return result;
}

std::vector<Scenario> replicate(
    const SimulationConfig& base,
    const std::vector<std::uint32_t>& seeds,
    const Tags& tags
) {
    std::vector<Scenario> scenarios;
    scenarios.reserve(seeds.size());

    for (std::uint32_t seed : seeds) {
        Scenario scenario;
        scenario.config = base;
        scenario.config.seed = seed;
        scenario.tags = tags;
        scenario.tags.emplace_back("num_servers", std::to_string(base.num_servers));
        scenario.tags.emplace_back("seed", std::to_string(seed));
        scenarios.push_back(std::move(scenario));
    }

    return scenarios;
}

std::vector<ScenarioResult> run_scenarios(
    const std::vector<Scenario>& scenarios,
    int num_workers
) {
    std::vector<ScenarioResult> results(scenarios.size());
    std::vector<std::exception_ptr> errors(scenarios.size());
    std::atomic<std::size_t> next(0);

    auto worker = [&]() {
        for (std::size_t i = next++; i < scenarios.size(); i = next++) {
            try {
                results[i] = run_scenario(scenarios[i]);
            } catch (const std::exception& e) {
                log_error("scenario", "scenario " + std::to_string(i) + " failed: " + e.what());
                errors[i] = std::current_exception();
            }
        }
    };

    int threads = std::min<int>(num_workers, static_cast<int>(scenarios.size()));
    if (threads <= 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(threads);
        for (int t = 0; t < threads; ++t) {
            pool.emplace_back(worker);
        }
        for (auto& th : pool) {
            th.join();
        }
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    return results;
}

ScenarioResult concatenate(const std::vector<ScenarioResult>& results) {
    ScenarioResult all;
    for (const auto& r : results) {
        all.utilisations.insert(all.utilisations.end(), r.utilisations.begin(), r.utilisations.end());
        all.system_times.insert(all.system_times.end(), r.system_times.begin(), r.system_times.end());
    }
    return all;
}

} // namespace pathsim
