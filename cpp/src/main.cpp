/**
 * @file main.cpp
 * @brief Command-line interface for care pathway what-if simulations
 *
 * Estimates per-cluster queue parameters from an admissions CSV, runs
 * replications and writes utilisation and system-time CSV tables.
 */

#include "pathsim/errors.hpp"
#include "pathsim/io_config.hpp"
#include "pathsim/io_data.hpp"
#include "pathsim/io_output.hpp"
#include "pathsim/logger.hpp"
#include "pathsim/scenario.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace pathsim;

void print_usage() {
    std::cerr << "Usage: pathsim --data FILE [options]\n"
              << "Options:\n"
              << "  --data FILE              Admissions CSV (admission_date, true_los, cluster)\n"
              << "  --params FILE            Params file: props... num_servers score\n"
              << "  --config FILE            Key/value config file (command line wins)\n"
              << "  --servers N              Number of servers\n"
              << "  --max-time DAYS          Simulated horizon (default: 1460)\n"
              << "  --seed SEED              First replication seed (default: 0)\n"
              << "  --sigma X                Arrival rate scaling (default: 1)\n"
              << "  --props p0,p1,...        Service scaling per cluster (default: params file or 1)\n"
              << "  --replications N         Number of runs (default: 1)\n"
              << "  --workers N              Parallel runs (default: 1)\n"
              << "  --negative-shift POLICY  clamp or reject a negative shortest stay (default: clamp)\n"
              << "  --out DIR                Output directory (default: results)\n"
              << "  --log FILE               Write the log to FILE instead of stderr\n"
              << "  --log-level LEVEL        debug, info, warn or error (default: info)\n"
              << "  --help                   Show this help\n";
}

static const char* find_config_arg(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            return argv[i + 1];
        }
    }
    return nullptr;
}

static bool parse_args(int argc, char* argv[], AppConfig& config, std::string& err) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            err = "unknown or incomplete option: " + arg;
            return false;
        }
        std::string value = argv[++i];

        bool ok = true;
        if (arg == "--config") {
            // Already loaded
        }
        else if (arg == "--data") config.data_path = value;
        else if (arg == "--params") config.params_path = value;
        else if (arg == "--servers") ok = parse_int_value(value, config.num_servers);
        else if (arg == "--max-time") ok = parse_double_value(value, config.max_time);
        else if (arg == "--seed") ok = parse_seed_value(value, config.seed);
        else if (arg == "--sigma") ok = parse_double_value(value, config.sigma);
        else if (arg == "--props") ok = parse_double_list(value, config.props);
        else if (arg == "--replications") ok = parse_int_value(value, config.replications);
        else if (arg == "--workers") ok = parse_int_value(value, config.workers);
        else if (arg == "--negative-shift") ok = parse_negative_shift(value, config.negative_shift);
        else if (arg == "--out") config.out_dir = value;
        else if (arg == "--log") config.log_path = value;
        else if (arg == "--log-level") config.log_level = value;
        else {
            err = "unknown option: " + arg;
            return false;
        }
        if (!ok) {
            err = "bad value for " + arg + ": " + value;
            return false;
        }
    }
    return true;
}

static int run(int argc, char* argv[]) {
    AppConfig config;
    std::string err;

    if (const char* path = find_config_arg(argc, argv)) {
        if (!load_config(path, config, err)) {
            log_error("config", err);
            return 1;
        }
    }
    if (!parse_args(argc, argv, config, err)) {
        log_error("cli", err);
        print_usage();
        return 1;
    }

    LogLevel level;
    if (!parse_log_level(config.log_level, level)) {
        log_error("config", "log_level: unknown level '" + config.log_level + "'");
        return 1;
    }
    Logger::instance().set_level(level);
    if (!config.log_path.empty()) {
        Logger::instance().open(config.log_path);
    }

    std::vector<AdmissionRecord> admissions;
    if (!config.data_path.empty() && !load_admissions_csv(config.data_path, admissions, err)) {
        log_error("data", err);
        return 1;
    }

    if (!config.params_path.empty()) {
        std::vector<double> props;
        int num_servers = 0;
        if (!load_params_file(config.params_path, props, num_servers, err)) {
            log_error("params", err);
            return 1;
        }
        if (config.props.empty()) config.props = props;
        if (config.num_servers <= 0) config.num_servers = num_servers;
    }
    if (config.props.empty()) {
        config.props.assign(group_by_cluster(admissions).size(), 1.0);
    }

    if (!validate_config(config, err)) {
        log_error("config", err);
        return 1;
    }

    EstimatorOptions estimator_options;
    estimator_options.negative_shift = config.negative_shift;

    SimulationConfig base = build_simulation_config(
        admissions, config.props, config.sigma,
        config.num_servers, config.seed, config.max_time, estimator_options);

    std::vector<std::uint32_t> seeds;
    for (int i = 0; i < config.replications; ++i) {
        seeds.push_back(config.seed + static_cast<std::uint32_t>(i));
    }

    std::ostringstream sigma;
    sigma << config.sigma;
    Tags tags;
    tags.emplace_back("sigma", sigma.str());
    auto scenarios = replicate(base, seeds, tags);

    {
        std::ostringstream oss;
        oss << admissions.size() << " admissions, " << base.classes.size() << " classes, "
            << config.num_servers << " servers, " << config.replications
            << " replications on " << config.workers << " workers";
        log_info("pathsim", oss.str());
    }

    ScenarioResult all = concatenate(run_scenarios(scenarios, config.workers));

    if (!write_utilisations_csv(config.out_dir, all.utilisations, err)) {
        log_error("output", err);
        return 1;
    }
    if (!write_system_times_csv(config.out_dir, all.system_times, err)) {
        log_error("output", err);
        return 1;
    }

    double util_sum = 0.0;
    for (const auto& row : all.utilisations) {
        util_sum += row.utilisation;
    }
    SystemTimeSummary summary = summarise(all.system_times);

    std::cout << "metric,value\n";
    std::cout << "mean_utilisation," << (all.utilisations.empty() ? 0.0 : util_sum / all.utilisations.size()) << "\n";
    std::cout << "mean_system_time," << summary.mean << "\n";
    std::cout << "p90_system_time," << summary.p90 << "\n";
    std::cout << "observed_patients," << summary.count << "\n";
    std::cout << "replications," << config.replications << "\n";

    return 0;
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        }
    }

    try {
        return run(argc, argv);
    } catch (const InsufficientDataError& e) {
        log_error("estimator", e.what());
    } catch (const InvalidParameter& e) {
        log_error("config", e.what());
    } catch (const std::exception& e) {
        log_error("pathsim", e.what());
    }
    return 1;
}
