/**
 * @file io_config.hpp
 * @brief Run settings: defaults, key/value config file and validation
 */

#ifndef PATHSIM_IO_CONFIG_HPP
#define PATHSIM_IO_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "pathsim/estimator.hpp"

namespace pathsim {

/**
 * @brief Settings of a batch of what-if runs
 */
struct AppConfig {
    std::string data_path;
    std::string params_path;
    std::string out_dir;
    std::string log_level;
    std::string log_path;

    int num_servers;          // 0: take it from the params file
    double max_time;          // Simulated days
    std::uint32_t seed;       // First replication seed
    double sigma;
    std::vector<double> props;
    int replications;
    int workers;
    NegativeShiftPolicy negative_shift;

    AppConfig()
        : out_dir("results")
        , log_level("info")
        , num_servers(0)
        , max_time(365.0 * 4)
        , seed(0)
        , sigma(1.0)
        , replications(1)
        , workers(1)
        , negative_shift(NegativeShiftPolicy::CLAMP) {}
};

// "key value" per line, '#' starts a comment. Unknown keys and bad values are errors.
bool load_config(const std::string& path, AppConfig& cfg, std::string& err);

// Whole-token parsers: trailing characters, fractions and out-of-range values fail.
bool parse_int_value(const std::string& s, int& out);
bool parse_seed_value(const std::string& s, std::uint32_t& out);
bool parse_double_value(const std::string& s, double& out);
bool parse_double_list(const std::string& s, std::vector<double>& out);

// "clamp" or "reject"
bool parse_negative_shift(const std::string& s, NegativeShiftPolicy& out);

// Reject values the simulator cannot run with; names the offending key.
bool validate_config(const AppConfig& cfg, std::string& err);

} // namespace pathsim

#endif // PATHSIM_IO_CONFIG_HPP
