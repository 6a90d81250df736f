/**
 * @file statistics.hpp
 * @brief Utilisation and system-time tables from a finished run
 */

#ifndef PATHSIM_STATISTICS_HPP
#define PATHSIM_STATISTICS_HPP

#include "pathsim/simulation.hpp"

#include <string>
#include <utility>
#include <vector>

namespace pathsim {

/// Constant column broadcast onto every row, e.g. {"num_servers", "12"}
using Tag = std::pair<std::string, std::string>;
using Tags = std::vector<Tag>;

struct UtilisationRow {
    int server_id;
    double utilisation;
    Tags tags;
};

struct SystemTimeRow {
    double system_time;
    Tags tags;
};

/**
 * @brief Summary of a system-time table
 */
struct SystemTimeSummary {
    int count;
    double mean;
    double p90;
};

/**
 * @brief One row per server: busy time / observed time over the whole run
 */
std::vector<UtilisationRow> utilisation_table(const SimulationRun& run, const Tags& tags = Tags());

/**
 * @brief System time of customers arriving in the central half of the run
 *
 * Keeps records with 0.25 * max_time < arrival_date < 0.75 * max_time
 * (both bounds exclusive); everything else is dropped.
 */
std::vector<SystemTimeRow> system_time_table(
    const std::vector<Record>& records,
    double max_time,
    const Tags& tags = Tags()
);

SystemTimeSummary summarise(const std::vector<SystemTimeRow>& rows);

/**
 * @brief Export a table to CSV format string (header included)
 */
std::string utilisations_to_csv(const std::vector<UtilisationRow>& rows);
std::string system_times_to_csv(const std::vector<SystemTimeRow>& rows);

} // namespace pathsim

#endif // PATHSIM_STATISTICS_HPP
