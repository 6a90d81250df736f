/**
 * @file statistics.cpp
 * @brief Result tables and their CSV form
 */

#include "pathsim/statistics.hpp"

#include <algorithm>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace pathsim {

namespace {

void write_tag_header(std::ostringstream& oss, const Tags& tags) {
    for (const auto& tag : tags) {
        oss << "," << tag.first;
    }
    oss << "\n";
}

void write_tag_values(std::ostringstream& oss, const Tags& tags) {
    for (const auto& tag : tags) {
        oss << "," << tag.second;
    }
    oss << "\n";
}

} // namespace

std::vector<UtilisationRow> utilisation_table(const SimulationRun& run, const Tags& tags) {
    std::vector<UtilisationRow> rows;
    rows.reserve(run.servers.size());
    for (const auto& server : run.servers) {
        double utilisation = 0.0;
        if (server.observed_time > 0.0) {
            utilisation = server.busy_time / server.observed_time;
        }
        rows.push_back(UtilisationRow{server.id, utilisation, tags});
    }
    return rows;
}

std::vector<SystemTimeRow> system_time_table(
    const std::vector<Record>& records,
    double max_time,
    const Tags& tags
) {
    const double lower = max_time * 0.25;
    const double upper = max_time * 0.75;

    std::vector<SystemTimeRow> rows;
    for (const auto& record : records) {
        if (lower < record.arrival_date && record.arrival_date < upper) {
            rows.push_back(SystemTimeRow{record.exit_date - record.arrival_date, tags});
        }
    }
    return rows;
}

SystemTimeSummary summarise(const std::vector<SystemTimeRow>& rows) {
    SystemTimeSummary summary;
    summary.count = static_cast<int>(rows.size());
    summary.mean = 0.0;
    summary.p90 = 0.0;
    if (rows.empty()) {
        return summary;
    }

    std::vector<double> times;
    times.reserve(rows.size());
    for (const auto& row : rows) {
        times.push_back(row.system_time);
    }

    summary.mean = std::accumulate(times.begin(), times.end(), 0.0) / times.size();

    // 90th percentile
    std::sort(times.begin(), times.end());
    size_t p90_idx = static_cast<size_t>(0.9 * times.size());
    summary.p90 = times[std::min(p90_idx, times.size() - 1)];

    return summary;
}

std::string utilisations_to_csv(const std::vector<UtilisationRow>& rows) {
    std::ostringstream oss;
    oss << std::setprecision(10);

    oss << "server_id,utilisation";
    write_tag_header(oss, rows.empty() ? Tags() : rows.front().tags);
    for (const auto& row : rows) {
        oss << row.server_id << "," << row.utilisation;
        write_tag_values(oss, row.tags);
    }
    return oss.str();
}

std::string system_times_to_csv(const std::vector<SystemTimeRow>& rows) {
    std::ostringstream oss;
    oss << std::setprecision(10);

    oss << "system_time";
    write_tag_header(oss, rows.empty() ? Tags() : rows.front().tags);
    for (const auto& row : rows) {
        oss << row.system_time;
        write_tag_values(oss, row.tags);
    }
    return oss.str();
}

} // namespace pathsim
