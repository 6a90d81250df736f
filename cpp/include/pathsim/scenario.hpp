/**
 * @file scenario.hpp
 * @brief Scenario construction from historical data and batch execution
 */

#ifndef PATHSIM_SCENARIO_HPP
#define PATHSIM_SCENARIO_HPP

#include "pathsim/estimator.hpp"
#include "pathsim/simulation.hpp"
#include "pathsim/statistics.hpp"

#include <cstdint>
#include <map>
#include <vector>

namespace pathsim {

/**
 * @brief Fully specified, self-contained simulation task
 */
struct Scenario {
    SimulationConfig config;
    Tags tags;
};

/**
 * @brief The two result tables of one scenario
 */
struct ScenarioResult {
    std::vector<UtilisationRow> utilisations;
    std::vector<SystemTimeRow> system_times;
};

/**
 * @brief Partition admissions by cluster label (labels in ascending order)
 */
std::map<int, std::vector<AdmissionRecord>> group_by_cluster(
    const std::vector<AdmissionRecord>& admissions
);

/**
 * @brief Estimate every class and assemble a simulation configuration
 *
 * props[i] scales service times of the i-th cluster label in ascending
 * order; the class id is the cluster label itself.
 *
 * @throws InvalidParameter if props does not have one entry per cluster
 * @throws InsufficientDataError if a cluster cannot be estimated
 */
SimulationConfig build_simulation_config(
    const std::vector<AdmissionRecord>& admissions,
    const std::vector<double>& props,
    double sigma,
    int num_servers,
    std::uint32_t seed,
    double max_time,
    const EstimatorOptions& options = EstimatorOptions()
);

/**
 * @brief Run one scenario and aggregate its tables
 */
ScenarioResult run_scenario(const Scenario& scenario);

/**
 * @brief One scenario per seed, tagged with "seed" and "num_servers"
 */
std::vector<Scenario> replicate(
    const SimulationConfig& base,
    const std::vector<std::uint32_t>& seeds,
    const Tags& tags = Tags()
);

/**
 * @brief Run independent scenarios on a pool of worker threads
 *
 * Each task owns its simulator and random source. Results keep the input
 * order. If any scenario throws, the first failure in input order is
 * rethrown once every worker has finished.
 *
 * @param num_workers Thread count; values < 1 run on the calling thread
 */
std::vector<ScenarioResult> run_scenarios(
    const std::vector<Scenario>& scenarios,
    int num_workers
);

/**
 * @brief Concatenate the tables of many scenarios
 */
ScenarioResult concatenate(const std::vector<ScenarioResult>& results);

} // namespace pathsim

#endif // PATHSIM_SCENARIO_HPP
