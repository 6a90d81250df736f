/**
 * @file estimator.hpp
 * @brief Queue parameter estimation from historical admissions
 */

#ifndef PATHSIM_ESTIMATOR_HPP
#define PATHSIM_ESTIMATOR_HPP

#include <vector>

namespace pathsim {

/**
 * @brief One historical stay
 */
struct AdmissionRecord {
    double admission_day;    // Days since 1970-01-01 (fractional)
    double length_of_stay;   // Observed sojourn in days
    int cluster;             // Class label
};

/**
 * @brief Per-class parameters driving the arrival and service distributions
 */
struct QueueParams {
    double arrival_rate;     // Arrivals per day
    double service_rate;     // Rate of the exponential part of a stay
    double minimum_shift;    // Guaranteed minimum stay in days
};

/**
 * @brief What to do when the shortest recorded stay is negative
 */
enum class NegativeShiftPolicy {
    CLAMP,    // Use a zero shift and log a warning
    REJECT    // Throw InvalidParameter
};

struct EstimatorOptions {
    NegativeShiftPolicy negative_shift;

    EstimatorOptions() : negative_shift(NegativeShiftPolicy::CLAMP) {}
};

/**
 * @brief Estimate arrival and service parameters for one class
 *
 * minimum_shift = max(0, min stay), service_rate = 1 / (mean shifted stay * prop),
 * arrival_rate = sigma / mean gap between chronologically sorted admissions.
 *
 * @param records  Historical stays of the class (any order)
 * @param prop     Service time scaling factor (> 0)
 * @param sigma    Arrival rate scaling factor (> 0)
 * @param class_id Used in error messages only
 * @throws InsufficientDataError with fewer than two records, or when the
 *         gaps or shifted stays average to zero
 * @throws InvalidParameter on a non-positive prop or sigma
 */
QueueParams estimate_queue_params(
    const std::vector<AdmissionRecord>& records,
    double prop,
    double sigma,
    int class_id,
    const EstimatorOptions& options = EstimatorOptions()
);

} // namespace pathsim

#endif // PATHSIM_ESTIMATOR_HPP
