/**
 * @file estimator.cpp
 * @brief Arrival and service rate estimation
 */

#include "pathsim/estimator.hpp"
#include "pathsim/errors.hpp"
#include "pathsim/logger.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace pathsim {

namespace {

std::string class_prefix(int class_id) {
    std::ostringstream oss;
    oss << "class " << class_id << ": ";
    return oss.str();
}

void check_knob(const char* name, double value, int class_id) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream oss;
        oss << class_prefix(class_id) << name << " must be positive, got " << value;
        throw InvalidParameter(oss.str());
    }
}

} // namespace

QueueParams estimate_queue_params(
    const std::vector<AdmissionRecord>& records,
    double prop,
    double sigma,
    int class_id,
    const EstimatorOptions& options
) {
    check_knob("prop", prop, class_id);
    check_knob("sigma", sigma, class_id);

    if (records.size() < 2) {
        std::ostringstream oss;
        oss << class_prefix(class_id) << "need at least 2 records to estimate "
            << "inter-arrival times, got " << records.size();
        throw InsufficientDataError(oss.str());
    }

    // Service: shortest stay becomes the shift
    double min_los = records.front().length_of_stay;
    for (const auto& r : records) {
        min_los = std::min(min_los, r.length_of_stay);
    }

    double minimum_shift = min_los;
    if (min_los < 0.0) {
        std::ostringstream oss;
        oss << class_prefix(class_id) << "negative minimum length of stay " << min_los;
        if (options.negative_shift == NegativeShiftPolicy::REJECT) {
            throw InvalidParameter(oss.str());
        }
        log_warn("estimator", oss.str() + ", clamping shift to 0");
        minimum_shift = 0.0;
    }

    double shifted_sum = 0.0;
    for (const auto& r : records) {
        shifted_sum += r.length_of_stay - minimum_shift;
    }
    double mean_shifted = shifted_sum / records.size();
    if (mean_shifted < 0.0) {
        std::ostringstream oss;
        oss << class_prefix(class_id) << "mean length of stay " << mean_shifted
            << " is negative, service rate is undefined";
        throw InsufficientDataError(oss.str());
    }
    if (mean_shifted == 0.0) {
        throw InsufficientDataError(class_prefix(class_id) +
            "all lengths of stay are equal, service rate is undefined");
    }

    // Arrivals: gaps between chronologically sorted admissions
    std::vector<double> days;
    days.reserve(records.size());
    for (const auto& r : records) {
        days.push_back(r.admission_day);
    }
    std::sort(days.begin(), days.end());

    std::vector<double> gaps(days.size());
    std::adjacent_difference(days.begin(), days.end(), gaps.begin());
    double gap_sum = std::accumulate(gaps.begin() + 1, gaps.end(), 0.0);
    double mean_gap = gap_sum / (gaps.size() - 1);
    if (mean_gap <= 0.0) {
        throw InsufficientDataError(class_prefix(class_id) +
            "all admissions share one timestamp, arrival rate is undefined");
    }

    QueueParams params;
    params.arrival_rate = sigma / mean_gap;
    params.service_rate = 1.0 / (mean_shifted * prop);
    params.minimum_shift = minimum_shift;
    return params;
}

} // namespace pathsim
