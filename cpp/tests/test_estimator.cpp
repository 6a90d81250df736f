#include "pathsim/errors.hpp"
#include "pathsim/estimator.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace pathsim;

namespace {

std::vector<AdmissionRecord> make_records(const std::vector<double>& days,
                                          const std::vector<double>& stays,
                                          int cluster = 0) {
    std::vector<AdmissionRecord> records;
    for (size_t i = 0; i < days.size(); ++i) {
        records.push_back(AdmissionRecord{days[i], stays[i], cluster});
    }
    return records;
}

} // namespace

TEST(Estimator, WorkedExample) {
    auto params = estimate_queue_params(make_records({0, 2, 4}, {1, 3, 5}), 1.0, 1.0, 0);
    EXPECT_DOUBLE_EQ(params.minimum_shift, 1.0);
    EXPECT_DOUBLE_EQ(params.service_rate, 0.5);
    EXPECT_DOUBLE_EQ(params.arrival_rate, 0.5);
}

TEST(Estimator, AdmissionOrderDoesNotMatter) {
    auto params = estimate_queue_params(make_records({4, 0, 2}, {5, 1, 3}), 1.0, 1.0, 0);
    EXPECT_DOUBLE_EQ(params.arrival_rate, 0.5);
    EXPECT_DOUBLE_EQ(params.service_rate, 0.5);
}

TEST(Estimator, ScalingKnobs) {
    auto params = estimate_queue_params(make_records({0, 2, 4}, {1, 3, 5}), 2.0, 3.0, 0);
    EXPECT_DOUBLE_EQ(params.service_rate, 0.25);   // 1 / (2 * 2)
    EXPECT_DOUBLE_EQ(params.arrival_rate, 1.5);    // 3 / 2
    EXPECT_DOUBLE_EQ(params.minimum_shift, 1.0);
}

TEST(Estimator, FractionalDays) {
    auto params = estimate_queue_params(make_records({10.0, 10.5, 11.5}, {2, 2.5, 4}), 1.0, 1.0, 0);
    EXPECT_DOUBLE_EQ(params.arrival_rate, 1.0 / 0.75);
    EXPECT_DOUBLE_EQ(params.minimum_shift, 2.0);
    EXPECT_DOUBLE_EQ(params.service_rate, 1.0 / (2.5 / 3.0));
}

TEST(Estimator, NegativeStayIsClampedByDefault) {
    auto params = estimate_queue_params(make_records({0, 1, 2}, {-1, 1, 3}), 1.0, 1.0, 0);
    EXPECT_DOUBLE_EQ(params.minimum_shift, 0.0);
    EXPECT_DOUBLE_EQ(params.service_rate, 1.0);    // mean of {-1, 1, 3}
}

TEST(Estimator, NegativeStayCanBeRejected) {
    EstimatorOptions options;
    options.negative_shift = NegativeShiftPolicy::REJECT;
    EXPECT_THROW(estimate_queue_params(make_records({0, 1, 2}, {-1, 1, 3}), 1.0, 1.0, 4, options),
                 InvalidParameter);
}

TEST(Estimator, SingleRecordIsInsufficient) {
    try {
        estimate_queue_params(make_records({0}, {1}), 1.0, 1.0, 3);
        FAIL() << "expected InsufficientDataError";
    } catch (const InsufficientDataError& e) {
        EXPECT_NE(std::string(e.what()).find("class 3"), std::string::npos);
    }
    EXPECT_THROW(estimate_queue_params({}, 1.0, 1.0, 0), InsufficientDataError);
}

TEST(Estimator, DegenerateDataIsInsufficient) {
    EXPECT_THROW(estimate_queue_params(make_records({5, 5, 5}, {1, 2, 3}), 1.0, 1.0, 0),
                 InsufficientDataError);
    EXPECT_THROW(estimate_queue_params(make_records({0, 1, 2}, {2, 2, 2}), 1.0, 1.0, 0),
                 InsufficientDataError);
}

TEST(Estimator, NegativeMeanStayAfterClampIsReported) {
    try {
        estimate_queue_params(make_records({0, 1}, {-3, 1}), 1.0, 1.0, 2);
        FAIL() << "expected InsufficientDataError";
    } catch (const InsufficientDataError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("class 2"), std::string::npos);
        EXPECT_NE(what.find("negative"), std::string::npos);
        EXPECT_EQ(what.find("equal"), std::string::npos);
    }
}

TEST(Estimator, RejectsBadKnobs) {
    auto records = make_records({0, 2, 4}, {1, 3, 5});
    try {
        estimate_queue_params(records, 0.0, 1.0, 1);
        FAIL() << "expected InvalidParameter";
    } catch (const InvalidParameter& e) {
        EXPECT_NE(std::string(e.what()).find("prop"), std::string::npos);
    }
    EXPECT_THROW(estimate_queue_params(records, 1.0, -1.0, 1), InvalidParameter);
}
