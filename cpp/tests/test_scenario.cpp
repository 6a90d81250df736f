#include "pathsim/errors.hpp"
#include "pathsim/scenario.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace pathsim;

namespace {

// Two clusters with regular admissions: cluster 2 every 2 days, cluster 5 every 4 days
std::vector<AdmissionRecord> sample_admissions() {
    std::vector<AdmissionRecord> admissions;
    for (int i = 0; i < 50; ++i) {
        admissions.push_back(AdmissionRecord{2.0 * i, 1.0 + (i % 3), 2});
        if (i % 2 == 0) {
            admissions.push_back(AdmissionRecord{2.0 * i + 0.5, 0.5 + (i % 4), 5});
        }
    }
    return admissions;
}

} // namespace

TEST(Scenario, GroupsByCluster) {
    auto clusters = group_by_cluster(sample_admissions());
    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters.begin()->first, 2);
    EXPECT_EQ(clusters[2].size(), 50u);
    EXPECT_EQ(clusters[5].size(), 25u);
}

TEST(Scenario, BuildsOneClassPerCluster) {
    SimulationConfig config = build_simulation_config(sample_admissions(), {1.0, 2.0}, 1.0, 3, 17, 500.0);

    EXPECT_EQ(config.num_servers, 3);
    EXPECT_EQ(config.seed, 17u);
    EXPECT_DOUBLE_EQ(config.max_time, 500.0);
    ASSERT_EQ(config.classes.size(), 2u);

    EXPECT_EQ(config.classes[0].id, 2);
    EXPECT_DOUBLE_EQ(config.classes[0].arrival.rate(), 0.5);
    EXPECT_DOUBLE_EQ(config.classes[0].service.shift(), 1.0);

    EXPECT_EQ(config.classes[1].id, 5);
    EXPECT_DOUBLE_EQ(config.classes[1].arrival.rate(), 0.25);
    EXPECT_DOUBLE_EQ(config.classes[1].service.shift(), 0.5);
    EXPECT_EQ(config.classes[1].service.kind(), Distribution::Kind::SHIFTED_EXPONENTIAL);
}

TEST(Scenario, PropsMustMatchClusters) {
    EXPECT_THROW(build_simulation_config(sample_admissions(), {1.0}, 1.0, 3, 0, 100.0),
                 InvalidParameter);
    EXPECT_THROW(build_simulation_config({}, {}, 1.0, 3, 0, 100.0), InsufficientDataError);
}

TEST(Scenario, SparseClusterIsInsufficient) {
    auto admissions = sample_admissions();
    admissions.push_back(AdmissionRecord{3.0, 2.0, 9});
    EXPECT_THROW(build_simulation_config(admissions, {1.0, 1.0, 1.0}, 1.0, 3, 0, 100.0),
                 InsufficientDataError);
}

TEST(Scenario, ReplicateTagsEachSeed) {
    SimulationConfig base = build_simulation_config(sample_admissions(), {1.0, 1.0}, 1.0, 2, 0, 200.0);
    auto scenarios = replicate(base, {3, 4, 5}, Tags{{"sigma", "1"}});

    ASSERT_EQ(scenarios.size(), 3u);
    EXPECT_EQ(scenarios[1].config.seed, 4u);
    ASSERT_EQ(scenarios[1].tags.size(), 3u);
    EXPECT_EQ(scenarios[1].tags[0], (Tag{"sigma", "1"}));
    EXPECT_EQ(scenarios[1].tags[1], (Tag{"num_servers", "2"}));
    EXPECT_EQ(scenarios[1].tags[2], (Tag{"seed", "4"}));
}

TEST(Scenario, RunScenarioProducesBothTables) {
    Scenario scenario;
    scenario.config = build_simulation_config(sample_admissions(), {1.0, 1.0}, 1.0, 2, 1, 400.0);
    scenario.tags = Tags{{"label", "base"}};

    ScenarioResult result = run_scenario(scenario);
    ASSERT_EQ(result.utilisations.size(), 2u);
    for (const auto& row : result.utilisations) {
        EXPECT_GE(row.utilisation, 0.0);
        EXPECT_LE(row.utilisation, 1.0);
        EXPECT_EQ(row.tags, scenario.tags);
    }
    EXPECT_FALSE(result.system_times.empty());
    for (const auto& row : result.system_times) {
        EXPECT_GE(row.system_time, 0.0);
    }
}

TEST(Scenario, WorkerPoolMatchesSerialRuns) {
    SimulationConfig base = build_simulation_config(sample_admissions(), {1.0, 1.0}, 1.0, 2, 0, 300.0);
    auto scenarios = replicate(base, {1, 2, 3, 4, 5, 6});

    auto serial = run_scenarios(scenarios, 1);
    auto parallel = run_scenarios(scenarios, 4);
    ASSERT_EQ(serial.size(), parallel.size());

    for (size_t i = 0; i < serial.size(); ++i) {
        ASSERT_EQ(serial[i].system_times.size(), parallel[i].system_times.size());
        for (size_t j = 0; j < serial[i].system_times.size(); ++j) {
            EXPECT_EQ(serial[i].system_times[j].system_time, parallel[i].system_times[j].system_time);
        }
        ASSERT_EQ(serial[i].utilisations.size(), parallel[i].utilisations.size());
        for (size_t j = 0; j < serial[i].utilisations.size(); ++j) {
            EXPECT_EQ(serial[i].utilisations[j].utilisation, parallel[i].utilisations[j].utilisation);
        }
    }

    ScenarioResult all = concatenate(parallel);
    EXPECT_EQ(all.utilisations.size(), 12u);
}

TEST(Scenario, WorkerPoolRethrowsFailures) {
    SimulationConfig base = build_simulation_config(sample_admissions(), {1.0, 1.0}, 1.0, 2, 0, 100.0);
    auto scenarios = replicate(base, {1, 2, 3});
    scenarios[1].config.num_servers = 0;

    EXPECT_THROW(run_scenarios(scenarios, 2), InvalidParameter);
}
