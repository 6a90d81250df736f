#include "pathsim/statistics.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace pathsim;

namespace {

Record record_at(int id, double arrival, double exit) {
    return Record{id, 0, arrival, arrival, exit, 0};
}

} // namespace

TEST(SystemTimeTable, KeepsOnlyTheCentralHalf) {
    std::vector<Record> records = {
        record_at(0, 10.0, 15.0),
        record_at(1, 100.0, 104.0),
        record_at(2, 200.0, 203.5),
        record_at(3, 300.0, 301.0),
    };

    auto rows = system_time_table(records, 400.0);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(rows[0].system_time, 3.5);
}

TEST(SystemTimeTable, BroadcastsTags) {
    std::vector<Record> records = {
        record_at(0, 30.0, 31.0),
        record_at(1, 50.0, 52.0),
    };
    Tags tags = {{"num_servers", "3"}, {"seed", "9"}};

    auto rows = system_time_table(records, 100.0, tags);
    ASSERT_EQ(rows.size(), 2u);
    for (const auto& row : rows) {
        EXPECT_EQ(row.tags, tags);
    }
    EXPECT_DOUBLE_EQ(rows[1].system_time, 2.0);
}

TEST(UtilisationTable, OneRowPerServer) {
    SimulationRun run;
    run.end_time = 10.0;
    run.servers = {
        Server{0, false, 0.0, 4.0, 10.0},
        Server{1, true, 8.0, 10.0, 10.0},
        Server{2, false, 0.0, 0.0, 10.0},
    };

    auto rows = utilisation_table(run, Tags{{"scenario", "base"}});
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].server_id, 0);
    EXPECT_DOUBLE_EQ(rows[0].utilisation, 0.4);
    EXPECT_DOUBLE_EQ(rows[1].utilisation, 1.0);
    EXPECT_DOUBLE_EQ(rows[2].utilisation, 0.0);
    EXPECT_EQ(rows[2].tags.front().second, "base");
}

TEST(Summary, MeanAndPercentile) {
    std::vector<SystemTimeRow> rows;
    for (int i = 1; i <= 10; ++i) {
        rows.push_back(SystemTimeRow{static_cast<double>(i), Tags()});
    }
    SystemTimeSummary summary = summarise(rows);
    EXPECT_EQ(summary.count, 10);
    EXPECT_DOUBLE_EQ(summary.mean, 5.5);
    EXPECT_DOUBLE_EQ(summary.p90, 10.0);

    SystemTimeSummary empty = summarise({});
    EXPECT_EQ(empty.count, 0);
    EXPECT_DOUBLE_EQ(empty.mean, 0.0);
}

TEST(Csv, HeadersIncludeTags) {
    Tags tags = {{"seed", "4"}};
    std::vector<UtilisationRow> util = {{0, 0.5, tags}, {1, 0.25, tags}};
    std::vector<SystemTimeRow> times = {{2.5, tags}};

    EXPECT_EQ(utilisations_to_csv(util), "server_id,utilisation,seed\n0,0.5,4\n1,0.25,4\n");
    EXPECT_EQ(system_times_to_csv(times), "system_time,seed\n2.5,4\n");
    EXPECT_EQ(system_times_to_csv({}), "system_time\n");
}
