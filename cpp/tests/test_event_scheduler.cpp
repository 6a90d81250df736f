#include "pathsim/errors.hpp"
#include "pathsim/event_scheduler.hpp"

#include <gtest/gtest.h>

using namespace pathsim;

TEST(EventScheduler, PopsInTimeOrder) {
    EventScheduler scheduler;
    scheduler.schedule(make_arrival(3.0, 0));
    scheduler.schedule(make_arrival(1.0, 1));
    scheduler.schedule(make_completion(2.0, 0, 0, 5));

    EXPECT_EQ(scheduler.size(), 3u);
    EXPECT_DOUBLE_EQ(scheduler.peek_time(), 1.0);

    Event first = scheduler.pop_next();
    EXPECT_DOUBLE_EQ(first.time, 1.0);
    EXPECT_EQ(first.class_id, 1);
    EXPECT_DOUBLE_EQ(scheduler.now(), 1.0);

    Event second = scheduler.pop_next();
    EXPECT_EQ(second.type, EventType::SERVICE_COMPLETION);
    EXPECT_EQ(second.customer_id, 5);
    EXPECT_DOUBLE_EQ(scheduler.now(), 2.0);

    EXPECT_DOUBLE_EQ(scheduler.pop_next().time, 3.0);
    EXPECT_TRUE(scheduler.empty());
}

TEST(EventScheduler, TiesKeepInsertionOrder) {
    EventScheduler scheduler;
    scheduler.schedule(make_completion(5.0, 0, 1, 10));
    scheduler.schedule(make_arrival(5.0, 2));
    scheduler.schedule(make_completion(5.0, 0, 0, 11));
    scheduler.schedule(make_arrival(5.0, 1));

    EXPECT_EQ(scheduler.pop_next().customer_id, 10);
    EXPECT_EQ(scheduler.pop_next().class_id, 2);
    EXPECT_EQ(scheduler.pop_next().customer_id, 11);
    EXPECT_EQ(scheduler.pop_next().class_id, 1);
}

TEST(EventScheduler, EmptyScheduleThrows) {
    EventScheduler scheduler;
    EXPECT_THROW(scheduler.pop_next(), EmptySchedule);
    EXPECT_THROW(scheduler.peek_time(), EmptySchedule);

    scheduler.schedule(make_arrival(1.0, 0));
    scheduler.pop_next();
    EXPECT_THROW(scheduler.pop_next(), EmptySchedule);
}

TEST(EventScheduler, ClearResetsClock) {
    EventScheduler scheduler;
    scheduler.schedule(make_arrival(4.0, 0));
    scheduler.pop_next();
    scheduler.schedule(make_arrival(6.0, 0));
    scheduler.clear();

    EXPECT_TRUE(scheduler.empty());
    EXPECT_DOUBLE_EQ(scheduler.now(), 0.0);
}

TEST(EventScheduler, TypeNames) {
    EXPECT_STREQ(event_type_str(EventType::ARRIVAL), "arrival");
    EXPECT_STREQ(event_type_str(EventType::SERVICE_COMPLETION), "service_completion");
}
