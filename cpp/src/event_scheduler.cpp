/**
 * @file event_scheduler.cpp
 * @brief Event heap with stable ordering
 */

#include "pathsim/event_scheduler.hpp"
#include "pathsim/errors.hpp"

namespace pathsim {

const char* event_type_str(EventType type) {
    switch (type) {
        case EventType::ARRIVAL: return "arrival";
        case EventType::SERVICE_COMPLETION: return "service_completion";
    }
    return "unknown";
}

Event make_arrival(double time, int class_id) {
    return Event{time, EventType::ARRIVAL, class_id, -1, -1, 0};
}

Event make_completion(double time, int class_id, int server_id, int customer_id) {
    return Event{time, EventType::SERVICE_COMPLETION, class_id, server_id, customer_id, 0};
}

EventScheduler::EventScheduler()
    : next_sequence_(0)
    , now_(0.0)
{
}

void EventScheduler::schedule(Event event) {
    event.sequence = next_sequence_++;
    queue_.push(event);
}

Event EventScheduler::pop_next() {
    if (queue_.empty()) {
        throw EmptySchedule();
    }
    Event event = queue_.top();
    queue_.pop();
    now_ = event.time;
    return event;
}

double EventScheduler::peek_time() const {
    if (queue_.empty()) {
        throw EmptySchedule();
    }
    return queue_.top().time;
}

void EventScheduler::clear() {
    while (!queue_.empty()) {
        queue_.pop();
    }
    next_sequence_ = 0;
    now_ = 0.0;
}

} // namespace pathsim
