/**
 * @file event_scheduler.hpp
 * @brief Time-ordered queue of pending simulation events
 */

#ifndef PATHSIM_EVENT_SCHEDULER_HPP
#define PATHSIM_EVENT_SCHEDULER_HPP

#include <cstdint>
#include <functional>
#include <queue>
#include <vector>

namespace pathsim {

/**
 * @brief Event types in the discrete-event simulation
 */
enum class EventType {
    ARRIVAL,
    SERVICE_COMPLETION
};

const char* event_type_str(EventType type);

/**
 * @brief Simulation event structure
 */
struct Event {
    double time;             // Scheduled time (days from start)
    EventType type;
    int class_id;            // Customer class
    int server_id;           // Server finishing service (-1 for arrivals)
    int customer_id;         // Customer being served (-1 for arrivals)
    std::uint64_t sequence;  // Insertion order, set by EventScheduler

    // Min-heap comparison: earliest time first, then earliest insertion
    bool operator>(const Event& other) const {
        if (time != other.time) {
            return time > other.time;
        }
        return sequence > other.sequence;
    }
};

Event make_arrival(double time, int class_id);
Event make_completion(double time, int class_id, int server_id, int customer_id);

/**
 * @brief Priority queue of events with FIFO tie-breaking
 *
 * Events sharing a timestamp pop in the order they were scheduled,
 * regardless of type.
 */
class EventScheduler {
public:
    EventScheduler();

    /**
     * @brief Insert an event, stamping its insertion sequence
     */
    void schedule(Event event);

    /**
     * @brief Remove the earliest event and advance now() to its time
     * @throws EmptySchedule if nothing is pending
     */
    Event pop_next();

    /**
     * @brief Time of the earliest pending event
     * @throws EmptySchedule if nothing is pending
     */
    double peek_time() const;

    bool empty() const { return queue_.empty(); }
    std::size_t size() const { return queue_.size(); }
    double now() const { return now_; }

    void clear();

private:
    std::priority_queue<Event, std::vector<Event>, std::greater<Event>> queue_;
    std::uint64_t next_sequence_;
    double now_;
};

} // namespace pathsim

#endif // PATHSIM_EVENT_SCHEDULER_HPP
