/**
 * @file simulation.hpp
 * @brief Discrete-Event Simulation Engine for a multi-class care pathway queue
 *
 * Patient-pathway capacity simulator.
 * One node, one shared bank of identical servers, FCFS across all classes.
 */

#ifndef PATHSIM_SIMULATION_HPP
#define PATHSIM_SIMULATION_HPP

#include "pathsim/distributions.hpp"
#include "pathsim/event_scheduler.hpp"
#include "pathsim/server_pool.hpp"

#include <cstdint>
#include <map>
#include <queue>
#include <vector>

namespace pathsim {

/**
 * @brief Sub-population with its own arrival and service distributions
 */
struct CustomerClass {
    int id;
    Distribution arrival;    // Inter-arrival time
    Distribution service;    // Service (length of stay) time
};

enum class CustomerState {
    ARRIVED,
    WAITING,
    IN_SERVICE,
    COMPLETED
};

/**
 * @brief Patient entity tracking arrival, service start and exit
 */
struct Customer {
    int id;
    int class_id;
    double arrival_time;
    double service_start_time;
    double exit_time;
    CustomerState state;
};

/**
 * @brief Completed-customer observation
 */
struct Record {
    int customer_id;
    int class_id;
    double arrival_date;
    double service_start_date;
    double exit_date;
    int server_id;
};

bool operator==(const Record& a, const Record& b);

/**
 * @brief One processed event, kept when SimulationConfig::record_trace is set
 */
struct TraceEntry {
    double time;
    EventType type;
    int busy_servers;
    int queue_length;
};

/**
 * @brief Configuration for a simulation run
 */
struct SimulationConfig {
    int num_servers;
    double max_time;                       // Horizon in days
    std::uint32_t seed;
    std::vector<CustomerClass> classes;
    bool record_trace;

    SimulationConfig()
        : num_servers(1)
        , max_time(365.0 * 4)
        , seed(0)
        , record_trace(false) {}
};

/**
 * @brief Everything a finished run leaves behind
 */
struct SimulationRun {
    std::vector<Record> records;           // In completion order
    std::vector<Server> servers;           // Closed at end_time
    double end_time;
    int customers_arrived;
    int customers_waiting;                 // Still queued at the horizon
    int customers_in_service;              // Still in service at the horizon
    std::vector<TraceEntry> trace;
};

/**
 * @brief Discrete-Event Simulation Engine
 *
 * Implements a single-queue, multi-server model with:
 * - One Poisson arrival stream per customer class
 * - Class-specific shifted exponential service times
 * - FIFO queue discipline shared by all classes
 */
class QueueSimulator {
public:
    /**
     * @throws InvalidParameter on a non-positive server count or horizon,
     *         an empty class list or duplicate class ids
     */
    explicit QueueSimulator(const SimulationConfig& config);

    /**
     * @brief Execute one complete simulation run
     * @return Records, server counters and end-of-run state
     */
    SimulationRun run();

    /**
     * @brief Reset simulator state for a new run
     */
    void reset();

    const SimulationConfig& config() const { return config_; }

private:
    SimulationConfig config_;

    Rng rng_;

    // Simulation state
    EventScheduler scheduler_;
    ServerPool pool_;
    std::queue<int> waiting_queue_;  // Customer IDs waiting for service
    std::vector<Customer> customers_;
    std::vector<Record> records_;
    std::vector<TraceEntry> trace_;
    std::map<int, std::size_t> class_index_;  // Class id -> position in config_.classes

    const CustomerClass& customer_class(int class_id) const;

    void schedule_arrival(int class_id);
    void process_arrival(const Event& event);
    void process_completion(const Event& event);
    void start_service(int customer_id, int server_id);
};

} // namespace pathsim

#endif // PATHSIM_SIMULATION_HPP
