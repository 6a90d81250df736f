/**
 * @file simulation.cpp
 * @brief Implementation of Discrete-Event Simulation Engine
 *
 * Patient-pathway capacity simulator.
 */

#include "pathsim/simulation.hpp"
#include "pathsim/errors.hpp"
#include "pathsim/logger.hpp"

#include <cmath>
#include <sstream>

namespace pathsim {

bool operator==(const Record& a, const Record& b) {
    return a.customer_id == b.customer_id
        && a.class_id == b.class_id
        && a.arrival_date == b.arrival_date
        && a.service_start_date == b.service_start_date
        && a.exit_date == b.exit_date
        && a.server_id == b.server_id;
}

// ============================================================================
// QueueSimulator Implementation
// ============================================================================

QueueSimulator::QueueSimulator(const SimulationConfig& config)
    : config_(config)
    , rng_(config.seed)
    , pool_(config.num_servers)
{
    // Validate configuration
    if (!std::isfinite(config_.max_time) || config_.max_time <= 0.0) {
        std::ostringstream oss;
        oss << "max_time must be positive, got " << config_.max_time;
        throw InvalidParameter(oss.str());
    }
    if (config_.classes.empty()) {
        throw InvalidParameter("at least one customer class is required");
    }
    for (std::size_t i = 0; i < config_.classes.size(); ++i) {
        int id = config_.classes[i].id;
        if (!class_index_.emplace(id, i).second) {
            std::ostringstream oss;
            oss << "duplicate customer class id " << id;
            throw InvalidParameter(oss.str());
        }
    }

    reset();
}

void QueueSimulator::reset() {
    scheduler_.clear();
    pool_.reset();

    while (!waiting_queue_.empty()) {
        waiting_queue_.pop();
    }

    customers_.clear();
    records_.clear();
    trace_.clear();

    // Reseed RNG
    rng_.seed(config_.seed);

    // One pending arrival per class
    for (const auto& cls : config_.classes) {
        schedule_arrival(cls.id);
    }
}

const CustomerClass& QueueSimulator::customer_class(int class_id) const {
    return config_.classes[class_index_.at(class_id)];
}

void QueueSimulator::schedule_arrival(int class_id) {
    double gap = customer_class(class_id).arrival.sample(rng_);
    scheduler_.schedule(make_arrival(scheduler_.now() + gap, class_id));
}

void QueueSimulator::start_service(int customer_id, int server_id) {
    Customer& customer = customers_[customer_id];
    customer.state = CustomerState::IN_SERVICE;
    customer.service_start_time = scheduler_.now();

    double service_time = customer_class(customer.class_id).service.sample(rng_);
    double completion_time = scheduler_.now() + service_time;

    scheduler_.schedule(make_completion(completion_time, customer.class_id, server_id, customer_id));
}

void QueueSimulator::process_arrival(const Event& event) {
    // Create customer record
    Customer customer;
    customer.id = static_cast<int>(customers_.size());
    customer.class_id = event.class_id;
    customer.arrival_time = scheduler_.now();
    customer.service_start_time = -1.0;
    customer.exit_time = -1.0;
    customer.state = CustomerState::ARRIVED;
    customers_.push_back(customer);

    // Each class keeps exactly one arrival pending
    schedule_arrival(event.class_id);

    int server_id = pool_.acquire(scheduler_.now());
    if (server_id >= 0) {
        start_service(customer.id, server_id);
    } else {
        customers_[customer.id].state = CustomerState::WAITING;
        waiting_queue_.push(customer.id);
    }
}

void QueueSimulator::process_completion(const Event& event) {
    int server_id = event.server_id;
    Customer& customer = customers_[event.customer_id];

    pool_.release(server_id, scheduler_.now());

    customer.exit_time = scheduler_.now();
    customer.state = CustomerState::COMPLETED;
    records_.push_back(Record{
        customer.id,
        customer.class_id,
        customer.arrival_time,
        customer.service_start_time,
        customer.exit_time,
        server_id
    });

    // Serve next customer if queue not empty; only the freed server can be idle here
    if (!waiting_queue_.empty()) {
        int next_customer = waiting_queue_.front();
        waiting_queue_.pop();
        int reassigned = pool_.acquire(scheduler_.now());
        start_service(next_customer, reassigned);
    }
}

SimulationRun QueueSimulator::run() {
    reset();

    while (!scheduler_.empty()) {
        if (scheduler_.peek_time() > config_.max_time) {
            break;
        }

        Event event = scheduler_.pop_next();

        switch (event.type) {
            case EventType::ARRIVAL:
                process_arrival(event);
                break;
            case EventType::SERVICE_COMPLETION:
                process_completion(event);
                break;
        }

        if (config_.record_trace) {
            trace_.push_back(TraceEntry{
                event.time,
                event.type,
                pool_.busy_count(),
                static_cast<int>(waiting_queue_.size())
            });
        }
    }

    pool_.close(config_.max_time);

    SimulationRun result;
    result.records = records_;
    result.servers = pool_.servers();
    result.end_time = config_.max_time;
    result.customers_arrived = static_cast<int>(customers_.size());
    result.customers_waiting = static_cast<int>(waiting_queue_.size());
    result.customers_in_service = pool_.busy_count();
    result.trace = trace_;

    if (Logger::instance().enabled(LogLevel::INFO)) {
        std::ostringstream oss;
        oss << "seed=" << config_.seed
            << " servers=" << config_.num_servers
            << " arrived=" << result.customers_arrived
            << " completed=" << result.records.size()
            << " waiting=" << result.customers_waiting
            << " in_service=" << result.customers_in_service;
        log_info("simulation", oss.str());
    }

    return result;
}

} // namespace pathsim
