/**
 * @file server_pool.cpp
 * @brief Server acquisition, release and utilisation
 */

#include "pathsim/server_pool.hpp"
#include "pathsim/errors.hpp"

#include <sstream>

namespace pathsim {

ServerPool::ServerPool(int num_servers)
    : busy_count_(0)
    , start_time_(0.0)
{
    if (num_servers <= 0) {
        std::ostringstream oss;
        oss << "num_servers must be positive, got " << num_servers;
        throw InvalidParameter(oss.str());
    }
    servers_.resize(num_servers);
    reset();
}

void ServerPool::reset() {
    for (int i = 0; i < size(); ++i) {
        servers_[i] = Server{i, false, 0.0, 0.0, 0.0};
    }
    busy_count_ = 0;
    start_time_ = 0.0;
}

int ServerPool::acquire(double at_time) {
    for (auto& server : servers_) {
        if (!server.is_busy) {
            server.is_busy = true;
            server.assigned_at = at_time;
            ++busy_count_;
            return server.id;
        }
    }
    return -1;  // No free server
}

void ServerPool::release(int server_id, double at_time) {
    if (server_id < 0 || server_id >= size()) {
        std::ostringstream oss;
        oss << "release of unknown server " << server_id;
        throw InvalidRelease(oss.str());
    }
    Server& server = servers_[server_id];
    if (!server.is_busy) {
        std::ostringstream oss;
        oss << "release of idle server " << server_id << " at t=" << at_time;
        throw InvalidRelease(oss.str());
    }
    server.busy_time += at_time - server.assigned_at;
    server.is_busy = false;
    --busy_count_;
}

void ServerPool::close(double end_time) {
    for (auto& server : servers_) {
        if (server.is_busy && end_time > server.assigned_at) {
            server.busy_time += end_time - server.assigned_at;
            server.assigned_at = end_time;
        }
        server.observed_time = end_time - start_time_;
    }
}

double ServerPool::utilisation(int server_id) const {
    const Server& server = servers_.at(server_id);
    if (server.observed_time <= 0.0) {
        return 0.0;
    }
    return server.busy_time / server.observed_time;
}

} // namespace pathsim
