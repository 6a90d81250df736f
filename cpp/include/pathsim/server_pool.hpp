/**
 * @file server_pool.hpp
 * @brief Fixed bank of identical servers shared by all customer classes
 */

#ifndef PATHSIM_SERVER_POOL_HPP
#define PATHSIM_SERVER_POOL_HPP

#include <vector>

namespace pathsim {

/**
 * @brief Server resource with busy-time accounting
 */
struct Server {
    int id;
    bool is_busy;
    double assigned_at;     // Start of the current service episode
    double busy_time;       // Completed busy time so far
    double observed_time;   // Set by ServerPool::close()
};

/**
 * @brief Server bank; servers are available from time 0
 */
class ServerPool {
public:
    /**
     * @throws InvalidParameter if num_servers <= 0
     */
    explicit ServerPool(int num_servers);

    /**
     * @brief Take the lowest-numbered idle server
     * @return Server id, or -1 if every server is busy
     */
    int acquire(double at_time);

    /**
     * @brief Return a busy server to the pool and credit its busy time
     * @throws InvalidRelease if the server is unknown or idle
     */
    void release(int server_id, double at_time);

    /**
     * @brief End the observation period at end_time
     *
     * Servers still in service are credited up to end_time; each server's
     * observed time becomes the whole run length.
     */
    void close(double end_time);

    /**
     * @brief busy_time / observed_time, 0 before close() or for an empty run
     */
    double utilisation(int server_id) const;

    int size() const { return static_cast<int>(servers_.size()); }
    int busy_count() const { return busy_count_; }
    const std::vector<Server>& servers() const { return servers_; }

    void reset();

private:
    std::vector<Server> servers_;
    int busy_count_;
    double start_time_;
};

} // namespace pathsim

#endif // PATHSIM_SERVER_POOL_HPP
