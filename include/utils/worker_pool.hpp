#ifndef ZGS_UTILS_WORKER_POOL_HPP
#define ZGS_UTILS_WORKER_POOL_HPP

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

#include "utils/channel.hpp"

namespace zgs {
namespace utils {

// Fixed number of threads draining a job channel
class WorkerPool {
public:
    using Job = std::function<void()>;

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit WorkerPool(std::size_t num_workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queues a job, returns false after shutdown. Jobs must not throw.
    bool submit(Job job);

    // Runs the queued jobs to completion and joins the threads
    void shutdown();

    std::size_t num_workers() const { return workers_.size(); }

private:
    void worker_loop();

    Channel<Job> jobs_;
    std::vector<std::thread> workers_;
};

} // namespace utils
} // namespace zgs

#endif // ZGS_UTILS_WORKER_POOL_HPP
