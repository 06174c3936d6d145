#include "utils/worker_pool.hpp"

#include <boost/log/trivial.hpp>

namespace zgs {
namespace utils {

WorkerPool::WorkerPool(std::size_t num_workers) {
    if (num_workers == 0) {
        num_workers = 1;
    }
    workers_.reserve(num_workers);
    for (std::size_t i = 0; i < num_workers; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    BOOST_LOG_TRIVIAL(debug) << "Worker pool: started " << num_workers << " workers";
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Job job) {
    return jobs_.produce(std::move(job));
}

void WorkerPool::shutdown() {
    jobs_.close();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::worker_loop() {
    Job job;
    while (jobs_.wait_consume(job)) {
        job();
    }
}

} // namespace utils
} // namespace zgs
