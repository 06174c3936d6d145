#ifndef ZGS_UTILS_CHANNEL_HPP
#define ZGS_UTILS_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace zgs {
namespace utils {

// Mutex guarded FIFO shared between producer and consumer threads
template <typename T>
class Channel {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    Channel() = default;
    ~Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;


    // ---- CHANNEL CONTROL METHODS ----
    // Adds an item to the back of the queue, returns false once closed
    bool produce(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Retrieves and removes the next item without blocking
    bool consume(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    // Blocks until an item arrives, returns false once closed and drained
    bool wait_consume(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    // Rejects further items and wakes all blocked consumers
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }


    // ---- QUERY METHODS ----
    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<T> queue_;
    bool closed_ = false;
};

} // namespace utils
} // namespace zgs

#endif // ZGS_UTILS_CHANNEL_HPP
