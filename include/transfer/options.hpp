#ifndef ZGS_TRANSFER_OPTIONS_HPP
#define ZGS_TRANSFER_OPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace zgs {
namespace transfer {

struct UploadOptions {
    std::vector<uint8_t> tags;
    bool finality_required = true;
    // Segments per upload request
    uint64_t task_size = 10;
    uint64_t expected_replica = 1;
    // Reuse an existing log entry instead of submitting a new transaction
    bool skip_tx = false;
    // Worker threads for segment upload tasks
    std::size_t parallelism = 4;
};

struct RetryOptions {
    // Attempts per task for transient node errors
    uint32_t too_many_data_retries = 3;
    // Backoff base, attempt n waits interval * n
    std::chrono::milliseconds interval{3000};
    // Period of the log entry poll
    std::chrono::milliseconds log_poll_interval{1000};
};

} // namespace transfer
} // namespace zgs

#endif // ZGS_TRANSFER_OPTIONS_HPP
