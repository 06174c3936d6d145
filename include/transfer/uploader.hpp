#ifndef ZGS_UPLOADER_HPP
#define ZGS_UPLOADER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "common/storage_error.hpp"
#include "file/file.hpp"
#include "merkle/merkle_tree.hpp"
#include "network/types.hpp"
#include "transfer/options.hpp"
#include "transfer/submitter.hpp"
#include "transfer/transfer_utils.hpp"

namespace zgs {
namespace transfer {

// Consecutive segments of one node's shard, sent in a single request
struct UploadTask {
    std::size_t client_index = 0;
    uint64_t task_size = 0;
    // Segment index relative to the start of the file
    uint64_t seg_index = 0;
    uint64_t num_shard = 1;
    uint64_t tx_seq = 0;
};

class Uploader {
public:
    Uploader(std::vector<StorageNodePtr> nodes, std::shared_ptr<TransactionSubmitter> submitter);

    // Commits the file and uploads its segments. Throws MerkleTreeError when
    // the file has no content, otherwise UploadError carrying the partial result.
    UploadResult upload_file(const file::File& file,
                             const UploadOptions& options = UploadOptions(),
                             const RetryOptions& retry = RetryOptions());

    // Wakes any wait in progress, the upload then fails with "upload cancelled"
    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    // ---- STAGES ----
    // Polls until every node has the log entry (finalized if required).
    // Returns the last node's info, nullopt when there are no nodes.
    std::optional<network::FileInfo> wait_for_log_entry(uint64_t tx_seq, bool finality_required,
                                         std::chrono::milliseconds poll_interval);

    // Empty when some node already holds the finalized file
    std::vector<UploadTask> split_tasks(const network::FileInfo& info,
                                        const merkle::MerkleTree& tree,
                                        const UploadOptions& options);

    // ---- HELPERS ----
    // Smallest index >= start_index held by the shard
    static uint64_t next_segment_index(const node::ShardConfig& config, uint64_t start_index);

    // Round robin over per node task lists, shortest list first
    static std::vector<UploadTask> interleave_tasks(std::vector<std::vector<UploadTask>> per_node);

    // Segment with proof, nullopt past the end of the file. all_data_uploaded
    // is set when the segment is the last one of the file.
    static std::optional<network::SegmentWithProof> get_segment(const file::File& file,
                                                                const merkle::MerkleTree& tree,
                                                                uint64_t seg_index,
                                                                bool& all_data_uploaded);

private:
    void run_upload(const file::File& file, const merkle::MerkleTree& tree,
                    const UploadOptions& options, const RetryOptions& retry,
                    UploadResult& result);
    std::optional<network::FileInfo> find_existing_file_info(const crypto::Hash& root);
    void process_tasks(const file::File& file, const merkle::MerkleTree& tree,
                       const std::vector<UploadTask>& tasks, const UploadOptions& options,
                       const RetryOptions& retry);
    void upload_task(const file::File& file, const merkle::MerkleTree& tree,
                     const UploadTask& task, const RetryOptions& retry);

    // Sleeps for the duration, returns false when cancelled
    bool wait_or_cancel(std::chrono::milliseconds duration);

    std::vector<StorageNodePtr> nodes_;
    std::shared_ptr<TransactionSubmitter> submitter_;

    std::atomic<bool> cancelled_{false};
    std::mutex cancel_mutex_;
    std::condition_variable cancel_cv_;
};

} // namespace transfer
} // namespace zgs

#endif // ZGS_UPLOADER_HPP
