#include "transfer/uploader.hpp"
#include "node/node_selector.hpp"
#include "utils/worker_pool.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <cctype>
#include <exception>

namespace zgs {
namespace transfer {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_already_uploaded_error(const std::string& message) {
    std::string lower = to_lower(message);
    return lower.find("already uploaded and finalized") != std::string::npos
        || (lower.find("invalid params") != std::string::npos
            && lower.find("already uploaded") != std::string::npos);
}

bool is_retryable_error(const std::string& message) {
    std::string lower = to_lower(message);
    return lower.find("too many data writing") != std::string::npos
        || lower.find("returned null for upload segments") != std::string::npos;
}

} // namespace

Uploader::Uploader(std::vector<StorageNodePtr> nodes, std::shared_ptr<TransactionSubmitter> submitter)
    : nodes_(std::move(nodes)), submitter_(std::move(submitter)) {}

void Uploader::cancel() {
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        cancelled_ = true;
    }
    cancel_cv_.notify_all();
    BOOST_LOG_TRIVIAL(info) << "Uploader: cancellation requested";
}

bool Uploader::wait_or_cancel(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(cancel_mutex_);
    return !cancel_cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}

//===========================================================================
// Upload flow
//===========================================================================

UploadResult Uploader::upload_file(const file::File& file, const UploadOptions& options,
                                   const RetryOptions& retry) {
    auto tree = file.merkle_tree();
    if (!tree) {
        throw MerkleTreeError("Failed to create Merkle tree");
    }

    UploadResult result;
    result.root_hash = crypto::to_hex(tree->root_hash());
    BOOST_LOG_TRIVIAL(info) << "Uploader: data prepared to upload root=" << result.root_hash
                            << " size=" << file.size()
                            << " numSegments=" << file.num_segments()
                            << " numChunks=" << file.num_chunks();

    try {
        run_upload(file, *tree, options, retry, result);
    }
    catch (const StorageError& e) {
        throw UploadError(e.what(), result);
    }
    return result;
}

void Uploader::run_upload(const file::File& file, const merkle::MerkleTree& tree,
                          const UploadOptions& options, const RetryOptions& retry,
                          UploadResult& result) {
    auto info = find_existing_file_info(tree.root_hash());

    if (!options.skip_tx || !info) {
        file::Submission submission = file.create_submission(options.tags);
        SubmitReceipt receipt = submitter_->submit(submission, options);
        result.tx_hash = receipt.tx_hash;
        BOOST_LOG_TRIVIAL(info) << "Uploader: transaction hash " << receipt.tx_hash;

        if (receipt.tx_seqs.empty()) {
            throw UploadError("Failed to get txSeqs", result);
        }
        BOOST_LOG_TRIVIAL(info) << "Uploader: transaction sequence number " << receipt.tx_seqs.front();

        info = wait_for_log_entry(receipt.tx_seqs.front(), false, retry.log_poll_interval);
    }

    if (!info) {
        throw UploadError("Failed to get log entry", result);
    }

    UploadOptions task_options = options;
    task_options.expected_replica = std::max<uint64_t>(options.expected_replica, 1);
    task_options.task_size = std::max<uint64_t>(options.task_size, 1);

    std::vector<UploadTask> tasks;
    try {
        tasks = split_tasks(*info, tree, task_options);
    }
    catch (const StorageError& e) {
        throw UploadError(std::string("Failed to get upload tasks: ") + e.what(), result);
    }
    if (tasks.empty()) {
        BOOST_LOG_TRIVIAL(info) << "Uploader: nothing to upload for " << result.root_hash;
        return;
    }

    BOOST_LOG_TRIVIAL(info) << "Uploader: processing " << tasks.size() << " tasks";
    try {
        process_tasks(file, tree, tasks, task_options, retry);
    }
    catch (const StorageError& e) {
        throw UploadError(e.what(), result);
    }
    BOOST_LOG_TRIVIAL(info) << "Uploader: all tasks processed";

    if (options.finality_required) {
        wait_for_log_entry(info->tx.seq, true, retry.log_poll_interval);
    }
}

std::optional<network::FileInfo> Uploader::find_existing_file_info(const crypto::Hash& root) {
    for (const auto& client : nodes_) {
        try {
            auto info = client->get_file_info(root, false);
            if (info) {
                BOOST_LOG_TRIVIAL(info) << "Uploader: found existing file info on " << client->url()
                                        << " with tx seq " << info->tx.seq;
                return info;
            }
        }
        catch (const StorageError& e) {
            BOOST_LOG_TRIVIAL(warning) << "Uploader: failed to get file info from "
                                       << client->url() << ": " << e.what();
        }
    }
    return std::nullopt;
}

std::optional<network::FileInfo> Uploader::wait_for_log_entry(uint64_t tx_seq, bool finality_required,
                                                              std::chrono::milliseconds poll_interval) {
    BOOST_LOG_TRIVIAL(info) << "Uploader: waiting for log entry " << tx_seq << " on storage nodes";

    std::optional<network::FileInfo> info;
    while (true) {
        if (!wait_or_cancel(poll_interval)) {
            throw UploadError("upload cancelled");
        }

        bool ok = true;
        for (const auto& client : nodes_) {
            try {
                info = client->get_file_info_by_tx_seq(tx_seq);
            }
            catch (const StorageError& e) {
                BOOST_LOG_TRIVIAL(warning) << "Uploader: polling " << client->url()
                                           << " failed: " << e.what();
                ok = false;
                break;
            }

            if (!info) {
                std::string message = "log entry is unavailable yet";
                try {
                    if (auto status = client->get_status()) {
                        message += ", zgsNodeSyncHeight=" + std::to_string(status->log_sync_height);
                    }
                }
                catch (const StorageError& e) {
                    message += " (status unavailable: " + std::string(e.what()) + ")";
                }
                BOOST_LOG_TRIVIAL(info) << "Uploader: " << message;
                ok = false;
                break;
            }

            if (finality_required && !info->finalized) {
                BOOST_LOG_TRIVIAL(info) << "Uploader: log entry is available on " << client->url()
                                        << " but not finalized yet";
                ok = false;
                break;
            }
        }

        if (ok) {
            return info;
        }
    }
}

//===========================================================================
// Task splitting
//===========================================================================

uint64_t Uploader::next_segment_index(const node::ShardConfig& config, uint64_t start_index) {
    if (config.num_shard < 2) {
        return start_index;
    }
    return ((start_index + config.num_shard - 1 - config.shard_id) / config.num_shard)
        * config.num_shard + config.shard_id;
}

std::vector<UploadTask> Uploader::interleave_tasks(std::vector<std::vector<UploadTask>> per_node) {
    std::stable_sort(per_node.begin(), per_node.end(),
                     [](const std::vector<UploadTask>& a, const std::vector<UploadTask>& b) {
                         return a.size() < b.size();
                     });

    std::vector<UploadTask> tasks;
    std::size_t longest = per_node.empty() ? 0 : per_node.back().size();
    for (std::size_t task_index = 0; task_index < longest; ++task_index) {
        for (const auto& node_tasks : per_node) {
            if (task_index < node_tasks.size()) {
                tasks.push_back(node_tasks[task_index]);
            }
        }
    }
    return tasks;
}

std::vector<UploadTask> Uploader::split_tasks(const network::FileInfo& info,
                                              const merkle::MerkleTree& tree,
                                              const UploadOptions& options) {
    auto shard_configs = get_shard_configs(nodes_);
    if (!shard_configs) {
        throw StorageError("failed to get shard configs");
    }
    if (!node::check_replica(*shard_configs, options.expected_replica)) {
        throw InsufficientReplicasError("selected nodes cannot provide "
                                        + std::to_string(options.expected_replica) + " replicas");
    }

    uint64_t tx_seq = info.tx.seq;
    auto [start_segment_index, end_segment_index] =
        segment_range(info.tx.start_entry_index, info.tx.size);

    for (const auto& client : nodes_) {
        auto node_info = client->get_file_info(tree.root_hash(), true);
        if (node_info && node_info->finalized) {
            BOOST_LOG_TRIVIAL(info) << "Uploader: file already finalized on " << client->url()
                                    << ", skipping upload";
            return {};
        }
    }

    std::vector<std::vector<UploadTask>> per_node;
    for (std::size_t client_index = 0; client_index < shard_configs->size(); ++client_index) {
        const node::ShardConfig& config = (*shard_configs)[client_index];

        std::vector<UploadTask> node_tasks;
        uint64_t seg_index = next_segment_index(config, start_segment_index);
        while (seg_index <= end_segment_index) {
            UploadTask task;
            task.client_index = client_index;
            task.task_size = options.task_size;
            task.seg_index = seg_index - start_segment_index;
            task.num_shard = config.num_shard;
            task.tx_seq = tx_seq;
            node_tasks.push_back(task);
            seg_index += config.num_shard * options.task_size;
        }

        if (!node_tasks.empty()) {
            per_node.push_back(std::move(node_tasks));
        }
    }

    return interleave_tasks(std::move(per_node));
}

//===========================================================================
// Segment transfer
//===========================================================================

std::optional<network::SegmentWithProof> Uploader::get_segment(const file::File& file,
                                                               const merkle::MerkleTree& tree,
                                                               uint64_t seg_index,
                                                               bool& all_data_uploaded) {
    uint64_t num_chunks = file.num_chunks();
    uint64_t start_index = seg_index * file::DEFAULT_SEGMENT_MAX_CHUNKS;
    all_data_uploaded = false;
    if (start_index >= num_chunks) {
        all_data_uploaded = true;
        return std::nullopt;
    }

    auto iter = file.iterate_with_offset_and_batch(seg_index * file::DEFAULT_SEGMENT_SIZE,
                                                   file::DEFAULT_SEGMENT_SIZE, true);
    if (!iter->next()) {
        throw FileError("no data for segment " + std::to_string(seg_index));
    }

    std::vector<uint8_t> segment = iter->current();
    if (start_index + segment.size() / file::DEFAULT_CHUNK_SIZE >= num_chunks) {
        segment.resize(file::DEFAULT_CHUNK_SIZE * (num_chunks - start_index));
        all_data_uploaded = true;
    }

    network::SegmentWithProof result;
    result.root = tree.root_hash();
    result.data = crypto::base64_encode(segment);
    result.index = seg_index;
    result.proof = tree.proof_at(seg_index);
    result.file_size = file.size();
    return result;
}

void Uploader::upload_task(const file::File& file, const merkle::MerkleTree& tree,
                           const UploadTask& task, const RetryOptions& retry) {
    std::vector<network::SegmentWithProof> segments;
    uint64_t seg_index = task.seg_index;
    for (uint64_t i = 0; i < task.task_size; ++i) {
        bool all_data_uploaded = false;
        auto segment = get_segment(file, tree, seg_index, all_data_uploaded);
        if (segment) {
            segments.push_back(std::move(*segment));
        }
        if (all_data_uploaded) {
            break;
        }
        seg_index += task.num_shard;
    }

    const StorageNodePtr& client = nodes_[task.client_index];
    uint32_t max_retries = std::max<uint32_t>(retry.too_many_data_retries, 1);

    for (uint32_t attempt = 0; attempt < max_retries; ++attempt) {
        std::string message;
        try {
            nlohmann::json response = client->upload_segments_by_tx_seq(segments, task.tx_seq);
            if (response.is_null()) {
                throw StorageError("Node " + client->url() + " returned null for upload segments");
            }
            BOOST_LOG_TRIVIAL(debug) << "Uploader: uploaded " << segments.size()
                                     << " segments from index " << task.seg_index
                                     << " to " << client->url();
            return;
        }
        catch (const StorageError& e) {
            message = e.what();
        }

        if (is_already_uploaded_error(message)) {
            BOOST_LOG_TRIVIAL(info) << "Uploader: segments already uploaded and finalized on "
                                    << client->url();
            return;
        }

        if (!is_retryable_error(message)) {
            BOOST_LOG_TRIVIAL(error) << "Uploader: non-retryable error from " << client->url()
                                     << ": " << message;
            throw UploadError(message);
        }

        if (attempt + 1 >= max_retries) {
            BOOST_LOG_TRIVIAL(error) << "Uploader: max retries (" << max_retries
                                     << ") reached for error: " << message;
            throw UploadError("Failed after " + std::to_string(max_retries) + " attempts: " + message);
        }

        auto wait_time = retry.interval * (attempt + 1);
        BOOST_LOG_TRIVIAL(warning) << "Uploader: " << message << " on attempt " << attempt + 1
                                   << "/" << max_retries << ", retrying in "
                                   << wait_time.count() << "ms";
        if (!wait_or_cancel(wait_time)) {
            throw UploadError("upload cancelled");
        }
    }
}

void Uploader::process_tasks(const file::File& file, const merkle::MerkleTree& tree,
                             const std::vector<UploadTask>& tasks, const UploadOptions& options,
                             const RetryOptions& retry) {
    std::vector<std::exception_ptr> errors(tasks.size());
    std::atomic<bool> failed{false};

    {
        utils::WorkerPool pool(std::min(std::max<std::size_t>(options.parallelism, 1), tasks.size()));
        for (std::size_t i = 0; i < tasks.size(); ++i) {
            pool.submit([this, &file, &tree, &tasks, &retry, &errors, &failed, i]() {
                if (failed.load() || cancelled_.load()) {
                    return;
                }
                try {
                    upload_task(file, tree, tasks[i], retry);
                }
                catch (...) {
                    // Handed back to the caller thread below
                    errors[i] = std::current_exception();
                    failed = true;
                }
            });
        }
        pool.shutdown();
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    if (cancelled_.load()) {
        throw UploadError("upload cancelled");
    }
}

} // namespace transfer
} // namespace zgs
