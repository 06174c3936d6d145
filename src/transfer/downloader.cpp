#include "transfer/downloader.hpp"
#include "common/storage_error.hpp"
#include "crypto/crypto_error.hpp"
#include "file/file.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <fstream>

namespace zgs {
namespace transfer {

Downloader::Downloader(std::vector<StorageNodePtr> nodes)
    : nodes_(std::move(nodes)) {}

bool Downloader::check_exist(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path dir = path.parent_path();
    if (!dir.empty() && !std::filesystem::is_directory(dir, ec)) {
        return true;
    }
    return std::filesystem::exists(path, ec);
}

network::FileInfo Downloader::query_file(const crypto::Hash& root) {
    std::optional<network::FileInfo> file_info;
    for (const auto& client : nodes_) {
        try {
            auto info = client->get_file_info(root, true);
            if (!info) {
                continue;
            }
            if (info->finalized) {
                return *info;
            }
            if (!file_info) {
                file_info = info;
            }
        }
        catch (const StorageError& e) {
            BOOST_LOG_TRIVIAL(warning) << "Downloader: failed to query " << client->url()
                                       << ": " << e.what();
        }
    }

    if (!file_info) {
        throw DownloadError("File not found on any storage node");
    }
    return *file_info;
}

void Downloader::download_file(const crypto::Hash& root, const std::filesystem::path& path,
                               bool with_proof) {
    network::FileInfo info = query_file(root);
    if (!info.finalized) {
        throw DownloadError("File not finalized");
    }

    if (check_exist(path)) {
        throw DownloadError("Wrong path, provide a file path which does not exist.");
    }

    auto configs = get_shard_configs(nodes_);
    if (!configs) {
        throw DownloadError("Failed to get shard configs");
    }
    shard_configs_ = std::move(*configs);

    std::ofstream out(path, std::ios::binary | std::ios::out);
    if (!out) {
        throw FileError("cannot create " + path.string());
    }

    try {
        download_segments(root, info, out, with_proof);
        out.close();
        if (!out) {
            throw FileError("failed to flush " + path.string());
        }
    }
    catch (const std::exception&) {
        out.close();
        std::error_code ec;
        std::filesystem::remove(path, ec);
        throw;
    }

    BOOST_LOG_TRIVIAL(info) << "Downloader: wrote " << info.tx.size << " bytes of "
                            << crypto::to_hex(root) << " to " << path.string();
}

void Downloader::download_segments(const crypto::Hash& root, const network::FileInfo& info,
                                   std::ofstream& out, bool with_proof) {
    uint64_t num_chunks = file::num_splits(info.tx.size, file::DEFAULT_CHUNK_SIZE);
    std::tie(start_segment_index_, end_segment_index_) =
        segment_range(info.tx.start_entry_index, info.tx.size);
    uint64_t num_tasks = end_segment_index_ - start_segment_index_ + 1;

    for (uint64_t task_ind = 0; task_ind < num_tasks; ++task_ind) {
        std::vector<uint8_t> segment = download_task(root, info, task_ind, num_chunks, with_proof);
        out.write(reinterpret_cast<const char*>(segment.data()),
                  static_cast<std::streamsize>(segment.size()));
        if (!out) {
            throw FileError("write failed for segment " + std::to_string(task_ind));
        }
    }
}

std::vector<uint8_t> Downloader::download_task(const crypto::Hash& root, const network::FileInfo& info,
                                               uint64_t task_ind, uint64_t num_chunks,
                                               bool with_proof) {
    uint64_t segment_index = task_ind;
    uint64_t start_index = segment_index * file::DEFAULT_SEGMENT_MAX_CHUNKS;
    uint64_t end_index = std::min(start_index + file::DEFAULT_SEGMENT_MAX_CHUNKS, num_chunks);

    for (std::size_t i = 0; i < shard_configs_.size(); ++i) {
        std::size_t node_index = (task_ind + i) % shard_configs_.size();
        const node::ShardConfig& config = shard_configs_[node_index];
        if ((start_segment_index_ + segment_index) % config.num_shard != config.shard_id) {
            continue;
        }

        const StorageNodePtr& client = nodes_[node_index];
        std::optional<std::vector<uint8_t>> segment;
        try {
            if (with_proof) {
                segment = fetch_verified(client, root, info, segment_index, num_chunks);
            } else {
                auto encoded = client->download_segment_by_tx_seq(info.tx.seq, start_index, end_index);
                if (encoded) {
                    segment = crypto::base64_decode(*encoded);
                }
            }
        }
        catch (const merkle::VerificationError&) {
            throw;
        }
        catch (const StorageError& e) {
            BOOST_LOG_TRIVIAL(warning) << "Downloader: segment " << segment_index << " from "
                                       << client->url() << " failed: " << e.what();
            continue;
        }
        catch (const crypto::EncodingError& e) {
            BOOST_LOG_TRIVIAL(warning) << "Downloader: segment " << segment_index << " from "
                                       << client->url() << " is malformed: " << e.what();
            continue;
        }

        if (!segment) {
            continue;
        }

        if (start_segment_index_ + segment_index == end_segment_index_) {
            uint64_t last_chunk_size = info.tx.size % file::DEFAULT_CHUNK_SIZE;
            if (last_chunk_size > 0) {
                uint64_t paddings = file::DEFAULT_CHUNK_SIZE - last_chunk_size;
                segment->resize(segment->size() > paddings ? segment->size() - paddings : 0);
            }
        }

        BOOST_LOG_TRIVIAL(debug) << "Downloader: segment " << segment_index << " ("
                                 << segment->size() << " bytes) from " << client->url();
        return std::move(*segment);
    }

    throw DownloadError("No storage node holds segment with index " + std::to_string(segment_index));
}

std::optional<std::vector<uint8_t>> Downloader::fetch_verified(const StorageNodePtr& client,
                                                               const crypto::Hash& root,
                                                               const network::FileInfo& info,
                                                               uint64_t segment_index,
                                                               uint64_t num_chunks) {
    auto segment = client->download_segment_with_proof_by_tx_seq(info.tx.seq, segment_index);
    if (!segment) {
        return std::nullopt;
    }

    std::vector<uint8_t> data = crypto::base64_decode(segment->data);

    // Leaves of the file tree are segment roots over the flow padded chunks
    uint64_t padded_chunks = file::compute_padded_size(num_chunks).first;
    uint64_t num_leaves = file::num_splits(padded_chunks, file::DEFAULT_SEGMENT_MAX_CHUNKS);
    uint64_t segment_chunks = std::min(file::DEFAULT_SEGMENT_MAX_CHUNKS,
                                       padded_chunks - segment_index * file::DEFAULT_SEGMENT_MAX_CHUNKS);
    uint64_t data_chunks = file::num_splits(data.size(), file::DEFAULT_CHUNK_SIZE);
    uint64_t empty_chunks = segment_chunks > data_chunks ? segment_chunks - data_chunks : 0;

    crypto::Hash segment_root = file::File::segment_root(data, empty_chunks);
    if (auto error = segment->proof.validate_hash(root, segment_root, segment_index, num_leaves)) {
        BOOST_LOG_TRIVIAL(error) << "Downloader: proof of segment " << segment_index << " from "
                                 << client->url() << " rejected: "
                                 << merkle::proof_error_to_string(*error);
        throw merkle::VerificationError(*error);
    }
    return data;
}

} // namespace transfer
} // namespace zgs
