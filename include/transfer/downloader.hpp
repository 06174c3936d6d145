#ifndef ZGS_DOWNLOADER_HPP
#define ZGS_DOWNLOADER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>

#include "network/types.hpp"
#include "transfer/transfer_utils.hpp"

namespace zgs {
namespace transfer {

class Downloader {
public:
    explicit Downloader(std::vector<StorageNodePtr> nodes);

    // Fetches every segment of the file in order and writes it to path, which
    // must not exist yet. With with_proof each segment is checked against the
    // root. Throws DownloadError or VerificationError, removing partial output.
    void download_file(const crypto::Hash& root, const std::filesystem::path& path,
                       bool with_proof = false);

    // Finalized info when any node has it, else the first info found
    network::FileInfo query_file(const crypto::Hash& root);

    // True when path exists or its directory does not
    static bool check_exist(const std::filesystem::path& path);

private:
    void download_segments(const crypto::Hash& root, const network::FileInfo& info,
                           std::ofstream& out, bool with_proof);
    std::vector<uint8_t> download_task(const crypto::Hash& root, const network::FileInfo& info,
                                       uint64_t task_ind, uint64_t num_chunks, bool with_proof);
    std::optional<std::vector<uint8_t>> fetch_verified(const StorageNodePtr& client,
                                                       const crypto::Hash& root,
                                                       const network::FileInfo& info,
                                                       uint64_t segment_index,
                                                       uint64_t num_chunks);

    std::vector<StorageNodePtr> nodes_;
    std::vector<node::ShardConfig> shard_configs_;
    uint64_t start_segment_index_ = 0;
    uint64_t end_segment_index_ = 0;
};

} // namespace transfer
} // namespace zgs

#endif // ZGS_DOWNLOADER_HPP
