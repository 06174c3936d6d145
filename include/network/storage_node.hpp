#ifndef ZGS_STORAGE_NODE_HPP
#define ZGS_STORAGE_NODE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "network/http_provider.hpp"
#include "network/types.hpp"

namespace zgs {
namespace network {

// Client of a single storage node's zgs_* JSON-RPC methods
class StorageNode {
public:
    explicit StorageNode(const std::string& url);
    explicit StorageNode(std::shared_ptr<Provider> provider);

    const std::string& url() const { return provider_->url(); }

    // ---- NODE STATE ----
    std::optional<Status> get_status();
    std::optional<node::ShardConfig> get_shard_config();

    // ---- FILE INFO ----
    std::optional<FileInfo> get_file_info(const crypto::Hash& root, bool need_available);
    std::optional<FileInfo> get_file_info_by_tx_seq(uint64_t tx_seq);

    // ---- SEGMENT TRANSFER ----
    nlohmann::json upload_segments_by_tx_seq(const std::vector<SegmentWithProof>& segments,
                                             uint64_t tx_seq);

    // Base64 data of chunks [start_index, end_index), nullopt when unavailable
    std::optional<std::string> download_segment_by_tx_seq(uint64_t tx_seq,
                                                          uint64_t start_index, uint64_t end_index);
    std::optional<SegmentWithProof> download_segment_with_proof_by_tx_seq(uint64_t tx_seq,
                                                                          uint64_t index);

private:
    std::shared_ptr<Provider> provider_;
};

} // namespace network
} // namespace zgs

#endif // ZGS_STORAGE_NODE_HPP
