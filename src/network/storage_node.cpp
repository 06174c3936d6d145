#include "network/storage_node.hpp"
#include "common/storage_error.hpp"

namespace zgs {
namespace network {

namespace {

// Requests method and parses its result, a result of the wrong shape is a node failure
template <typename T>
std::optional<T> optional_result(Provider& provider, const std::string& method,
                                 const nlohmann::json& params = nlohmann::json()) {
    nlohmann::json result = provider.request(method, params);
    if (result.is_null()) {
        return std::nullopt;
    }
    try {
        return result.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw NodeUnavailableError(provider.url(), "malformed " + method + " result: " + e.what());
    }
}

} // namespace

StorageNode::StorageNode(const std::string& url)
    : provider_(std::make_shared<HttpProvider>(url)) {}

StorageNode::StorageNode(std::shared_ptr<Provider> provider)
    : provider_(std::move(provider)) {}

std::optional<Status> StorageNode::get_status() {
    return optional_result<Status>(*provider_, "zgs_getStatus");
}

std::optional<node::ShardConfig> StorageNode::get_shard_config() {
    return optional_result<node::ShardConfig>(*provider_, "zgs_getShardConfig");
}

std::optional<FileInfo> StorageNode::get_file_info(const crypto::Hash& root, bool need_available) {
    return optional_result<FileInfo>(*provider_, "zgs_getFileInfo",
                                     nlohmann::json::array({crypto::to_hex(root), need_available}));
}

std::optional<FileInfo> StorageNode::get_file_info_by_tx_seq(uint64_t tx_seq) {
    return optional_result<FileInfo>(*provider_, "zgs_getFileInfoByTxSeq",
                                     nlohmann::json::array({tx_seq}));
}

nlohmann::json StorageNode::upload_segments_by_tx_seq(const std::vector<SegmentWithProof>& segments,
                                                      uint64_t tx_seq) {
    return provider_->request("zgs_uploadSegmentsByTxSeq",
                              nlohmann::json::array({nlohmann::json(segments), tx_seq}));
}

std::optional<std::string> StorageNode::download_segment_by_tx_seq(uint64_t tx_seq,
                                                                   uint64_t start_index,
                                                                   uint64_t end_index) {
    return optional_result<std::string>(*provider_, "zgs_downloadSegmentByTxSeq",
                                        nlohmann::json::array({tx_seq, start_index, end_index}));
}

std::optional<SegmentWithProof> StorageNode::download_segment_with_proof_by_tx_seq(uint64_t tx_seq,
                                                                                   uint64_t index) {
    return optional_result<SegmentWithProof>(*provider_, "zgs_downloadSegmentWithProofByTxSeq",
                                             nlohmann::json::array({tx_seq, index}));
}

} // namespace network
} // namespace zgs
