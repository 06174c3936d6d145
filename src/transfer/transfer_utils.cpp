#include "transfer/transfer_utils.hpp"
#include "file/file_utils.hpp"

#include <boost/log/trivial.hpp>
#include <cctype>

namespace zgs {
namespace transfer {

std::pair<uint64_t, uint64_t> segment_range(uint64_t start_chunk_index, uint64_t file_size) {
    uint64_t total_chunks = file::num_splits(file_size, file::DEFAULT_CHUNK_SIZE);
    uint64_t start_segment_index = start_chunk_index / file::DEFAULT_SEGMENT_MAX_CHUNKS;
    uint64_t end_chunk_index = start_chunk_index + (total_chunks > 0 ? total_chunks - 1 : 0);
    uint64_t end_segment_index = end_chunk_index / file::DEFAULT_SEGMENT_MAX_CHUNKS;
    return {start_segment_index, end_segment_index};
}

std::optional<std::vector<node::ShardConfig>> get_shard_configs(const std::vector<StorageNodePtr>& nodes) {
    std::vector<node::ShardConfig> configs;
    configs.reserve(nodes.size());
    for (const auto& client : nodes) {
        auto config = client->get_shard_config();
        if (!config || !node::is_valid_config(*config)) {
            BOOST_LOG_TRIVIAL(warning) << "Transfer: invalid shard config from " << client->url();
            return std::nullopt;
        }
        configs.push_back(*config);
    }
    return configs;
}

bool validate_root_hash(const std::string& root) {
    if (root.size() != 66 || root[0] != '0' || root[1] != 'x') {
        return false;
    }
    for (std::size_t i = 2; i < root.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(root[i]))) {
            return false;
        }
    }
    return true;
}

bool validate_replicas(uint64_t replicas) {
    return replicas >= 1;
}

} // namespace transfer
} // namespace zgs
