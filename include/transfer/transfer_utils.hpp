#ifndef ZGS_TRANSFER_UTILS_HPP
#define ZGS_TRANSFER_UTILS_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "network/storage_node.hpp"
#include "node/shard.hpp"

namespace zgs {
namespace transfer {

using StorageNodePtr = std::shared_ptr<network::StorageNode>;

// First and last flow segment index touched by a file
std::pair<uint64_t, uint64_t> segment_range(uint64_t start_chunk_index, uint64_t file_size);

// Shard config of every node, nullopt if any node reports none or an invalid one
std::optional<std::vector<node::ShardConfig>> get_shard_configs(const std::vector<StorageNodePtr>& nodes);

// "0x" followed by 64 hex digits
bool validate_root_hash(const std::string& root);
bool validate_replicas(uint64_t replicas);

} // namespace transfer
} // namespace zgs

#endif // ZGS_TRANSFER_UTILS_HPP
