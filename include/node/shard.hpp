#ifndef ZGS_NODE_SHARD_HPP
#define ZGS_NODE_SHARD_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace zgs {
namespace node {

// A node holds every segment index i with i % num_shard == shard_id
struct ShardConfig {
    uint64_t num_shard = 1;
    uint64_t shard_id = 0;
};

// Node announced by the indexer
struct ShardedNode {
    std::string url;
    ShardConfig config;
    int64_t latency = 0;
    int64_t since = 0;
};

// num_shard is a positive power of two and shard_id < num_shard
bool is_valid_config(const ShardConfig& config);

} // namespace node
} // namespace zgs

#endif // ZGS_NODE_SHARD_HPP
