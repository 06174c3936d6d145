#ifndef ZGS_NODE_SELECTOR_HPP
#define ZGS_NODE_SELECTOR_HPP

#include <cstdint>
#include <utility>
#include <vector>

#include "node/shard.hpp"

namespace zgs {
namespace node {

// Implicit binary trie over the shard address space. Children are
// materialized on demand and addressed by index into the arena.
class SegmentTree {
public:
    explicit SegmentTree(uint64_t expected_replica);

    // Returns true when the config adds coverage to a not yet satisfied shard
    bool insert(const ShardConfig& config);

    // Replicas covering the whole address space
    uint64_t replica() const { return nodes_[0].replica; }

private:
    struct Node {
        uint64_t num_shard;
        uint64_t replica = 0;
        uint64_t lazy_tags = 0;
        int64_t children[2] = {-1, -1};
    };

    bool insert(std::size_t index, uint64_t num_shard, uint64_t shard_id);
    void push_down(std::size_t index);

    std::vector<Node> nodes_;
    uint64_t expected_replica_;
};

// Picks the nodes, in (num_shard, shard_id) order, that together cover the
// shard space expected_replica times. Returns ({}, false) when impossible.
std::pair<std::vector<ShardedNode>, bool> select_nodes(std::vector<ShardedNode> nodes,
                                                       uint64_t expected_replica);

// True when the configs can satisfy expected_replica
bool check_replica(const std::vector<ShardConfig>& configs, uint64_t expected_replica);

} // namespace node
} // namespace zgs

#endif // ZGS_NODE_SELECTOR_HPP
