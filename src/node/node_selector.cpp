#include "node/node_selector.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>

namespace zgs {
namespace node {

bool is_valid_config(const ShardConfig& config) {
    return config.num_shard > 0
        && (config.num_shard & (config.num_shard - 1)) == 0
        && config.shard_id < config.num_shard;
}

//===========================================================================
// SegmentTree
//===========================================================================

SegmentTree::SegmentTree(uint64_t expected_replica)
    : expected_replica_(expected_replica) {
    nodes_.push_back(Node{1});
}

bool SegmentTree::insert(const ShardConfig& config) {
    return insert(0, config.num_shard, config.shard_id);
}

void SegmentTree::push_down(std::size_t index) {
    if (nodes_[index].children[0] < 0) {
        uint64_t child_shard = nodes_[index].num_shard << 1;
        for (int i = 0; i < 2; ++i) {
            nodes_.push_back(Node{child_shard});
            nodes_[index].children[i] = static_cast<int64_t>(nodes_.size() - 1);
        }
    }

    uint64_t lazy = nodes_[index].lazy_tags;
    for (int64_t child : nodes_[index].children) {
        nodes_[child].replica += lazy;
        nodes_[child].lazy_tags += lazy;
    }
    nodes_[index].lazy_tags = 0;
}

bool SegmentTree::insert(std::size_t index, uint64_t num_shard, uint64_t shard_id) {
    if (nodes_[index].replica >= expected_replica_) {
        return false;
    }

    if (nodes_[index].num_shard == num_shard) {
        nodes_[index].replica += 1;
        nodes_[index].lazy_tags += 1;
        return true;
    }

    push_down(index);

    // push_down may grow the arena, so read the children afterwards
    std::size_t child = static_cast<std::size_t>(nodes_[index].children[shard_id % 2]);
    bool inserted = insert(child, num_shard, shard_id >> 1);

    const Node& left = nodes_[nodes_[index].children[0]];
    const Node& right = nodes_[nodes_[index].children[1]];
    nodes_[index].replica = std::min(left.replica, right.replica);
    return inserted;
}

//===========================================================================
// Selection
//===========================================================================

std::pair<std::vector<ShardedNode>, bool> select_nodes(std::vector<ShardedNode> nodes,
                                                       uint64_t expected_replica) {
    if (expected_replica == 0) {
        return {{}, false};
    }

    std::stable_sort(nodes.begin(), nodes.end(), [](const ShardedNode& a, const ShardedNode& b) {
        if (a.config.num_shard != b.config.num_shard) {
            return a.config.num_shard < b.config.num_shard;
        }
        return a.config.shard_id < b.config.shard_id;
    });

    SegmentTree tree(expected_replica);
    std::vector<ShardedNode> selected;
    for (const auto& node : nodes) {
        if (!is_valid_config(node.config)) {
            BOOST_LOG_TRIVIAL(warning) << "Node selector: skipping " << node.url
                                       << " with invalid shard config " << node.config.shard_id
                                       << "/" << node.config.num_shard;
            continue;
        }
        if (tree.insert(node.config)) {
            selected.push_back(node);
        }
        if (tree.replica() >= expected_replica) {
            BOOST_LOG_TRIVIAL(debug) << "Node selector: selected " << selected.size()
                                     << " of " << nodes.size() << " nodes for "
                                     << expected_replica << " replicas";
            return {selected, true};
        }
    }

    BOOST_LOG_TRIVIAL(debug) << "Node selector: " << nodes.size()
                             << " nodes cannot provide " << expected_replica << " replicas";
    return {{}, false};
}

bool check_replica(const std::vector<ShardConfig>& configs, uint64_t expected_replica) {
    std::vector<ShardedNode> nodes;
    nodes.reserve(configs.size());
    for (const auto& config : configs) {
        ShardedNode node;
        node.config = config;
        nodes.push_back(node);
    }
    return select_nodes(std::move(nodes), expected_replica).second;
}

} // namespace node
} // namespace zgs
