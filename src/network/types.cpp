#include "network/types.hpp"

namespace zgs {

namespace {

// Nodes report missing fields as absent or null
template <typename T>
T field_or(const nlohmann::json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    return it->get<T>();
}

} // namespace

namespace node {

void to_json(nlohmann::json& j, const ShardConfig& config) {
    j = nlohmann::json{{"numShard", config.num_shard}, {"shardId", config.shard_id}};
}

void from_json(const nlohmann::json& j, ShardConfig& config) {
    config.num_shard = field_or<uint64_t>(j, "numShard", 0);
    config.shard_id = field_or<uint64_t>(j, "shardId", 0);
}

void to_json(nlohmann::json& j, const ShardedNode& node) {
    j = nlohmann::json{
        {"url", node.url},
        {"config", node.config},
        {"latency", node.latency},
        {"since", node.since}
    };
}

void from_json(const nlohmann::json& j, ShardedNode& node) {
    node.url = j.at("url").get<std::string>();
    if (j.contains("config") && !j.at("config").is_null()) {
        node.config = j.at("config").get<ShardConfig>();
    }
    node.latency = field_or<int64_t>(j, "latency", 0);
    node.since = field_or<int64_t>(j, "since", 0);
}

} // namespace node

namespace network {

void from_json(const nlohmann::json& j, Transaction& tx) {
    tx.stream_ids.clear();
    if (j.contains("streamIds") && j.at("streamIds").is_array()) {
        for (const auto& id : j.at("streamIds")) {
            tx.stream_ids.push_back(id.is_string() ? id.get<std::string>() : id.dump());
        }
    }
    tx.data = field_or<std::string>(j, "data", "");
    tx.data_merkle_root = field_or<std::string>(j, "dataMerkleRoot", "");

    tx.merkle_nodes.clear();
    if (j.contains("merkleNodes") && j.at("merkleNodes").is_array()) {
        for (const auto& node : j.at("merkleNodes")) {
            if (node.is_array() && node.size() == 2) {
                tx.merkle_nodes.emplace_back(node[0].get<uint64_t>(), node[1].get<std::string>());
            } else if (node.is_object()) {
                tx.merkle_nodes.emplace_back(node.at("height").get<uint64_t>(),
                                             node.at("root").get<std::string>());
            }
        }
    }

    tx.start_entry_index = field_or<uint64_t>(j, "startEntryIndex", 0);
    tx.size = field_or<uint64_t>(j, "size", 0);
    tx.seq = field_or<uint64_t>(j, "seq", 0);
}

void from_json(const nlohmann::json& j, FileInfo& info) {
    info.tx = j.at("tx").get<Transaction>();
    info.finalized = field_or<bool>(j, "finalized", false);
    info.is_cached = field_or<bool>(j, "isCached", false);
    info.uploaded_seg_num = field_or<uint64_t>(j, "uploadedSegNum", 0);
}

void from_json(const nlohmann::json& j, NetworkProtocolVersion& version) {
    version.major = field_or<uint64_t>(j, "major", 0);
    version.minor = field_or<uint64_t>(j, "minor", 0);
    version.build = field_or<uint64_t>(j, "build", 0);
}

void from_json(const nlohmann::json& j, NetworkIdentity& identity) {
    identity.chain_id = field_or<uint64_t>(j, "chainId", 0);
    identity.flow_address = field_or<std::string>(j, "flowAddress", "");
    if (j.contains("p2pProtocolVersion")) {
        identity.p2p_protocol_version = j.at("p2pProtocolVersion").get<NetworkProtocolVersion>();
    }
}

void from_json(const nlohmann::json& j, Status& status) {
    status.connected_peers = field_or<uint64_t>(j, "connectedPeers", 0);
    status.log_sync_height = field_or<uint64_t>(j, "logSyncHeight", 0);
    status.log_sync_block = field_or<std::string>(j, "logSyncBlock", "");
    status.next_tx_seq = field_or<uint64_t>(j, "nextTxSeq", 0);
    if (j.contains("networkIdentity") && !j.at("networkIdentity").is_null()) {
        status.network_identity = j.at("networkIdentity").get<NetworkIdentity>();
    }
}

void to_json(nlohmann::json& j, const SegmentWithProof& segment) {
    nlohmann::json lemma = nlohmann::json::array();
    for (const auto& hash : segment.proof.lemma) {
        lemma.push_back(crypto::to_hex(hash));
    }
    nlohmann::json path = nlohmann::json::array();
    for (bool left : segment.proof.path) {
        path.push_back(left);
    }

    j = nlohmann::json{
        {"root", crypto::to_hex(segment.root)},
        {"data", segment.data},
        {"index", segment.index},
        {"proof", {{"lemma", lemma}, {"path", path}}},
        {"fileSize", segment.file_size}
    };
}

void from_json(const nlohmann::json& j, SegmentWithProof& segment) {
    segment.root = crypto::hash_from_hex(j.at("root").get<std::string>());
    segment.data = j.at("data").get<std::string>();
    segment.index = field_or<uint64_t>(j, "index", 0);
    segment.file_size = field_or<uint64_t>(j, "fileSize", 0);

    segment.proof = merkle::Proof{};
    const auto& proof = j.at("proof");
    for (const auto& hash : proof.at("lemma")) {
        segment.proof.lemma.push_back(crypto::hash_from_hex(hash.get<std::string>()));
    }
    for (const auto& left : proof.at("path")) {
        segment.proof.path.push_back(left.get<bool>());
    }
}

void from_json(const nlohmann::json& j, ShardedNodes& nodes) {
    nodes.trusted = field_or<std::vector<node::ShardedNode>>(j, "trusted", {});
    nodes.discovered = field_or<std::vector<node::ShardedNode>>(j, "discovered", {});
}

void from_json(const nlohmann::json& j, NodeLocation& location) {
    location.city = field_or<std::string>(j, "city", "");
    location.region = field_or<std::string>(j, "region", "");
    location.country = field_or<std::string>(j, "country", "");
    location.location = field_or<std::string>(j, "location", "");
    location.timezone = field_or<std::string>(j, "timezone", "");
}

} // namespace network
} // namespace zgs
