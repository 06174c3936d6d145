#ifndef ZGS_NETWORK_TYPES_HPP
#define ZGS_NETWORK_TYPES_HPP

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "merkle/merkle_tree.hpp"
#include "node/shard.hpp"

namespace zgs {

namespace node {

// ---- SHARD JSON CONVERSION ----
void to_json(nlohmann::json& j, const ShardConfig& config);
void from_json(const nlohmann::json& j, ShardConfig& config);
void to_json(nlohmann::json& j, const ShardedNode& node);
void from_json(const nlohmann::json& j, ShardedNode& node);

} // namespace node

namespace network {

// Log entry of a file as recorded by the flow contract
struct Transaction {
    std::vector<std::string> stream_ids;
    std::string data;
    std::string data_merkle_root;
    std::vector<std::pair<uint64_t, std::string>> merkle_nodes;
    uint64_t start_entry_index = 0;
    uint64_t size = 0;
    uint64_t seq = 0;
};

struct FileInfo {
    Transaction tx;
    bool finalized = false;
    bool is_cached = false;
    uint64_t uploaded_seg_num = 0;
};

struct NetworkProtocolVersion {
    uint64_t major = 0;
    uint64_t minor = 0;
    uint64_t build = 0;
};

struct NetworkIdentity {
    uint64_t chain_id = 0;
    std::string flow_address;
    NetworkProtocolVersion p2p_protocol_version;
};

struct Status {
    uint64_t connected_peers = 0;
    uint64_t log_sync_height = 0;
    std::string log_sync_block;
    uint64_t next_tx_seq = 0;
    NetworkIdentity network_identity;
};

// Unit of segment transfer
struct SegmentWithProof {
    crypto::Hash root{};
    std::string data;  // base64
    uint64_t index = 0;
    merkle::Proof proof;
    uint64_t file_size = 0;
};

struct ShardedNodes {
    std::vector<node::ShardedNode> trusted;
    std::vector<node::ShardedNode> discovered;
};

struct NodeLocation {
    std::string city;
    std::string region;
    std::string country;
    std::string location;
    std::string timezone;
};

// ---- JSON CONVERSION ----
void from_json(const nlohmann::json& j, Transaction& tx);
void from_json(const nlohmann::json& j, FileInfo& info);
void from_json(const nlohmann::json& j, NetworkProtocolVersion& version);
void from_json(const nlohmann::json& j, NetworkIdentity& identity);
void from_json(const nlohmann::json& j, Status& status);
void to_json(nlohmann::json& j, const SegmentWithProof& segment);
void from_json(const nlohmann::json& j, SegmentWithProof& segment);
void from_json(const nlohmann::json& j, ShardedNodes& nodes);
void from_json(const nlohmann::json& j, NodeLocation& location);

} // namespace network
} // namespace zgs

#endif // ZGS_NETWORK_TYPES_HPP
