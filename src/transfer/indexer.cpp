#include "transfer/indexer.hpp"
#include "common/storage_error.hpp"
#include "node/node_selector.hpp"

#include <boost/log/trivial.hpp>
#include <algorithm>
#include <set>

namespace zgs {
namespace transfer {

namespace {

template <typename T>
T parse_result(const network::Provider& provider, const std::string& method,
               const nlohmann::json& result) {
    try {
        return result.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw NodeUnavailableError(provider.url(), "malformed " + method + " result: " + e.what());
    }
}

} // namespace

Indexer::Indexer(const std::string& url)
    : Indexer(std::make_shared<network::HttpProvider>(url),
              [](const std::string& node_url) {
                  return std::make_shared<network::StorageNode>(node_url);
              }) {}

Indexer::Indexer(std::shared_ptr<network::Provider> provider, NodeFactory node_factory)
    : provider_(std::move(provider)), node_factory_(std::move(node_factory)) {}

network::ShardedNodes Indexer::get_sharded_nodes() {
    nlohmann::json result = provider_->request("indexer_getShardedNodes");
    if (result.is_null()) {
        return {};
    }
    return parse_result<network::ShardedNodes>(*provider_, "indexer_getShardedNodes", result);
}

std::map<std::string, network::NodeLocation> Indexer::get_node_locations() {
    nlohmann::json result = provider_->request("indexer_getNodeLocations");
    std::map<std::string, network::NodeLocation> locations;
    if (!result.is_object()) {
        return locations;
    }
    for (auto it = result.begin(); it != result.end(); ++it) {
        locations[it.key()] =
            parse_result<network::NodeLocation>(*provider_, "indexer_getNodeLocations", it.value());
    }
    return locations;
}

std::vector<node::ShardedNode> Indexer::get_file_locations(const crypto::Hash& root) {
    nlohmann::json result = provider_->request("indexer_getFileLocations",
                                               nlohmann::json::array({crypto::to_hex(root)}));
    if (result.is_null()) {
        return {};
    }
    return parse_result<std::vector<node::ShardedNode>>(*provider_, "indexer_getFileLocations",
                                                        result);
}

std::vector<StorageNodePtr> Indexer::select_nodes(uint64_t expected_replica) {
    network::ShardedNodes nodes = get_sharded_nodes();
    auto [selected, ok] = node::select_nodes(nodes.trusted, expected_replica);
    if (!ok) {
        throw InsufficientReplicasError(
            "cannot select a subset from the returned nodes that meets the replication requirement");
    }

    std::vector<StorageNodePtr> clients;
    for (const auto& node : selected) {
        clients.push_back(node_factory_(node.url));
    }
    BOOST_LOG_TRIVIAL(info) << "Indexer: selected " << clients.size() << " storage nodes";
    return clients;
}

UploadResult Indexer::upload(const file::File& file, std::shared_ptr<TransactionSubmitter> submitter,
                             const UploadOptions& options, const RetryOptions& retry) {
    UploadOptions upload_options = options;
    upload_options.expected_replica = std::max<uint64_t>(options.expected_replica, 1);

    Uploader uploader(select_nodes(upload_options.expected_replica), std::move(submitter));
    return uploader.upload_file(file, upload_options, retry);
}

std::vector<StorageNodePtr> Indexer::locate(const crypto::Hash& root) {
    std::vector<node::ShardedNode> locations;
    try {
        locations = get_file_locations(root);
    }
    catch (const StorageError& e) {
        BOOST_LOG_TRIVIAL(warning) << "Indexer: file location lookup failed: " << e.what();
    }

    if (locations.empty()) {
        BOOST_LOG_TRIVIAL(info) << "Indexer: no locations for " << crypto::to_hex(root)
                                << ", falling back to all known nodes";
        network::ShardedNodes nodes = get_sharded_nodes();
        locations = nodes.trusted;
        locations.insert(locations.end(), nodes.discovered.begin(), nodes.discovered.end());
    }

    std::vector<StorageNodePtr> clients;
    std::set<std::string> seen;
    for (const auto& location : locations) {
        if (seen.insert(location.url).second) {
            clients.push_back(node_factory_(location.url));
        }
    }
    if (clients.empty()) {
        throw DownloadError("failed to get file locations");
    }
    return clients;
}

void Indexer::download(const crypto::Hash& root, const std::filesystem::path& path, bool with_proof) {
    Downloader downloader(locate(root));
    downloader.download_file(root, path, with_proof);
}

} // namespace transfer
} // namespace zgs
