#ifndef ZGS_INDEXER_HPP
#define ZGS_INDEXER_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "network/http_provider.hpp"
#include "network/types.hpp"
#include "transfer/downloader.hpp"
#include "transfer/uploader.hpp"

namespace zgs {
namespace transfer {

// Client of the indexer service, which tracks storage nodes and file locations
class Indexer {
public:
    using NodeFactory = std::function<StorageNodePtr(const std::string& url)>;

    explicit Indexer(const std::string& url);
    Indexer(std::shared_ptr<network::Provider> provider, NodeFactory node_factory);

    // ---- INDEXER RPC ----
    network::ShardedNodes get_sharded_nodes();
    std::map<std::string, network::NodeLocation> get_node_locations();
    std::vector<node::ShardedNode> get_file_locations(const crypto::Hash& root);

    // Trusted nodes that jointly hold expected_replica copies.
    // Throws InsufficientReplicasError when the trusted set is not enough.
    std::vector<StorageNodePtr> select_nodes(uint64_t expected_replica);

    // ---- TRANSFER ----
    UploadResult upload(const file::File& file, std::shared_ptr<TransactionSubmitter> submitter,
                        const UploadOptions& options = UploadOptions(),
                        const RetryOptions& retry = RetryOptions());

    // Locates the file, falling back to every known node, and downloads it
    void download(const crypto::Hash& root, const std::filesystem::path& path,
                  bool with_proof = false);

private:
    std::vector<StorageNodePtr> locate(const crypto::Hash& root);

    std::shared_ptr<network::Provider> provider_;
    NodeFactory node_factory_;
};

} // namespace transfer
} // namespace zgs

#endif // ZGS_INDEXER_HPP
