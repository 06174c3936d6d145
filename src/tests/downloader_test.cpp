#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <vector>
#include "transfer/downloader.hpp"
#include "transfer/uploader.hpp"
#include "test_utils.hpp"

using namespace zgs::transfer;
using zgs::file::DEFAULT_SEGMENT_SIZE;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class DownloaderTest : public ::testing::Test {
protected:
    using Provider = ::testing::NiceMock<MockProvider>;

    struct Node {
        std::shared_ptr<FakeStorageBackend> backend;
        std::shared_ptr<Provider> provider;
        zgs::node::ShardConfig config;
    };

    void SetUp() override {
        init_logging();
        out_path_ = temp_dir_.path() / "out.bin";
    }

    std::shared_ptr<Provider> add_node(uint64_t num_shard, uint64_t shard_id) {
        Node node;
        node.backend = std::make_shared<FakeStorageBackend>(num_shard, shard_id);
        node.provider = make_backed_provider(node.backend, "http://node" + std::to_string(nodes_.size()) + ":5678");
        node.config = {num_shard, shard_id};
        nodes_.push_back(node);
        return node.provider;
    }

    std::vector<StorageNodePtr> clients() const {
        std::vector<StorageNodePtr> result;
        for (const auto& node : nodes_) {
            result.push_back(std::make_shared<zgs::network::StorageNode>(node.provider));
        }
        return result;
    }

    // Places each segment on the nodes of its shard, as a finished upload leaves them
    zgs::crypto::Hash publish(const std::vector<uint8_t>& data, bool finalized = true,
                              uint64_t skip_index = std::numeric_limits<uint64_t>::max()) {
        zgs::file::MemFile file(data);
        auto tree = file.merkle_tree();
        zgs::crypto::Hash root = tree->root_hash();

        for (const auto& node : nodes_) {
            node.backend->set_file(root, 5, 0, data.size(), finalized);
            for (uint64_t i = 0; i < file.num_segments(); ++i) {
                if (i == skip_index || i % node.config.num_shard != node.config.shard_id) {
                    continue;
                }
                bool all_data_uploaded = false;
                auto segment = Uploader::get_segment(file, *tree, i, all_data_uploaded);
                node.backend->store_segment(i, zgs::crypto::base64_decode(segment->data));
                node.backend->store_segment_with_proof(i, nlohmann::json(*segment));
            }
        }
        return root;
    }

    std::vector<uint8_t> read_output() const {
        std::ifstream in(out_path_, std::ios::binary);
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    TempDir temp_dir_;
    std::filesystem::path out_path_;
    std::vector<Node> nodes_;
};

//===========================================================================
// Reassembly
//===========================================================================

TEST_F(DownloaderTest, SmallFile) {
    add_node(1, 0);
    std::vector<uint8_t> data = random_bytes(1000);
    auto root = publish(data);

    Downloader downloader(clients());
    downloader.download_file(root, out_path_);

    EXPECT_EQ(read_output(), data);
}

TEST_F(DownloaderTest, ReassemblesShardedFile) {
    add_node(2, 0);
    add_node(2, 1);
    std::vector<uint8_t> data = random_bytes(DEFAULT_SEGMENT_SIZE * 3 + 1000);
    auto root = publish(data);

    Downloader downloader(clients());
    downloader.download_file(root, out_path_);

    EXPECT_EQ(read_output(), data);
}

TEST_F(DownloaderTest, ChunkAlignedFileKeepsLastChunk) {
    add_node(1, 0);
    std::vector<uint8_t> data = random_bytes(DEFAULT_SEGMENT_SIZE + 512);
    auto root = publish(data);

    Downloader downloader(clients());
    downloader.download_file(root, out_path_);

    EXPECT_EQ(read_output(), data);
}

TEST_F(DownloaderTest, FallsBackToNextNode) {
    auto failing = add_node(1, 0);
    add_node(1, 0);
    EXPECT_CALL(*failing, request("zgs_downloadSegmentByTxSeq", _))
        .WillRepeatedly(Throw(zgs::NodeUnavailableError("http://node0:5678", "connection refused")));

    std::vector<uint8_t> data = random_bytes(DEFAULT_SEGMENT_SIZE * 2 + 10);
    auto root = publish(data);

    Downloader downloader(clients());
    downloader.download_file(root, out_path_);

    EXPECT_EQ(read_output(), data);
}

TEST_F(DownloaderTest, MissingSegmentRemovesPartialFile) {
    add_node(1, 0);
    auto root = publish(random_bytes(DEFAULT_SEGMENT_SIZE * 3), true, 1);

    Downloader downloader(clients());
    try {
        downloader.download_file(root, out_path_);
        FAIL() << "Expected DownloadError";
    }
    catch (const zgs::DownloadError& e) {
        EXPECT_EQ(std::string(e.what()), "No storage node holds segment with index 1");
    }
    EXPECT_FALSE(std::filesystem::exists(out_path_));
}

//===========================================================================
// Proof verification
//===========================================================================

TEST_F(DownloaderTest, WithProofVerifiesSegments) {
    add_node(2, 0);
    add_node(2, 1);
    std::vector<uint8_t> data = random_bytes(DEFAULT_SEGMENT_SIZE * 2 + 1000);
    auto root = publish(data);

    Downloader downloader(clients());
    downloader.download_file(root, out_path_, true);

    EXPECT_EQ(read_output(), data);
}

TEST_F(DownloaderTest, WithProofRejectsTamperedSegment) {
    add_node(1, 0);
    std::vector<uint8_t> data = random_bytes(DEFAULT_SEGMENT_SIZE * 2);
    auto root = publish(data);

    // Same proof, different bytes
    zgs::file::MemFile file(data);
    auto tree = file.merkle_tree();
    bool all_data_uploaded = false;
    auto segment = Uploader::get_segment(file, *tree, 1, all_data_uploaded);
    segment->data = zgs::crypto::base64_encode(random_bytes(DEFAULT_SEGMENT_SIZE, 7));
    nodes_[0].backend->store_segment_with_proof(1, nlohmann::json(*segment));

    Downloader downloader(clients());
    try {
        downloader.download_file(root, out_path_, true);
        FAIL() << "Expected VerificationError";
    }
    catch (const zgs::merkle::VerificationError& e) {
        EXPECT_EQ(e.error(), zgs::merkle::ProofError::CONTENT_MISMATCH);
    }
    EXPECT_FALSE(std::filesystem::exists(out_path_));
}

//===========================================================================
// Preconditions
//===========================================================================

TEST_F(DownloaderTest, ExistingPathIsRejected) {
    add_node(1, 0);
    auto root = publish(random_bytes(1000));
    {
        std::ofstream existing(out_path_);
        existing << "keep me";
    }

    Downloader downloader(clients());
    try {
        downloader.download_file(root, out_path_);
        FAIL() << "Expected DownloadError";
    }
    catch (const zgs::DownloadError& e) {
        EXPECT_EQ(std::string(e.what()), "Wrong path, provide a file path which does not exist.");
    }
    EXPECT_EQ(read_output(), (std::vector<uint8_t>{'k', 'e', 'e', 'p', ' ', 'm', 'e'}));
}

TEST_F(DownloaderTest, NotFinalizedFileIsRejected) {
    add_node(1, 0);
    auto root = publish(random_bytes(1000), false);

    Downloader downloader(clients());
    try {
        downloader.download_file(root, out_path_);
        FAIL() << "Expected DownloadError";
    }
    catch (const zgs::DownloadError& e) {
        EXPECT_EQ(std::string(e.what()), "File not finalized");
    }
    EXPECT_FALSE(std::filesystem::exists(out_path_));
}

TEST_F(DownloaderTest, UnknownFile) {
    add_node(1, 0);
    Downloader downloader(clients());

    try {
        downloader.download_file(zgs::crypto::keccak256(std::string("nothing")), out_path_);
        FAIL() << "Expected DownloadError";
    }
    catch (const zgs::DownloadError& e) {
        EXPECT_EQ(std::string(e.what()), "File not found on any storage node");
    }
}

TEST_F(DownloaderTest, QueryPrefersFinalizedInfo) {
    auto unreachable = add_node(1, 0);
    add_node(1, 0);
    add_node(1, 0);
    EXPECT_CALL(*unreachable, request("zgs_getFileInfo", _))
        .WillRepeatedly(Throw(zgs::NodeUnavailableError("http://node0:5678", "timeout")));

    zgs::crypto::Hash root = zgs::crypto::keccak256(std::string("file"));
    nodes_[1].backend->set_file(root, 1, 0, 1000, false);
    nodes_[2].backend->set_file(root, 2, 0, 1000, true);

    Downloader downloader(clients());
    zgs::network::FileInfo info = downloader.query_file(root);
    EXPECT_EQ(info.tx.seq, 2u);
    EXPECT_TRUE(info.finalized);
}

TEST_F(DownloaderTest, MalformedFileInfoMovesToNextNode) {
    auto broken = add_node(1, 0);
    add_node(1, 0);
    EXPECT_CALL(*broken, request("zgs_getFileInfo", _))
        .WillRepeatedly(Return(nlohmann::json{{"unexpected", 1}}));

    std::vector<uint8_t> data = random_bytes(1000);
    auto root = publish(data);

    Downloader downloader(clients());
    EXPECT_EQ(downloader.query_file(root).tx.seq, 5u);
    downloader.download_file(root, out_path_);
    EXPECT_EQ(read_output(), data);
}

TEST_F(DownloaderTest, MalformedFileInfoEverywhereIsNotFound) {
    auto broken = add_node(1, 0);
    EXPECT_CALL(*broken, request("zgs_getFileInfo", _))
        .WillRepeatedly(Return(nlohmann::json{{"unexpected", 1}}));

    Downloader downloader(clients());
    EXPECT_THROW(downloader.query_file(zgs::crypto::keccak256(std::string("file"))),
                 zgs::DownloadError);
}

TEST_F(DownloaderTest, CheckExist) {
    EXPECT_FALSE(Downloader::check_exist(out_path_));
    EXPECT_TRUE(Downloader::check_exist(temp_dir_.path()));
    EXPECT_TRUE(Downloader::check_exist(temp_dir_.path() / "missing" / "out.bin"));
}
