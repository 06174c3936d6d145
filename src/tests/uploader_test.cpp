#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "transfer/uploader.hpp"
#include "test_utils.hpp"

using namespace zgs::transfer;
using zgs::file::DEFAULT_SEGMENT_SIZE;
using zgs::UploadResult;
using ::testing::_;
using ::testing::DoDefault;
using ::testing::Return;
using ::testing::Throw;

class UploaderTest : public ::testing::Test {
protected:
    using Provider = ::testing::NiceMock<MockProvider>;

    void SetUp() override {
        init_logging();
        retry_.too_many_data_retries = 3;
        retry_.interval = std::chrono::milliseconds(1);
        retry_.log_poll_interval = std::chrono::milliseconds(1);
    }

    // Adds a fake storage node with the given shard
    std::shared_ptr<Provider> add_node(uint64_t num_shard, uint64_t shard_id) {
        auto backend = std::make_shared<FakeStorageBackend>(num_shard, shard_id);
        std::string url = "http://node" + std::to_string(backends_.size()) + ":5678";
        auto provider = make_backed_provider(backend, url);
        backends_.push_back(backend);
        nodes_.push_back(std::make_shared<zgs::network::StorageNode>(provider));
        return provider;
    }

    std::shared_ptr<FakeSubmitter> make_submitter(const zgs::file::File& file) {
        return std::make_shared<FakeSubmitter>(backends_, file.merkle_tree()->root_hash());
    }

    UploadOptions options(uint64_t task_size = 1) {
        UploadOptions opts;
        opts.task_size = task_size;
        opts.parallelism = 2;
        return opts;
    }

    // Concatenation of what a backend received, in segment order
    static std::vector<uint8_t> joined(const FakeStorageBackend& backend) {
        std::vector<uint8_t> out;
        for (const auto& [index, data] : backend.segments()) {
            out.insert(out.end(), data.begin(), data.end());
        }
        return out;
    }

    std::vector<std::shared_ptr<FakeStorageBackend>> backends_;
    std::vector<StorageNodePtr> nodes_;
    RetryOptions retry_;
};

//===========================================================================
// Full flow
//===========================================================================

TEST_F(UploaderTest, UploadsEverySegmentToSingleNode) {
    add_node(1, 0);
    std::vector<uint8_t> data = random_bytes(DEFAULT_SEGMENT_SIZE * 2 + 1000);
    zgs::file::MemFile file(data);
    auto submitter = make_submitter(file);

    Uploader uploader(nodes_, submitter);
    UploadResult result = uploader.upload_file(file, options(2), retry_);

    EXPECT_EQ(result.tx_hash, "0xabc");
    EXPECT_EQ(result.root_hash, zgs::crypto::to_hex(file.merkle_tree()->root_hash()));
    ASSERT_EQ(submitter->submissions().size(), 1u);
    EXPECT_EQ(submitter->submissions()[0].length, data.size());

    auto segments = backends_[0]->segments();
    ASSERT_EQ(segments.size(), 3u);
    // Last segment is cut at the chunk boundary
    EXPECT_EQ(segments[2].size(), 1024u);

    std::vector<uint8_t> received = joined(*backends_[0]);
    ASSERT_GE(received.size(), data.size());
    EXPECT_TRUE(std::equal(data.begin(), data.end(), received.begin()));
}

TEST_F(UploaderTest, UploadedProofsMatchSegmentIndex) {
    add_node(1, 0);
    zgs::file::MemFile file(random_bytes(DEFAULT_SEGMENT_SIZE * 3));

    Uploader uploader(nodes_, make_submitter(file));
    uploader.upload_file(file, options(), retry_);

    auto root = file.merkle_tree()->root_hash();
    for (const auto& [index, json] : backends_[0]->uploaded_segments()) {
        auto segment = json.get<zgs::network::SegmentWithProof>();
        EXPECT_EQ(segment.root, root);
        EXPECT_EQ(segment.file_size, DEFAULT_SEGMENT_SIZE * 3);
        EXPECT_EQ(segment.proof.calculate_proof_position(3), index);
        auto data = zgs::crypto::base64_decode(segment.data);
        EXPECT_EQ(segment.proof.validate_hash(root, zgs::file::File::segment_root(data), index, 3),
                  std::nullopt);
    }
}

TEST_F(UploaderTest, ShardedNodesReceiveTheirSegments) {
    add_node(2, 0);
    add_node(2, 1);
    zgs::file::MemFile file(random_bytes(DEFAULT_SEGMENT_SIZE * 4 + 10));

    Uploader uploader(nodes_, make_submitter(file));
    uploader.upload_file(file, options(), retry_);

    auto even = backends_[0]->uploaded_indices();
    auto odd = backends_[1]->uploaded_indices();
    std::sort(even.begin(), even.end());
    std::sort(odd.begin(), odd.end());
    EXPECT_EQ(even, (std::vector<uint64_t>{0, 2, 4}));
    EXPECT_EQ(odd, (std::vector<uint64_t>{1, 3}));
}

TEST_F(UploaderTest, ShardFollowsFlowPosition) {
    add_node(2, 0);
    add_node(2, 1);
    zgs::file::MemFile file(random_bytes(DEFAULT_SEGMENT_SIZE * 2));
    // Entry starts at flow segment 3, so file segment 0 belongs to shard 1
    auto submitter = std::make_shared<FakeSubmitter>(backends_, file.merkle_tree()->root_hash(),
                                                     9, 3 * 1024);

    Uploader uploader(nodes_, submitter);
    uploader.upload_file(file, options(), retry_);

    EXPECT_EQ(backends_[0]->uploaded_indices(), std::vector<uint64_t>{1});
    EXPECT_EQ(backends_[1]->uploaded_indices(), std::vector<uint64_t>{0});
}

TEST_F(UploaderTest, SkipTxReusesExistingEntry) {
    add_node(1, 0);
    zgs::file::MemFile file(random_bytes(5000));
    auto submitter = make_submitter(file);
    backends_[0]->set_file(file.merkle_tree()->root_hash(), 4, 0, file.size(), false);

    UploadOptions opts = options();
    opts.skip_tx = true;
    Uploader uploader(nodes_, submitter);
    UploadResult result = uploader.upload_file(file, opts, retry_);

    EXPECT_TRUE(submitter->submissions().empty());
    EXPECT_TRUE(result.tx_hash.empty());
    EXPECT_EQ(backends_[0]->uploaded_indices(), std::vector<uint64_t>{0});
}

TEST_F(UploaderTest, FinalizedFileIsNotUploadedAgain) {
    add_node(1, 0);
    zgs::file::MemFile file(random_bytes(5000));
    backends_[0]->set_file(file.merkle_tree()->root_hash(), 4, 0, file.size(), true);

    UploadOptions opts = options();
    opts.skip_tx = true;
    Uploader uploader(nodes_, make_submitter(file));
    uploader.upload_file(file, opts, retry_);

    EXPECT_TRUE(backends_[0]->uploaded_indices().empty());
}

//===========================================================================
// Failures and retries
//===========================================================================

TEST_F(UploaderTest, RetriesTooManyDataWriting) {
    auto provider = add_node(1, 0);
    EXPECT_CALL(*provider, request("zgs_uploadSegmentsByTxSeq", _))
        .WillOnce(Throw(zgs::RpcError("too many data writing", -32000)))
        .WillRepeatedly(DoDefault());

    zgs::file::MemFile file(random_bytes(5000));
    Uploader uploader(nodes_, make_submitter(file));
    EXPECT_NO_THROW(uploader.upload_file(file, options(), retry_));
    EXPECT_EQ(backends_[0]->uploaded_indices(), std::vector<uint64_t>{0});
}

TEST_F(UploaderTest, GivesUpAfterMaxRetries) {
    auto provider = add_node(1, 0);
    EXPECT_CALL(*provider, request("zgs_uploadSegmentsByTxSeq", _))
        .Times(2)
        .WillRepeatedly(Throw(zgs::RpcError("too many data writing", -32000)));

    zgs::file::MemFile file(random_bytes(5000));
    Uploader uploader(nodes_, make_submitter(file));
    retry_.too_many_data_retries = 2;

    try {
        uploader.upload_file(file, options(), retry_);
        FAIL() << "Expected UploadError";
    }
    catch (const zgs::UploadError& e) {
        EXPECT_NE(std::string(e.what()).find("Failed after 2 attempts"), std::string::npos);
        EXPECT_EQ(e.partial_result().tx_hash, "0xabc");
    }
}

TEST_F(UploaderTest, NonRetryableErrorFailsImmediately) {
    auto provider = add_node(1, 0);
    EXPECT_CALL(*provider, request("zgs_uploadSegmentsByTxSeq", _))
        .Times(1)
        .WillOnce(Throw(zgs::RpcError("segment proof invalid", -32000)));

    zgs::file::MemFile file(random_bytes(5000));
    Uploader uploader(nodes_, make_submitter(file));

    try {
        uploader.upload_file(file, options(), retry_);
        FAIL() << "Expected UploadError";
    }
    catch (const zgs::UploadError& e) {
        EXPECT_NE(std::string(e.what()).find("segment proof invalid"), std::string::npos);
        EXPECT_EQ(e.partial_result().root_hash,
                  zgs::crypto::to_hex(file.merkle_tree()->root_hash()));
    }
}

TEST_F(UploaderTest, AlreadyUploadedCountsAsSuccess) {
    auto provider = add_node(1, 0);
    EXPECT_CALL(*provider, request("zgs_uploadSegmentsByTxSeq", _))
        .WillOnce(Throw(zgs::RpcError("Invalid params: segment has already uploaded", -32602)));

    zgs::file::MemFile file(random_bytes(5000));
    UploadOptions opts = options();
    opts.finality_required = false;
    Uploader uploader(nodes_, make_submitter(file));

    EXPECT_NO_THROW(uploader.upload_file(file, opts, retry_));
}

TEST_F(UploaderTest, NullUploadResponseIsRetried) {
    auto provider = add_node(1, 0);
    EXPECT_CALL(*provider, request("zgs_uploadSegmentsByTxSeq", _))
        .WillOnce(Return(nlohmann::json()))
        .WillRepeatedly(DoDefault());

    zgs::file::MemFile file(random_bytes(5000));
    Uploader uploader(nodes_, make_submitter(file));
    EXPECT_NO_THROW(uploader.upload_file(file, options(), retry_));
    EXPECT_EQ(backends_[0]->uploaded_indices(), std::vector<uint64_t>{0});
}

TEST_F(UploaderTest, NullUploadResponseExhaustsRetries) {
    auto provider = add_node(1, 0);
    EXPECT_CALL(*provider, request("zgs_uploadSegmentsByTxSeq", _))
        .Times(2)
        .WillRepeatedly(Return(nlohmann::json()));

    zgs::file::MemFile file(random_bytes(5000));
    Uploader uploader(nodes_, make_submitter(file));
    retry_.too_many_data_retries = 2;

    try {
        uploader.upload_file(file, options(), retry_);
        FAIL() << "Expected UploadError";
    }
    catch (const zgs::UploadError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("Failed after 2 attempts"), std::string::npos);
        EXPECT_NE(message.find("returned null for upload segments"), std::string::npos);
        EXPECT_EQ(e.partial_result().root_hash,
                  zgs::crypto::to_hex(file.merkle_tree()->root_hash()));
    }
}

TEST_F(UploaderTest, MalformedFileInfoFailsWithPartialResult) {
    auto provider = add_node(1, 0);
    EXPECT_CALL(*provider, request("zgs_getFileInfo", _))
        .WillRepeatedly(Return(nlohmann::json{{"unexpected", 1}}));

    zgs::file::MemFile file(random_bytes(5000));
    Uploader uploader(nodes_, make_submitter(file));

    try {
        uploader.upload_file(file, options(), retry_);
        FAIL() << "Expected UploadError";
    }
    catch (const zgs::UploadError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("Failed to get upload tasks"), std::string::npos);
        EXPECT_NE(message.find("malformed zgs_getFileInfo result"), std::string::npos);
        EXPECT_EQ(e.partial_result().tx_hash, "0xabc");
        EXPECT_EQ(e.partial_result().root_hash,
                  zgs::crypto::to_hex(file.merkle_tree()->root_hash()));
    }
    EXPECT_TRUE(backends_[0]->uploaded_indices().empty());
}

TEST_F(UploaderTest, MalformedPollAnswerIsNotReady) {
    auto provider = add_node(1, 0);
    EXPECT_CALL(*provider, request("zgs_getFileInfoByTxSeq", _))
        .WillOnce(Return(nlohmann::json{{"unexpected", 1}}))
        .WillRepeatedly(DoDefault());

    zgs::file::MemFile file(random_bytes(5000));
    Uploader uploader(nodes_, make_submitter(file));

    EXPECT_NO_THROW(uploader.upload_file(file, options(), retry_));
    EXPECT_EQ(backends_[0]->uploaded_indices(), std::vector<uint64_t>{0});
}

TEST_F(UploaderTest, MissingSequenceNumbers) {
    add_node(1, 0);
    zgs::file::MemFile file(random_bytes(5000));
    auto submitter = make_submitter(file);
    submitter->set_emit_seqs(false);

    Uploader uploader(nodes_, submitter);
    try {
        uploader.upload_file(file, options(), retry_);
        FAIL() << "Expected UploadError";
    }
    catch (const zgs::UploadError& e) {
        EXPECT_EQ(std::string(e.what()), "Failed to get txSeqs");
        EXPECT_EQ(e.partial_result().tx_hash, "0xabc");
    }
}

TEST_F(UploaderTest, InsufficientShardCoverage) {
    add_node(2, 0);
    zgs::file::MemFile file(random_bytes(5000));
    Uploader uploader(nodes_, make_submitter(file));

    try {
        uploader.upload_file(file, options(), retry_);
        FAIL() << "Expected UploadError";
    }
    catch (const zgs::UploadError& e) {
        EXPECT_NE(std::string(e.what()).find("Failed to get upload tasks"), std::string::npos);
    }
}

TEST_F(UploaderTest, EmptyFileIsRejected) {
    add_node(1, 0);
    zgs::file::MemFile file{std::vector<uint8_t>()};
    Uploader uploader(nodes_, std::make_shared<FakeSubmitter>(backends_, zgs::crypto::Hash{}));

    EXPECT_THROW(uploader.upload_file(file, options(), retry_), zgs::MerkleTreeError);
}

TEST_F(UploaderTest, CancelStopsLogEntryWait) {
    add_node(1, 0);
    zgs::file::MemFile file(random_bytes(5000));
    auto submitter = make_submitter(file);
    submitter->set_announce(false);
    retry_.log_poll_interval = std::chrono::milliseconds(10);

    Uploader uploader(nodes_, submitter);
    std::thread canceller([&uploader] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        uploader.cancel();
    });

    try {
        uploader.upload_file(file, options(), retry_);
        FAIL() << "Expected UploadError";
    }
    catch (const zgs::UploadError& e) {
        EXPECT_EQ(std::string(e.what()), "upload cancelled");
        EXPECT_EQ(e.partial_result().tx_hash, "0xabc");
    }
    canceller.join();
    EXPECT_TRUE(uploader.cancelled());
}

//===========================================================================
// Helpers
//===========================================================================

TEST(UploaderHelpersTest, NextSegmentIndex) {
    EXPECT_EQ(Uploader::next_segment_index({1, 0}, 7), 7u);
    EXPECT_EQ(Uploader::next_segment_index({4, 1}, 0), 1u);
    EXPECT_EQ(Uploader::next_segment_index({4, 1}, 5), 5u);
    EXPECT_EQ(Uploader::next_segment_index({4, 1}, 6), 9u);
    EXPECT_EQ(Uploader::next_segment_index({4, 3}, 4), 7u);
}

TEST(UploaderHelpersTest, InterleaveShortestFirst) {
    auto make = [](std::size_t client, std::size_t count) {
        std::vector<UploadTask> tasks;
        for (std::size_t i = 0; i < count; ++i) {
            UploadTask task;
            task.client_index = client;
            task.seg_index = i;
            tasks.push_back(task);
        }
        return tasks;
    };

    auto tasks = Uploader::interleave_tasks({make(0, 3), make(1, 1), make(2, 2)});
    std::vector<std::pair<std::size_t, uint64_t>> order;
    for (const auto& task : tasks) {
        order.emplace_back(task.client_index, task.seg_index);
    }

    std::vector<std::pair<std::size_t, uint64_t>> expected = {
        {1, 0}, {2, 0}, {0, 0}, {2, 1}, {0, 1}, {0, 2}};
    EXPECT_EQ(order, expected);
}

TEST(UploaderHelpersTest, GetSegmentPastEnd) {
    zgs::file::MemFile file(random_bytes(DEFAULT_SEGMENT_SIZE + 100));
    auto tree = file.merkle_tree();
    ASSERT_TRUE(tree);

    bool all_data_uploaded = false;
    auto first = Uploader::get_segment(file, *tree, 0, all_data_uploaded);
    ASSERT_TRUE(first);
    EXPECT_FALSE(all_data_uploaded);

    auto last = Uploader::get_segment(file, *tree, 1, all_data_uploaded);
    ASSERT_TRUE(last);
    EXPECT_TRUE(all_data_uploaded);
    EXPECT_EQ(zgs::crypto::base64_decode(last->data).size(), 256u);

    EXPECT_FALSE(Uploader::get_segment(file, *tree, 2, all_data_uploaded));
    EXPECT_TRUE(all_data_uploaded);
}
