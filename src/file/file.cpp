#include "file/file.hpp"
#include "common/storage_error.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace zgs {
namespace file {

void to_json(nlohmann::json& j, const SubmissionNode& node) {
    j = nlohmann::json{{"height", node.height}, {"root", crypto::to_hex(node.root)}};
}

void to_json(nlohmann::json& j, const Submission& submission) {
    j = nlohmann::json{
        {"length", submission.length},
        {"tags", crypto::bytes_to_hex(submission.tags)},
        {"nodes", submission.nodes}
    };
}

//===========================================================================
// File
//===========================================================================

uint64_t File::num_chunks() const {
    return num_splits(file_size_, DEFAULT_CHUNK_SIZE);
}

uint64_t File::num_segments() const {
    return num_splits(file_size_, DEFAULT_SEGMENT_SIZE);
}

std::unique_ptr<SegmentIterator> File::iterate(bool flow_padding) const {
    return iterate_with_offset_and_batch(0, DEFAULT_SEGMENT_SIZE, flow_padding);
}

crypto::Hash File::segment_root(const uint8_t* data, std::size_t len, uint64_t empty_chunks_padded) {
    merkle::MerkleTree tree;
    for (std::size_t offset = 0; offset < len; offset += DEFAULT_CHUNK_SIZE) {
        tree.add_leaf(data + offset, std::min<std::size_t>(DEFAULT_CHUNK_SIZE, len - offset));
    }
    for (uint64_t i = 0; i < empty_chunks_padded; ++i) {
        tree.add_leaf_by_hash(empty_chunk_hash());
    }

    if (!tree.build()) {
        return zero_hash();
    }
    return tree.root_hash();
}

crypto::Hash File::segment_root(const std::vector<uint8_t>& segment, uint64_t empty_chunks_padded) {
    return segment_root(segment.data(), segment.size(), empty_chunks_padded);
}

std::optional<merkle::MerkleTree> File::merkle_tree() const {
    auto iter = iterate(true);
    merkle::MerkleTree tree;
    while (iter->next()) {
        tree.add_leaf_by_hash(segment_root(iter->current()));
    }

    if (!tree.build()) {
        return std::nullopt;
    }
    BOOST_LOG_TRIVIAL(debug) << "File: merkle tree of " << file_size_ << " bytes over "
                             << tree.num_leaves() << " segments, root "
                             << crypto::to_hex(tree.root_hash());
    return tree;
}

Submission File::create_submission(const std::vector<uint8_t>& tags) const {
    Submission submission;
    submission.length = file_size_;
    submission.tags = tags;

    uint64_t offset = 0;
    for (uint64_t chunks : split_nodes()) {
        submission.nodes.push_back(create_node(offset, chunks));
        offset += chunks * DEFAULT_CHUNK_SIZE;
    }
    return submission;
}

std::vector<uint64_t> File::split_nodes() const {
    std::vector<uint64_t> nodes;
    auto [padded_chunks, chunks_next_pow2] = compute_padded_size(num_chunks());

    uint64_t next_chunk_size = chunks_next_pow2;
    while (padded_chunks > 0) {
        if (padded_chunks >= next_chunk_size) {
            padded_chunks -= next_chunk_size;
            nodes.push_back(next_chunk_size);
        }
        next_chunk_size /= 2;
    }
    return nodes;
}

SubmissionNode File::create_node(uint64_t offset, uint64_t chunks) const {
    uint64_t batch = std::min(chunks, DEFAULT_SEGMENT_MAX_CHUNKS);
    return create_segment_node(offset, DEFAULT_CHUNK_SIZE * batch, DEFAULT_CHUNK_SIZE * chunks);
}

SubmissionNode File::create_segment_node(uint64_t offset, uint64_t batch, uint64_t size) const {
    auto iter = iterate_with_offset_and_batch(offset, batch, true);
    merkle::MerkleTree tree;

    uint64_t i = 0;
    while (i < size) {
        if (!iter->next()) {
            break;
        }
        const auto& current = iter->current();
        tree.add_leaf_by_hash(segment_root(current));
        i += current.size();
    }

    if (!tree.build()) {
        throw MerkleTreeError("no data for submission node at offset " + std::to_string(offset));
    }

    SubmissionNode node;
    node.height = log2_pow2(size / DEFAULT_CHUNK_SIZE);
    node.root = tree.root_hash();
    return node;
}

//===========================================================================
// MemFile / DiskFile
//===========================================================================

MemFile::MemFile(std::vector<uint8_t> data)
    : File(data.size()),
      data_(std::make_shared<const std::vector<uint8_t>>(std::move(data))) {}

std::unique_ptr<SegmentIterator> MemFile::iterate_with_offset_and_batch(
    uint64_t offset, uint64_t batch, bool flow_padding) const {
    return std::make_unique<MemIterator>(data_, offset, batch, flow_padding);
}

namespace {

uint64_t regular_file_size(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw FileError(path.string() + " is not a regular file");
    }
    uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw FileError("cannot stat " + path.string() + ": " + ec.message());
    }
    return size;
}

} // namespace

DiskFile::DiskFile(const std::filesystem::path& path)
    : File(regular_file_size(path)), path_(path) {}

std::unique_ptr<SegmentIterator> DiskFile::iterate_with_offset_and_batch(
    uint64_t offset, uint64_t batch, bool flow_padding) const {
    return std::make_unique<FileIterator>(path_, size(), offset, batch, flow_padding);
}

} // namespace file
} // namespace zgs
