#ifndef ZGS_FILE_HPP
#define ZGS_FILE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "crypto/hash.hpp"
#include "file/file_utils.hpp"
#include "file/iterator.hpp"
#include "merkle/merkle_tree.hpp"

namespace zgs {
namespace file {

// One power of two sized sub-tree of the on-chain submission
struct SubmissionNode {
    uint64_t height = 0;
    crypto::Hash root{};
};

// On-chain descriptor of a file
struct Submission {
    uint64_t length = 0;
    std::vector<uint8_t> tags;
    std::vector<SubmissionNode> nodes;
};

void to_json(nlohmann::json& j, const SubmissionNode& node);
void to_json(nlohmann::json& j, const Submission& submission);

class File {
public:
    virtual ~File() = default;

    uint64_t size() const { return file_size_; }
    uint64_t num_chunks() const;
    uint64_t num_segments() const;

    // ---- ITERATION ----
    // Segment sized batches from the start of the file
    std::unique_ptr<SegmentIterator> iterate(bool flow_padding) const;
    virtual std::unique_ptr<SegmentIterator> iterate_with_offset_and_batch(
        uint64_t offset, uint64_t batch, bool flow_padding) const = 0;

    // ---- MERKLE ----
    // Tree with one leaf per flow padded segment, empty for a zero length file
    std::optional<merkle::MerkleTree> merkle_tree() const;

    // Root of a segment: one leaf per chunk plus empty_chunks_padded empty chunks
    static crypto::Hash segment_root(const uint8_t* data, std::size_t len,
                                     uint64_t empty_chunks_padded = 0);
    static crypto::Hash segment_root(const std::vector<uint8_t>& segment,
                                     uint64_t empty_chunks_padded = 0);

    // ---- SUBMISSION ----
    Submission create_submission(const std::vector<uint8_t>& tags) const;
    // Chunk counts of the submission sub-trees, largest first
    std::vector<uint64_t> split_nodes() const;
    SubmissionNode create_node(uint64_t offset, uint64_t chunks) const;

protected:
    explicit File(uint64_t file_size) : file_size_(file_size) {}

private:
    SubmissionNode create_segment_node(uint64_t offset, uint64_t batch, uint64_t size) const;

    uint64_t file_size_;
};

class MemFile : public File {
public:
    explicit MemFile(std::vector<uint8_t> data);

    std::unique_ptr<SegmentIterator> iterate_with_offset_and_batch(
        uint64_t offset, uint64_t batch, bool flow_padding) const override;

private:
    std::shared_ptr<const std::vector<uint8_t>> data_;
};

class DiskFile : public File {
public:
    // Throws FileError when the path is missing or not a regular file
    explicit DiskFile(const std::filesystem::path& path);

    const std::filesystem::path& path() const { return path_; }

    std::unique_ptr<SegmentIterator> iterate_with_offset_and_batch(
        uint64_t offset, uint64_t batch, bool flow_padding) const override;

private:
    std::filesystem::path path_;
};

} // namespace file
} // namespace zgs

#endif // ZGS_FILE_HPP
