#ifndef ZGS_MERKLE_TREE_HPP
#define ZGS_MERKLE_TREE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "common/storage_error.hpp"
#include "crypto/hash.hpp"

namespace zgs {
namespace merkle {

using crypto::Hash;

enum class ProofError {
    WRONG_FORMAT,
    CONTENT_MISMATCH,
    ROOT_MISMATCH,
    POSITION_MISMATCH,
    VALIDATION_FAILURE
};

const char* proof_error_to_string(ProofError error);

class VerificationError : public StorageError {
public:
    explicit VerificationError(ProofError error)
        : StorageError(proof_error_to_string(error)), error_(error) {}

    ProofError error() const { return error_; }

private:
    ProofError error_;
};

// Inclusion proof: target leaf, one sibling per level, root.
// path[i] is true when the node at level i is a left child.
struct Proof {
    std::vector<Hash> lemma;
    std::vector<bool> path;

    std::optional<ProofError> validate_format() const;

    // Checks format, content, root, position and the hash chain in that order
    std::optional<ProofError> validate(const Hash& root, const std::vector<uint8_t>& content,
                                       std::size_t position, std::size_t num_leaf_nodes) const;
    std::optional<ProofError> validate_hash(const Hash& root, const Hash& content_hash,
                                            std::size_t position, std::size_t num_leaf_nodes) const;

    // Recomputes the root from lemma[0] and compares it with lemma.back()
    bool validate_root() const;

    // Leaf index implied by the path for a tree of num_leaf_nodes leaves
    std::size_t calculate_proof_position(std::size_t num_leaf_nodes) const;
};

// Arena node, links are indices into the owning tree
struct LeafNode {
    Hash hash{};
    std::optional<std::size_t> left;
    std::optional<std::size_t> right;
    std::optional<std::size_t> parent;

    static LeafNode from_content(const uint8_t* data, std::size_t len);
    static LeafNode from_content(const std::vector<uint8_t>& content);
    static LeafNode from_hash(const Hash& hash);
};

class MerkleTree {
public:
    MerkleTree() = default;

    // ---- LEAF INSERTION ----
    // Adding a leaf discards any previously built interior nodes
    void add_leaf(const uint8_t* data, std::size_t len);
    void add_leaf(const std::vector<uint8_t>& content);
    void add_leaf_by_hash(const Hash& hash);

    // Builds the interior nodes, returns false when there are no leaves
    bool build();

    // ---- QUERY METHODS ----
    std::size_t num_leaves() const { return num_leaves_; }
    bool is_built() const { return root_.has_value(); }
    std::optional<std::size_t> root_index() const { return root_; }
    const Hash& root_hash() const;
    const LeafNode& node(std::size_t index) const;
    const LeafNode& leaf(std::size_t i) const;

    // True when the node is its parent's left child
    bool is_left_side(std::size_t index) const;

    // Throws std::out_of_range for an invalid leaf index
    Proof proof_at(std::size_t i) const;

private:
    void push_leaf(const LeafNode& leaf);
    std::size_t combine(std::size_t left, std::size_t right);

    // Leaves occupy [0, num_leaves_), interior nodes follow
    std::vector<LeafNode> nodes_;
    std::size_t num_leaves_ = 0;
    std::optional<std::size_t> root_;
};

} // namespace merkle
} // namespace zgs

#endif // ZGS_MERKLE_TREE_HPP
