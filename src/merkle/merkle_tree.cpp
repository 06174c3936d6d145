#include "merkle/merkle_tree.hpp"

#include <boost/log/trivial.hpp>
#include <deque>
#include <stdexcept>
#include <string>

namespace zgs {
namespace merkle {

namespace {

std::size_t next_pow2(std::size_t n) {
    if (n == 0) {
        return 0;
    }
    std::size_t result = 1;
    while (result < n) {
        result <<= 1;
    }
    return result;
}

} // namespace

const char* proof_error_to_string(ProofError error) {
    switch (error) {
        case ProofError::WRONG_FORMAT: return "invalid merkle proof format";
        case ProofError::CONTENT_MISMATCH: return "merkle proof content mismatch";
        case ProofError::ROOT_MISMATCH: return "merkle proof root mismatch";
        case ProofError::POSITION_MISMATCH: return "merkle proof position mismatch";
        case ProofError::VALIDATION_FAILURE: return "failed to validate merkle proof";
        default: return "unknown merkle proof error";
    }
}

//===========================================================================
// Proof
//===========================================================================

std::optional<ProofError> Proof::validate_format() const {
    if (path.empty()) {
        if (lemma.size() != 1) {
            return ProofError::WRONG_FORMAT;
        }
        return std::nullopt;
    }
    if (lemma.size() != path.size() + 2) {
        return ProofError::WRONG_FORMAT;
    }
    return std::nullopt;
}

std::optional<ProofError> Proof::validate(const Hash& root, const std::vector<uint8_t>& content,
                                          std::size_t position, std::size_t num_leaf_nodes) const {
    return validate_hash(root, crypto::keccak256(content), position, num_leaf_nodes);
}

std::optional<ProofError> Proof::validate_hash(const Hash& root, const Hash& content_hash,
                                               std::size_t position, std::size_t num_leaf_nodes) const {
    if (auto error = validate_format()) {
        return error;
    }

    if (lemma.front() != content_hash) {
        return ProofError::CONTENT_MISMATCH;
    }

    if (lemma.size() > 1 && lemma.back() != root) {
        return ProofError::ROOT_MISMATCH;
    }

    if (calculate_proof_position(num_leaf_nodes) != position) {
        return ProofError::POSITION_MISMATCH;
    }

    if (!validate_root()) {
        return ProofError::VALIDATION_FAILURE;
    }

    return std::nullopt;
}

bool Proof::validate_root() const {
    if (lemma.empty()) {
        return false;
    }

    Hash hash = lemma.front();
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i + 1 >= lemma.size()) {
            return false;
        }
        if (path[i]) {
            hash = crypto::hash_combine(hash, lemma[i + 1]);
        } else {
            hash = crypto::hash_combine(lemma[i + 1], hash);
        }
    }
    return hash == lemma.back();
}

std::size_t Proof::calculate_proof_position(std::size_t num_leaf_nodes) const {
    std::size_t position = 0;
    for (std::size_t i = path.size(); i-- > 0;) {
        std::size_t left_side_leaf_nodes = next_pow2(num_leaf_nodes) / 2;
        if (path[i]) {
            num_leaf_nodes = left_side_leaf_nodes;
        } else {
            position += left_side_leaf_nodes;
            num_leaf_nodes -= left_side_leaf_nodes;
        }
    }
    return position;
}

//===========================================================================
// LeafNode
//===========================================================================

LeafNode LeafNode::from_content(const uint8_t* data, std::size_t len) {
    return from_hash(crypto::keccak256(data, len));
}

LeafNode LeafNode::from_content(const std::vector<uint8_t>& content) {
    return from_content(content.data(), content.size());
}

LeafNode LeafNode::from_hash(const Hash& hash) {
    LeafNode node;
    node.hash = hash;
    return node;
}

//===========================================================================
// MerkleTree
//===========================================================================

void MerkleTree::push_leaf(const LeafNode& leaf) {
    if (root_ || nodes_.size() > num_leaves_) {
        nodes_.resize(num_leaves_);
        for (auto& node : nodes_) {
            node.parent.reset();
        }
        root_.reset();
    }
    nodes_.push_back(leaf);
    ++num_leaves_;
}

void MerkleTree::add_leaf(const uint8_t* data, std::size_t len) {
    push_leaf(LeafNode::from_content(data, len));
}

void MerkleTree::add_leaf(const std::vector<uint8_t>& content) {
    push_leaf(LeafNode::from_content(content));
}

void MerkleTree::add_leaf_by_hash(const Hash& hash) {
    push_leaf(LeafNode::from_hash(hash));
}

std::size_t MerkleTree::combine(std::size_t left, std::size_t right) {
    LeafNode parent;
    parent.hash = crypto::hash_combine(nodes_[left].hash, nodes_[right].hash);
    parent.left = left;
    parent.right = right;

    std::size_t index = nodes_.size();
    nodes_.push_back(parent);
    nodes_[left].parent = index;
    nodes_[right].parent = index;
    return index;
}

bool MerkleTree::build() {
    if (num_leaves_ == 0) {
        return false;
    }

    // Drop interior nodes from an earlier build
    nodes_.resize(num_leaves_);
    for (auto& node : nodes_) {
        node.parent.reset();
    }

    std::deque<std::size_t> queue;
    for (std::size_t i = 0; i < num_leaves_; i += 2) {
        if (i == num_leaves_ - 1) {
            queue.push_back(i);
        } else {
            queue.push_back(combine(i, i + 1));
        }
    }

    while (true) {
        std::size_t num_nodes = queue.size();
        if (num_nodes <= 1) {
            break;
        }

        for (std::size_t i = 0; i < num_nodes / 2; ++i) {
            std::size_t left = queue.front();
            queue.pop_front();
            std::size_t right = queue.front();
            queue.pop_front();
            queue.push_back(combine(left, right));
        }

        // Carry the unpaired node of this level over unchanged
        if (num_nodes % 2 == 1) {
            queue.push_back(queue.front());
            queue.pop_front();
        }
    }

    root_ = queue.front();
    BOOST_LOG_TRIVIAL(trace) << "Merkle tree: built over " << num_leaves_
                             << " leaves, root " << crypto::to_hex(nodes_[*root_].hash);
    return true;
}

const Hash& MerkleTree::root_hash() const {
    if (!root_) {
        throw MerkleTreeError("tree has not been built");
    }
    return nodes_[*root_].hash;
}

const LeafNode& MerkleTree::node(std::size_t index) const {
    if (index >= nodes_.size()) {
        throw std::out_of_range("node index " + std::to_string(index) + " out of range");
    }
    return nodes_[index];
}

const LeafNode& MerkleTree::leaf(std::size_t i) const {
    if (i >= num_leaves_) {
        throw std::out_of_range("leaf index " + std::to_string(i) + " out of range");
    }
    return nodes_[i];
}

bool MerkleTree::is_left_side(std::size_t index) const {
    const LeafNode& current = node(index);
    return current.parent && nodes_[*current.parent].left == index;
}

Proof MerkleTree::proof_at(std::size_t i) const {
    if (i >= num_leaves_) {
        throw std::out_of_range("leaf index " + std::to_string(i) + " out of range");
    }
    if (!root_) {
        throw MerkleTreeError("tree has not been built");
    }

    Proof proof;
    if (num_leaves_ == 1) {
        proof.lemma.push_back(root_hash());
        return proof;
    }

    proof.lemma.push_back(nodes_[i].hash);
    std::size_t current = i;
    while (nodes_[current].parent) {
        const LeafNode& parent = nodes_[*nodes_[current].parent];
        if (is_left_side(current)) {
            proof.lemma.push_back(nodes_[*parent.right].hash);
            proof.path.push_back(true);
        } else {
            proof.lemma.push_back(nodes_[*parent.left].hash);
            proof.path.push_back(false);
        }
        current = *nodes_[current].parent;
    }
    proof.lemma.push_back(root_hash());
    return proof;
}

} // namespace merkle
} // namespace zgs
