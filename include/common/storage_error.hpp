#ifndef ZGS_STORAGE_ERROR_HPP
#define ZGS_STORAGE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace zgs {

// Outcome of an upload, also attached to UploadError as the partial result
struct UploadResult {
    std::string tx_hash;
    std::string root_hash;
};

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error(message) {}
};

class MerkleTreeError : public StorageError {
public:
    explicit MerkleTreeError(const std::string& message)
        : StorageError("Merkle tree error: " + message) {}
};

class UploadError : public StorageError {
public:
    explicit UploadError(const std::string& message, UploadResult partial = {})
        : StorageError(message), partial_(std::move(partial)) {}

    const UploadResult& partial_result() const { return partial_; }

private:
    UploadResult partial_;
};

class DownloadError : public StorageError {
public:
    explicit DownloadError(const std::string& message)
        : StorageError(message) {}
};

class InsufficientReplicasError : public StorageError {
public:
    explicit InsufficientReplicasError(const std::string& message)
        : StorageError(message) {}
};

// Transport level failure talking to a single node
class NodeUnavailableError : public StorageError {
public:
    NodeUnavailableError(const std::string& url, const std::string& message)
        : StorageError("Node " + url + " unavailable: " + message), url_(url) {}

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

// The node answered with a JSON-RPC error object
class RpcError : public StorageError {
public:
    explicit RpcError(const std::string& message, int code = 0)
        : StorageError("RPC Error: " + message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

class ContractError : public StorageError {
public:
    explicit ContractError(const std::string& message)
        : StorageError("Contract error: " + message) {}
};

class FileError : public StorageError {
public:
    explicit FileError(const std::string& message)
        : StorageError("File error: " + message) {}
};

} // namespace zgs

#endif // ZGS_STORAGE_ERROR_HPP
