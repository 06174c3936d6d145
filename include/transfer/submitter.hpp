#ifndef ZGS_TRANSFER_SUBMITTER_HPP
#define ZGS_TRANSFER_SUBMITTER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "file/file.hpp"
#include "transfer/options.hpp"

namespace zgs {
namespace transfer {

struct SubmitReceipt {
    std::string tx_hash;
    // Sequence numbers emitted by the flow contract, in log order
    std::vector<uint64_t> tx_seqs;
};

// Commits a submission to the chain. Implementations sign, send and wait for
// the receipt, and throw ContractError on failure.
class TransactionSubmitter {
public:
    virtual ~TransactionSubmitter() = default;

    virtual SubmitReceipt submit(const file::Submission& submission,
                                 const UploadOptions& options) = 0;
};

} // namespace transfer
} // namespace zgs

#endif // ZGS_TRANSFER_SUBMITTER_HPP
