#pragma once

#include "access_control.hpp"
#include "encrypted_arithmetic.hpp"
#include "event_journal.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace cl {

using BatchId = std::uint64_t;

struct LoanParams {
    EncryptedHandle loanAmount;
    EncryptedHandle collateralAmount;
    EncryptedHandle interestRate;

    bool fullyInitialized() const {
        return loanAmount.initialized && collateralAmount.initialized && interestRate.initialized;
    }
};

// SHA-256 over the three handle ids; what observers see of a submission.
std::string commitParams(BatchId batchId, const LoanParams& params);

struct SubmissionReceipt {
    BatchId batchId = 0;
    std::string paramsCommitment;
    std::size_t coercedInputs = 0;
};

// Batch lifecycle and the parameter triple recorded for each batch. At most one batch is
// open; ids start at 1 and only ever grow. Role, pause and cooldown checks happen in the
// caller before these methods run.
class BatchLedger {
public:
    explicit BatchLedger(EventJournal& journal);

    BatchId openBatch(const CallContext& ctx);
    BatchId closeBatch(const CallContext& ctx);

    // Uninitialized inputs are replaced by arithmetic.zero(); the previous triple, if any,
    // is overwritten.
    SubmissionReceipt submitParams(const CallContext& ctx,
                                   LoanParams params,
                                   EncryptedArithmetic& arithmetic);

    BatchId currentBatchId() const { return currentBatchId_; }
    bool isOpen() const { return isOpen_; }
    bool hasBatch() const { return currentBatchId_ != 0; }

    // Missing submissions read back as three uninitialized handles.
    LoanParams paramsFor(BatchId batchId) const;
    bool hasParams(BatchId batchId) const { return params_.count(batchId) != 0; }

private:
    BatchId currentBatchId_ = 0;
    bool isOpen_ = false;
    std::map<BatchId, LoanParams> params_;
    EventJournal& journal_;
};

} // namespace cl
