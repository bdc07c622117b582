#include "batch_ledger.hpp"

#include "encoding.hpp"
#include "errors.hpp"

#include <sstream>
#include <utility>

namespace cl {

namespace {

std::size_t coerceToZero(EncryptedHandle& handle, EncryptedArithmetic& arithmetic) {
    if (arithmetic.isInitialized(handle)) {
        return 0;
    }
    handle = arithmetic.zero();
    return 1;
}

} // namespace

std::string commitParams(BatchId batchId, const LoanParams& params) {
    std::ostringstream oss;
    oss << "params:" << batchId << ';';
    appendLengthPrefixed(oss, params.loanAmount.id);
    appendLengthPrefixed(oss, params.collateralAmount.id);
    appendLengthPrefixed(oss, params.interestRate.id);
    return sha256Hex(oss.str());
}

BatchLedger::BatchLedger(EventJournal& journal)
    : journal_(journal) {}

BatchId BatchLedger::openBatch(const CallContext& ctx) {
    if (isOpen_) {
        raise(ErrorKind::BatchAlreadyOpen,
              "batch " + std::to_string(currentBatchId_) + " is still open");
    }
    ++currentBatchId_;
    isOpen_ = true;

    Event event;
    event.kind = EventKind::BatchOpened;
    event.timestamp = ctx.timestamp;
    event.with("batchId", std::to_string(currentBatchId_));
    journal_.emit(std::move(event));
    return currentBatchId_;
}

BatchId BatchLedger::closeBatch(const CallContext& ctx) {
    if (!isOpen_) {
        raise(ErrorKind::BatchAlreadyClosed, "no batch is open");
    }
    isOpen_ = false;

    Event event;
    event.kind = EventKind::BatchClosed;
    event.timestamp = ctx.timestamp;
    event.with("batchId", std::to_string(currentBatchId_));
    journal_.emit(std::move(event));
    return currentBatchId_;
}

SubmissionReceipt BatchLedger::submitParams(const CallContext& ctx,
                                            LoanParams params,
                                            EncryptedArithmetic& arithmetic) {
    if (!isOpen_) {
        raise(ErrorKind::BatchClosed, "no batch is open for submissions");
    }

    SubmissionReceipt receipt;
    receipt.batchId = currentBatchId_;
    receipt.coercedInputs += coerceToZero(params.loanAmount, arithmetic);
    receipt.coercedInputs += coerceToZero(params.collateralAmount, arithmetic);
    receipt.coercedInputs += coerceToZero(params.interestRate, arithmetic);
    receipt.paramsCommitment = commitParams(currentBatchId_, params);

    params_[currentBatchId_] = std::move(params);

    Event event;
    event.kind = EventKind::ParamsSubmitted;
    event.timestamp = ctx.timestamp;
    event.with("batchId", std::to_string(receipt.batchId))
        .with("provider", ctx.caller)
        .with("commitment", receipt.paramsCommitment);
    journal_.emit(std::move(event));
    return receipt;
}

LoanParams BatchLedger::paramsFor(BatchId batchId) const {
    auto it = params_.find(batchId);
    if (it == params_.end()) {
        return LoanParams{};
    }
    return it->second;
}

} // namespace cl
