#include "decryption_coordinator.hpp"

#include "abi_codec.hpp"
#include "commitment.hpp"
#include "compute_stage.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <utility>

namespace cl {

DecryptionCoordinator::DecryptionCoordinator(ArithmeticPtr arithmetic,
                                             OraclePtr oracle,
                                             std::string selfIdentity,
                                             EventJournal& journal)
    : arithmetic_(std::move(arithmetic))
    , oracle_(std::move(oracle))
    , selfIdentity_(std::move(selfIdentity))
    , journal_(journal) {
    if (!arithmetic_) {
        throw std::invalid_argument("DecryptionCoordinator requires an arithmetic backend");
    }
    if (!oracle_) {
        throw std::invalid_argument("DecryptionCoordinator requires a decryption oracle");
    }
    if (selfIdentity_.empty()) {
        throw std::invalid_argument("DecryptionCoordinator requires a self identity");
    }
}

DecryptionRequest DecryptionCoordinator::executeAndRequest(const CallContext& ctx,
                                                           BatchId batchId,
                                                           const LoanParams& params) {
    EncryptedHandle profit = computeProfit(params, *arithmetic_);
    std::string stateHash = computeStateHash({ profit }, selfIdentity_);

    // The id is only known once the oracle has queued the request, so a reissued id is
    // detected after the fact; the oracle keeps that request but the pool never records it.
    RequestId requestId = oracle_->requestDecryption({ profit }, kCallbackRef);
    if (requests_.count(requestId) != 0) {
        raise(ErrorKind::InvalidArgument,
              "oracle reissued request id " + std::to_string(requestId));
    }

    // Overwrites any earlier profit for this batch; an outstanding request for the old
    // handle will fail its state-hash check.
    profits_[batchId] = profit;

    DecryptionRequest request;
    request.requestId = requestId;
    request.batchId = batchId;
    request.stateHash = stateHash;
    request.processed = false;
    request.requestedAt = ctx.timestamp;
    requests_.emplace(requestId, request);

    Event event;
    event.kind = EventKind::DecryptionRequested;
    event.timestamp = ctx.timestamp;
    event.with("requestId", std::to_string(requestId))
        .with("batchId", std::to_string(batchId))
        .with("stateHash", stateHash);
    journal_.emit(std::move(event));
    return request;
}

RevealedResult DecryptionCoordinator::onDecryptionCallback(const CallContext& ctx,
                                                           RequestId requestId,
                                                           const Bytes& cleartext,
                                                           const Bytes& proof) {
    auto it = requests_.find(requestId);
    if (it != requests_.end() && it->second.processed) {
        raise(ErrorKind::ReplayAttempt,
              "request " + std::to_string(requestId) + " was already processed");
    }
    if (it == requests_.end()) {
        raise(ErrorKind::StateMismatch,
              "no commitment recorded for request " + std::to_string(requestId));
    }
    DecryptionRequest& request = it->second;

    auto profitIt = profits_.find(request.batchId);
    if (profitIt == profits_.end()) {
        raise(ErrorKind::StateMismatch,
              "batch " + std::to_string(request.batchId) + " has no stored result");
    }
    std::string currentHash = computeStateHash({ profitIt->second }, selfIdentity_);
    if (currentHash != request.stateHash) {
        raise(ErrorKind::StateMismatch,
              "stored result of batch " + std::to_string(request.batchId) +
                  " changed since request " + std::to_string(requestId));
    }

    if (!oracle_->checkSignatures(requestId, cleartext, proof)) {
        raise(ErrorKind::InvalidProof,
              "oracle proof rejected for request " + std::to_string(requestId));
    }

    auto plaintext = decodeUint64Word(cleartext);
    if (!plaintext) {
        raise(ErrorKind::InvalidArgument,
              "cleartext for request " + std::to_string(requestId) + " is not a uint64 word");
    }

    request.processed = true;

    RevealedResult result;
    result.requestId = requestId;
    result.batchId = request.batchId;
    result.plaintext = *plaintext;
    result.revealedAt = ctx.timestamp;
    revealed_[request.batchId] = result;

    Event event;
    event.kind = EventKind::DecryptionCompleted;
    event.timestamp = ctx.timestamp;
    event.with("requestId", std::to_string(requestId))
        .with("batchId", std::to_string(result.batchId))
        .with("plaintext", std::to_string(result.plaintext));
    journal_.emit(std::move(event));
    return result;
}

std::optional<DecryptionRequest> DecryptionCoordinator::request(RequestId requestId) const {
    auto it = requests_.find(requestId);
    if (it == requests_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<EncryptedHandle> DecryptionCoordinator::profitFor(BatchId batchId) const {
    auto it = profits_.find(batchId);
    if (it == profits_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<RevealedResult> DecryptionCoordinator::revealedFor(BatchId batchId) const {
    auto it = revealed_.find(batchId);
    if (it == revealed_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<RequestId> DecryptionCoordinator::outstandingRequests() const {
    std::vector<RequestId> out;
    for (const auto& [id, request] : requests_) {
        if (!request.processed) {
            out.push_back(id);
        }
    }
    return out;
}

} // namespace cl
