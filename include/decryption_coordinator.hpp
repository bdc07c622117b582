#pragma once

#include "access_control.hpp"
#include "batch_ledger.hpp"
#include "decryption_oracle.hpp"
#include "encrypted_arithmetic.hpp"
#include "event_journal.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cl {

enum class RequestState { Requested, Processed };

struct DecryptionRequest {
    RequestId requestId = 0;
    BatchId batchId = 0;
    // computeStateHash({profit}, selfIdentity) at request time.
    std::string stateHash;
    bool processed = false;
    std::uint64_t requestedAt = 0;

    RequestState state() const { return processed ? RequestState::Processed : RequestState::Requested; }
};

struct RevealedResult {
    RequestId requestId = 0;
    BatchId batchId = 0;
    std::uint64_t plaintext = 0;
    std::uint64_t revealedAt = 0;
};

// Owns the profit handle of every executed batch and one record per decryption request.
//
// A request moves Requested -> Processed exactly once, and only when a callback passes, in
// order: the replay guard, the state-hash check against the profit handle currently stored
// for the batch, and the oracle's signature check. Re-executing a batch while its request is
// outstanding replaces the stored handle, so the older request can no longer be revealed;
// its callback fails with StateMismatch.
class DecryptionCoordinator {
public:
    static constexpr const char* kCallbackRef = "onDecryptionCallback";

    DecryptionCoordinator(ArithmeticPtr arithmetic,
                          OraclePtr oracle,
                          std::string selfIdentity,
                          EventJournal& journal);

    DecryptionRequest executeAndRequest(const CallContext& ctx,
                                        BatchId batchId,
                                        const LoanParams& params);

    RevealedResult onDecryptionCallback(const CallContext& ctx,
                                        RequestId requestId,
                                        const Bytes& cleartext,
                                        const Bytes& proof);

    std::optional<DecryptionRequest> request(RequestId requestId) const;
    std::optional<EncryptedHandle> profitFor(BatchId batchId) const;
    std::optional<RevealedResult> revealedFor(BatchId batchId) const;
    std::vector<RequestId> outstandingRequests() const;
    const std::string& selfIdentity() const { return selfIdentity_; }

private:
    ArithmeticPtr arithmetic_;
    OraclePtr oracle_;
    std::string selfIdentity_;
    EventJournal& journal_;

    std::map<BatchId, EncryptedHandle> profits_;
    std::map<RequestId, DecryptionRequest> requests_;
    std::map<BatchId, RevealedResult> revealed_;
};

} // namespace cl
