#pragma once

#include "access_control.hpp"
#include "batch_ledger.hpp"
#include "cooldown_gate.hpp"
#include "decryption_coordinator.hpp"
#include "decryption_oracle.hpp"
#include "encrypted_arithmetic.hpp"
#include "event_journal.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace cl {

// Public surface of the confidential loan pool. Every mutating entry point runs its checks in
// the same order: role, pause flag, cooldown, then the component's own lifecycle checks.
class LoanPool {
public:
    struct Config {
        // Pool identity folded into every state hash. Empty falls back to CL_DEPLOYMENT_ID.
        std::string deploymentId;
        // Optional; empty falls back to CL_CHAIN_ID.
        std::string chainId;
        std::uint64_t cooldownSeconds = 60;
    };

    LoanPool(const Config& cfg, Principal owner, ArithmeticPtr arithmetic, OraclePtr oracle);

    LoanPool(const LoanPool&) = delete;
    LoanPool& operator=(const LoanPool&) = delete;

    void transferOwnership(const CallContext& ctx, const Principal& newOwner);
    void addProvider(const CallContext& ctx, const Principal& provider);
    void removeProvider(const CallContext& ctx, const Principal& provider);
    void setPaused(const CallContext& ctx, bool paused);
    void setCooldownSeconds(const CallContext& ctx, std::uint64_t seconds);

    BatchId openBatch(const CallContext& ctx);
    BatchId closeBatch(const CallContext& ctx);

    SubmissionReceipt submitParams(const CallContext& ctx,
                                   const EncryptedHandle& loanAmount,
                                   const EncryptedHandle& collateralAmount,
                                   const EncryptedHandle& interestRate);

    // Works on the current batch whether or not it is still open; fails with BatchClosed
    // only when no batch has ever been opened.
    DecryptionRequest executeAndRequestDecryption(const CallContext& ctx);

    // Oracle delivery. Not subject to the pause flag: the request it answers was admitted
    // before any pause, and the oracle is not obliged to redeliver.
    RevealedResult onDecryptionCallback(const CallContext& ctx,
                                        RequestId requestId,
                                        const Bytes& cleartext,
                                        const Bytes& proof);

    void subscribe(EventListener listener) { journal_.subscribe(std::move(listener)); }

    const AccessControl& access() const { return access_; }
    const CooldownGate& cooldowns() const { return cooldowns_; }
    const BatchLedger& ledger() const { return ledger_; }
    const DecryptionCoordinator& coordinator() const { return coordinator_; }
    const EventJournal& journal() const { return journal_; }
    const std::string& selfIdentity() const { return coordinator_.selfIdentity(); }

    static std::string resolveSelfIdentity(const Config& cfg);

private:
    EventJournal journal_;
    AccessControl access_;
    CooldownGate cooldowns_;
    BatchLedger ledger_;
    ArithmeticPtr arithmetic_;
    DecryptionCoordinator coordinator_;
};

} // namespace cl
