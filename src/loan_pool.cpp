#include "loan_pool.hpp"

#include "errors.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cl {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::string resolveDeploymentId(const LoanPool::Config& cfg) {
    std::string deployment = trim(cfg.deploymentId);
    if (deployment.empty()) {
        const char* env = std::getenv("CL_DEPLOYMENT_ID");
        if (env != nullptr) {
            deployment = trim(env);
        }
    }
    if (deployment.empty()) {
        throw std::runtime_error(
            "Loan pool requires a deploymentId (set LoanPool::Config::deploymentId or CL_DEPLOYMENT_ID)");
    }
    if (deployment == "default") {
        throw std::runtime_error(
            "Loan pool deploymentId cannot be \"default\"; set an environment-specific value such as \"mainnet\" or \"testnet\"");
    }
    return deployment;
}

std::string resolveChainId(const LoanPool::Config& cfg) {
    if (!cfg.chainId.empty()) {
        return trim(cfg.chainId);
    }
    const char* env = std::getenv("CL_CHAIN_ID");
    if (env == nullptr) {
        return "";
    }
    return trim(env);
}

} // namespace

std::string LoanPool::resolveSelfIdentity(const Config& cfg) {
    std::ostringstream oss;
    oss << "cipherloan:" << resolveDeploymentId(cfg);
    std::string chainId = resolveChainId(cfg);
    if (!chainId.empty()) {
        oss << "|" << chainId;
    }
    return oss.str();
}

LoanPool::LoanPool(const Config& cfg, Principal owner, ArithmeticPtr arithmetic, OraclePtr oracle)
    : journal_()
    , access_(std::move(owner), journal_)
    , cooldowns_(cfg.cooldownSeconds, journal_)
    , ledger_(journal_)
    , arithmetic_(std::move(arithmetic))
    , coordinator_(arithmetic_, std::move(oracle), resolveSelfIdentity(cfg), journal_) {}

void LoanPool::transferOwnership(const CallContext& ctx, const Principal& newOwner) {
    access_.transferOwnership(ctx, newOwner);
}

void LoanPool::addProvider(const CallContext& ctx, const Principal& provider) {
    access_.addProvider(ctx, provider);
}

void LoanPool::removeProvider(const CallContext& ctx, const Principal& provider) {
    access_.removeProvider(ctx, provider);
}

void LoanPool::setPaused(const CallContext& ctx, bool paused) {
    access_.setPaused(ctx, paused);
}

void LoanPool::setCooldownSeconds(const CallContext& ctx, std::uint64_t seconds) {
    access_.requireOwner(ctx.caller);
    access_.requireNotPaused();
    cooldowns_.setCooldownSeconds(ctx, seconds);
}

BatchId LoanPool::openBatch(const CallContext& ctx) {
    access_.requireOwner(ctx.caller);
    access_.requireNotPaused();
    return ledger_.openBatch(ctx);
}

BatchId LoanPool::closeBatch(const CallContext& ctx) {
    access_.requireOwner(ctx.caller);
    access_.requireNotPaused();
    return ledger_.closeBatch(ctx);
}

SubmissionReceipt LoanPool::submitParams(const CallContext& ctx,
                                         const EncryptedHandle& loanAmount,
                                         const EncryptedHandle& collateralAmount,
                                         const EncryptedHandle& interestRate) {
    access_.requireProvider(ctx.caller);
    access_.requireNotPaused();
    cooldowns_.checkAndStamp(ctx.caller, ActionClass::SubmitParams, ctx.timestamp);
    return ledger_.submitParams(ctx, LoanParams{ loanAmount, collateralAmount, interestRate }, *arithmetic_);
}

DecryptionRequest LoanPool::executeAndRequestDecryption(const CallContext& ctx) {
    access_.requireProvider(ctx.caller);
    access_.requireNotPaused();
    cooldowns_.checkAndStamp(ctx.caller, ActionClass::RequestDecryption, ctx.timestamp);
    if (!ledger_.hasBatch()) {
        raise(ErrorKind::BatchClosed, "no batch has been opened");
    }
    BatchId batchId = ledger_.currentBatchId();
    return coordinator_.executeAndRequest(ctx, batchId, ledger_.paramsFor(batchId));
}

RevealedResult LoanPool::onDecryptionCallback(const CallContext& ctx,
                                              RequestId requestId,
                                              const Bytes& cleartext,
                                              const Bytes& proof) {
    return coordinator_.onDecryptionCallback(ctx, requestId, cleartext, proof);
}

} // namespace cl
