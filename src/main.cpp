#include "errors.hpp"
#include "local_oracle.hpp"
#include "loan_pool.hpp"
#include "test_arithmetic.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

using namespace cl;

namespace {

void printEvent(const Event& event) {
    std::cout << "  [t=" << event.timestamp << "] " << eventKindName(event.kind);
    for (const auto& [key, value] : event.fields) {
        std::cout << " " << key << "=" << value;
    }
    std::cout << "\n";
}

bool parseAmount(const char* text, std::uint64_t& out) {
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0') {
        return false;
    }
    out = static_cast<std::uint64_t>(parsed);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::uint64_t loanAmount = 100;
    std::uint64_t collateralAmount = 50;
    std::uint64_t interestRate = 2;
    if (argc == 4) {
        if (!parseAmount(argv[1], loanAmount) || !parseAmount(argv[2], collateralAmount) ||
            !parseAmount(argv[3], interestRate)) {
            std::cerr << "Usage: cipherloan_demo [<loanAmount> <collateralAmount> <interestRate>]\n";
            return 1;
        }
    } else if (argc != 1) {
        std::cerr << "Usage: cipherloan_demo [<loanAmount> <collateralAmount> <interestRate>]\n";
        return 1;
    }

    const char* deploymentEnv = std::getenv("CL_DEPLOYMENT_ID");
    const char* chainEnv = std::getenv("CL_CHAIN_ID");
    LoanPool::Config cfg;
    cfg.deploymentId = deploymentEnv ? deploymentEnv : "local-cli";
    cfg.chainId = chainEnv ? chainEnv : "offchain";

    try {
        auto arithmetic = std::make_shared<InsecureTestArithmetic>();
        auto oracle = std::make_shared<LocalDecryptionOracle>(arithmetic);

        const Principal owner = "owner";
        const Principal provider = "provider-1";
        LoanPool pool(cfg, owner, arithmetic, oracle);
        pool.subscribe(printEvent);

        std::cout << "Pool identity: " << pool.selfIdentity() << "\n";
        std::cout << "Oracle public key: " << oracle->publicKeyHex() << "\n";
        std::cout << "(set CL_DEPLOYMENT_ID/CL_CHAIN_ID to override the identity)\n\n";

        std::uint64_t now = 1'000;
        pool.addProvider({ owner, now }, provider);
        BatchId batchId = pool.openBatch({ owner, ++now });

        // A real client would encrypt off-pool; the test backend mints handles directly.
        auto receipt = pool.submitParams({ provider, ++now },
                                         arithmetic->trivialEncrypt(loanAmount),
                                         arithmetic->trivialEncrypt(collateralAmount),
                                         arithmetic->trivialEncrypt(interestRate));
        std::cout << "Submitted params for batch " << receipt.batchId
                  << " commitment " << receipt.paramsCommitment << "\n";

        pool.closeBatch({ owner, ++now });
        DecryptionRequest request = pool.executeAndRequestDecryption({ provider, ++now });

        DecryptionResponse response = oracle->fulfill(request.requestId);
        RevealedResult result = pool.onDecryptionCallback(
            { "oracle", ++now }, response.requestId, response.cleartext, response.proof);

        std::cout << "\nBatch " << batchId << " profit revealed: " << result.plaintext << "\n";

        try {
            pool.onDecryptionCallback({ "oracle", ++now }, response.requestId, response.cleartext, response.proof);
            std::cerr << "Duplicate delivery was accepted\n";
            return 1;
        } catch (const ProtocolError& ex) {
            std::cout << "Duplicate delivery rejected: " << ex.what() << "\n";
        }

        std::cout << "Event journal root (" << pool.journal().size()
                  << " events): " << pool.journal().merkleRoot() << "\n";
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }
    return 0;
}
