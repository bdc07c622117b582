#include "abi_codec.hpp"
#include "commitment.hpp"
#include "test_support.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

using namespace cl;
using cltest::check;
using cltest::expectError;

namespace {

const std::string kSuite = "decryption_flow_test";

// Oracle that always hands out the same request id and accepts every proof.
class StuckCounterOracle : public DecryptionOracle {
public:
    RequestId requestDecryption(const std::vector<EncryptedHandle>&, const std::string&) override {
        ++calls;
        return 7;
    }
    bool checkSignatures(RequestId, const Bytes&, const Bytes&) const override { return true; }

    int calls = 0;
};

DecryptionRequest runToRequest(cltest::Fixture& fx, std::uint64_t loan, std::uint64_t collateral, std::uint64_t rate) {
    LoanPool& pool = *fx.pool;
    pool.openBatch({ "owner", 10 });
    pool.submitParams({ "alice", 11 }, fx.enc(loan), fx.enc(collateral), fx.enc(rate));
    pool.closeBatch({ "owner", 12 });
    return pool.executeAndRequestDecryption({ "alice", 13 });
}

void happyPathRevealsProfit() {
    cltest::Fixture fx;
    LoanPool& pool = *fx.pool;
    DecryptionRequest request = runToRequest(fx, 100, 50, 2);

    check(request.batchId == 1, kSuite, "request bound to wrong batch");
    check(request.state() == RequestState::Requested, kSuite, "request not in Requested state");
    auto profit = pool.coordinator().profitFor(1);
    check(profit.has_value(), kSuite, "profit handle not stored");
    check(request.stateHash == computeStateHash({ *profit }, pool.selfIdentity()),
          kSuite,
          "state hash is not the commitment over the stored profit");

    auto requested = pool.journal().eventsOfKind(EventKind::DecryptionRequested);
    check(requested.size() == 1, kSuite, "expected one DecryptionRequested event");
    check(requested[0].field("requestId") == std::to_string(request.requestId) &&
              requested[0].field("batchId") == "1" && requested[0].field("stateHash") == request.stateHash,
          kSuite,
          "DecryptionRequested fields wrong");

    DecryptionResponse response = fx.oracle->fulfill(request.requestId);
    check(LocalDecryptionOracle::verifyResponse(fx.oracle->publicKeyHex(), response),
          kSuite,
          "oracle response does not verify offline");
    RevealedResult result =
        pool.onDecryptionCallback({ "oracle", 20 }, request.requestId, response.cleartext, response.proof);

    check(result.plaintext == 150, kSuite, "expected plaintext 150");
    check(pool.coordinator().request(request.requestId)->processed, kSuite, "request not marked processed");
    check(pool.coordinator().revealedFor(1)->plaintext == 150, kSuite, "revealed result not queryable");
    check(pool.coordinator().outstandingRequests().empty(), kSuite, "request still outstanding");

    auto completed = pool.journal().eventsOfKind(EventKind::DecryptionCompleted);
    check(completed.size() == 1 && completed[0].field("plaintext") == "150" && completed[0].field("batchId") == "1",
          kSuite,
          "DecryptionCompleted fields wrong");
}

void stateHashIsDeterministic() {
    cltest::Fixture a;
    cltest::Fixture b;
    auto requestA = runToRequest(a, 100, 50, 2);
    auto requestB = runToRequest(b, 100, 50, 2);
    check(requestA.stateHash == requestB.stateHash, kSuite, "identical runs gave different state hashes");

    auto profit = *a.pool->coordinator().profitFor(1);
    check(computeStateHash({ profit }, "cipherloan:other") != requestA.stateHash,
          kSuite,
          "state hash ignores pool identity");
}

void duplicateDeliveryIsRejected() {
    cltest::Fixture fx;
    LoanPool& pool = *fx.pool;
    DecryptionRequest request = runToRequest(fx, 100, 50, 2);
    DecryptionResponse response = fx.oracle->fulfill(request.requestId);

    pool.onDecryptionCallback({ "oracle", 20 }, request.requestId, response.cleartext, response.proof);
    std::size_t eventsAfterFirst = pool.journal().size();

    expectError(ErrorKind::ReplayAttempt,
                [&] { pool.onDecryptionCallback({ "oracle", 21 }, request.requestId, response.cleartext, response.proof); },
                kSuite,
                "identical redelivery");
    expectError(ErrorKind::ReplayAttempt,
                [&] { pool.onDecryptionCallback({ "oracle", 22 }, request.requestId, encodeUintWord(999), Bytes{ 1, 2 }); },
                kSuite,
                "redelivery with different arguments");
    check(pool.journal().size() == eventsAfterFirst, kSuite, "rejected redelivery emitted events");
    check(pool.coordinator().revealedFor(1)->plaintext == 150, kSuite, "redelivery changed the revealed value");
}

void reentrantDeliveryIsRejected() {
    cltest::Fixture fx;
    LoanPool& pool = *fx.pool;
    DecryptionRequest request = runToRequest(fx, 100, 50, 2);
    DecryptionResponse response = fx.oracle->fulfill(request.requestId);

    bool sawReplay = false;
    bool reentered = false;
    pool.subscribe([&](const Event& event) {
        if (event.kind != EventKind::DecryptionCompleted || reentered) {
            return;
        }
        reentered = true;
        try {
            pool.onDecryptionCallback({ "oracle", 30 }, response.requestId, response.cleartext, response.proof);
        } catch (const ProtocolError& ex) {
            sawReplay = ex.kind() == ErrorKind::ReplayAttempt;
        }
    });

    pool.onDecryptionCallback({ "oracle", 30 }, response.requestId, response.cleartext, response.proof);
    check(reentered && sawReplay, kSuite, "nested delivery from a listener was not rejected as a replay");
    check(pool.journal().eventsOfKind(EventKind::DecryptionCompleted).size() == 1,
          kSuite,
          "nested delivery completed twice");
}

void staleRequestFailsAfterReexecution() {
    cltest::Fixture fx;
    LoanPool& pool = *fx.pool;
    pool.openBatch({ "owner", 10 });
    pool.submitParams({ "alice", 11 }, fx.enc(100), fx.enc(50), fx.enc(2));
    DecryptionRequest stale = pool.executeAndRequestDecryption({ "alice", 13 });
    DecryptionResponse staleResponse = fx.oracle->fulfill(stale.requestId);

    // The batch is still open: new params land and the profit is recomputed before the callback.
    pool.submitParams({ "alice", 100 }, fx.enc(200), fx.enc(50), fx.enc(2));
    DecryptionRequest fresh = pool.executeAndRequestDecryption({ "alice", 100 });
    check(fresh.batchId == stale.batchId && fresh.requestId != stale.requestId, kSuite, "re-execution ids wrong");
    check(fresh.stateHash != stale.stateHash, kSuite, "recompute from new params kept the old commitment");

    expectError(ErrorKind::StateMismatch,
                [&] {
                    pool.onDecryptionCallback(
                        { "oracle", 101 }, stale.requestId, staleResponse.cleartext, staleResponse.proof);
                },
                kSuite,
                "stale callback");
    check(!pool.coordinator().request(stale.requestId)->processed, kSuite, "stale request marked processed");

    DecryptionResponse freshResponse = fx.oracle->fulfill(fresh.requestId);
    auto result = pool.onDecryptionCallback(
        { "oracle", 102 }, fresh.requestId, freshResponse.cleartext, freshResponse.proof);
    check(result.plaintext == 350, kSuite, "fresh request should reveal 200*2-50");

    // The stale request stays unrevealable.
    expectError(ErrorKind::StateMismatch,
                [&] {
                    pool.onDecryptionCallback(
                        { "oracle", 103 }, stale.requestId, staleResponse.cleartext, staleResponse.proof);
                },
                kSuite,
                "stale callback after fresh reveal");
}

void reexecutionOnSameParamsKeepsCommitment() {
    cltest::Fixture fx;
    LoanPool& pool = *fx.pool;
    DecryptionRequest first = runToRequest(fx, 100, 50, 2);
    auto profit = *pool.coordinator().profitFor(1);

    DecryptionRequest second = pool.executeAndRequestDecryption({ "alice", 100 });
    check(second.requestId != first.requestId, kSuite, "re-execution reused the request id");
    check(second.stateHash == first.stateHash, kSuite, "identical params changed the state hash");
    check(*pool.coordinator().profitFor(1) == profit, kSuite, "identical params changed the profit handle");

    DecryptionResponse firstResponse = fx.oracle->fulfill(first.requestId);
    auto result = pool.onDecryptionCallback(
        { "oracle", 101 }, first.requestId, firstResponse.cleartext, firstResponse.proof);
    check(result.plaintext == 150, kSuite, "outstanding request failed after an identical re-execution");

    DecryptionResponse secondResponse = fx.oracle->fulfill(second.requestId);
    result = pool.onDecryptionCallback(
        { "oracle", 102 }, second.requestId, secondResponse.cleartext, secondResponse.proof);
    check(result.plaintext == 150 && result.requestId == second.requestId, kSuite, "second request did not reveal");
}

void invalidProofLeavesRequestOpen() {
    cltest::Fixture fx;
    LoanPool& pool = *fx.pool;
    DecryptionRequest request = runToRequest(fx, 100, 50, 2);
    DecryptionResponse response = fx.oracle->fulfill(request.requestId);

    Bytes tampered = response.proof;
    tampered[0] ^= 0x01;
    expectError(ErrorKind::InvalidProof,
                [&] { pool.onDecryptionCallback({ "oracle", 20 }, request.requestId, response.cleartext, tampered); },
                kSuite,
                "tampered proof");
    expectError(ErrorKind::InvalidProof,
                [&] { pool.onDecryptionCallback({ "oracle", 21 }, request.requestId, encodeUintWord(1'000'000), response.proof); },
                kSuite,
                "forged cleartext");
    expectError(ErrorKind::InvalidProof,
                [&] { pool.onDecryptionCallback({ "oracle", 22 }, request.requestId, response.cleartext, Bytes{}); },
                kSuite,
                "empty proof");

    // A genuine signature from a different oracle key.
    LocalDecryptionOracle rogue(fx.arithmetic);
    rogue.requestDecryption({ *pool.coordinator().profitFor(1) }, DecryptionCoordinator::kCallbackRef);
    DecryptionResponse rogueResponse = rogue.fulfill(request.requestId);
    expectError(ErrorKind::InvalidProof,
                [&] { pool.onDecryptionCallback({ "oracle", 23 }, request.requestId, rogueResponse.cleartext, rogueResponse.proof); },
                kSuite,
                "foreign signer");

    check(!pool.coordinator().request(request.requestId)->processed, kSuite, "invalid proof marked processed");
    check(pool.journal().eventsOfKind(EventKind::DecryptionCompleted).empty(), kSuite, "invalid proof revealed");

    auto result = pool.onDecryptionCallback({ "oracle", 24 }, request.requestId, response.cleartext, response.proof);
    check(result.plaintext == 150, kSuite, "first valid delivery should win");
}

void unknownRequestHasNoCommitment() {
    cltest::Fixture fx;
    LoanPool& pool = *fx.pool;
    runToRequest(fx, 100, 50, 2);
    expectError(ErrorKind::StateMismatch,
                [&] { pool.onDecryptionCallback({ "oracle", 20 }, 424242, encodeUintWord(1), Bytes(64, 0)); },
                kSuite,
                "unknown request id");
}

void malformedCleartextIsRejected() {
    auto arithmetic = std::make_shared<InsecureTestArithmetic>();
    auto oracle = std::make_shared<StuckCounterOracle>();
    LoanPool::Config cfg;
    cfg.deploymentId = "unit-test";
    LoanPool pool(cfg, "owner", arithmetic, oracle);

    pool.openBatch({ "owner", 1 });
    pool.submitParams({ "owner", 2 }, arithmetic->trivialEncrypt(3), arithmetic->trivialEncrypt(1), arithmetic->trivialEncrypt(4));
    DecryptionRequest request = pool.executeAndRequestDecryption({ "owner", 3 });
    check(request.requestId == 7, kSuite, "oracle id not used");

    expectError(ErrorKind::InvalidArgument,
                [&] { pool.onDecryptionCallback({ "oracle", 4 }, 7, Bytes(31, 0), Bytes{}); },
                kSuite,
                "short cleartext");
    Bytes tooWide(kAbiWordBytes, 0);
    tooWide[0] = 1;
    expectError(ErrorKind::InvalidArgument,
                [&] { pool.onDecryptionCallback({ "oracle", 5 }, 7, tooWide, Bytes{}); },
                kSuite,
                "cleartext wider than 64 bits");
    check(!pool.coordinator().request(7)->processed, kSuite, "malformed cleartext marked processed");

    auto result = pool.onDecryptionCallback({ "oracle", 6 }, 7, encodeUintWord(11), Bytes{});
    check(result.plaintext == 11, kSuite, "well-formed cleartext not decoded");

    // The oracle reissues id 7 for a recompute over new params. The request reaches the
    // oracle, but the pool records nothing and keeps the old profit.
    auto profitBefore = *pool.coordinator().profitFor(1);
    std::size_t eventsBefore = pool.journal().size();
    pool.submitParams({ "owner", 100 },
                      arithmetic->trivialEncrypt(5),
                      arithmetic->trivialEncrypt(1),
                      arithmetic->trivialEncrypt(4));
    expectError(ErrorKind::InvalidArgument,
                [&] { pool.executeAndRequestDecryption({ "owner", 100 }); },
                kSuite,
                "reissued request id");
    check(oracle->calls == 2, kSuite, "oracle not consulted on re-execution");
    check(pool.journal().size() == eventsBefore + 1, kSuite, "rejected request emitted an event");
    check(*pool.coordinator().profitFor(1) == profitBefore, kSuite, "rejected request overwrote the profit");
    check(pool.coordinator().request(7)->processed, kSuite, "rejected request reset the processed record");
}

void oracleKeysRestoreFromHex() {
    cltest::Fixture fx;
    OracleKeyPair keys = generateOracleKeypair();
    LocalDecryptionOracle restored(fx.arithmetic, keys.secretKeyHex);
    check(restored.publicKeyHex() == keys.publicKeyHex, kSuite, "restored oracle derived another public key");

    auto handle = fx.enc(42);
    RequestId first = restored.requestDecryption({ handle }, DecryptionCoordinator::kCallbackRef);
    RequestId second = restored.requestDecryption({ handle, handle }, DecryptionCoordinator::kCallbackRef);
    auto pending = restored.pendingRequests();
    check(pending.size() == 2 && pending[0].requestId == first && pending[1].requestId == second,
          kSuite,
          "pending requests not listed in id order");
    check(pending[1].ciphertexts.size() == 2 && pending[1].callbackRef == DecryptionCoordinator::kCallbackRef,
          kSuite,
          "pending request lost its ciphertexts or callback");

    DecryptionResponse response = restored.fulfill(first);
    check(LocalDecryptionOracle::verifyResponse(keys.publicKeyHex, response), kSuite, "restored key signs badly");
    check(!LocalDecryptionOracle::verifyResponse(fx.oracle->publicKeyHex(), response),
          kSuite,
          "response verified under a foreign key");

    bool shortKeyRejected = false;
    try {
        LocalDecryptionOracle truncated(fx.arithmetic, keys.secretKeyHex.substr(0, 64));
    } catch (const std::invalid_argument&) {
        shortKeyRejected = true;
    }
    check(shortKeyRejected, kSuite, "short secret key accepted");

    bool badHexRejected = false;
    try {
        SecretBytes::fromHex("zz", 1);
    } catch (const std::invalid_argument&) {
        badHexRejected = true;
    }
    check(badHexRejected, kSuite, "non-hex secret accepted");

    SecretBytes key = SecretBytes::fromHex("00ff10", 3);
    check(key.toHex() == "00ff10", kSuite, "secret bytes did not keep their value");
    SecretBytes moved(std::move(key));
    check(key.empty() && moved.size() == 3, kSuite, "moved-from secret still holds bytes");
}

void pauseDoesNotBlockDelivery() {
    cltest::Fixture fx;
    LoanPool& pool = *fx.pool;
    DecryptionRequest request = runToRequest(fx, 100, 50, 2);
    pool.setPaused({ "owner", 14 }, true);

    DecryptionResponse response = fx.oracle->fulfill(request.requestId);
    auto result = pool.onDecryptionCallback({ "oracle", 15 }, request.requestId, response.cleartext, response.proof);
    check(result.plaintext == 150, kSuite, "delivery while paused failed");
}

void executionOnOpenBatch() {
    cltest::Fixture fx;
    LoanPool& pool = *fx.pool;
    pool.openBatch({ "owner", 10 });
    pool.submitParams({ "alice", 11 }, fx.enc(7), fx.enc(4), fx.enc(3));
    DecryptionRequest request = pool.executeAndRequestDecryption({ "alice", 12 });
    check(pool.ledger().isOpen(), kSuite, "execution closed the batch");

    DecryptionResponse response = fx.oracle->fulfill(request.requestId);
    auto result = pool.onDecryptionCallback({ "oracle", 13 }, request.requestId, response.cleartext, response.proof);
    check(result.plaintext == 17, kSuite, "expected 7*3-4");

    // Next batch reuses nothing from the previous one.
    pool.closeBatch({ "owner", 14 });
    pool.openBatch({ "owner", 15 });
    expectError(ErrorKind::NotInitialized,
                [&] { pool.executeAndRequestDecryption({ "alice", 100 }); },
                kSuite,
                "new batch inherited params");
}

} // namespace

int main() {
    happyPathRevealsProfit();
    stateHashIsDeterministic();
    duplicateDeliveryIsRejected();
    reentrantDeliveryIsRejected();
    staleRequestFailsAfterReexecution();
    reexecutionOnSameParamsKeepsCommitment();
    invalidProofLeavesRequestOpen();
    unknownRequestHasNoCommitment();
    malformedCleartextIsRejected();
    oracleKeysRestoreFromHex();
    pauseDoesNotBlockDelivery();
    executionOnOpenBatch();

    std::cout << "decryption_flow_test passed" << std::endl;
    return 0;
}
