#include "ledger_fixture.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace fl;
using namespace fltest;

namespace {

// Oracle that vouches for any payload, so malformed cleartexts get past
// proof verification.
class AcceptAnyOracle : public DecryptionOracle {
public:
    std::uint64_t requestDecryption(const std::vector<CiphertextHandle>&, const std::string&) override {
        return nextRequestId_++;
    }

    bool verify(std::uint64_t,
                const std::vector<CiphertextHandle>&,
                const std::string&,
                const std::string&,
                const std::string&) const override {
        return true;
    }

private:
    std::uint64_t nextRequestId_ = 1;
};

void openWithProviders(LedgerHarness& h) {
    h.ledger->addProvider("owner", "provider-a");
    h.ledger->addProvider("owner", "provider-b");
    h.ledger->openNewBatch("owner");
}

void checkTwoProviderScenario() {
    LedgerHarness h;
    openWithProviders(h);
    expect(h.ledger->currentModelVersion() == 1, "ledger must start on model v1");

    h.submit("provider-a", 50, 20, 30);
    h.submit("provider-b", 30, 10, 15);

    std::uint64_t requestId = h.ledger->requestBatchDecryption("auditor", 1);
    const DecryptionContext& pending = h.ledger->getDecryptionContext(requestId);
    expect(!pending.processed, "fresh context must be unprocessed");
    expect(pending.batchId == 1 && pending.modelVersion == 1, "context must capture batch and version");
    expect(pending.requester == "auditor", "context must capture requester");

    auto requested = h.ledger->eventLog().eventsOfKind(EventKind::DecryptionRequested);
    expect(requested.size() == 1, "request must emit one event");
    expect(requested.front().stateHash && *requested.front().stateHash == pending.stateHash,
           "request event must publish the state hash");

    BatchAggregates totals = h.fulfillAndFinalize(requestId);
    expect(totals.demand == 80, "demand total mismatch");
    expect(totals.supply == 30, "supply total mismatch");
    expect(totals.profit == 45, "profit total mismatch");

    const DecryptionContext& done = h.ledger->getDecryptionContext(requestId);
    expect(done.processed, "finalized context must be processed");
    expect(done.revealed && done.revealed->demand == 80, "context must retain the revealed totals");

    auto completed = h.ledger->eventLog().eventsOfKind(EventKind::DecryptionCompleted);
    expect(completed.size() == 1, "finalize must emit one completion event");
    expect(completed.front().aggregates && completed.front().aggregates->profit == 45,
           "completion event must carry plaintext aggregates");
    for (const auto& event : h.ledger->events()) {
        if (event.kind != EventKind::DecryptionCompleted) {
            expect(!event.aggregates, "only the completion event may carry plaintext");
        }
    }
}

void checkSubmissionBetweenRequestAndFinalize() {
    LedgerHarness h;
    openWithProviders(h);
    h.submit("provider-a", 50, 20, 30);

    std::uint64_t requestId = h.ledger->requestBatchDecryption("auditor", 1);
    DecryptionResponse stale = h.oracle->fulfill(requestId);

    h.submit("provider-b", 30, 10, 15);

    expectLedgerError(ErrorCode::InvalidStateHash,
                      [&] { h.ledger->finalizeBatchDecryption(requestId, stale.cleartexts, stale.proof); },
                      "finalize after drift");
    expect(!h.ledger->getDecryptionContext(requestId).processed, "drifted request must stay unprocessed");

    // A fresh request over the new state still succeeds.
    h.advance(kTestCooldown);
    std::uint64_t retryId = h.ledger->requestBatchDecryption("auditor", 1);
    BatchAggregates totals = h.fulfillAndFinalize(retryId);
    expect(totals.demand == 80 && totals.supply == 30 && totals.profit == 45, "re-request totals mismatch");
}

void checkDoubleFinalize() {
    LedgerHarness h;
    openWithProviders(h);
    h.submit("provider-a", 7, 8, 9);

    std::uint64_t requestId = h.ledger->requestBatchDecryption("auditor", 1);
    DecryptionResponse response = h.oracle->fulfill(requestId);
    h.ledger->finalizeBatchDecryption(requestId, response.cleartexts, response.proof);

    expectLedgerError(ErrorCode::ReplayAttempt,
                      [&] { h.ledger->finalizeBatchDecryption(requestId, response.cleartexts, response.proof); },
                      "second finalize with valid proof");
    expectLedgerError(ErrorCode::ReplayAttempt,
                      [&] { h.ledger->finalizeBatchDecryption(requestId, "garbage", "garbage"); },
                      "second finalize with invalid proof");
    expect(h.ledger->eventLog().eventsOfKind(EventKind::DecryptionCompleted).size() == 1,
           "replays must not emit completion events");
}

void checkModelVersionBump() {
    LedgerHarness h;
    openWithProviders(h);
    h.submit("provider-a", 1, 2, 3);

    std::uint64_t requestId = h.ledger->requestBatchDecryption("auditor", 1);
    DecryptionResponse response = h.oracle->fulfill(requestId);

    expect(h.ledger->bumpModelVersion("owner") == 2, "bump must advance to v2");
    expectLedgerError(ErrorCode::StaleWrite,
                      [&] { h.ledger->finalizeBatchDecryption(requestId, response.cleartexts, response.proof); },
                      "finalize after model bump");
    expect(!h.ledger->getDecryptionContext(requestId).processed, "stale request must stay unprocessed");

    h.advance(kTestCooldown);
    expectLedgerError(ErrorCode::StaleWrite,
                      [&] { h.ledger->requestBatchDecryption("auditor", 1); },
                      "request against superseded batch");
    expect(h.ledger->lastActionOf("auditor") == kStartTime, "rejected request must not touch the cooldown");

    expectLedgerError(ErrorCode::NotOwner,
                      [&] { h.ledger->bumpModelVersion("provider-a"); },
                      "bump by non-owner");
}

void checkZeroSubmissionBatch() {
    LedgerHarness h;
    h.ledger->openNewBatch("owner");
    std::uint64_t requestId = h.ledger->requestBatchDecryption("auditor", 1);
    BatchAggregates totals = h.fulfillAndFinalize(requestId);
    expect(totals.demand == 0 && totals.supply == 0 && totals.profit == 0, "empty batch must decrypt to zeros");
}

void checkInvalidProofThenRetry() {
    LedgerHarness h;
    openWithProviders(h);
    h.submit("provider-a", 11, 12, 13);

    std::uint64_t requestId = h.ledger->requestBatchDecryption("auditor", 1);
    DecryptionResponse response = h.oracle->fulfill(requestId);

    std::string forgedCleartexts = encodeCleartexts({ 1000, 12, 13 });
    expectLedgerError(ErrorCode::InvalidProof,
                      [&] { h.ledger->finalizeBatchDecryption(requestId, forgedCleartexts, response.proof); },
                      "forged cleartexts");

    std::string brokenProof = response.proof;
    brokenProof[0] = static_cast<char>(brokenProof[0] ^ 0x01);
    expectLedgerError(ErrorCode::InvalidProof,
                      [&] { h.ledger->finalizeBatchDecryption(requestId, response.cleartexts, brokenProof); },
                      "tampered proof");
    expect(!h.ledger->getDecryptionContext(requestId).processed, "bad proof must leave context unprocessed");

    BatchAggregates totals = h.ledger->finalizeBatchDecryption(requestId, response.cleartexts, response.proof);
    expect(totals.demand == 11 && totals.supply == 12 && totals.profit == 13, "retry with valid proof failed");
}

void checkClosedBatchStillFinalizes() {
    LedgerHarness h;
    openWithProviders(h);
    h.submit("provider-a", 4, 5, -6);

    std::uint64_t requestId = h.ledger->requestBatchDecryption("auditor", 1);
    h.ledger->closeCurrentBatch("owner");
    BatchAggregates totals = h.fulfillAndFinalize(requestId);
    expect(totals.profit == -6, "negative profit must survive the round trip");
}

void checkCrossContractIsolation() {
    LedgerHarness first("0xrail-0001");
    LedgerHarness second("0xrail-0002", first.backend, first.oracle);
    expect(first.ledger->contractIdentity() != second.ledger->contractIdentity(),
           "distinct addresses must yield distinct identities");

    EncryptedTotals totals;
    totals.demand = first.backend->encrypt(1);
    totals.supply = first.backend->encrypt(2);
    totals.profit = first.backend->encrypt(3);
    expect(computeStateHash(totals, first.ledger->contractIdentity()) !=
               computeStateHash(totals, second.ledger->contractIdentity()),
           "state hash must bind the contract identity");

    first.ledger->openNewBatch("owner");
    std::uint64_t requestId = first.ledger->requestBatchDecryption("auditor", 1);
    DecryptionResponse response = first.oracle->fulfill(requestId);

    const DecryptionContext& context = first.ledger->getDecryptionContext(requestId);
    expect(!verifyDecryptionProof(first.oracle->publicKeyHex(),
                                  requestId,
                                  context.snapshot.handles(),
                                  second.ledger->contractIdentity(),
                                  response.cleartexts,
                                  response.proof),
           "proof must not verify for another deployment");

    expectLedgerError(ErrorCode::UnknownRequest,
                      [&] { second.ledger->finalizeBatchDecryption(requestId, response.cleartexts, response.proof); },
                      "foreign request id");
}

void checkRequestGates() {
    LedgerHarness h;
    h.ledger->openNewBatch("owner");

    expectLedgerError(ErrorCode::InvalidBatch,
                      [&] { h.ledger->requestBatchDecryption("auditor", 42); },
                      "unknown batch");
    expectLedgerError(ErrorCode::UnknownRequest,
                      [&] { h.ledger->finalizeBatchDecryption(99, "", ""); },
                      "unknown request");

    std::uint64_t requestId = h.ledger->requestBatchDecryption("auditor", 1);
    expectLedgerError(ErrorCode::CooldownActive,
                      [&] { h.ledger->requestBatchDecryption("auditor", 1); },
                      "request inside cooldown");

    h.ledger->pause("owner");
    h.advance(kTestCooldown);
    expectLedgerError(ErrorCode::Paused,
                      [&] { h.ledger->requestBatchDecryption("auditor", 1); },
                      "request while paused");

    // Oracle callbacks are self-contained and still land while paused.
    BatchAggregates totals = h.fulfillAndFinalize(requestId);
    expect(totals.demand == 0, "finalize while paused must succeed");
}

void checkOracleSeesRequestHandles() {
    LedgerHarness h;
    openWithProviders(h);
    h.submit("provider-a", 3, 3, 3);
    std::uint64_t requestId = h.ledger->requestBatchDecryption("auditor", 1);

    const auto* pending = h.oracle->findRequest(requestId);
    expect(pending != nullptr, "oracle must track the request");
    expect(pending->handles == h.ledger->getBatch(1).totals.handles(), "oracle must receive batch totals");
    expect(pending->requesterIdentity == h.ledger->contractIdentity(), "oracle must receive contract identity");
    expect(h.oracle->pendingRequestIds() == std::vector<std::uint64_t>{ requestId }, "request must be pending");

    h.fulfillAndFinalize(requestId);
    expect(h.oracle->pendingRequestIds().empty(), "fulfilled request must leave the queue");
}

void checkMalformedCleartexts() {
    auto backend = makeTestBackend();
    LedgerConfig cfg;
    cfg.owner = "owner";
    cfg.deploymentId = "testnet";
    cfg.contractAddress = "0xrail-cleartext";
    cfg.cooldownInterval = kTestCooldown;
    cfg.clock = []() { return kStartTime; };
    CargoLedger ledger(cfg, backend, std::make_shared<AcceptAnyOracle>());

    ledger.addProvider("owner", "provider-a");
    ledger.openNewBatch("owner");
    ledger.submitEncryptedCargo("provider-a", backend->encrypt(1), backend->encrypt(2), backend->encrypt(3));
    std::uint64_t requestId = ledger.requestBatchDecryption("auditor", 1);

    const std::string valid = encodeCleartexts({ 1, 2, 3 });
    const std::vector<std::string> malformed = { "", valid.substr(0, 23), valid + "x", encodeCleartexts({ 1, 2 }) };
    for (const auto& payload : malformed) {
        LedgerError err = expectLedgerError(ErrorCode::InvalidCleartext,
                                            [&] { ledger.finalizeBatchDecryption(requestId, payload, "any"); },
                                            "payload of " + std::to_string(payload.size()) + " bytes");
        expect(err.category() == ErrorCategory::Integrity, "malformed cleartext is an integrity failure");
        expect(!ledger.getDecryptionContext(requestId).processed, "malformed cleartext must leave context unprocessed");
        expect(!ledger.getDecryptionContext(requestId).revealed, "malformed cleartext must not reveal totals");
    }
    expect(ledger.eventLog().eventsOfKind(EventKind::DecryptionCompleted).empty(),
           "malformed cleartext must not emit a completion event");

    BatchAggregates totals = ledger.finalizeBatchDecryption(requestId, valid, "any");
    expect(totals.demand == 1 && totals.supply == 2 && totals.profit == 3, "well-formed payload must still finalize");
}

} // namespace

int main() {
    try {
        checkTwoProviderScenario();
        checkSubmissionBetweenRequestAndFinalize();
        checkDoubleFinalize();
        checkModelVersionBump();
        checkZeroSubmissionBatch();
        checkInvalidProofThenRetry();
        checkClosedBatchStillFinalizes();
        checkCrossContractIsolation();
        checkRequestGates();
        checkOracleSeesRequestHandles();
        checkMalformedCleartexts();
    } catch (const std::exception& ex) {
        fail(std::string("unexpected exception: ") + ex.what());
    }
    std::cout << "decryption_protocol_test passed" << std::endl;
    return 0;
}
