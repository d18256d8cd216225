#include "ledger_fixture.hpp"

#include "ledger_events.hpp"
#include "transcript_log.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace fl;
using namespace fltest;

namespace {

void checkMerkleProofs() {
    TranscriptLog empty;
    expect(empty.merkleRoot().empty(), "empty transcript has no root");
    expect(empty.merkleProof(0).empty(), "empty transcript has no proofs");
    expect(empty.getLeaf(0).empty(), "out of range leaf must be empty");

    for (std::size_t count = 1; count <= 7; ++count) {
        TranscriptLog log;
        for (std::size_t i = 0; i < count; ++i) {
            log.append("record-" + std::to_string(i));
        }
        const std::string root = log.merkleRoot();
        for (std::size_t i = 0; i < count; ++i) {
            auto proof = log.merkleProof(i);
            expect(TranscriptLog::verifyInclusion(log.getLeaf(i), proof, root),
                   "inclusion proof failed for leaf " + std::to_string(i) + " of " + std::to_string(count));
            expect(log.getLeaf(i) == TranscriptLog::leafHash("record-" + std::to_string(i)), "leaf hash mismatch");
        }
    }

    TranscriptLog log;
    log.append("alpha");
    log.append("beta");
    log.append("gamma");
    const std::string root = log.merkleRoot();
    auto proof = log.merkleProof(1);
    expect(!TranscriptLog::verifyInclusion(TranscriptLog::leafHash("delta"), proof, root),
           "foreign leaf must not verify");
    proof.front().siblingIsLeft = !proof.front().siblingIsLeft;
    expect(!TranscriptLog::verifyInclusion(log.getLeaf(1), proof, root), "flipped sibling side must not verify");
    expect(!TranscriptLog::verifyInclusion(log.getLeaf(1), log.merkleProof(1), ""), "empty root must not verify");

    log.append("delta");
    expect(log.merkleRoot() != root, "appending must move the root");
}

void checkLedgerTranscript() {
    LedgerHarness h;
    std::vector<std::string> seen;
    std::vector<std::uint64_t> sequences;
    h.ledger->subscribe([&](const LedgerEvent& event) {
        seen.push_back(eventKindName(event.kind));
        sequences.push_back(event.sequence);
    });

    expect(h.ledger->transcriptRoot().empty(), "fresh ledger has an empty transcript");
    h.ledger->addProvider("owner", "provider-a");
    std::string afterAdd = h.ledger->transcriptRoot();
    expect(!afterAdd.empty(), "first event must seed the transcript");

    h.ledger->openNewBatch("owner");
    h.submit("provider-a", 10, 20, 30);
    std::uint64_t requestId = h.ledger->requestBatchDecryption("auditor", 1);
    h.fulfillAndFinalize(requestId);
    expect(h.ledger->transcriptRoot() != afterAdd, "transcript root must track new events");

    // Rejected calls leave no trace.
    std::string before = h.ledger->transcriptRoot();
    expectLedgerError(ErrorCode::NotOwner, [&] { h.ledger->pause("auditor"); }, "pause by non-owner");
    expectLedgerError(ErrorCode::ReplayAttempt, [&] { h.fulfillAndFinalize(requestId); }, "replayed finalize");
    expect(h.ledger->transcriptRoot() == before, "rejections must not extend the transcript");

    const std::vector<std::string> expected = {
        "ProviderAdded", "BatchOpened", "CargoSubmitted", "DecryptionRequested", "DecryptionCompleted"
    };
    expect(seen == expected, "listener must observe events in commit order");
    expect(sequences == std::vector<std::uint64_t>{ 1, 2, 3, 4, 5 }, "sequence numbers must start at 1");

    const EventLog& log = h.ledger->eventLog();
    expect(log.size() == 5 && log.transcript().size() == 5, "every event must land in the transcript");
    for (std::size_t i = 0; i < log.size(); ++i) {
        const std::string leaf = TranscriptLog::leafHash(encodeEvent(log.events()[i]));
        expect(TranscriptLog::verifyInclusion(leaf, log.transcript().merkleProof(i), log.transcriptRoot()),
               "event " + std::to_string(i) + " must be provably included");
    }

    LedgerEvent forged = log.events()[4];
    forged.aggregates->demand += 1;
    expect(!TranscriptLog::verifyInclusion(TranscriptLog::leafHash(encodeEvent(forged)),
                                           log.transcript().merkleProof(4),
                                           log.transcriptRoot()),
           "tampered aggregates must not verify");

    const LedgerEvent& completed = log.events()[4];
    expect(completed.actor == "auditor" && completed.requestId == requestId, "completion must credit the requester");
    expect(completed.timestamp == kStartTime, "events must be stamped with the ledger clock");
}

void checkTranscriptBindsDeployment() {
    LedgerHarness first("0xrail-0001");
    LedgerHarness second("0xrail-0002", first.backend, first.oracle);
    first.ledger->openNewBatch("owner");
    second.ledger->openNewBatch("owner");
    std::uint64_t a = first.ledger->requestBatchDecryption("auditor", 1);
    std::uint64_t b = second.ledger->requestBatchDecryption("auditor", 1);

    auto hashA = first.ledger->getDecryptionContext(a).stateHash;
    auto hashB = second.ledger->getDecryptionContext(b).stateHash;
    expect(hashA != hashB, "state hashes must differ across deployments");
    expect(first.ledger->transcriptRoot() != second.ledger->transcriptRoot(),
           "transcripts of distinct deployments must diverge");
}

} // namespace

int main() {
    try {
        checkMerkleProofs();
        checkLedgerTranscript();
        checkTranscriptBindsDeployment();
    } catch (const std::exception& ex) {
        fail(std::string("unexpected exception: ") + ex.what());
    }
    std::cout << "transcript_log_test passed" << std::endl;
    return 0;
}
