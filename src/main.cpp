#include "cargo_ledger.hpp"
#include "decryption_oracle.hpp"
#include "ledger_error.hpp"
#include "paillier_backend.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace fl;

namespace {

struct CargoReport {
    std::string provider;
    std::int64_t demand;
    std::int64_t supply;
    std::int64_t profit;
};

void printEvent(const LedgerEvent& event) {
    std::cout << "  #" << event.sequence << " " << eventKindName(event.kind) << " actor=" << event.actor;
    if (!event.subject.empty()) {
        std::cout << " subject=" << event.subject;
    }
    if (event.batchId != 0) {
        std::cout << " batch=" << event.batchId;
    }
    if (event.requestId != 0) {
        std::cout << " request=" << event.requestId;
    }
    if (event.stateHash) {
        std::cout << " stateHash=" << bytesToHex(event.stateHash->data(), event.stateHash->size()).substr(0, 16)
                  << "...";
    }
    if (event.aggregates) {
        std::cout << " demand=" << event.aggregates->demand << " supply=" << event.aggregates->supply
                  << " profit=" << event.aggregates->profit;
    }
    std::cout << "\n";
}

std::uint64_t parsePrimeBits(int argc, char* argv[]) {
    if (argc < 2) {
        return 512;
    }
    return std::stoull(argv[1]);
}

} // namespace

int main(int argc, char* argv[]) {
    LedgerConfig cfg;
    cfg.owner = "operator";
    const char* deploymentEnv = std::getenv("FL_DEPLOYMENT_ID");
    cfg.deploymentId = deploymentEnv ? deploymentEnv : "local-cli";
    cfg.contractAddress = "0xfreight-ledger-demo";
    cfg.cooldownInterval = 1;

    // Demo clock advances one second per read so cooldowns never block the script.
    auto now = std::make_shared<std::uint64_t>(1'700'000'000);
    cfg.clock = [now]() { return (*now)++; };

    std::shared_ptr<PaillierBackend> backend;
    std::shared_ptr<SignedDecryptionOracle> oracle;
    std::unique_ptr<CargoLedger> ledger;
    try {
        PaillierBackend::Config heCfg;
        heCfg.primeBits = static_cast<std::uint32_t>(parsePrimeBits(argc, argv));
        backend = std::make_shared<PaillierBackend>(heCfg);
        oracle = std::make_shared<SignedDecryptionOracle>(backend, generateOracleKeypair());
        ledger = std::make_unique<CargoLedger>(cfg, backend, oracle);
    } catch (const std::exception& ex) {
        std::cerr << "Setup failed: " << ex.what() << "\n";
        return 1;
    }

    std::cout << "Freight ledger demo\n";
    std::cout << "Contract identity: " << ledger->contractIdentity() << "\n";
    std::cout << "Oracle public key: " << oracle->publicKeyHex() << "\n";
    std::cout << " (set FL_DEPLOYMENT_ID/FL_CHAIN_ID to override the deployment scope)\n";
    ledger->subscribe(printEvent);

    const std::vector<CargoReport> reports = {
        { "carrier-north", 50, 20, 30 },
        { "carrier-south", 30, 10, 15 },
    };

    try {
        std::cout << "\nEvents:\n";
        for (const auto& report : reports) {
            ledger->addProvider(cfg.owner, report.provider);
        }
        std::uint64_t batchId = ledger->openNewBatch(cfg.owner);
        for (const auto& report : reports) {
            ledger->submitEncryptedCargo(report.provider,
                                         backend->encrypt(report.demand),
                                         backend->encrypt(report.supply),
                                         backend->encrypt(report.profit));
        }
        ledger->closeCurrentBatch(cfg.owner);

        std::uint64_t requestId = ledger->requestBatchDecryption("auditor", batchId);
        DecryptionResponse response = oracle->fulfill(requestId);
        BatchAggregates totals = ledger->finalizeBatchDecryption(requestId, response.cleartexts, response.proof);

        const DecryptionContext& context = ledger->getDecryptionContext(requestId);
        std::cout << "\nBatch " << batchId << " totals: demand=" << totals.demand << " supply=" << totals.supply
                  << " profit=" << totals.profit << "\n";
        std::cout << "Proof: " << bytesToHex(reinterpret_cast<const unsigned char*>(response.proof.data()),
                                             response.proof.size())
                  << "\n";
        std::cout << "Cleartexts: "
                  << bytesToHex(reinterpret_cast<const unsigned char*>(response.cleartexts.data()),
                                response.cleartexts.size())
                  << "\n";
        std::cout << "Handles:";
        for (const auto& handle : context.snapshot.handles()) {
            std::cout << " " << handle.toHex();
        }
        std::cout << "\n";
    } catch (const LedgerError& err) {
        std::cerr << "Ledger rejected the call: " << err.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    std::cout << "Transcript root: " << ledger->transcriptRoot() << " (" << ledger->events().size() << " events)\n";
    return 0;
}
