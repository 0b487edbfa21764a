#include "draw_config.hpp"
#include "ledger.hpp"
#include "lottery_engine.hpp"
#include "vrf.hpp"
#include "vrf_oracle.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>

using namespace lk;

namespace {

const char* kEngineAddress = "lottery";
const char* kOracleAddress = "vrf-coordinator";
const Amount kMaxAmount = std::numeric_limits<Amount>::max();
const Timestamp kMaxSeconds = std::numeric_limits<Timestamp>::max();
const char* kDefaultKeyHash = "474e34a077df58807dbe9c96d3c009b23b3c6d0cce433e59bbf5b34f823bc56c";

std::string envOr(const char* name, const std::string& fallback) {
    const char* raw = std::getenv(name);
    return raw ? std::string(raw) : fallback;
}

void printHelp() {
    std::cout << "Commands:\n"
              << "  fund <account> <amount>     credit an account on the simulated ledger\n"
              << "  enter <account> [amount]    enter the round (defaults to the entry fee)\n"
              << "  wait <seconds>              advance the simulated clock\n"
              << "  check                       evaluate draw eligibility\n"
              << "  draw                        trigger a draw\n"
              << "  fulfill                     deliver VRF randomness for the pending draw\n"
              << "  reject <account> on|off     make an account refuse incoming funds\n"
              << "  status                      show round state\n"
              << "  help | quit\n";
}

void printEvent(const LotteryEvent& event) {
    std::cout << "  [event] " << toString(event.kind);
    switch (event.kind) {
    case LotteryEventKind::ENTERED:
        std::cout << " participant=" << event.participant << " payment=" << event.amount;
        break;
    case LotteryEventKind::DRAW_REQUESTED:
        std::cout << " requestId=" << event.requestId;
        break;
    case LotteryEventKind::WINNER_PICKED:
        std::cout << " winner=" << event.participant << " pot=" << event.amount
                  << " requestId=" << event.requestId;
        break;
    }
    std::cout << " t=" << event.timestamp << "\n";
}

void printStatus(const LotteryEngine& engine, const ManualClock& clock) {
    std::cout << "State: " << toString(engine.state()) << "\n";
    std::cout << "Clock: " << clock.now() << "  last draw: " << engine.lastDrawTimestamp()
              << "  interval: " << engine.interval() << "\n";
    std::cout << "Entry fee: " << engine.entryFee() << "  pot: " << engine.balance() << "\n";
    std::cout << "Participants (" << engine.participantCount() << "):\n";
    for (std::size_t i = 0; i < engine.participantCount(); ++i) {
        std::cout << "  [" << i << "] " << engine.participant(i) << "\n";
    }
    if (!engine.recentWinner().empty()) {
        std::cout << "Recent winner: " << engine.recentWinner() << "\n";
    }
    if (auto pending = engine.pendingRequest()) {
        std::cout << "Pending request: " << *pending << "\n";
    }
    if (!engine.events().empty()) {
        std::cout << "Event log root: " << engine.events().merkleRoot() << "\n";
    }
}

void printReveal(const FulfillmentProof& proof, const std::string& publicKey) {
    std::cout << "\n=== VRF REVEAL ===\n";
    std::cout << "Request: " << proof.requestId << "\n";
    std::cout << "VRF public key: " << publicKey << "\n";
    std::cout << "VRF input (alpha): " << proof.alpha << "\n";
    std::cout << "VRF proof: " << proof.vrfProofHex << "\n";
    std::cout << "VRF output: " << proof.vrfOutputHex << "\n";
    for (std::size_t i = 0; i < proof.randomWords.size(); ++i) {
        std::cout << "Random word " << i << ": " << proof.randomWords[i] << "\n";
    }
    bool ok = VrfRandomnessOracle::verifyFulfillment(proof, publicKey);
    std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << "\n";
}

} // namespace

int main() {
    DrawConfig defaults;
    defaults.oracle.coordinator = kOracleAddress;
    defaults.oracle.keyHash = kDefaultKeyHash;
    defaults.oracle.subscriptionId = 1;

    DrawConfig cfg;
    try {
        cfg = loadDrawConfigFromEnv(defaults);
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    VrfRandomnessOracle::Config oracleCfg;
    oracleCfg.address = cfg.oracle.coordinator;
    oracleCfg.keyHash = cfg.oracle.keyHash;
    oracleCfg.deploymentId = envOr("LK_DEPLOYMENT_ID", "local-cli");
    oracleCfg.chainId = envOr("LK_CHAIN_ID", "offchain");

    auto ledger = std::make_shared<Ledger>();
    auto clock = std::make_shared<ManualClock>(0);
    std::shared_ptr<VrfRandomnessOracle> oracle;
    std::unique_ptr<LotteryEngine> engine;
    try {
        const char* seedEnv = std::getenv("LK_ORACLE_SEED");
        VrfKeyPair keys = seedEnv ? deriveVrfKeypairFromSeed(seedEnv) : generateVrfKeypair();
        oracle = std::make_shared<VrfRandomnessOracle>(oracleCfg, keys);
        engine = std::make_unique<LotteryEngine>(kEngineAddress, cfg, ledger, clock, oracle);
    } catch (const std::exception& ex) {
        std::cerr << "Startup failed: " << ex.what() << "\n";
        return 1;
    }
    engine->setEventCallback(printEvent);

    std::cout << "Lottery keeper interactive session (simulated ledger and clock).\n";
    std::cout << "Oracle " << oracle->address() << " VRF public key: " << oracle->publicKey() << "\n";
    std::cout << "Deployment scope: " << oracleCfg.deploymentId << " | " << oracleCfg.chainId
              << " (set LK_DEPLOYMENT_ID/LK_CHAIN_ID to override)\n";
    printHelp();

    std::string line;
    while (true) {
        std::cout << "\n> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        std::istringstream iss(line);
        std::string command;
        if (!(iss >> command)) {
            continue;
        }

        try {
            if (command == "quit" || command == "exit") {
                break;
            } else if (command == "help") {
                printHelp();
            } else if (command == "fund") {
                std::string account;
                std::string amountText;
                if (!(iss >> account >> amountText)) {
                    std::cout << "Usage: fund <account> <amount>\n";
                    continue;
                }
                Amount amount = parseUnsignedField("amount", amountText, kMaxAmount);
                ledger->credit(account, amount);
                std::cout << account << " balance: " << ledger->balanceOf(account) << "\n";
            } else if (command == "enter") {
                std::string account;
                if (!(iss >> account)) {
                    std::cout << "Usage: enter <account> [amount]\n";
                    continue;
                }
                Amount amount = engine->entryFee();
                std::string amountText;
                if (iss >> amountText) {
                    amount = parseUnsignedField("amount", amountText, kMaxAmount);
                }
                engine->enter(account, amount);
            } else if (command == "wait") {
                std::string secondsText;
                if (!(iss >> secondsText)) {
                    std::cout << "Usage: wait <seconds>\n";
                    continue;
                }
                Timestamp seconds = parseUnsignedField("seconds", secondsText, kMaxSeconds);
                clock->advance(seconds);
                std::cout << "Clock: " << clock->now() << "\n";
            } else if (command == "check") {
                auto check = engine->checkUpkeep();
                std::cout << "Upkeep needed: " << (check.upkeepNeeded ? "yes" : "no") << "\n";
            } else if (command == "draw") {
                RequestId id = engine->triggerDraw();
                std::cout << "Draw requested, request id " << id << "\n";
            } else if (command == "fulfill") {
                auto pending = engine->pendingRequest();
                if (!pending) {
                    std::cout << "No draw is pending.\n";
                    continue;
                }
                try {
                    auto proof = oracle->fulfill(*pending);
                    printReveal(proof, oracle->publicKey());
                } catch (const PayoutFailed& ex) {
                    std::cerr << "PAYOUT FAILED: " << ex.what() << "\n";
                    if (auto proof = oracle->fulfillment(*pending)) {
                        printReveal(*proof, oracle->publicKey());
                    }
                }
            } else if (command == "reject") {
                std::string account;
                std::string mode;
                if (!(iss >> account >> mode) || (mode != "on" && mode != "off")) {
                    std::cout << "Usage: reject <account> on|off\n";
                    continue;
                }
                ledger->setRejectsIncoming(account, mode == "on");
            } else if (command == "status") {
                printStatus(*engine, *clock);
            } else {
                std::cout << "Unknown command. Type help.\n";
            }
        } catch (const std::exception& ex) {
            std::cerr << "Error: " << ex.what() << "\n";
        }
    }

    std::cout << "\nFinal pot: " << engine->balance() << "\n";
    return 0;
}
