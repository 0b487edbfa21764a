#include "lottery_engine.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace lk;

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "lottery_engine_test failure: " << msg << std::endl;
    std::exit(1);
}

void check(bool condition, const std::string& msg) {
    if (!condition) {
        fail(msg);
    }
}

template <typename Error, typename Fn>
Error expectThrows(Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const Error& ex) {
        return ex;
    }
    fail(what + ": expected exception was not thrown");
}

// Records requests and lets the test decide when and with what to call back.
class ScriptedOracle : public RandomnessOracle {
public:
    explicit ScriptedOracle(Address address) : address_(std::move(address)) {}

    const Address& address() const override { return address_; }

    RequestId requestRandomWords(const RandomWordsRequest& request,
                                 RandomnessConsumer& consumer) override {
        if (rejectNext) {
            rejectNext = false;
            throw OracleError("scripted rejection");
        }
        if (onRequest) {
            onRequest();
        }
        requests.push_back(request);
        consumer_ = &consumer;
        return ++lastId_;
    }

    void deliver(RequestId requestId, std::vector<RandomWord> words) {
        deliverAs(address_, requestId, std::move(words));
    }

    void deliverAs(const Address& caller, RequestId requestId, std::vector<RandomWord> words) {
        if (consumer_ == nullptr) {
            fail("deliver called before any request");
        }
        consumer_->rawFulfillRandomWords(caller, requestId, words);
    }

    std::vector<RandomWordsRequest> requests;
    bool rejectNext = false;
    std::function<void()> onRequest;

private:
    Address address_;
    RandomnessConsumer* consumer_ = nullptr;
    RequestId lastId_ = 100;
};

const Amount kFee = kNativeUnit / 100;

DrawConfig makeConfig(Amount fee = kFee, Timestamp interval = 30) {
    DrawConfig cfg;
    cfg.entryFee = fee;
    cfg.interval = interval;
    cfg.oracle.coordinator = "coordinator";
    cfg.oracle.keyHash = "0xd89b2bf150e3b9e13446986e571fb9cab24b13cea0a43ea20a6049a85cc807cc";
    cfg.oracle.subscriptionId = 7;
    cfg.oracle.callbackGasLimit = 500'000;
    cfg.oracle.requestConfirmations = 3;
    cfg.oracle.numWords = 1;
    return cfg;
}

struct Fixture {
    std::shared_ptr<Ledger> ledger = std::make_shared<Ledger>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(0);
    std::shared_ptr<ScriptedOracle> oracle = std::make_shared<ScriptedOracle>("coordinator");
    LotteryEngine engine;

    explicit Fixture(const DrawConfig& cfg = makeConfig())
        : engine("lottery", cfg, ledger, clock, oracle) {}

    void fundAndEnter(const Address& who, Amount payment) {
        ledger->credit(who, payment);
        engine.enter(who, payment);
    }
};

void testConstruction() {
    Fixture f;
    check(f.engine.state() == LotteryState::OPEN, "new round must be OPEN");
    check(f.engine.participantCount() == 0, "new round must have no participants");
    check(f.engine.lastDrawTimestamp() == 0, "timestamp must be set at construction");
    check(f.engine.entryFee() == kFee, "entry fee accessor");
    check(f.engine.interval() == 30, "interval accessor");
    check(f.engine.numWords() == 1, "numWords accessor");
    check(f.engine.requestConfirmations() == 3, "requestConfirmations accessor");
    check(f.engine.recentWinner().empty(), "no winner before the first draw");
    check(!f.engine.pendingRequest(), "no request before the first draw");

    auto ledger = std::make_shared<Ledger>();
    auto clock = std::make_shared<ManualClock>(0);
    auto stranger = std::make_shared<ScriptedOracle>("someone-else");
    expectThrows<std::invalid_argument>(
        [&] { LotteryEngine bad("lottery", makeConfig(), ledger, clock, stranger); },
        "oracle address mismatch");

    DrawConfig zeroWords = makeConfig();
    zeroWords.oracle.numWords = 0;
    auto oracle = std::make_shared<ScriptedOracle>("coordinator");
    expectThrows<std::invalid_argument>(
        [&] { LotteryEngine bad("lottery", zeroWords, ledger, clock, oracle); },
        "numWords of zero");
}

void testEnterAppendsParticipant() {
    Fixture f;
    f.fundAndEnter("alice", kFee);
    check(f.engine.participantCount() == 1, "participant count must grow by one");
    check(f.engine.participant(0) == "alice", "entrant must be at the new index");
    check(f.engine.balance() == kFee, "payment must move into the pot");
    check(f.ledger->balanceOf("alice") == 0, "payment must leave the sender");

    f.fundAndEnter("bob", kFee * 3);
    check(f.engine.participantCount() == 2, "second entry");
    check(f.engine.participant(1) == "bob", "second entrant at index 1");
    check(f.engine.balance() == kFee * 4, "excess payment is retained in the pot");

    f.fundAndEnter("alice", kFee);
    check(f.engine.participantCount() == 3, "repeat entries are separate tickets");

    expectThrows<std::out_of_range>([&] { f.engine.participant(3); }, "participant out of range");

    const auto& events = f.engine.events();
    check(events.size() == 3, "one notification per entry");
    check(events.at(1).kind == LotteryEventKind::ENTERED, "entered notification kind");
    check(events.at(1).participant == "bob", "entered notification participant");
    check(events.at(1).amount == kFee * 3, "entered notification amount");
}

void testEnterRejectsUnderpayment() {
    Fixture f;
    f.ledger->credit("carol", kFee);
    auto err = expectThrows<InsufficientPayment>([&] { f.engine.enter("carol", kFee - 1); },
                                                 "underpayment while OPEN");
    check(err.paid() == kFee - 1 && err.required() == kFee, "underpayment carries amounts");
    check(f.engine.participantCount() == 0, "rejected entry must not be recorded");
    check(f.ledger->balanceOf("carol") == kFee, "rejected entry must not move funds");

    f.fundAndEnter("alice", kFee);
    f.clock->advance(31);
    f.engine.triggerDraw();
    expectThrows<InsufficientPayment>([&] { f.engine.enter("carol", 0); },
                                      "underpayment while DRAWING");
}

void testEnterRejectedWhileDrawing() {
    Fixture f;
    f.fundAndEnter("alice", kFee);
    f.clock->advance(30);
    f.engine.triggerDraw();

    f.ledger->credit("bob", kFee);
    expectThrows<RoundNotOpen>([&] { f.engine.enter("bob", kFee); }, "entry while DRAWING");
    check(f.engine.participantCount() == 1, "entry while DRAWING must not be recorded");
    check(f.ledger->balanceOf("bob") == kFee, "entry while DRAWING must not move funds");
}

void testEnterWithoutFunds() {
    Fixture f;
    expectThrows<InsufficientFunds>([&] { f.engine.enter("dave", kFee); }, "unfunded entry");
    check(f.engine.participantCount() == 0, "unfunded entry must not be recorded");
    check(f.engine.events().empty(), "unfunded entry must not notify");
}

void testEligibility() {
    Fixture f;
    f.clock->advance(1000);
    check(!f.engine.isEligibleForDraw(), "no participants and no balance");

    f.ledger->credit("lottery", kFee);
    check(!f.engine.isEligibleForDraw(), "balance without participants is not eligible");

    Fixture g;
    g.fundAndEnter("alice", kFee);
    g.clock->advance(29);
    check(!g.engine.isEligibleForDraw(), "interval not yet elapsed");
    g.clock->advance(1);
    check(g.engine.isEligibleForDraw(), "eligible once the interval has elapsed");
    auto upkeep = g.engine.checkUpkeep();
    check(upkeep.upkeepNeeded, "checkUpkeep mirrors eligibility");
    check(upkeep.performData.empty(), "performData is reserved");

    check(g.engine.isEligibleForDraw(), "predicate must not mutate state");
    check(g.engine.state() == LotteryState::OPEN, "predicate must not change state");
}

void testEligibilityFalseWithZeroBalance() {
    Fixture f(makeConfig(0, 30));
    f.engine.enter("alice", 0);
    f.clock->advance(1'000'000);
    check(f.engine.participantCount() == 1, "free entry recorded");
    check(!f.engine.isEligibleForDraw(), "zero balance is never eligible");

    // Re-evaluated on each call: a later deposit flips the predicate.
    f.ledger->credit("lottery", 1);
    check(f.engine.isEligibleForDraw(), "eligibility follows the live balance");
}

void testTriggerDrawTwice() {
    Fixture f;
    f.fundAndEnter("alice", kFee);
    f.clock->advance(31);

    RequestId id = f.engine.triggerDraw();
    check(f.engine.state() == LotteryState::DRAWING, "trigger moves the round to DRAWING");
    check(f.engine.pendingRequest() && *f.engine.pendingRequest() == id, "request handle retained");
    check(!f.engine.isEligibleForDraw(), "DRAWING is not eligible");

    auto err = expectThrows<UpkeepNotNeeded>([&] { f.engine.triggerDraw(); }, "second trigger");
    check(err.state() == LotteryState::DRAWING, "snapshot carries DRAWING");
    check(err.participants() == 1, "snapshot carries participant count");
    check(err.balance() == kFee, "snapshot carries balance");
    check(f.oracle->requests.size() == 1, "exactly one oracle request");
}

void testTriggerDrawCarriesConfig() {
    Fixture f;
    f.fundAndEnter("alice", kFee);
    f.clock->advance(30);
    RequestId id = f.engine.triggerDraw();

    const auto& request = f.oracle->requests.front();
    const auto& cfg = f.engine.config().oracle;
    check(request.keyHash == cfg.keyHash, "request key hash");
    check(request.subscriptionId == cfg.subscriptionId, "request subscription");
    check(request.requestConfirmations == cfg.requestConfirmations, "request confirmations");
    check(request.callbackGasLimit == cfg.callbackGasLimit, "request gas budget");
    check(request.numWords == 1, "request word count");
    check(request.nativePayment == cfg.nativePayment, "request payment mode");

    const auto& last = f.engine.events().at(f.engine.events().size() - 1);
    check(last.kind == LotteryEventKind::DRAW_REQUESTED, "draw started notification");
    check(last.requestId == id, "draw started notification carries the handle");
}

void testReentrantTriggerIsRejected() {
    Fixture f;
    f.fundAndEnter("alice", kFee);
    f.clock->advance(30);

    bool reentrantRejected = false;
    f.oracle->onRequest = [&] {
        try {
            f.engine.triggerDraw();
        } catch (const UpkeepNotNeeded& ex) {
            reentrantRejected = ex.state() == LotteryState::DRAWING;
        }
    };
    f.engine.triggerDraw();
    check(reentrantRejected, "trigger from inside the request must see DRAWING");
    check(f.oracle->requests.size() == 1, "reentrant trigger must not double-request");
}

void testOracleRejectionRollsBack() {
    Fixture f;
    f.fundAndEnter("alice", kFee);
    f.clock->advance(30);
    f.oracle->rejectNext = true;

    expectThrows<OracleError>([&] { f.engine.triggerDraw(); }, "rejected oracle request");
    check(f.engine.state() == LotteryState::OPEN, "failed request must reopen the round");
    check(!f.engine.pendingRequest(), "failed request leaves no handle");
    check(f.engine.events().size() == 1, "failed request must not notify");
    check(f.engine.isEligibleForDraw(), "round stays eligible for a retry");

    f.engine.triggerDraw();
    check(f.engine.state() == LotteryState::DRAWING, "retry succeeds");
}

void testSingleEntrantScenario() {
    Fixture f;
    f.ledger->credit("alice", kFee);
    f.engine.enter("alice", kFee);

    f.clock->set(31);
    check(f.engine.isEligibleForDraw(), "eligible at t=31");
    RequestId id = f.engine.triggerDraw();
    check(f.engine.state() == LotteryState::DRAWING, "DRAWING after trigger");

    f.oracle->deliver(id, { RandomWord(7) });
    check(f.engine.recentWinner() == "alice", "7 mod 1 selects the only entrant");
    check(f.ledger->balanceOf("alice") == kFee, "winner receives the entire pot");
    check(f.engine.balance() == 0, "no funds persist across rounds");
    check(f.engine.state() == LotteryState::OPEN, "round reopens");
    check(f.engine.participantCount() == 0, "participants cleared");
    check(f.engine.lastDrawTimestamp() == 31, "timestamp advanced to the payout time");
    check(!f.engine.pendingRequest(), "handle released after fulfillment");

    const auto& last = f.engine.events().at(f.engine.events().size() - 1);
    check(last.kind == LotteryEventKind::WINNER_PICKED, "winner notification");
    check(last.participant == "alice" && last.amount == kFee, "winner notification payload");
}

void testEmptyRoundScenario() {
    Fixture f;
    f.clock->advance(60);
    check(!f.engine.isEligibleForDraw(), "empty round is not eligible");
    auto err = expectThrows<UpkeepNotNeeded>([&] { f.engine.triggerDraw(); }, "empty trigger");
    check(err.balance() == 0, "snapshot balance 0");
    check(err.participants() == 0, "snapshot participants 0");
    check(err.state() == LotteryState::OPEN, "snapshot state OPEN");
    check(f.oracle->requests.empty(), "no request for an ineligible draw");
}

void testWinnerSelectionUsesFullWord() {
    Fixture f;
    f.fundAndEnter("alice", kFee);
    f.fundAndEnter("bob", kFee);
    f.fundAndEnter("carol", kFee);
    f.clock->advance(30);
    RequestId id = f.engine.triggerDraw();

    Amount bobBefore = f.ledger->balanceOf("bob");
    // 2^255 + 2 = 1 (mod 3).
    RandomWord word = (RandomWord(1) << 255) + 2;
    f.oracle->deliver(id, { word });
    check(f.engine.recentWinner() == "bob", "uint256 word reduced modulo participant count");
    check(f.ledger->balanceOf("bob") == bobBefore + kFee * 3, "winner balance grows by the pot");
}

void testPayoutFailureKeepsReset() {
    Fixture f;
    f.fundAndEnter("alice", kFee);
    f.fundAndEnter("bob", kFee * 2);
    f.clock->advance(45);
    RequestId id = f.engine.triggerDraw();
    f.ledger->setRejectsIncoming("alice", true);

    auto err = expectThrows<PayoutFailed>([&] { f.oracle->deliver(id, { RandomWord(4) }); },
                                          "rejected payout");
    check(err.winner() == "alice", "payout failure names the winner");
    check(err.amount() == kFee * 3, "payout failure names the stranded amount");
    check(f.engine.recentWinner() == "alice", "winner is still recorded");
    check(f.engine.state() == LotteryState::OPEN, "round is reset despite the failed payout");
    check(f.engine.participantCount() == 0, "participants cleared despite the failed payout");
    check(f.engine.lastDrawTimestamp() == 45, "timestamp advanced despite the failed payout");
    check(f.engine.balance() == kFee * 3, "pot stays stranded in the holding account");
    check(f.ledger->balanceOf("alice") == 0, "winner received nothing");
    check(f.engine.events().at(f.engine.events().size() - 1).kind ==
              LotteryEventKind::WINNER_PICKED,
          "winner notification precedes the transfer");
}

void testOnlyOracleCanFulfill() {
    Fixture f;
    f.fundAndEnter("alice", kFee);
    f.clock->advance(30);
    RequestId id = f.engine.triggerDraw();

    auto err = expectThrows<OnlyOracleCanFulfill>(
        [&] { f.oracle->deliverAs("mallory", id, { RandomWord(0) }); }, "forged fulfillment");
    check(err.have() == "mallory" && err.want() == "coordinator", "capability error payload");
    check(f.engine.state() == LotteryState::DRAWING, "forged fulfillment leaves the draw pending");

    expectThrows<UnknownDrawRequest>([&] { f.oracle->deliver(id + 1, { RandomWord(0) }); },
                                     "stale request id");
    check(f.engine.state() == LotteryState::DRAWING, "stale fulfillment leaves the draw pending");

    f.oracle->deliver(id, { RandomWord(0) });
    expectThrows<UnknownDrawRequest>([&] { f.oracle->deliver(id, { RandomWord(0) }); },
                                     "second fulfillment of the same request");
}

void testObserverRunsAfterCommit() {
    Fixture f;
    std::size_t participantsAtEntry = 0;
    Amount winnerBalanceAtPick = 0;
    Amount potAtPick = 0;
    std::vector<LotteryEventKind> seen;
    f.engine.setEventCallback([&](const LotteryEvent& event) {
        seen.push_back(event.kind);
        if (event.kind == LotteryEventKind::ENTERED) {
            participantsAtEntry = f.engine.participantCount();
        } else if (event.kind == LotteryEventKind::WINNER_PICKED) {
            winnerBalanceAtPick = f.ledger->balanceOf(event.participant);
            potAtPick = f.engine.balance();
        }
    });

    f.fundAndEnter("alice", kFee);
    check(participantsAtEntry == 1, "entry is recorded before the observer runs");
    f.clock->advance(30);
    f.oracle->deliver(f.engine.triggerDraw(), { RandomWord(0) });
    check(winnerBalanceAtPick == kFee, "payout is committed before the observer runs");
    check(potAtPick == 0, "pot is emptied before the observer runs");
    check(seen.size() == 3, "observer sees every notification");

    // A refused payout still reaches the observer and still raises PayoutFailed.
    seen.clear();
    f.fundAndEnter("bob", kFee);
    f.clock->advance(30);
    RequestId id = f.engine.triggerDraw();
    f.ledger->setRejectsIncoming("bob", true);
    expectThrows<PayoutFailed>([&] { f.oracle->deliver(id, { RandomWord(0) }); },
                               "refused payout with an observer attached");
    check(!seen.empty() && seen.back() == LotteryEventKind::WINNER_PICKED,
          "observer is told about the winner of a failed payout");
    check(f.engine.balance() == kFee, "refused pot stays in the holding account");
}

void testConsecutiveRounds() {
    Fixture f;
    f.fundAndEnter("alice", kFee);
    f.clock->advance(30);
    f.oracle->deliver(f.engine.triggerDraw(), { RandomWord(0) });
    check(f.engine.lastDrawTimestamp() == 30, "first round closed at t=30");

    f.fundAndEnter("bob", kFee);
    f.fundAndEnter("carol", kFee);
    f.clock->advance(29);
    check(!f.engine.isEligibleForDraw(), "interval restarts at the last payout");
    f.clock->advance(1);
    RequestId second = f.engine.triggerDraw();
    check(second != 0, "second round requested");
    f.oracle->deliver(second, { RandomWord(3) });
    check(f.engine.recentWinner() == "carol", "3 mod 2 selects index 1");
    check(f.ledger->balanceOf("carol") == kFee * 2, "second pot paid out");
    check(f.engine.events().size() == 7, "one notification per entry plus two per draw");
}

} // namespace

int main() {
    try {
        testConstruction();
        testEnterAppendsParticipant();
        testEnterRejectsUnderpayment();
        testEnterRejectedWhileDrawing();
        testEnterWithoutFunds();
        testEligibility();
        testEligibilityFalseWithZeroBalance();
        testTriggerDrawTwice();
        testTriggerDrawCarriesConfig();
        testReentrantTriggerIsRejected();
        testOracleRejectionRollsBack();
        testSingleEntrantScenario();
        testEmptyRoundScenario();
        testWinnerSelectionUsesFullWord();
        testPayoutFailureKeepsReset();
        testOnlyOracleCanFulfill();
        testConsecutiveRounds();
        testObserverRunsAfterCommit();
    } catch (const std::exception& ex) {
        fail(std::string("unexpected exception: ") + ex.what());
    }

    std::cout << "lottery_engine_test passed" << std::endl;
    return 0;
}
