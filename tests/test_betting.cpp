#include "betting.hpp"
#include "cards.hpp"
#include "commitment.hpp"
#include "crash.hpp"
#include "errors.hpp"
#include "games.hpp"
#include "mines.hpp"
#include "rng.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace hb;
using namespace std::chrono_literals;

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "betting_test failure: " << msg << std::endl;
    std::exit(1);
}

const std::string kSeed = "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";

ErrorKind rejection(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const GameError& e) {
        return e.kind();
    }
    fail("expected a GameError");
}

BetRequest bet(const std::string& session, Amount amount, std::string seed = {}) {
    BetRequest req;
    req.session = session;
    req.amount = amount;
    req.playerSeed = std::move(seed);
    return req;
}

class FixedSource : public RandomSource {
public:
    explicit FixedSource(double value) : value_(value) {}
    double uniform01() override { return value_; }

private:
    double value_;
};

void testLedger() {
    InMemoryLedger ledger(1000);
    if (ledger.balance("new") != 1000) {
        fail("unknown sessions open at the starting balance");
    }
    if (!ledger.adjust("new", -1000) || ledger.adjust("new", -1) || ledger.balance("new") != 0) {
        fail("ledger must refuse to go negative");
    }
    if (!ledger.adjust("new", 250) || ledger.balance("new") != 250) {
        fail("credit not applied");
    }
}

void testPlay() {
    CommitmentManager commitments(kSeed);
    InMemoryLedger ledger(1000);
    MinesBoardStore mines;
    BetDesk desk(commitments, ledger, mines, nullptr, "client");

    // Conformance vector through the desk: "test", sequence 0 lands tails.
    BetRequest req = bet("s1", 100, "test");
    req.sequence = 0;
    CoinflipGame::Params tails;
    tails.pick = CoinFace::Tails;
    auto s = desk.play<CoinflipGame>(req, tails);
    if (!s.result.won || s.result.payout != 198 || s.netChange != 98 || s.balance != 1098 ||
        s.commitHash != commitments.commitment().commitHash) {
        fail("desk did not settle the coinflip vector");
    }

    // The same sequence cannot be replayed in this epoch.
    if (rejection([&] { desk.play<CoinflipGame>(req, tails); }) != ErrorKind::InvalidParameters ||
        ledger.balance("s1") != 1098) {
        fail("replayed sequence must be refused with the stake returned");
    }

    // Allocation picks up after the supplied sequence.
    auto allocated = desk.play<DiceGame>(bet("s1", 10), DiceGame::Params{});
    if (allocated.result.sequence != 1 || allocated.playerSeed != "client") {
        fail("allocated bets use the next free sequence and the default seed");
    }

    std::uint64_t issued = commitments.stream().issued();
    if (rejection([&] { desk.play<CoinflipGame>(bet("s1", 0), tails); }) != ErrorKind::InvalidBet ||
        rejection([&] { desk.play<CoinflipGame>(bet("s1", 5000), tails); }) != ErrorKind::InvalidBet) {
        fail("non-positive and unfunded stakes are InvalidBet");
    }
    KenoGame::Params noPicks;
    if (rejection([&] { desk.play<KenoGame>(bet("s1", 10), noPicks); }) != ErrorKind::InvalidParameters) {
        fail("bad parameters are InvalidParameters");
    }
    if (commitments.stream().issued() != issued || ledger.balance("s1") != allocated.balance) {
        fail("rejected bets must not consume sequences or money");
    }

    // Plinko and wheel pay on every round; losses are partial refunds.
    auto plinko = desk.play<PlinkoGame>(bet("s2", 1000), PlinkoGame::Params{});
    if (ledger.balance("s2") != plinko.result.payout || plinko.netChange != plinko.result.payout - 1000) {
        fail("table game net change wrong");
    }
}

void testReservations() {
    CommitmentManager commitments(kSeed);
    InMemoryLedger ledger(1000);
    MinesBoardStore mines;
    BetDesk desk(commitments, ledger, mines, nullptr, "client");

    auto reservation = desk.reserve<HiLoGame>("alice");
    if (reservation.span != HiLoGame::kSpan || reservation.epoch != 1) {
        fail("reservation must cover the game's span");
    }
    Card shown = HiLoGame::deal(commitments.stream(), "client", reservation.first);

    BetRequest stolen = bet("mallory", 10);
    stolen.sequence = reservation.first;
    if (rejection([&] { desk.play<HiLoGame>(stolen, HiLoGame::Params{}); }) != ErrorKind::InvalidParameters) {
        fail("another session cannot use a reservation");
    }

    BetRequest req = bet("alice", 10);
    req.sequence = reservation.first;
    auto s = desk.play<HiLoGame>(req, HiLoGame::Params{});
    if (s.result.detail.current.rank != shown.rank || s.result.sequence != reservation.first) {
        fail("the bet must resolve against the previewed card");
    }
    if (rejection([&] { desk.play<HiLoGame>(req, HiLoGame::Params{}); }) != ErrorKind::InvalidParameters) {
        fail("a reservation is used once");
    }

    // A previewed card must not leak into another game: its rank pins the
    // fraction the coinflip would read.
    auto hilo = desk.reserve<HiLoGame>("alice");
    Amount before = ledger.balance("alice");
    BetRequest coin = bet("alice", 10);
    coin.sequence = hilo.first;
    CoinflipGame::Params heads;
    if (rejection([&] { desk.play<CoinflipGame>(coin, heads); }) != ErrorKind::InvalidParameters ||
        ledger.balance("alice") != before) {
        fail("a hi-lo reservation cannot be spent on a coinflip");
    }
    BetRequest otherSeed = bet("alice", 10, "other");
    otherSeed.sequence = hilo.first;
    if (rejection([&] { desk.play<HiLoGame>(otherSeed, HiLoGame::Params{}); }) != ErrorKind::InvalidParameters ||
        ledger.balance("alice") != before) {
        fail("a reservation is bound to the player seed it was dealt under");
    }
    BetRequest right = bet("alice", 10);
    right.sequence = hilo.first;
    if (desk.play<HiLoGame>(right, HiLoGame::Params{}).result.sequence != hilo.first) {
        fail("refused misuse must leave the reservation usable for its own game");
    }

    auto seeded = desk.reserve<HiLoGame>("bob", "bob-seed");
    if (seeded.playerSeed != "bob-seed" || seeded.game != HiLoGame::kName ||
        desk.reserve<BlackjackGame>("bob").playerSeed != "client") {
        fail("reservations record their game and player seed");
    }

    auto stale = desk.reserve<HiLoGame>("alice");
    commitments.rotate();
    before = ledger.balance("alice");
    BetRequest afterRotate = bet("alice", 10);
    afterRotate.sequence = stale.first;
    if (rejection([&] { desk.play<HiLoGame>(afterRotate, HiLoGame::Params{}); }) != ErrorKind::InvalidParameters ||
        ledger.balance("alice") != before) {
        fail("a reservation from a retired epoch must be refused with the stake returned");
    }
}

void testMinesThroughDesk() {
    CommitmentManager commitments(kSeed);
    InMemoryLedger ledger(1000);
    MinesBoardStore mines;
    BetDesk desk(commitments, ledger, mines, nullptr, "client");

    auto opened = desk.openMines(bet("m", 100, "test"));
    if (opened.balance != 900) {
        fail("opening a board debits the stake");
    }
    auto layout = MinesGame::placeMines(commitments.stream(), "test", opened.sequence);
    int revealed = 0;
    for (int cell = 0; cell < MinesGame::kCells && revealed < 2; ++cell) {
        if (std::find(layout.begin(), layout.end(), cell) != layout.end()) {
            continue;
        }
        auto r = desk.revealMine("m", cell % 5, cell / 5);
        if (r.mine) {
            fail("revealed a cell the layout marks as safe and hit a mine");
        }
        ++revealed;
    }
    auto paid = desk.cashoutMines("m");
    if (paid.cashout.payout != 140 || paid.netChange != 40 || paid.balance != 1040) {
        fail("two safe reveals on 100 should pay 140");
    }
    if (rejection([&] { desk.revealMine("m", 0, 0); }) != ErrorKind::StaleBoard) {
        fail("board must be gone after cashout");
    }
    if (rejection([&] { desk.openMines(bet("m", 5000)); }) != ErrorKind::InvalidBet || mines.size() != 0) {
        fail("unfunded boards must not open");
    }

    desk.openMines(bet("m", 100));
    auto replaced = desk.openMines(bet("m", 100));
    if (!replaced.previous || replaced.previous->payout != 100 || replaced.balance != 940) {
        fail("an untouched board replaced by a new one returns its stake");
    }
}

void testCrashThroughDesk() {
    CommitmentManager commitments(kSeed);
    InMemoryLedger ledger(1000);
    MinesBoardStore mines;
    FixedSource source(0.9); // 5.00x
    BroadcastHub<CrashEvent> hub;
    CrashRoundScheduler scheduler(CrashConfig{}, source, hub);
    BetDesk desk(commitments, ledger, mines, &scheduler, "client");

    auto joined = desk.joinCrash("c", 200);
    if (joined.roundId != 1 || joined.balance != 800) {
        fail("joining before the first round stakes round 1");
    }
    if (rejection([&] { desk.joinCrash("c", 100); }) != ErrorKind::RaceViolation || ledger.balance("c") != 800) {
        fail("double join must be refused and refunded");
    }

    auto t0 = CrashRoundScheduler::TimePoint{} + std::chrono::hours(1);
    scheduler.start(t0);
    if (rejection([&] { desk.joinCrash("d", 100); }) != ErrorKind::RaceViolation || ledger.balance("d") != 1000) {
        fail("joining a running round must be refused and refunded");
    }
    for (int tick = 1; tick <= 5; ++tick) {
        scheduler.advance(t0 + tick * 200ms);
    }
    // Highest broadcast is now 2.20x.
    if (desk.cashoutCrash("c", Fixed64::fromHundredths(221)).accepted) {
        fail("claims above the broadcast multiplier are refused");
    }
    auto cashed = desk.cashoutCrash("c", Fixed64::fromHundredths(220));
    if (!cashed.accepted || cashed.payout != 435 || ledger.balance("c") != 1235) {
        fail("cashout at 2.20x on 200 should pay floor(435.6)");
    }
    if (desk.cashoutCrash("c", Fixed64::fromHundredths(220)).accepted || ledger.balance("c") != 1235) {
        fail("second cashout must be refused");
    }
    if (desk.cashoutCrash("nobody", Fixed64(1)).accepted) {
        fail("sessions without a stake cannot cash out");
    }
}

} // namespace

int main() {
    testLedger();
    testPlay();
    testReservations();
    testMinesThroughDesk();
    testCrashThroughDesk();
    std::cout << "Betting desk checks passed\n";
    return 0;
}
