#include "cards.hpp"
#include "deterministic_math.hpp"
#include "errors.hpp"
#include "fixed_point.hpp"
#include "games.hpp"
#include "rng.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace hb;

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "games_test failure: " << msg << std::endl;
    std::exit(1);
}

const std::string kSeed = "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";

void expectRejected(ErrorKind kind, const std::string& what, const std::function<void()>& fn) {
    try {
        fn();
    } catch (const GameError& e) {
        if (e.kind() != kind) {
            fail(what + ": wrong error kind " + toString(e.kind()));
        }
        return;
    }
    fail(what + ": accepted");
}

void testFixedPoint() {
    if (CoinflipGame::kPayout.applyTo(100) != 198) {
        fail("100 * 1.98 must pay exactly 198");
    }
    if (Fixed64::fromHundredths(199).applyTo(1) != 1) {
        fail("payouts must floor");
    }
    if (Fixed64::fromDouble(2.379999).toString(2) != "2.37" || Fixed64(3).toString(0) != "3") {
        fail("toString must truncate");
    }
    if (Fixed64::fromDouble(2.6489).floorToHundredths() != Fixed64::fromHundredths(264)) {
        fail("floorToHundredths must round down");
    }
}

void testValidation() {
    DiceGame::Params dice;
    dice.target = 99.0;
    DiceGame::validate(dice);
    dice.target = 1.0;
    DiceGame::validate(dice);
    dice.target = 99.01;
    expectRejected(ErrorKind::InvalidParameters, "dice under 99.01", [&] { DiceGame::validate(dice); });
    dice.over = true;
    dice.target = 98.99;
    DiceGame::validate(dice);
    dice.target = 99.0;
    expectRejected(ErrorKind::InvalidParameters, "dice over 99.00", [&] { DiceGame::validate(dice); });
    dice.target = 0.99;
    expectRejected(ErrorKind::InvalidParameters, "dice over 0.99", [&] { DiceGame::validate(dice); });

    LimboGame::Params limbo;
    limbo.target = 1.0;
    expectRejected(ErrorKind::InvalidParameters, "limbo 1.00", [&] { LimboGame::validate(limbo); });
    limbo.target = 1'000'001.0;
    expectRejected(ErrorKind::InvalidParameters, "limbo above cap", [&] { LimboGame::validate(limbo); });

    KenoGame::Params keno;
    expectRejected(ErrorKind::InvalidParameters, "keno no picks", [&] { KenoGame::validate(keno); });
    keno.picks = { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11 };
    expectRejected(ErrorKind::InvalidParameters, "keno 11 picks", [&] { KenoGame::validate(keno); });
    keno.picks = { 4, 4 };
    expectRejected(ErrorKind::InvalidParameters, "keno duplicates", [&] { KenoGame::validate(keno); });
    keno.picks = { 41 };
    expectRejected(ErrorKind::InvalidParameters, "keno 41", [&] { KenoGame::validate(keno); });

    RouletteGame::Params roulette;
    roulette.type = RouletteBet::Number;
    roulette.number = 37;
    expectRejected(ErrorKind::InvalidParameters, "roulette 37", [&] { RouletteGame::validate(roulette); });

    BlackjackGame::Params blackjack;
    blackjack.actions.assign(BlackjackGame::kMaxActions + 1, BlackjackAction::Hit);
    expectRejected(ErrorKind::InvalidParameters, "blackjack action flood", [&] { BlackjackGame::validate(blackjack); });
}

void testMultipliers() {
    DiceGame::Params under;
    under.target = 50.0;
    if (DiceGame::multiplier(under) != Fixed64::fromHundredths(198)) {
        fail("dice under 50 should pay 1.98");
    }
    DiceGame::Params over;
    over.over = true;
    over.target = 50.0;
    if (DiceGame::multiplier(over) != Fixed64::fromRaw(1'980'396)) {
        fail("dice over 50 should pay 0.99 / 0.4999");
    }
    if ((RouletteGame::baseMultiplier(RouletteBet::Number) * RouletteGame::kEdgeFactor) !=
        Fixed64::fromHundredths(3528)) {
        fail("straight-up roulette should pay 35.28");
    }
    if (!RouletteGame::wins({ RouletteBet::Odd, -1 }, 7) || RouletteGame::wins({ RouletteBet::Even, -1 }, 0) ||
        RouletteGame::wins({ RouletteBet::Odd, -1 }, 0) || !RouletteGame::wins({ RouletteBet::Number, 0 }, 0)) {
        fail("roulette coverage rules broken");
    }
    for (std::size_t picks = 1; picks <= KenoGame::kMaxPicks; ++picks) {
        if (KenoGame::paytable(picks).size() != picks + 1) {
            fail("keno paytable needs one entry per hit count");
        }
    }
}

void testLargeDicePayout() {
    // "test" seq 1 rolls 24.33, a win under 70.
    auto stream = RandomStream::fromRevealedSeed(kSeed);
    BetContext ctx{ 100'000'000, "test", 1 };
    DiceGame::Params under;
    under.target = 70.0;
    auto r = DiceGame::resolve(stream, ctx, under);
    if (!r.won || r.detail.rollHundredths != 2433) {
        fail("dice under 70 should win on a 24.33 roll");
    }
    // floor(1e8 * 0.99 / 0.70); the six-decimal multiplier alone would pay 141428500.
    if (r.payout != 141'428'571) {
        fail("large dice payout must floor once: got " + std::to_string(r.payout));
    }
    if (r.multiplier != Fixed64::fromRaw(1'414'285)) {
        fail("reported dice multiplier changed");
    }
    if (DeterministicMath::edgedPayout(100'000'000, DiceGame::kHouseEdge, 4999) != 198'039'607) {
        fail("dice over 50 on 1e8 should pay floor(1e8 * 0.99 / 0.4999)");
    }
}

void testLawsOverManyDraws() {
    auto stream = RandomStream::fromRevealedSeed(kSeed);
    Amount stake = 1000;

    int limboWins = 0;
    bool sawTie = false;
    bool sawBust = false;
    bool sawPush = false;
    for (std::uint64_t n = 0; n < 4000; ++n) {
        BetContext ctx{ stake, "laws", n * 64 };

        LimboGame::Params limbo;
        limbo.target = 2.0;
        auto l = LimboGame::resolve(stream, ctx, limbo);
        bool expectWin = l.detail.roll < 0.495;
        if (l.won != expectWin || (l.won && l.payout != 1980) || (!l.won && l.payout != 0)) {
            fail("limbo win rule or payout wrong");
        }
        limboWins += l.won ? 1 : 0;

        auto p = PlinkoGame::resolve(stream, ctx, PlinkoGame::Params{});
        int slot = 0;
        for (auto step : p.detail.path) {
            slot += step;
        }
        if (static_cast<int>(p.detail.slot) != slot ||
            p.payout != PlinkoGame::multipliers()[p.detail.slot].applyTo(stake)) {
            fail("plinko slot must equal the sum of its path");
        }

        auto w = WheelGame::resolve(stream, ctx, WheelGame::Params{});
        if (w.detail.segment >= WheelGame::kSegments ||
            w.payout != (w.detail.segmentMultiplier * WheelGame::kEdgeFactor).applyTo(stake)) {
            fail("wheel payout wrong");
        }

        KenoGame::Params keno;
        keno.picks = { 1, 2, 3, 4, 5 };
        auto k = KenoGame::resolve(stream, ctx, keno);
        std::vector<int> sorted = k.detail.drawn;
        std::sort(sorted.begin(), sorted.end());
        if (sorted.size() != KenoGame::kDrawn || std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end() ||
            sorted.front() < 1 || sorted.back() > KenoGame::kPoolSize) {
            fail("keno must draw 20 distinct numbers in 1..40");
        }

        auto h = HiLoGame::resolve(stream, ctx, HiLoGame::Params{});
        if (h.detail.tie) {
            sawTie = true;
            if (!h.push || h.won || h.payout != stake) {
                fail("hi-lo tie must refund the stake as a push");
            }
        } else if (h.won != (h.detail.next.rank > h.detail.current.rank)) {
            fail("hi-lo higher guess judged wrong");
        }

        BlackjackGame::Params bj;
        bj.actions = { BlackjackAction::Hit, BlackjackAction::Hit, BlackjackAction::Hit, BlackjackAction::Hit };
        auto b = BlackjackGame::resolve(stream, ctx, bj);
        const auto& d = b.detail;
        if (d.playerTotal != BlackjackGame::score(d.player) || d.dealerTotal < 17) {
            fail("blackjack totals inconsistent");
        }
        // Hits stop once the hand reaches 21.
        std::vector<int> beforeLast(d.player.begin(), d.player.end() - 1);
        if (d.player.size() > 2 && BlackjackGame::score(beforeLast) >= 21) {
            fail("blackjack drew after the player reached 21");
        }
        switch (d.outcome) {
        case BlackjackOutcome::Bust:
            sawBust = true;
            if (d.playerTotal <= 21 || b.payout != 0) {
                fail("bust must pay nothing");
            }
            break;
        case BlackjackOutcome::Push:
            sawPush = true;
            if (d.playerTotal != d.dealerTotal || b.payout != stake) {
                fail("blackjack push must refund");
            }
            break;
        case BlackjackOutcome::Win:
            if (b.payout != 1980) {
                fail("blackjack win pays 1.98");
            }
            break;
        case BlackjackOutcome::Lose:
            if (b.payout != 0 || d.dealerTotal > 21) {
                fail("blackjack loss inconsistent");
            }
            break;
        }
    }
    if (limboWins < 1800 || limboWins > 2160) {
        fail("limbo at 2.00x should win about 49.5% of the time");
    }
    if (!sawTie || !sawBust || !sawPush) {
        fail("4000 rounds should reach every hi-lo and blackjack edge");
    }
}

void testBlackjackScoring() {
    if (BlackjackGame::score({ 14, 13 }) != 21 || BlackjackGame::score({ 14, 14 }) != 12 ||
        BlackjackGame::score({ 14, 9, 5 }) != 15 || BlackjackGame::score({ 12, 11, 2 }) != 22) {
        fail("blackjack scoring wrong");
    }
    if (!BlackjackGame::dealerMustDraw({ 10, 6 }) || BlackjackGame::dealerMustDraw({ 14, 6 })) {
        fail("dealer stands on every 17");
    }
}

} // namespace

int main() {
    testFixedPoint();
    testValidation();
    testMultipliers();
    testLargeDicePayout();
    testLawsOverManyDraws();
    testBlackjackScoring();
    std::cout << "Game resolver checks passed\n";
    return 0;
}
