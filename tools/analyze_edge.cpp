#include "cards.hpp"
#include "commitment.hpp"
#include "crash.hpp"
#include "games.hpp"
#include "mines.hpp"
#include "rng.hpp"

#include <iomanip>
#include <iostream>
#include <vector>

using namespace hb;

namespace {

double choose(int n, int k) {
    if (k < 0 || k > n) {
        return 0.0;
    }
    double out = 1.0;
    for (int i = 1; i <= k; ++i) {
        out = out * (n - k + i) / i;
    }
    return out;
}

void row(const std::string& name, double rtp) {
    std::cout << "  " << std::setw(26) << std::left << name << " : " << std::fixed << std::setprecision(4)
              << rtp * 100.0 << "%  (edge " << (1.0 - rtp) * 100.0 << "%)\n";
}

double blackjackMonteCarlo(std::uint64_t hands) {
    RandomStream stream = RandomStream::fromRevealedSeed(generateServerSeed());
    Amount staked = 0;
    Amount returned = 0;
    for (std::uint64_t i = 0; i < hands; ++i) {
        std::uint64_t seq = i * BlackjackGame::kSpan;
        auto dealt = BlackjackGame::deal(stream, "edge", seq);
        BlackjackGame::Params params;
        std::vector<int> hand = dealt.player;
        std::uint64_t next = seq + 4;
        while (BlackjackGame::score(hand) < 17) {
            params.actions.push_back(BlackjackAction::Hit);
            hand.push_back(drawRank(stream, "edge", next++));
        }
        params.actions.push_back(BlackjackAction::Stand);

        BetContext ctx{ 100, "edge", seq };
        staked += ctx.amount;
        returned += BlackjackGame::resolve(stream, ctx, params).payout;
    }
    return static_cast<double>(returned) / static_cast<double>(staked);
}

} // namespace

int main() {
    std::cout << "=== RETURN TO PLAYER ===\n";

    for (double target : { 10.0, 50.0, 90.0 }) {
        DiceGame::Params params;
        params.target = target;
        double p = target / 100.0;
        row("dice under " + std::to_string(static_cast<int>(target)), p * DiceGame::multiplier(params).toDouble());
    }

    row("coinflip", 0.5 * CoinflipGame::kPayout.toDouble());

    for (double target : { 1.01, 2.0, 100.0 }) {
        double p = 0.99 / target;
        row("limbo x" + Fixed64::fromDouble(target).toString(2), p * target * LimboGame::kEdgeFactor.toDouble());
    }

    double red = 18.0 / RouletteGame::kPockets;
    row("roulette red", red * (RouletteGame::baseMultiplier(RouletteBet::Red) * RouletteGame::kEdgeFactor).toDouble());
    row("roulette number",
        (1.0 / RouletteGame::kPockets) *
            (RouletteGame::baseMultiplier(RouletteBet::Number) * RouletteGame::kEdgeFactor).toDouble());

    double plinko = 0.0;
    const auto& slots = PlinkoGame::multipliers();
    for (std::size_t k = 0; k < slots.size(); ++k) {
        plinko += choose(static_cast<int>(PlinkoGame::kRows), static_cast<int>(k)) / 4096.0 * slots[k].toDouble();
    }
    row("plinko", plinko);

    double wheel = 0.0;
    for (const auto& segment : WheelGame::segments()) {
        wheel += segment.toDouble();
    }
    row("wheel", wheel / WheelGame::kSegments * WheelGame::kEdgeFactor.toDouble());

    const int pool = KenoGame::kPoolSize;
    const int drawn = static_cast<int>(KenoGame::kDrawn);
    for (std::size_t picks = 1; picks <= KenoGame::kMaxPicks; ++picks) {
        const auto& table = KenoGame::paytable(picks);
        double rtp = 0.0;
        for (std::size_t hits = 0; hits < table.size(); ++hits) {
            int n = static_cast<int>(picks);
            int h = static_cast<int>(hits);
            double p = choose(n, h) * choose(pool - n, drawn - h) / choose(pool, drawn);
            rtp += p * table[hits].toDouble();
        }
        row("keno " + std::to_string(picks) + " picks", rtp);
    }

    // 78 of the 169 rank pairs go up, 13 tie.
    row("hi-lo (tie refunds)", 78.0 / 169.0 * HiLoGame::kPayout.toDouble() + 13.0 / 169.0);

    double survive = 1.0;
    for (int n = 1; n <= 5; ++n) {
        survive *= static_cast<double>(MinesGame::kCells - MinesGame::kMines - (n - 1)) /
                   static_cast<double>(MinesGame::kCells - (n - 1));
        row("mines cashout after " + std::to_string(n), survive * MinesGame::multiplierFor(n).toDouble());
    }

    CrashConfig crash;
    for (double at : { 1.5, 2.0, 10.0 }) {
        double p = crash.crashScale.toDouble() / at;
        row("crash cashout x" + Fixed64::fromDouble(at).toString(2), p * at * crash.edgeFactor.toDouble());
    }

    std::cout << "\n=== SIMULATED ===\n";
    row("blackjack, hit below 17", blackjackMonteCarlo(50000));
    return 0;
}
