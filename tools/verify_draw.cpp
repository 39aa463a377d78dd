#include "cards.hpp"
#include "crash.hpp"
#include "deterministic_math.hpp"
#include "games.hpp"
#include "mines.hpp"
#include "rng.hpp"

#include <iomanip>
#include <iostream>
#include <string>

using namespace hb;

namespace {

void printOutcome(const RandomStream& stream,
                  const std::string& game,
                  const std::string& playerSeed,
                  std::uint64_t sequence) {
    BetContext ctx{ 100, playerSeed, sequence };
    if (game == "coinflip") {
        auto r = CoinflipGame::resolve(stream, ctx, CoinflipGame::Params{});
        std::cout << "Coin: " << toString(r.detail.result) << '\n';
    } else if (game == "dice") {
        auto r = DiceGame::resolve(stream, ctx, DiceGame::Params{});
        std::cout << "Dice roll: " << std::fixed << std::setprecision(2) << r.detail.roll() << '\n';
    } else if (game == "limbo") {
        auto r = LimboGame::resolve(stream, ctx, LimboGame::Params{});
        std::cout << "Limbo roll: " << r.detail.roll << '\n';
    } else if (game == "roulette") {
        auto r = RouletteGame::resolve(stream, ctx, RouletteGame::Params{});
        std::cout << "Roulette pocket: " << r.detail.pocket << (r.detail.red ? " (red)" : "") << '\n';
    } else if (game == "plinko") {
        auto r = PlinkoGame::resolve(stream, ctx, PlinkoGame::Params{});
        std::cout << "Plinko path:";
        for (auto step : r.detail.path) {
            std::cout << ' ' << static_cast<int>(step);
        }
        std::cout << "  slot " << r.detail.slot << " (x" << r.multiplier.toString(2) << ")\n";
    } else if (game == "keno") {
        KenoGame::Params params;
        params.picks = { 1 };
        auto r = KenoGame::resolve(stream, ctx, params);
        std::cout << "Keno drawn:";
        for (int n : r.detail.drawn) {
            std::cout << ' ' << n;
        }
        std::cout << '\n';
    } else if (game == "wheel") {
        auto r = WheelGame::resolve(stream, ctx, WheelGame::Params{});
        std::cout << "Wheel segment: " << r.detail.segment << " (x"
                  << r.detail.segmentMultiplier.toString(2) << ")\n";
    } else if (game == "hilo") {
        std::cout << "Hi-Lo cards: " << toString(drawCard(stream, playerSeed, sequence)) << " then "
                  << toString(drawCard(stream, playerSeed, sequence + 2)) << '\n';
    } else if (game == "blackjack") {
        auto dealt = BlackjackGame::deal(stream, playerSeed, sequence);
        std::cout << "Blackjack player " << rankName(dealt.player[0]) << ' ' << rankName(dealt.player[1])
                  << ", dealer " << rankName(dealt.dealer[0]) << ' ' << rankName(dealt.dealer[1]) << '\n';
    } else if (game == "mines") {
        std::cout << "Mines at cells:";
        for (int cell : MinesGame::placeMines(stream, playerSeed, sequence)) {
            std::cout << ' ' << cell << " (" << cell % MinesGame::kGridSize << ','
                      << cell / MinesGame::kGridSize << ')';
        }
        std::cout << '\n';
    } else if (game == "crash") {
        CrashConfig cfg;
        Fixed64 point = DeterministicMath::crashPoint(stream.deriveFraction(playerSeed, sequence),
                                                      cfg.crashScale, cfg.maxCrash);
        std::cout << "Crash point: x" << point.toString(2) << '\n';
    } else {
        std::cerr << "Unknown game \"" << game << "\"\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 5) {
        std::cerr << "Usage: verify_draw <revealedSeed> <commitHash> <playerSeed> <sequence> [game]\n";
        std::cerr << "Games: coinflip dice limbo roulette plinko keno wheel hilo blackjack mines crash\n";
        std::cerr << "Crash rounds use the player seed \"crash\".\n";
        return 1;
    }

    std::string revealedSeed = argv[1];
    std::string commitHash = argv[2];
    std::string playerSeed = argv[3];
    std::uint64_t sequence = 0;
    try {
        sequence = std::stoull(argv[4]);
    } catch (const std::exception& ex) {
        std::cerr << "Sequence must be an unsigned integer: " << ex.what() << '\n';
        return 1;
    }

    bool ok = verifyCommitment(revealedSeed, commitHash);
    std::cout << "Commitment: " << (ok ? "valid" : "INVALID") << '\n';

    try {
        RandomStream stream = RandomStream::fromRevealedSeed(revealedSeed);
        std::cout << "Fraction: " << std::setprecision(17) << stream.deriveFraction(playerSeed, sequence)
                  << '\n';
        if (argc > 5) {
            printOutcome(stream, argv[5], playerSeed, sequence);
        }
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }
    return ok ? 0 : 3;
}
