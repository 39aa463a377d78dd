#include "betting.hpp"
#include "cards.hpp"
#include "commitment.hpp"
#include "config.hpp"
#include "crash.hpp"
#include "crash_loop.hpp"
#include "errors.hpp"
#include "games.hpp"
#include "log.hpp"
#include "mines.hpp"
#include "rng.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace hb;

namespace {

const std::string kSession = "cli";

std::string formatAmount(Amount amount) {
    std::string sign = amount < 0 ? "-" : "";
    Amount magnitude = amount < 0 ? -amount : amount;
    std::string cents = std::to_string(magnitude % 100);
    if (cents.size() < 2) {
        cents.insert(0, "0");
    }
    return sign + std::to_string(magnitude / 100) + "." + cents;
}

// "12", "12.5" or "12.50" into minor units.
Amount parseAmount(const std::string& text) {
    auto dot = text.find('.');
    std::string whole = text.substr(0, dot);
    std::string frac = dot == std::string::npos ? "" : text.substr(dot + 1);
    if (whole.empty() || frac.size() > 2 ||
        whole.find_first_not_of("0123456789") != std::string::npos ||
        frac.find_first_not_of("0123456789") != std::string::npos || whole.size() > 12) {
        throw GameError(ErrorKind::InvalidBet, "amount must look like 12 or 12.34");
    }
    frac.resize(2, '0');
    return std::stoll(whole) * 100 + std::stoll(frac);
}

std::vector<std::string> tokenize(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> out;
    std::string token;
    while (iss >> token) {
        out.push_back(token);
    }
    return out;
}

const std::string& arg(const std::vector<std::string>& args, std::size_t index) {
    if (index >= args.size()) {
        throw GameError(ErrorKind::InvalidParameters, "missing argument; try 'help'");
    }
    return args[index];
}

std::string promptLine(const std::string& prompt) {
    std::cout << prompt;
    std::string line;
    if (!std::getline(std::cin, line)) {
        return {};
    }
    return trim(line);
}

void printHelp() {
    std::cout << "Amounts are in credits with up to two decimals.\n"
              << "  balance | commit | rotate | seed <playerSeed>\n"
              << "  dice <amount> <target> <under|over>\n"
              << "  coin <amount> <heads|tails>\n"
              << "  limbo <amount> <target>\n"
              << "  roulette <amount> <red|black|even|odd|0-36>\n"
              << "  plinko <amount> | wheel <amount>\n"
              << "  keno <amount> <n,n,...>   (1 to 10 distinct numbers in 1..40)\n"
              << "  hilo <amount> | blackjack <amount>\n"
              << "  mines <amount> | reveal <x> <y> | cashout\n"
              << "  crash | crash join <amount> | crash cashout <multiplier> | crash watch <seconds>\n"
              << "  verify <revealedSeed> <commitHash>\n"
              << "  quit\n";
}

template <typename Detail>
void printSettlement(const Settlement<Detail>& s) {
    const auto& r = s.result;
    std::cout << (r.push ? "Push." : (r.won ? "You won." : "You lost."))
              << " Payout " << formatAmount(r.payout)
              << " (x" << r.multiplier.toString(2) << ")"
              << "  Net " << formatAmount(s.netChange)
              << "  Balance " << formatAmount(s.balance) << "\n";
    std::cout << "  epoch " << r.epoch << " seq " << r.sequence
              << " playerSeed \"" << s.playerSeed << "\" commit " << s.commitHash << "\n";
}

std::string cardsToString(const std::vector<int>& ranks) {
    std::string out;
    for (int rank : ranks) {
        if (!out.empty()) {
            out += " ";
        }
        out += rankName(rank);
    }
    return out;
}

class Console {
public:
    Console(CommitmentManager& commitments,
            BetDesk& desk,
            CrashRoundScheduler& crash,
            const RoundCommitmentSource& crashDraws,
            const ServiceConfig& cfg)
        : commitments_(commitments)
        , desk_(desk)
        , crash_(crash)
        , crashDraws_(crashDraws)
        , playerSeed_(cfg.defaultPlayerSeed)
        , events_(crash.subscribe()) {}

    // False once the user asked to quit.
    bool handle(const std::vector<std::string>& args) {
        const std::string& cmd = args.front();
        if (cmd == "quit" || cmd == "exit") {
            return false;
        }
        if (cmd == "help") {
            printHelp();
        } else if (cmd == "balance") {
            std::cout << "Balance " << formatAmount(desk_.balance(kSession)) << "\n";
        } else if (cmd == "commit") {
            auto info = commitments_.commitment();
            std::cout << "Epoch " << info.epoch << " commit " << info.commitHash << "\n";
        } else if (cmd == "rotate") {
            auto reveal = commitments_.rotate();
            std::cout << "Revealed seed for epoch " << reveal.revealedEpoch << ": " << reveal.revealedSeed << "\n"
                      << "  matched commit " << reveal.previousCommitHash << " ("
                      << reveal.drawsAllocated << " sequence numbers issued)\n"
                      << "New epoch " << reveal.newEpoch << " commit " << reveal.newCommitHash << "\n";
        } else if (cmd == "seed") {
            playerSeed_ = arg(args, 1);
            std::cout << "Player seed set to \"" << playerSeed_ << "\"\n";
        } else if (cmd == "dice") {
            DiceGame::Params params;
            params.target = std::stod(arg(args, 2));
            params.over = arg(args, 3) == "over";
            printSettlement(desk_.play<DiceGame>(request(args), params));
        } else if (cmd == "coin") {
            CoinflipGame::Params params;
            params.pick = arg(args, 2) == "tails" ? CoinFace::Tails : CoinFace::Heads;
            auto s = desk_.play<CoinflipGame>(request(args), params);
            std::cout << "Coin shows " << toString(s.result.detail.result) << ". ";
            printSettlement(s);
        } else if (cmd == "limbo") {
            LimboGame::Params params;
            params.target = std::stod(arg(args, 2));
            auto s = desk_.play<LimboGame>(request(args), params);
            std::cout << "Roll " << s.result.detail.roll << ". ";
            printSettlement(s);
        } else if (cmd == "roulette") {
            printSettlement(playRoulette(args));
        } else if (cmd == "plinko") {
            auto s = desk_.play<PlinkoGame>(request(args), PlinkoGame::Params{});
            std::cout << "Ball lands in slot " << s.result.detail.slot << ". ";
            printSettlement(s);
        } else if (cmd == "wheel") {
            auto s = desk_.play<WheelGame>(request(args), WheelGame::Params{});
            std::cout << "Wheel stops on segment " << s.result.detail.segment << " (x"
                      << s.result.detail.segmentMultiplier.toString(2) << "). ";
            printSettlement(s);
        } else if (cmd == "keno") {
            playKeno(args);
        } else if (cmd == "hilo") {
            playHiLo(args);
        } else if (cmd == "blackjack") {
            playBlackjack(args);
        } else if (cmd == "mines") {
            auto opened = desk_.openMines(request(args));
            if (opened.previous) {
                std::cout << "Previous board cashed out at x" << opened.previous->multiplier.toString(2)
                          << " for " << formatAmount(opened.previous->payout) << "\n";
            }
            std::cout << "Board open (5x5, 3 mines) at seq " << opened.sequence << ". Balance "
                      << formatAmount(opened.balance) << "\n";
        } else if (cmd == "reveal") {
            auto r = desk_.revealMine(kSession, std::stoi(arg(args, 1)), std::stoi(arg(args, 2)));
            if (r.mine) {
                std::cout << "Boom. Mines were at cells";
                for (int cell : r.mines) {
                    std::cout << " " << cell;
                }
                std::cout << "\n";
            } else {
                std::cout << (r.repeated ? "Already revealed. " : "Safe. ") << r.safeReveals
                          << " safe, x" << r.multiplier.toString(2) << " would pay "
                          << formatAmount(r.potentialPayout) << "\n";
            }
        } else if (cmd == "cashout") {
            auto s = desk_.cashoutMines(kSession);
            std::cout << "Cashed out " << formatAmount(s.cashout.payout) << " after " << s.cashout.safeReveals
                      << " reveals. Net " << formatAmount(s.netChange) << "  Balance "
                      << formatAmount(s.balance) << "\n";
        } else if (cmd == "crash") {
            handleCrash(args);
        } else if (cmd == "verify") {
            bool ok = verifyCommitment(arg(args, 1), arg(args, 2));
            std::cout << "Commitment " << (ok ? "valid" : "INVALID") << "\n";
        } else {
            std::cout << "Unknown command. Try 'help'.\n";
        }
        return true;
    }

private:
    BetRequest request(const std::vector<std::string>& args) const {
        BetRequest req;
        req.session = kSession;
        req.amount = parseAmount(arg(args, 1));
        req.playerSeed = playerSeed_;
        return req;
    }

    Settlement<RouletteGame::Detail> playRoulette(const std::vector<std::string>& args) {
        RouletteGame::Params params;
        const std::string& pick = arg(args, 2);
        if (pick == "red") {
            params.type = RouletteBet::Red;
        } else if (pick == "black") {
            params.type = RouletteBet::Black;
        } else if (pick == "even") {
            params.type = RouletteBet::Even;
        } else if (pick == "odd") {
            params.type = RouletteBet::Odd;
        } else {
            params.type = RouletteBet::Number;
            params.number = std::stoi(pick);
        }
        auto s = desk_.play<RouletteGame>(request(args), params);
        std::cout << "Pocket " << s.result.detail.pocket << (s.result.detail.red ? " red" : "") << ". ";
        return s;
    }

    void playKeno(const std::vector<std::string>& args) {
        KenoGame::Params params;
        std::istringstream picks(arg(args, 2));
        std::string number;
        while (std::getline(picks, number, ',')) {
            params.picks.push_back(std::stoi(number));
        }
        auto s = desk_.play<KenoGame>(request(args), params);
        std::cout << "Drawn:";
        for (int n : s.result.detail.drawn) {
            std::cout << " " << n;
        }
        std::cout << "\n" << s.result.detail.hits << " hits. ";
        printSettlement(s);
    }

    void playHiLo(const std::vector<std::string>& args) {
        BetRequest req = request(args);
        auto reservation = desk_.reserve<HiLoGame>(kSession, playerSeed_);
        Card current = HiLoGame::deal(commitments_.stream(), playerSeed_, reservation.first);
        std::cout << "Current card: " << toString(current) << "\n";

        std::string guess = promptLine("Higher or lower? [h/l]: ");
        HiLoGame::Params params;
        params.guess = (guess == "l" || guess == "lower") ? HiLoGuess::Lower : HiLoGuess::Higher;
        req.sequence = reservation.first;
        auto s = desk_.play<HiLoGame>(req, params);
        std::cout << "Next card: " << toString(s.result.detail.next) << ". ";
        printSettlement(s);
    }

    void playBlackjack(const std::vector<std::string>& args) {
        BetRequest req = request(args);
        auto reservation = desk_.reserve<BlackjackGame>(kSession, playerSeed_);
        RandomStream stream = commitments_.stream();
        auto dealt = BlackjackGame::deal(stream, playerSeed_, reservation.first);
        std::cout << "Dealer shows " << rankName(dealt.dealer.front()) << "\n";

        BlackjackGame::Params params;
        std::vector<int> hand = dealt.player;
        std::uint64_t nextCard = reservation.first + 4;
        while (BlackjackGame::score(hand) < 21 && params.actions.size() < BlackjackGame::kMaxActions) {
            std::cout << "Your hand: " << cardsToString(hand) << " (" << BlackjackGame::score(hand) << ")\n";
            std::string action = promptLine("Hit or stand? [h/s]: ");
            if (action != "h" && action != "hit") {
                params.actions.push_back(BlackjackAction::Stand);
                break;
            }
            params.actions.push_back(BlackjackAction::Hit);
            hand.push_back(drawRank(stream, playerSeed_, nextCard++));
        }

        req.sequence = reservation.first;
        auto s = desk_.play<BlackjackGame>(req, params);
        const auto& d = s.result.detail;
        std::cout << "You: " << cardsToString(d.player) << " (" << d.playerTotal << ")  Dealer: "
                  << cardsToString(d.dealer) << " (" << d.dealerTotal << ")  " << toString(d.outcome) << "\n";
        printSettlement(s);
    }

    void handleCrash(const std::vector<std::string>& args) {
        if (args.size() == 1) {
            auto snap = crash_.snapshot();
            std::cout << "Round " << snap.roundId << " " << toString(snap.phase) << " at x"
                      << snap.multiplier.toString(2) << ", " << snap.enrolled << " stakes, "
                      << snap.cashouts << " cashouts\n";
            if (!snap.lastRoot.empty()) {
                std::cout << "  last transcript root " << snap.lastRoot << "\n";
            }
            std::cout << "  crash seed commitment " << crashDraws_.commitment().commitHash << "\n";
            if (auto reveal = crashDraws_.lastReveal()) {
                std::cout << "  last crash seed (epoch " << reveal->revealedEpoch << ", "
                          << reveal->drawsAllocated << " draws, playerSeed \"crash\"): "
                          << reveal->revealedSeed << "\n";
            }
            return;
        }
        const std::string& sub = args[1];
        if (sub == "join") {
            auto joined = desk_.joinCrash(kSession, parseAmount(arg(args, 2)));
            std::cout << "Staked " << formatAmount(joined.stake) << " on round " << joined.roundId
                      << ". Balance " << formatAmount(joined.balance) << "\n";
        } else if (sub == "cashout") {
            auto result = desk_.cashoutCrash(kSession, Fixed64::fromDouble(std::stod(arg(args, 2))));
            if (result.accepted) {
                std::cout << "Cashed out " << formatAmount(result.payout) << " in round " << result.roundId
                          << ". Balance " << formatAmount(desk_.balance(kSession)) << "\n";
            } else {
                std::cout << "Cashout rejected: " << result.reason << "\n";
            }
        } else if (sub == "watch") {
            watch(std::chrono::seconds(std::stoi(arg(args, 2))));
        } else {
            std::cout << "Unknown crash command. Try 'help'.\n";
        }
    }

    void watch(std::chrono::seconds duration) {
        // Events queued while the prompt was idle are stale; show only the newest.
        auto backlog = events_->drain();
        if (!backlog.empty()) {
            std::cout << backlog.back().toString() << "\n";
        }
        auto until = std::chrono::steady_clock::now() + duration;
        while (std::chrono::steady_clock::now() < until) {
            auto event = events_->waitPop(std::chrono::milliseconds(250));
            if (event) {
                std::cout << event->toString() << "\n";
            }
        }
        if (events_->dropped() > 0) {
            std::cout << "(" << events_->dropped() << " events dropped while idle)\n";
        }
    }

    CommitmentManager& commitments_;
    BetDesk& desk_;
    CrashRoundScheduler& crash_;
    const RoundCommitmentSource& crashDraws_;
    std::string playerSeed_;
    BroadcastHub<CrashEvent>::Subscription events_;
};

} // namespace

int main() {
    ServiceConfig cfg;
    try {
        cfg = loadConfigFromEnv();
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }
    Log::setLevel(cfg.logLevel);

    try {
        CommitmentManager commitments;
        InMemoryLedger ledger(cfg.startingBalance);
        MinesBoardStore mines;
        BroadcastHub<CrashEvent> hub;
        RoundCommitmentSource crashDraws("crash");
        CrashRoundScheduler crash(cfg.crash, crashDraws, hub);
        BetDesk desk(commitments, ledger, mines, &crash, cfg.defaultPlayerSeed);
        Console console(commitments, desk, crash, crashDraws, cfg);

        CrashLoop loop(crash);
        loop.start();

        auto info = commitments.commitment();
        std::cout << "Welcome to HexaBets.\n";
        std::cout << "Server seed commitment (epoch " << info.epoch << "): " << info.commitHash << "\n";
        std::cout << "Player seed \"" << cfg.defaultPlayerSeed << "\", balance "
                  << formatAmount(ledger.balance(kSession)) << ". Type 'help' for commands.\n";

        std::string line;
        while (std::cout << "> " && std::getline(std::cin, line)) {
            auto args = tokenize(line);
            if (args.empty()) {
                continue;
            }
            try {
                if (!console.handle(args)) {
                    break;
                }
            } catch (const GameError& ex) {
                std::cout << "Rejected: " << ex.what() << "\n";
            } catch (const std::invalid_argument& ex) {
                std::cout << "Bad input: " << ex.what() << "\n";
            } catch (const std::out_of_range& ex) {
                std::cout << "Bad input: " << ex.what() << "\n";
            }
        }

        loop.stop();
        std::cout << "\nFinal balance: " << formatAmount(ledger.balance(kSession)) << "\n";
        auto reveal = commitments.rotate();
        std::cout << "Revealed seed for epoch " << reveal.revealedEpoch << ": " << reveal.revealedSeed << "\n";
        crashDraws.settle();
        if (auto crashReveal = crashDraws.lastReveal()) {
            std::cout << "Revealed crash seed for epoch " << crashReveal->revealedEpoch << ": "
                      << crashReveal->revealedSeed << "\n";
        }
        std::cout << "Thanks for playing.\n";
    } catch (const EntropyFailure& ex) {
        std::cerr << "fatal: " << ex.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "fatal: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
