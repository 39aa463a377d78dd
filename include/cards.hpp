#pragma once

#include "games.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace hb {

// Ranks run 2..14 with 11=J, 12=Q, 13=K, 14=A. Cards come from an endless
// shoe: every draw is an independent pick from the 13 ranks.
constexpr int kRankCount = 13;
constexpr int kLowestRank = 2;

enum class Suit { Spades, Hearts, Diamonds, Clubs };

struct Card {
    int rank = kLowestRank;
    Suit suit = Suit::Spades;
};

std::string rankName(int rank);
std::string toString(const Card& card);

int drawRank(const RandomStream& stream, const std::string& playerSeed, std::uint64_t sequence);

// Rank at `sequence`, cosmetic suit at `sequence + 1`.
Card drawCard(const RandomStream& stream, const std::string& playerSeed, std::uint64_t sequence);

enum class HiLoGuess { Higher, Lower };

struct HiLoGame {
    struct Params {
        HiLoGuess guess = HiLoGuess::Higher;
    };
    struct Detail {
        Card current;
        Card next;
        bool tie = false;
    };

    static constexpr const char* kName = "hilo";
    static constexpr std::uint64_t kSpan = 4;
    static const Fixed64 kPayout;

    // The card shown before the player guesses.
    static Card deal(const RandomStream& stream, const std::string& playerSeed, std::uint64_t sequence);

    static void validate(const Params&) {}

    // Equal ranks are a push: the stake comes back, reported apart from a loss.
    static GameResult<Detail> resolve(const RandomStream& stream,
                                      const BetContext& ctx,
                                      const Params& params);
};

enum class BlackjackAction { Hit, Stand };
enum class BlackjackOutcome { Win, Lose, Push, Bust };

const char* toString(BlackjackOutcome outcome);

struct BlackjackGame {
    static constexpr std::size_t kMaxActions = 32;
    static constexpr int kDealerStandsOn = 17;

    struct Params {
        std::vector<BlackjackAction> actions;
    };
    struct Deal {
        std::vector<int> player;
        std::vector<int> dealer;
    };
    struct Detail {
        std::vector<int> player;
        std::vector<int> dealer;
        int playerTotal = 0;
        int dealerTotal = 0;
        BlackjackOutcome outcome = BlackjackOutcome::Lose;
    };

    static constexpr const char* kName = "blackjack";
    // Hits stop at 21 and the dealer at 17, so at most 21 + 17 cards are drawn.
    static constexpr std::uint64_t kSpan = 64;
    static const Fixed64 kPayout;

    // Aces count 11, dropping to 1 one at a time while the hand is over 21.
    static int score(const std::vector<int>& ranks);
    static bool dealerMustDraw(const std::vector<int>& ranks);

    static Deal deal(const RandomStream& stream, const std::string& playerSeed, std::uint64_t sequence);

    static void validate(const Params& params);
    static GameResult<Detail> resolve(const RandomStream& stream,
                                      const BetContext& ctx,
                                      const Params& params);
};

} // namespace hb
