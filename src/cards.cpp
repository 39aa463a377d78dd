#include "cards.hpp"

#include "errors.hpp"
#include "rng.hpp"

#include <array>

namespace hb {

const Fixed64 HiLoGame::kPayout = Fixed64::fromHundredths(192);
const Fixed64 BlackjackGame::kPayout = Fixed64::fromHundredths(198);

std::string rankName(int rank) {
    switch (rank) {
    case 11:
        return "J";
    case 12:
        return "Q";
    case 13:
        return "K";
    case 14:
        return "A";
    default:
        return std::to_string(rank);
    }
}

std::string toString(const Card& card) {
    static const std::array<const char*, 4> suits{ "S", "H", "D", "C" };
    return rankName(card.rank) + suits[static_cast<std::size_t>(card.suit)];
}

int drawRank(const RandomStream& stream, const std::string& playerSeed, std::uint64_t sequence) {
    return kLowestRank + static_cast<int>(stream.drawInt(playerSeed, sequence, kRankCount));
}

Card drawCard(const RandomStream& stream, const std::string& playerSeed, std::uint64_t sequence) {
    Card card;
    card.rank = drawRank(stream, playerSeed, sequence);
    card.suit = static_cast<Suit>(stream.drawInt(playerSeed, sequence + 1, 4));
    return card;
}

Card HiLoGame::deal(const RandomStream& stream, const std::string& playerSeed, std::uint64_t sequence) {
    return drawCard(stream, playerSeed, sequence);
}

GameResult<HiLoGame::Detail> HiLoGame::resolve(const RandomStream& stream,
                                               const BetContext& ctx,
                                               const Params& params) {
    GameResult<Detail> result;
    result.detail.current = deal(stream, ctx.playerSeed, ctx.sequence);
    result.detail.next = drawCard(stream, ctx.playerSeed, ctx.sequence + 2);
    result.detail.tie = result.detail.next.rank == result.detail.current.rank;
    result.sequence = ctx.sequence;
    result.epoch = stream.epoch();

    if (result.detail.tie) {
        result.push = true;
        result.multiplier = Fixed64(1);
        result.payout = ctx.amount;
        return result;
    }

    bool higher = result.detail.next.rank > result.detail.current.rank;
    result.won = (params.guess == HiLoGuess::Higher) == higher;
    result.multiplier = kPayout;
    result.payout = result.won ? kPayout.applyTo(ctx.amount) : 0;
    return result;
}

const char* toString(BlackjackOutcome outcome) {
    switch (outcome) {
    case BlackjackOutcome::Win:
        return "win";
    case BlackjackOutcome::Lose:
        return "lose";
    case BlackjackOutcome::Push:
        return "push";
    case BlackjackOutcome::Bust:
        return "bust";
    }
    return "unknown";
}

int BlackjackGame::score(const std::vector<int>& ranks) {
    int total = 0;
    int softAces = 0;
    for (int rank : ranks) {
        if (rank >= 11 && rank <= 13) {
            total += 10;
        } else if (rank == 14) {
            total += 11;
            ++softAces;
        } else {
            total += rank;
        }
    }
    while (total > 21 && softAces > 0) {
        total -= 10;
        --softAces;
    }
    return total;
}

bool BlackjackGame::dealerMustDraw(const std::vector<int>& ranks) {
    return score(ranks) < kDealerStandsOn;
}

BlackjackGame::Deal BlackjackGame::deal(const RandomStream& stream,
                                        const std::string& playerSeed,
                                        std::uint64_t sequence) {
    Deal out;
    out.player = { drawRank(stream, playerSeed, sequence), drawRank(stream, playerSeed, sequence + 1) };
    out.dealer = { drawRank(stream, playerSeed, sequence + 2),
                   drawRank(stream, playerSeed, sequence + 3) };
    return out;
}

void BlackjackGame::validate(const Params& params) {
    if (params.actions.size() > kMaxActions) {
        throw GameError(ErrorKind::InvalidParameters, "too many blackjack actions");
    }
}

GameResult<BlackjackGame::Detail> BlackjackGame::resolve(const RandomStream& stream,
                                                         const BetContext& ctx,
                                                         const Params& params) {
    validate(params);

    Deal opening = deal(stream, ctx.playerSeed, ctx.sequence);
    Detail detail;
    detail.player = std::move(opening.player);
    detail.dealer = std::move(opening.dealer);

    std::uint64_t next = ctx.sequence + 4;
    for (BlackjackAction action : params.actions) {
        if (action == BlackjackAction::Stand || score(detail.player) >= 21) {
            break;
        }
        detail.player.push_back(drawRank(stream, ctx.playerSeed, next++));
    }
    while (dealerMustDraw(detail.dealer)) {
        detail.dealer.push_back(drawRank(stream, ctx.playerSeed, next++));
    }

    detail.playerTotal = score(detail.player);
    detail.dealerTotal = score(detail.dealer);

    GameResult<Detail> result;
    result.sequence = ctx.sequence;
    result.epoch = stream.epoch();
    if (detail.playerTotal > 21) {
        detail.outcome = BlackjackOutcome::Bust;
    } else if (detail.dealerTotal > 21 || detail.playerTotal > detail.dealerTotal) {
        detail.outcome = BlackjackOutcome::Win;
        result.won = true;
        result.multiplier = kPayout;
        result.payout = kPayout.applyTo(ctx.amount);
    } else if (detail.playerTotal == detail.dealerTotal) {
        detail.outcome = BlackjackOutcome::Push;
        result.push = true;
        result.multiplier = Fixed64(1);
        result.payout = ctx.amount;
    } else {
        detail.outcome = BlackjackOutcome::Lose;
    }
    result.detail = std::move(detail);
    return result;
}

} // namespace hb
