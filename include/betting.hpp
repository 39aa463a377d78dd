#pragma once

#include "commitment.hpp"
#include "crash.hpp"
#include "errors.hpp"
#include "fixed_point.hpp"
#include "games.hpp"
#include "log.hpp"
#include "mines.hpp"
#include "rng.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace hb {

// Wallet seen from the desk. adjust() applies a signed delta and refuses
// (returns false) when the balance would go negative.
class BalanceLedger {
public:
    virtual ~BalanceLedger() = default;
    virtual Amount balance(const std::string& session) const = 0;
    virtual bool adjust(const std::string& session, Amount delta) = 0;
};

// Process-local ledger for the CLI and tests. Unknown sessions start at the
// opening balance.
class InMemoryLedger : public BalanceLedger {
public:
    explicit InMemoryLedger(Amount openingBalance);

    Amount balance(const std::string& session) const override;
    bool adjust(const std::string& session, Amount delta) override;

private:
    Amount& slot(const std::string& session) const;

    const Amount openingBalance_;
    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, Amount> balances_;
};

struct BetRequest {
    std::string session;
    Amount amount = 0;
    std::string playerSeed;                 // empty = desk default
    std::optional<std::uint64_t> sequence;  // empty = allocate
};

template <typename Detail>
struct Settlement {
    GameResult<Detail> result;
    Amount netChange = 0;
    Amount balance = 0;
    std::string commitHash;
    std::string playerSeed;
};

// Sequence numbers set aside for one game, one epoch and one player seed:
// the cards previewed for it are only valid under all three.
struct SequenceReservation {
    std::string game;
    std::string playerSeed;
    std::uint64_t epoch = 0;
    std::string commitHash;
    std::uint64_t first = 0;
    std::uint64_t span = 0;
};

struct MinesOpened {
    std::uint64_t sequence = 0;
    std::uint64_t epoch = 0;
    std::string commitHash;
    std::string playerSeed;
    Amount balance = 0;
    std::optional<MinesCashout> previous; // unsettled board this one replaced
};

struct MinesSettlement {
    MinesCashout cashout;
    Amount netChange = 0;
    Amount balance = 0;
};

struct CrashJoin {
    std::uint64_t roundId = 0;
    Amount stake = 0;
    Amount balance = 0;
};

// Request boundary for every game. Stakes are debited before any sequence
// number is taken and payouts credited after resolution; a GameError leaves
// the session's balance as it was.
//
// A caller-supplied sequence must be one this session reserved in the live
// epoch for the same game and player seed, or lie wholly above everything
// issued so far. Anything else could replay a draw the caller has already seen.
class BetDesk {
public:
    static constexpr std::size_t kMaxReservationsPerSession = 16;
    static constexpr std::size_t kMaxPlayerSeedLength = 256;

    BetDesk(const CommitmentManager& commitments,
            BalanceLedger& ledger,
            MinesBoardStore& mines,
            CrashRoundScheduler* crash,
            std::string defaultPlayerSeed);

    template <typename Game>
    Settlement<typename Game::Detail> play(const BetRequest& request,
                                           const typename Game::Params& params);

    // Empty playerSeed = desk default.
    template <typename Game>
    SequenceReservation reserve(const std::string& session, const std::string& playerSeed = {}) {
        BetRequest request;
        request.session = session;
        request.playerSeed = playerSeed;
        return reserveSpan(session, Game::kName, Game::kSpan, playerSeedFor(request));
    }

    MinesOpened openMines(const BetRequest& request);
    MinesReveal revealMine(const std::string& session, int x, int y);
    MinesSettlement cashoutMines(const std::string& session);

    CrashJoin joinCrash(const std::string& session, Amount amount);
    CashoutResult cashoutCrash(const std::string& session, Fixed64 claimedMultiplier);

    Amount balance(const std::string& session) const { return ledger_.balance(session); }
    const std::string& defaultPlayerSeed() const { return defaultPlayerSeed_; }

private:
    std::string playerSeedFor(const BetRequest& request) const;
    void debit(const std::string& session, Amount amount);
    void credit(const std::string& session, Amount amount);
    std::uint64_t takeSequence(const RandomStream& stream,
                               const BetRequest& request,
                               const char* game,
                               std::uint64_t span,
                               const std::string& playerSeed);
    bool consumeReservation(const std::string& session,
                            const RandomStream& stream,
                            std::uint64_t first,
                            const char* game,
                            std::uint64_t span,
                            const std::string& playerSeed);
    SequenceReservation reserveSpan(const std::string& session,
                                    const char* game,
                                    std::uint64_t span,
                                    std::string playerSeed);

    const CommitmentManager& commitments_;
    BalanceLedger& ledger_;
    MinesBoardStore& mines_;
    CrashRoundScheduler* crash_;
    const std::string defaultPlayerSeed_;

    std::mutex reservationMutex_;
    std::unordered_map<std::string, std::deque<SequenceReservation>> reservations_;
};

template <typename Game>
Settlement<typename Game::Detail> BetDesk::play(const BetRequest& request,
                                                const typename Game::Params& params) {
    if (request.amount <= 0) {
        throw GameError(ErrorKind::InvalidBet, "bet amount must be positive");
    }
    Game::validate(params);
    std::string playerSeed = playerSeedFor(request);

    debit(request.session, request.amount);

    Settlement<typename Game::Detail> out;
    RandomStream stream = commitments_.stream();
    try {
        BetContext ctx{ request.amount, playerSeed,
                        takeSequence(stream, request, Game::kName, Game::kSpan, playerSeed) };
        out.result = Game::resolve(stream, ctx, params);
    } catch (...) {
        credit(request.session, request.amount);
        throw;
    }

    if (out.result.payout > 0) {
        credit(request.session, out.result.payout);
    }
    out.netChange = out.result.payout - request.amount;
    out.balance = ledger_.balance(request.session);
    out.commitHash = stream.commitHash();
    out.playerSeed = std::move(playerSeed);

    Log::debug("desk", Game::kName, " session=", request.session,
               " seq=", out.result.sequence, " epoch=", out.result.epoch,
               " stake=", request.amount, " payout=", out.result.payout);
    return out;
}

} // namespace hb
