#include "betting.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace hb {

InMemoryLedger::InMemoryLedger(Amount openingBalance)
    : openingBalance_(openingBalance) {
    if (openingBalance_ < 0) {
        throw std::invalid_argument("opening balance must not be negative");
    }
}

Amount& InMemoryLedger::slot(const std::string& session) const {
    return balances_.emplace(session, openingBalance_).first->second;
}

Amount InMemoryLedger::balance(const std::string& session) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot(session);
}

bool InMemoryLedger::adjust(const std::string& session, Amount delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount& current = slot(session);
    if (delta > 0 && current > std::numeric_limits<Amount>::max() - delta) {
        return false;
    }
    if (current + delta < 0) {
        return false;
    }
    current += delta;
    return true;
}

BetDesk::BetDesk(const CommitmentManager& commitments,
                 BalanceLedger& ledger,
                 MinesBoardStore& mines,
                 CrashRoundScheduler* crash,
                 std::string defaultPlayerSeed)
    : commitments_(commitments)
    , ledger_(ledger)
    , mines_(mines)
    , crash_(crash)
    , defaultPlayerSeed_(std::move(defaultPlayerSeed)) {
    if (defaultPlayerSeed_.empty() || defaultPlayerSeed_.size() > kMaxPlayerSeedLength) {
        throw std::invalid_argument("default player seed must be 1.." +
                                    std::to_string(kMaxPlayerSeedLength) + " characters");
    }
}

std::string BetDesk::playerSeedFor(const BetRequest& request) const {
    if (request.playerSeed.empty()) {
        return defaultPlayerSeed_;
    }
    if (request.playerSeed.size() > kMaxPlayerSeedLength) {
        throw GameError(ErrorKind::InvalidParameters, "player seed is too long");
    }
    return request.playerSeed;
}

void BetDesk::debit(const std::string& session, Amount amount) {
    if (!ledger_.adjust(session, -amount)) {
        throw GameError(ErrorKind::InvalidBet, "insufficient funds");
    }
}

void BetDesk::credit(const std::string& session, Amount amount) {
    if (!ledger_.adjust(session, amount)) {
        Log::error("desk", "ledger refused a credit of ", amount, " to ", session);
        throw std::runtime_error("ledger refused a credit");
    }
}

std::uint64_t BetDesk::takeSequence(const RandomStream& stream,
                                    const BetRequest& request,
                                    const char* game,
                                    std::uint64_t span,
                                    const std::string& playerSeed) {
    if (!request.sequence) {
        return stream.allocate(span);
    }
    std::uint64_t first = *request.sequence;
    if (first > std::numeric_limits<std::uint64_t>::max() - span) {
        throw GameError(ErrorKind::InvalidParameters, "sequence out of range");
    }
    if (consumeReservation(request.session, stream, first, game, span, playerSeed)) {
        return first;
    }
    if (!stream.claim(first, span)) {
        throw GameError(ErrorKind::InvalidParameters,
                        "sequence " + std::to_string(first) + " was already issued in epoch " +
                            std::to_string(stream.epoch()));
    }
    return first;
}

// False when the session holds no reservation starting at `first`. A
// reservation that exists but does not fit this bet is refused outright; a
// stale one is dropped on the way.
bool BetDesk::consumeReservation(const std::string& session,
                                 const RandomStream& stream,
                                 std::uint64_t first,
                                 const char* game,
                                 std::uint64_t span,
                                 const std::string& playerSeed) {
    std::lock_guard<std::mutex> lock(reservationMutex_);
    auto it = reservations_.find(session);
    if (it == reservations_.end()) {
        return false;
    }
    auto& pending = it->second;
    auto live = std::find_if(pending.begin(), pending.end(), [&](const SequenceReservation& r) {
        return r.first == first && r.epoch == stream.epoch();
    });
    if (live == pending.end()) {
        auto stale = std::find_if(pending.begin(), pending.end(), [&](const SequenceReservation& r) {
            return r.first == first;
        });
        if (stale == pending.end()) {
            return false;
        }
        std::uint64_t staleEpoch = stale->epoch;
        pending.erase(stale);
        if (pending.empty()) {
            reservations_.erase(it);
        }
        throw GameError(ErrorKind::InvalidParameters,
                        "reservation " + std::to_string(first) + " expired with epoch " +
                            std::to_string(staleEpoch));
    }
    if (live->game != game || live->span != span) {
        throw GameError(ErrorKind::InvalidParameters,
                        "sequence " + std::to_string(first) + " is reserved for " + live->game);
    }
    if (live->playerSeed != playerSeed) {
        throw GameError(ErrorKind::InvalidParameters,
                        "sequence " + std::to_string(first) + " was reserved under another player seed");
    }
    pending.erase(live);
    if (pending.empty()) {
        reservations_.erase(it);
    }
    return true;
}

SequenceReservation BetDesk::reserveSpan(const std::string& session,
                                         const char* game,
                                         std::uint64_t span,
                                         std::string playerSeed) {
    RandomStream stream = commitments_.stream();
    SequenceReservation out;
    out.game = game;
    out.playerSeed = std::move(playerSeed);
    out.epoch = stream.epoch();
    out.commitHash = stream.commitHash();
    out.first = stream.allocate(span);
    out.span = span;

    std::lock_guard<std::mutex> lock(reservationMutex_);
    auto& pending = reservations_[session];
    pending.push_back(out);
    if (pending.size() > kMaxReservationsPerSession) {
        pending.pop_front();
    }
    return out;
}

MinesOpened BetDesk::openMines(const BetRequest& request) {
    if (request.amount <= 0) {
        throw GameError(ErrorKind::InvalidBet, "bet amount must be positive");
    }
    std::string playerSeed = playerSeedFor(request);

    debit(request.session, request.amount);

    MinesOpened out;
    RandomStream stream = commitments_.stream();
    try {
        std::uint64_t sequence =
            takeSequence(stream, request, MinesGame::kName, MinesGame::kSpan, playerSeed);
        auto mines = MinesGame::placeMines(stream, playerSeed, sequence);
        out.previous = mines_.open(request.session,
                                   std::make_shared<MinesBoard>(request.amount, playerSeed, sequence,
                                                                stream.epoch(), std::move(mines)));
        out.sequence = sequence;
    } catch (...) {
        credit(request.session, request.amount);
        throw;
    }
    if (out.previous && out.previous->payout > 0) {
        credit(request.session, out.previous->payout);
    }

    out.epoch = stream.epoch();
    out.commitHash = stream.commitHash();
    out.playerSeed = std::move(playerSeed);
    out.balance = ledger_.balance(request.session);
    Log::debug("desk", "mines session=", request.session, " seq=", out.sequence,
               " stake=", request.amount);
    return out;
}

MinesReveal BetDesk::revealMine(const std::string& session, int x, int y) {
    return mines_.reveal(session, x, y);
}

MinesSettlement BetDesk::cashoutMines(const std::string& session) {
    MinesSettlement out;
    out.cashout = mines_.cashout(session);
    if (out.cashout.payout > 0) {
        credit(session, out.cashout.payout);
    }
    out.netChange = out.cashout.payout - out.cashout.stake;
    out.balance = ledger_.balance(session);
    return out;
}

CrashJoin BetDesk::joinCrash(const std::string& session, Amount amount) {
    if (!crash_) {
        throw std::logic_error("crash is not enabled on this desk");
    }
    if (amount <= 0) {
        throw GameError(ErrorKind::InvalidBet, "bet amount must be positive");
    }

    debit(session, amount);
    std::optional<std::uint64_t> round;
    try {
        round = crash_->enroll(session, amount);
    } catch (...) {
        credit(session, amount);
        throw;
    }
    if (!round) {
        credit(session, amount);
        throw GameError(ErrorKind::RaceViolation,
                        "crash stakes are taken between rounds, once per round");
    }
    return CrashJoin{ *round, amount, ledger_.balance(session) };
}

CashoutResult BetDesk::cashoutCrash(const std::string& session, Fixed64 claimedMultiplier) {
    if (!crash_) {
        throw std::logic_error("crash is not enabled on this desk");
    }
    auto stake = crash_->stakeFor(session);
    if (!stake) {
        CashoutResult out;
        out.reason = "no stake in the running round";
        return out;
    }

    CashoutResult out =
        crash_->cashout(CashoutRequest{ session, stake->amount, claimedMultiplier, stake->roundId });
    if (out.accepted && out.payout > 0) {
        credit(session, out.payout);
    }
    return out;
}

} // namespace hb
