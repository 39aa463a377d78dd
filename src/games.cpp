#include "games.hpp"

#include "deterministic_math.hpp"
#include "errors.hpp"
#include "rng.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <set>

namespace hb {

namespace {

template <typename Detail>
GameResult<Detail> settleFixed(const RandomStream& stream,
                               const BetContext& ctx,
                               Detail detail,
                               Fixed64 multiplier,
                               bool won) {
    GameResult<Detail> result;
    result.detail = std::move(detail);
    result.won = won;
    result.multiplier = multiplier;
    result.payout = won ? multiplier.applyTo(ctx.amount) : 0;
    result.sequence = ctx.sequence;
    result.epoch = stream.epoch();
    return result;
}

// Table games always pay the looked-up multiplier; "won" means a profit.
template <typename Detail>
GameResult<Detail> settleTable(const RandomStream& stream,
                               const BetContext& ctx,
                               Detail detail,
                               Fixed64 multiplier) {
    GameResult<Detail> result;
    result.detail = std::move(detail);
    result.multiplier = multiplier;
    result.payout = multiplier.applyTo(ctx.amount);
    result.won = result.payout > ctx.amount;
    result.push = result.payout == ctx.amount;
    result.sequence = ctx.sequence;
    result.epoch = stream.epoch();
    return result;
}

std::int64_t toHundredths(double value) {
    return static_cast<std::int64_t>(std::llround(value * 100.0));
}

std::int64_t diceWinHundredths(std::int64_t targetHundredths, bool over) {
    // Rolls live on the 0.00..99.99 grid; "over" excludes the target itself.
    return over ? 10000 - targetHundredths - 1 : targetHundredths;
}

} // namespace

const Fixed64 DiceGame::kHouseEdge = Fixed64::fromRaw(10'000);
const Fixed64 CoinflipGame::kPayout = Fixed64::fromHundredths(198);
const Fixed64 LimboGame::kEdgeFactor = Fixed64::fromHundredths(99);
const Fixed64 LimboGame::kMinTarget = Fixed64::fromHundredths(101);
const Fixed64 LimboGame::kMaxTarget = Fixed64(1'000'000);
const Fixed64 RouletteGame::kEdgeFactor = Fixed64::fromHundredths(98);
const Fixed64 WheelGame::kEdgeFactor = Fixed64::fromHundredths(99);

void DiceGame::validate(const Params& params) {
    if (!std::isfinite(params.target)) {
        throw GameError(ErrorKind::InvalidParameters, "dice target must be a number");
    }
    std::int64_t target = toHundredths(params.target);
    std::int64_t maxTarget = params.over ? 9899 : 9900;
    if (target < 100 || target > maxTarget) {
        throw GameError(ErrorKind::InvalidParameters,
                        params.over ? "dice target over must lie in [1.00, 98.99]"
                                    : "dice target under must lie in [1.00, 99.00]");
    }
}

Fixed64 DiceGame::multiplier(const Params& params) {
    validate(params);
    return DeterministicMath::edgedOdds(kHouseEdge,
                                        diceWinHundredths(toHundredths(params.target), params.over));
}

GameResult<DiceGame::Detail> DiceGame::resolve(const RandomStream& stream,
                                               const BetContext& ctx,
                                               const Params& params) {
    Fixed64 odds = multiplier(params);

    Detail detail;
    detail.targetHundredths = toHundredths(params.target);
    detail.over = params.over;
    detail.rollHundredths = stream.drawInt(ctx.playerSeed, ctx.sequence, 10000);

    std::int64_t roll = detail.rollHundredths;
    bool won = params.over ? roll > detail.targetHundredths : roll < detail.targetHundredths;
    auto result = settleFixed(stream, ctx, detail, odds, won);
    if (won) {
        result.payout = DeterministicMath::edgedPayout(
            ctx.amount, kHouseEdge, diceWinHundredths(detail.targetHundredths, params.over));
    }
    return result;
}

const char* toString(CoinFace face) {
    return face == CoinFace::Heads ? "heads" : "tails";
}

GameResult<CoinflipGame::Detail> CoinflipGame::resolve(const RandomStream& stream,
                                                       const BetContext& ctx,
                                                       const Params& params) {
    Detail detail;
    detail.roll = stream.deriveFraction(ctx.playerSeed, ctx.sequence);
    detail.result = detail.roll < 0.5 ? CoinFace::Heads : CoinFace::Tails;
    return settleFixed(stream, ctx, detail, kPayout, detail.result == params.pick);
}

void LimboGame::validate(const Params& params) {
    if (!std::isfinite(params.target)) {
        throw GameError(ErrorKind::InvalidParameters, "limbo target must be a number");
    }
    Fixed64 target = Fixed64::fromDouble(params.target);
    if (target < kMinTarget || target > kMaxTarget) {
        throw GameError(ErrorKind::InvalidParameters, "limbo target must lie in [1.01, 1000000]");
    }
}

GameResult<LimboGame::Detail> LimboGame::resolve(const RandomStream& stream,
                                                 const BetContext& ctx,
                                                 const Params& params) {
    validate(params);
    Detail detail;
    detail.target = Fixed64::fromDouble(params.target);
    detail.roll = stream.deriveFraction(ctx.playerSeed, ctx.sequence);

    bool won = detail.roll < (1.0 / detail.target.toDouble()) * kEdgeFactor.toDouble();
    return settleFixed(stream, ctx, detail, detail.target * kEdgeFactor, won);
}

const char* toString(RouletteBet bet) {
    switch (bet) {
    case RouletteBet::Number:
        return "number";
    case RouletteBet::Red:
        return "red";
    case RouletteBet::Black:
        return "black";
    case RouletteBet::Even:
        return "even";
    case RouletteBet::Odd:
        return "odd";
    }
    return "unknown";
}

bool RouletteGame::isRed(std::uint32_t pocket) {
    static const std::set<std::uint32_t> red{ 1,  3,  5,  7,  9,  12, 14, 16, 18,
                                              19, 21, 23, 25, 27, 30, 32, 34, 36 };
    return red.count(pocket) != 0;
}

Fixed64 RouletteGame::baseMultiplier(RouletteBet type) {
    return type == RouletteBet::Number ? Fixed64(36) : Fixed64(2);
}

bool RouletteGame::wins(const Params& params, std::uint32_t pocket) {
    switch (params.type) {
    case RouletteBet::Number:
        return static_cast<int>(pocket) == params.number;
    case RouletteBet::Red:
        return isRed(pocket);
    case RouletteBet::Black:
        return pocket != 0 && !isRed(pocket);
    case RouletteBet::Even:
        return pocket != 0 && pocket % 2 == 0;
    case RouletteBet::Odd:
        return pocket % 2 == 1;
    }
    return false;
}

void RouletteGame::validate(const Params& params) {
    if (params.type == RouletteBet::Number &&
        (params.number < 0 || params.number >= static_cast<int>(kPockets))) {
        throw GameError(ErrorKind::InvalidParameters, "roulette number must lie in [0, 36]");
    }
}

GameResult<RouletteGame::Detail> RouletteGame::resolve(const RandomStream& stream,
                                                       const BetContext& ctx,
                                                       const Params& params) {
    validate(params);
    Detail detail;
    detail.pocket = stream.drawInt(ctx.playerSeed, ctx.sequence, kPockets);
    detail.red = isRed(detail.pocket);
    return settleFixed(stream,
                       ctx,
                       detail,
                       baseMultiplier(params.type) * kEdgeFactor,
                       wins(params, detail.pocket));
}

const std::array<Fixed64, PlinkoGame::kRows + 1>& PlinkoGame::multipliers() {
    static const std::array<Fixed64, kRows + 1> table{
        Fixed64::fromHundredths(20),  Fixed64::fromHundredths(30),  Fixed64::fromHundredths(50),
        Fixed64::fromHundredths(80),  Fixed64::fromHundredths(100), Fixed64::fromHundredths(120),
        Fixed64::fromHundredths(300), Fixed64::fromHundredths(120), Fixed64::fromHundredths(100),
        Fixed64::fromHundredths(80),  Fixed64::fromHundredths(50),  Fixed64::fromHundredths(30),
        Fixed64::fromHundredths(20),
    };
    return table;
}

GameResult<PlinkoGame::Detail> PlinkoGame::resolve(const RandomStream& stream,
                                                   const BetContext& ctx,
                                                   const Params&) {
    Detail detail;
    for (std::size_t row = 0; row < kRows; ++row) {
        double f = stream.deriveFraction(ctx.playerSeed, ctx.sequence + row);
        detail.path[row] = f < 0.5 ? 0 : 1;
        detail.slot += detail.path[row];
    }
    return settleTable(stream, ctx, detail, multipliers()[detail.slot]);
}

const std::vector<Fixed64>& KenoGame::paytable(std::size_t pickCount) {
    static const std::map<std::size_t, std::vector<Fixed64>> tables = [] {
        const std::map<std::size_t, std::vector<std::int64_t>> hundredths{
            { 1, { 0, 190 } },
            { 2, { 0, 100, 350 } },
            { 3, { 0, 50, 200, 900 } },
            { 4, { 0, 50, 200, 700, 2800 } },
            { 5, { 0, 0, 100, 500, 1200, 5000 } },
            { 6, { 0, 0, 50, 300, 1000, 3000, 7500 } },
            { 7, { 0, 0, 50, 200, 700, 2000, 5000, 12000 } },
            { 8, { 0, 0, 50, 200, 500, 1500, 4000, 9000, 20000 } },
            { 9, { 0, 0, 50, 100, 300, 1000, 2500, 6000, 12000, 30000 } },
            { 10, { 0, 0, 50, 100, 200, 700, 2000, 5000, 10000, 20000, 50000 } },
        };
        std::map<std::size_t, std::vector<Fixed64>> out;
        for (const auto& entry : hundredths) {
            std::vector<Fixed64> row;
            for (std::int64_t value : entry.second) {
                row.push_back(Fixed64::fromHundredths(value));
            }
            out.emplace(entry.first, std::move(row));
        }
        return out;
    }();

    auto it = tables.find(pickCount);
    if (it == tables.end()) {
        throw GameError(ErrorKind::InvalidParameters, "keno tickets hold 1 to 10 numbers");
    }
    return it->second;
}

void KenoGame::validate(const Params& params) {
    if (params.picks.empty() || params.picks.size() > kMaxPicks) {
        throw GameError(ErrorKind::InvalidParameters, "pick 1 to 10 keno numbers");
    }
    std::set<int> seen;
    for (int pick : params.picks) {
        if (pick < 1 || pick > kPoolSize) {
            throw GameError(ErrorKind::InvalidParameters, "keno numbers must lie in [1, 40]");
        }
        if (!seen.insert(pick).second) {
            throw GameError(ErrorKind::InvalidParameters, "keno numbers must be distinct");
        }
    }
}

GameResult<KenoGame::Detail> KenoGame::resolve(const RandomStream& stream,
                                               const BetContext& ctx,
                                               const Params& params) {
    validate(params);

    std::vector<int> pool(kPoolSize);
    std::iota(pool.begin(), pool.end(), 1);
    for (int i = kPoolSize - 1; i > 0; --i) {
        auto j = stream.drawInt(ctx.playerSeed, ctx.sequence + static_cast<std::uint64_t>(i),
                                static_cast<std::uint32_t>(i + 1));
        std::swap(pool[static_cast<std::size_t>(i)], pool[j]);
    }

    Detail detail;
    detail.drawn.assign(pool.begin(), pool.begin() + kDrawn);
    for (int pick : params.picks) {
        if (std::find(detail.drawn.begin(), detail.drawn.end(), pick) != detail.drawn.end()) {
            ++detail.hits;
        }
    }
    Fixed64 multiplier = paytable(params.picks.size()).at(detail.hits);
    return settleTable(stream, ctx, detail, multiplier);
}

const std::array<Fixed64, WheelGame::kSegments>& WheelGame::segments() {
    static const std::array<Fixed64, kSegments> table = [] {
        const std::array<std::int64_t, kSegments> whole{ 1, 1, 1, 2, 2, 3, 5, 10, 1, 1,
                                                         1, 2, 2, 3, 5, 1, 1, 2, 3, 20 };
        std::array<Fixed64, kSegments> out{};
        for (std::size_t i = 0; i < kSegments; ++i) {
            out[i] = Fixed64(whole[i]);
        }
        return out;
    }();
    return table;
}

GameResult<WheelGame::Detail> WheelGame::resolve(const RandomStream& stream,
                                                 const BetContext& ctx,
                                                 const Params&) {
    Detail detail;
    detail.segment =
        stream.drawInt(ctx.playerSeed, ctx.sequence, static_cast<std::uint32_t>(kSegments));
    detail.segmentMultiplier = segments()[detail.segment];
    return settleTable(stream, ctx, detail, detail.segmentMultiplier * kEdgeFactor);
}

} // namespace hb
