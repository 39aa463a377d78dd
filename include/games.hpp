#pragma once

#include "fixed_point.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace hb {

class RandomStream;

// What every resolver sees of a bet. The sequence is the first of the
// game's kSpan consecutive sequence numbers.
struct BetContext {
    Amount amount = 0;
    std::string playerSeed;
    std::uint64_t sequence = 0;
};

template <typename Detail>
struct GameResult {
    Detail detail;
    bool won = false;
    bool push = false;
    Amount payout = 0;
    Fixed64 multiplier;
    std::uint64_t sequence = 0;
    std::uint64_t epoch = 0;
};

// Each game below follows the same shape, consumed by BetDesk::play:
//   Params / Detail        request parameters and outcome detail
//   kSpan                  sequence numbers consumed from BetContext::sequence
//   validate(params)       throws GameError(InvalidParameters), draws nothing
//   resolve(...)           pure; never touches balances

struct DiceGame {
    struct Params {
        double target = 50.0;
        bool over = false;
    };
    struct Detail {
        std::uint32_t rollHundredths = 0;
        std::int64_t targetHundredths = 0;
        bool over = false;
        double roll() const { return rollHundredths / 100.0; }
    };

    static constexpr const char* kName = "dice";
    static constexpr std::uint64_t kSpan = 1;
    static const Fixed64 kHouseEdge;

    static void validate(const Params& params);
    static Fixed64 multiplier(const Params& params);
    static GameResult<Detail> resolve(const RandomStream& stream,
                                      const BetContext& ctx,
                                      const Params& params);
};

enum class CoinFace { Heads, Tails };

const char* toString(CoinFace face);

struct CoinflipGame {
    struct Params {
        CoinFace pick = CoinFace::Heads;
    };
    struct Detail {
        CoinFace result = CoinFace::Heads;
        double roll = 0.0;
    };

    static constexpr const char* kName = "coinflip";
    static constexpr std::uint64_t kSpan = 1;
    static const Fixed64 kPayout;

    static void validate(const Params&) {}
    static GameResult<Detail> resolve(const RandomStream& stream,
                                      const BetContext& ctx,
                                      const Params& params);
};

struct LimboGame {
    struct Params {
        double target = 2.0;
    };
    struct Detail {
        double roll = 0.0;
        Fixed64 target;
    };

    static constexpr const char* kName = "limbo";
    static constexpr std::uint64_t kSpan = 1;
    static const Fixed64 kEdgeFactor;
    static const Fixed64 kMinTarget;
    static const Fixed64 kMaxTarget;

    static void validate(const Params& params);
    static GameResult<Detail> resolve(const RandomStream& stream,
                                      const BetContext& ctx,
                                      const Params& params);
};

enum class RouletteBet { Number, Red, Black, Even, Odd };

const char* toString(RouletteBet bet);

struct RouletteGame {
    struct Params {
        RouletteBet type = RouletteBet::Red;
        int number = -1;
    };
    struct Detail {
        std::uint32_t pocket = 0;
        bool red = false;
    };

    static constexpr const char* kName = "roulette";
    static constexpr std::uint64_t kSpan = 1;
    static constexpr std::uint32_t kPockets = 37;
    static const Fixed64 kEdgeFactor;

    static bool isRed(std::uint32_t pocket);
    static Fixed64 baseMultiplier(RouletteBet type);
    static bool wins(const Params& params, std::uint32_t pocket);

    static void validate(const Params& params);
    static GameResult<Detail> resolve(const RandomStream& stream,
                                      const BetContext& ctx,
                                      const Params& params);
};

struct PlinkoGame {
    static constexpr std::size_t kRows = 12;

    struct Params {};
    struct Detail {
        std::array<std::uint8_t, kRows> path{};
        std::uint32_t slot = 0;
    };

    static constexpr const char* kName = "plinko";
    static constexpr std::uint64_t kSpan = kRows;

    static const std::array<Fixed64, kRows + 1>& multipliers();

    static void validate(const Params&) {}
    static GameResult<Detail> resolve(const RandomStream& stream,
                                      const BetContext& ctx,
                                      const Params& params);
};

struct KenoGame {
    static constexpr int kPoolSize = 40;
    static constexpr std::size_t kDrawn = 20;
    static constexpr std::size_t kMaxPicks = 10;

    struct Params {
        std::vector<int> picks;
    };
    struct Detail {
        std::vector<int> drawn;
        std::uint32_t hits = 0;
    };

    static constexpr const char* kName = "keno";
    static constexpr std::uint64_t kSpan = kPoolSize;

    // Multipliers indexed by hit count for a ticket of `pickCount` numbers.
    static const std::vector<Fixed64>& paytable(std::size_t pickCount);

    static void validate(const Params& params);
    static GameResult<Detail> resolve(const RandomStream& stream,
                                      const BetContext& ctx,
                                      const Params& params);
};

struct WheelGame {
    static constexpr std::size_t kSegments = 20;

    struct Params {};
    struct Detail {
        std::uint32_t segment = 0;
        Fixed64 segmentMultiplier;
    };

    static constexpr const char* kName = "wheel";
    static constexpr std::uint64_t kSpan = 1;
    static const Fixed64 kEdgeFactor;

    static const std::array<Fixed64, kSegments>& segments();

    static void validate(const Params&) {}
    static GameResult<Detail> resolve(const RandomStream& stream,
                                      const BetContext& ctx,
                                      const Params& params);
};

} // namespace hb
