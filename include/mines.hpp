#pragma once

#include "fixed_point.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace hb {

class RandomStream;

struct MinesGame {
    static constexpr int kGridSize = 5;
    static constexpr int kCells = kGridSize * kGridSize;
    static constexpr int kMines = 3;

    static constexpr const char* kName = "mines";
    static constexpr std::uint64_t kSpan = kMines;
    static const Fixed64 kStepBonus;

    // Partial Fisher-Yates over the 25 cells, one draw per mine.
    static std::vector<int> placeMines(const RandomStream& stream,
                                       const std::string& playerSeed,
                                       std::uint64_t sequence);

    static Fixed64 multiplierFor(std::size_t safeReveals);
    static int cellIndex(int x, int y);
};

struct MinesReveal {
    bool mine = false;
    bool repeated = false;
    std::size_t safeReveals = 0;
    Fixed64 multiplier;
    Amount potentialPayout = 0;
    std::vector<int> mines; // filled once the board is over
};

struct MinesCashout {
    Amount stake = 0;
    Amount payout = 0;
    std::size_t safeReveals = 0;
    Fixed64 multiplier;
    std::vector<int> mines;
};

class MinesBoard {
public:
    MinesBoard(Amount stake,
               std::string playerSeed,
               std::uint64_t sequence,
               std::uint64_t epoch,
               std::vector<int> mines);

    MinesReveal reveal(int x, int y);
    MinesCashout cashout();
    // As cashout(), but nothing when the board is already closed.
    std::optional<MinesCashout> settle();

    Amount stake() const { return stake_; }
    const std::string& playerSeed() const { return playerSeed_; }
    std::uint64_t sequence() const { return sequence_; }
    std::uint64_t epoch() const { return epoch_; }
    std::size_t revealedCount() const;
    bool closed() const;

private:
    std::vector<int> mineList() const;

    const Amount stake_;
    const std::string playerSeed_;
    const std::uint64_t sequence_;
    const std::uint64_t epoch_;
    std::set<int> mines_;

    mutable std::mutex mutex_;
    std::set<int> revealed_;
    bool closed_ = false;
};

// Live boards keyed by session. Opening a board replaces the session's
// previous one, which is cashed out at its current multiplier rather than
// forfeited; open() returns that settlement for the caller to credit. A mine
// hit or a cashout removes a board. Requests against a session without a live
// board are rejected as StaleBoard.
class MinesBoardStore {
public:
    std::optional<MinesCashout> open(const std::string& session, std::shared_ptr<MinesBoard> board);
    MinesReveal reveal(const std::string& session, int x, int y);
    MinesCashout cashout(const std::string& session);

    std::shared_ptr<MinesBoard> find(const std::string& session) const;
    std::size_t size() const;

private:
    std::shared_ptr<MinesBoard> require(const std::string& session) const;
    void release(const std::string& session, const std::shared_ptr<MinesBoard>& board);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<MinesBoard>> boards_;
};

} // namespace hb
