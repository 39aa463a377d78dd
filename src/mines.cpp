#include "mines.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "rng.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace hb {

const Fixed64 MinesGame::kStepBonus = Fixed64::fromHundredths(20);

std::vector<int> MinesGame::placeMines(const RandomStream& stream,
                                       const std::string& playerSeed,
                                       std::uint64_t sequence) {
    std::vector<int> cells(kCells);
    std::iota(cells.begin(), cells.end(), 0);
    for (int i = 0; i < kMines; ++i) {
        auto offset = stream.drawInt(playerSeed,
                                     sequence + static_cast<std::uint64_t>(i),
                                     static_cast<std::uint32_t>(kCells - i));
        std::swap(cells[static_cast<std::size_t>(i)], cells[static_cast<std::size_t>(i) + offset]);
    }
    std::vector<int> mines(cells.begin(), cells.begin() + kMines);
    std::sort(mines.begin(), mines.end());
    return mines;
}

Fixed64 MinesGame::multiplierFor(std::size_t safeReveals) {
    Fixed64 bonus = Fixed64::fromRaw(kStepBonus.raw() * static_cast<std::int64_t>(safeReveals));
    return Fixed64(1) + bonus;
}

int MinesGame::cellIndex(int x, int y) {
    if (x < 0 || x >= kGridSize || y < 0 || y >= kGridSize) {
        throw GameError(ErrorKind::InvalidParameters, "mines coordinates must lie in [0, 4]");
    }
    return y * kGridSize + x;
}

MinesBoard::MinesBoard(Amount stake,
                       std::string playerSeed,
                       std::uint64_t sequence,
                       std::uint64_t epoch,
                       std::vector<int> mines)
    : stake_(stake)
    , playerSeed_(std::move(playerSeed))
    , sequence_(sequence)
    , epoch_(epoch)
    , mines_(mines.begin(), mines.end()) {
    if (stake_ <= 0) {
        throw GameError(ErrorKind::InvalidBet, "mines stake must be positive");
    }
    for (int cell : mines_) {
        if (cell < 0 || cell >= MinesGame::kCells) {
            throw std::invalid_argument("mine outside the grid");
        }
    }
}

std::vector<int> MinesBoard::mineList() const {
    return std::vector<int>(mines_.begin(), mines_.end());
}

MinesReveal MinesBoard::reveal(int x, int y) {
    int cell = MinesGame::cellIndex(x, y);

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw GameError(ErrorKind::StaleBoard, "mines board is already settled");
    }

    MinesReveal out;
    if (mines_.count(cell) != 0) {
        closed_ = true;
        out.mine = true;
        out.safeReveals = revealed_.size();
        out.mines = mineList();
        return out;
    }

    out.repeated = !revealed_.insert(cell).second;
    out.safeReveals = revealed_.size();
    out.multiplier = MinesGame::multiplierFor(out.safeReveals);
    out.potentialPayout = out.multiplier.applyTo(stake_);
    return out;
}

MinesCashout MinesBoard::cashout() {
    auto out = settle();
    if (!out) {
        throw GameError(ErrorKind::StaleBoard, "mines board is already settled");
    }
    return *out;
}

std::optional<MinesCashout> MinesBoard::settle() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return std::nullopt;
    }
    closed_ = true;

    MinesCashout out;
    out.stake = stake_;
    out.safeReveals = revealed_.size();
    out.multiplier = MinesGame::multiplierFor(out.safeReveals);
    out.payout = out.multiplier.applyTo(stake_);
    out.mines = mineList();
    return out;
}

std::size_t MinesBoard::revealedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revealed_.size();
}

bool MinesBoard::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::optional<MinesCashout> MinesBoardStore::open(const std::string& session,
                                                  std::shared_ptr<MinesBoard> board) {
    if (!board) {
        throw std::invalid_argument("cannot open a null mines board");
    }
    std::shared_ptr<MinesBoard> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = boards_[session];
        replaced = std::move(slot);
        slot = std::move(board);
    }
    if (!replaced) {
        return std::nullopt;
    }
    auto settled = replaced->settle();
    if (settled) {
        Log::info("mines", "session ", session, " opened a new board; previous one cashed out at ",
                  settled->multiplier.toString(2), "x for ", settled->payout);
    }
    return settled;
}

std::shared_ptr<MinesBoard> MinesBoardStore::find(const std::string& session) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = boards_.find(session);
    return it == boards_.end() ? nullptr : it->second;
}

std::shared_ptr<MinesBoard> MinesBoardStore::require(const std::string& session) const {
    auto board = find(session);
    if (!board) {
        throw GameError(ErrorKind::StaleBoard, "no live mines board for this session");
    }
    return board;
}

void MinesBoardStore::release(const std::string& session, const std::shared_ptr<MinesBoard>& board) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = boards_.find(session);
    if (it != boards_.end() && it->second == board) {
        boards_.erase(it);
    }
}

MinesReveal MinesBoardStore::reveal(const std::string& session, int x, int y) {
    auto board = require(session);
    MinesReveal out = board->reveal(x, y);
    if (out.mine) {
        release(session, board);
    }
    return out;
}

MinesCashout MinesBoardStore::cashout(const std::string& session) {
    auto board = require(session);
    MinesCashout out = board->cashout();
    release(session, board);
    return out;
}

std::size_t MinesBoardStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return boards_.size();
}

} // namespace hb
