#pragma once

#include "broadcast.hpp"
#include "fixed_point.hpp"
#include "transcript_log.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace hb {

class RandomSource;

struct CrashConfig {
    std::chrono::milliseconds tickInterval{ 200 };
    std::chrono::milliseconds interRoundDelay{ 3000 };
    Fixed64 growthPerSecond = Fixed64::fromHundredths(120);
    Fixed64 crashScale = Fixed64::fromHundredths(50);
    Fixed64 maxCrash = Fixed64(1'000'000);
    Fixed64 edgeFactor = Fixed64::fromHundredths(99);
    std::size_t subscriberCapacity = 64;
};

enum class CrashPhase { Idle, Running, Ended };
enum class CrashEventKind { Status, Tick, End };

const char* toString(CrashPhase phase);
const char* toString(CrashEventKind kind);

struct CrashEvent {
    CrashEventKind kind = CrashEventKind::Status;
    CrashPhase phase = CrashPhase::Idle;
    std::uint64_t roundId = 0;
    Fixed64 multiplier;
    std::int64_t elapsedMs = 0;
    std::string transcriptRoot; // end events only

    // Canonical line; also what the round transcript hashes.
    std::string toString() const;
};

struct CrashSnapshot {
    CrashPhase phase = CrashPhase::Idle;
    std::uint64_t roundId = 0;
    Fixed64 multiplier;                  // highest broadcast, or the crash point once ended
    std::optional<Fixed64> crashPoint;   // revealed only after the end event
    std::int64_t elapsedMs = 0;
    std::size_t cashouts = 0;
    std::size_t enrolled = 0;
    std::string lastRoot;
};

struct CashoutRequest {
    std::string participantId;
    Amount betAmount = 0;
    Fixed64 claimedMultiplier;
    std::uint64_t roundId = 0; // 0 = whatever round is live
};

struct CashoutResult {
    bool accepted = false;
    Amount payout = 0;
    std::uint64_t roundId = 0;
    std::string reason;
};

struct CrashStake {
    std::uint64_t roundId = 0;
    Amount amount = 0;
};

// Drives crash rounds in caller-supplied time. Nothing here reads a clock:
// CrashLoop feeds steady_clock, tests feed virtual time points.
//
// Idle until start(); then Running -> Ended -> (interRoundDelay) -> Running.
// The random source is settled as each round ends, never while one runs.
// All public calls serialize on one mutex; events go to the hub's mailboxes
// and never into subscriber code.
class CrashRoundScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    CrashRoundScheduler(CrashConfig config, RandomSource& random, BroadcastHub<CrashEvent>& hub);

    CrashRoundScheduler(const CrashRoundScheduler&) = delete;
    CrashRoundScheduler& operator=(const CrashRoundScheduler&) = delete;

    void start(TimePoint now);

    // One step: a tick, the end of a round, or the start of the next one.
    void advance(TimePoint now);

    // TimePoint::max() while idle.
    TimePoint nextDeadline() const;

    CrashSnapshot snapshot() const;

    // The new mailbox already holds a status event describing the live round.
    BroadcastHub<CrashEvent>::Subscription subscribe(std::size_t capacity = 0);

    CashoutResult cashout(const CashoutRequest& request);

    // Records a stake for the next round. Returns that round's id, or nothing
    // while a round is running or when the participant already joined it.
    std::optional<std::uint64_t> enroll(const std::string& participantId, Amount stake);
    std::optional<CrashStake> stakeFor(const std::string& participantId) const;

    // The transcript of the most recently finished round.
    RoundTranscript lastTranscript() const;

    Fixed64 multiplierAt(std::chrono::milliseconds elapsed) const;
    const CrashConfig& config() const { return config_; }

private:
    void beginRound(TimePoint now);
    void endRound(TimePoint now);
    void tick(TimePoint now);
    void publish(const CrashEvent& event);
    CrashEvent statusEvent() const;
    std::int64_t elapsedMs(TimePoint at) const;

    const CrashConfig config_;
    RandomSource& random_;
    BroadcastHub<CrashEvent>& hub_;

    mutable std::mutex mutex_;
    CrashPhase phase_ = CrashPhase::Idle;
    std::uint64_t roundId_ = 0;
    Fixed64 crashPoint_;
    Fixed64 highest_;
    TimePoint roundStart_{};
    TimePoint deadline_ = TimePoint::max();
    std::uint64_t ticks_ = 0;
    RoundTranscript transcript_;
    RoundTranscript lastTranscript_;
    std::string lastRoot_;
    std::unordered_set<std::string> cashedOut_;
    std::unordered_map<std::string, Amount> stakes_;
    std::unordered_map<std::string, Amount> pending_;
};

} // namespace hb
