#include "crash.hpp"

#include "deterministic_math.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "rng.hpp"

#include <sstream>

namespace hb {

const char* toString(CrashPhase phase) {
    switch (phase) {
    case CrashPhase::Idle:
        return "idle";
    case CrashPhase::Running:
        return "running";
    case CrashPhase::Ended:
        return "ended";
    }
    return "unknown";
}

const char* toString(CrashEventKind kind) {
    switch (kind) {
    case CrashEventKind::Status:
        return "status";
    case CrashEventKind::Tick:
        return "tick";
    case CrashEventKind::End:
        return "end";
    }
    return "unknown";
}

std::string CrashEvent::toString() const {
    std::ostringstream oss;
    oss << "crash:" << hb::toString(kind)
        << " round=" << roundId
        << " phase=" << hb::toString(phase)
        << " m=" << multiplier.toString(2)
        << " t=" << elapsedMs;
    if (!transcriptRoot.empty()) {
        oss << " root=" << transcriptRoot;
    }
    return oss.str();
}

CrashRoundScheduler::CrashRoundScheduler(CrashConfig config,
                                         RandomSource& random,
                                         BroadcastHub<CrashEvent>& hub)
    : config_(std::move(config))
    , random_(random)
    , hub_(hub)
    , highest_(1) {
    if (config_.tickInterval.count() <= 0) {
        throw std::invalid_argument("crash tick interval must be positive");
    }
    if (config_.interRoundDelay.count() < 0) {
        throw std::invalid_argument("crash inter-round delay must not be negative");
    }
    if (config_.maxCrash < Fixed64(1) || config_.crashScale <= Fixed64()) {
        throw std::invalid_argument("crash distribution parameters out of range");
    }
    if (config_.subscriberCapacity == 0) {
        throw std::invalid_argument("crash subscriber capacity must be positive");
    }
}

Fixed64 CrashRoundScheduler::multiplierAt(std::chrono::milliseconds elapsed) const {
    Fixed64 seconds = Fixed64::fromRaw(elapsed.count() * (Fixed64::kScale / 1000));
    return (Fixed64(1) + config_.growthPerSecond * seconds).floorToHundredths();
}

void CrashRoundScheduler::start(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != CrashPhase::Idle) {
        Log::debug("crash", "start ignored, scheduler already ", hb::toString(phase_));
        return;
    }
    beginRound(now);
}

void CrashRoundScheduler::advance(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ == CrashPhase::Idle || now < deadline_) {
        return;
    }
    if (phase_ == CrashPhase::Running) {
        tick(now);
    } else {
        beginRound(now);
    }
}

CrashRoundScheduler::TimePoint CrashRoundScheduler::nextDeadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_;
}

void CrashRoundScheduler::beginRound(TimePoint now) {
    // Draw before touching state so a failing source leaves the last round intact.
    Fixed64 point = DeterministicMath::crashPoint(random_.uniform01(), config_.crashScale, config_.maxCrash);

    ++roundId_;
    crashPoint_ = point;
    phase_ = CrashPhase::Running;
    roundStart_ = now;
    ticks_ = 0;
    highest_ = Fixed64(1);
    transcript_.clear();
    cashedOut_.clear();
    stakes_ = std::move(pending_);
    pending_.clear();
    deadline_ = now + config_.tickInterval;

    Log::debug("crash", "round ", roundId_, " started with ", stakes_.size(), " stakes");
    publish(statusEvent());

    if (crashPoint_ <= Fixed64(1)) {
        endRound(now);
    }
}

void CrashRoundScheduler::tick(TimePoint now) {
    ++ticks_;
    auto elapsed = config_.tickInterval * static_cast<std::int64_t>(ticks_);
    Fixed64 current = multiplierAt(elapsed);
    if (current >= crashPoint_) {
        endRound(now);
        return;
    }

    highest_ = current;
    CrashEvent event;
    event.kind = CrashEventKind::Tick;
    event.phase = phase_;
    event.roundId = roundId_;
    event.multiplier = current;
    event.elapsedMs = elapsed.count();
    publish(event);

    deadline_ = roundStart_ + config_.tickInterval * static_cast<std::int64_t>(ticks_ + 1);
}

void CrashRoundScheduler::endRound(TimePoint now) {
    phase_ = CrashPhase::Ended;
    lastRoot_ = transcript_.merkleRoot();
    lastTranscript_ = transcript_;

    CrashEvent event;
    event.kind = CrashEventKind::End;
    event.phase = phase_;
    event.roundId = roundId_;
    event.multiplier = crashPoint_;
    event.elapsedMs = elapsedMs(now);
    event.transcriptRoot = lastRoot_;
    publish(event);

    Log::info("crash", "round ", roundId_, " crashed at ", crashPoint_.toString(2),
              "x after ", ticks_, " ticks, ", cashedOut_.size(), " cashouts, ",
              stakes_.size(), " stakes lost");
    stakes_.clear();
    deadline_ = now + config_.interRoundDelay;

    // Nothing of this round can be cashed out any more; its draw may be revealed.
    random_.settle();
}

void CrashRoundScheduler::publish(const CrashEvent& event) {
    if (event.kind != CrashEventKind::End) {
        transcript_.append(event.toString());
    }
    hub_.publish(event);
}

std::int64_t CrashRoundScheduler::elapsedMs(TimePoint at) const {
    if (phase_ == CrashPhase::Idle || at < roundStart_) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(at - roundStart_).count();
}

CrashEvent CrashRoundScheduler::statusEvent() const {
    CrashEvent event;
    event.kind = CrashEventKind::Status;
    event.phase = phase_;
    event.roundId = roundId_;
    switch (phase_) {
    case CrashPhase::Idle:
        event.multiplier = Fixed64(1);
        break;
    case CrashPhase::Running:
        event.multiplier = highest_;
        event.elapsedMs = (config_.tickInterval * static_cast<std::int64_t>(ticks_)).count();
        break;
    case CrashPhase::Ended:
        event.multiplier = crashPoint_;
        event.transcriptRoot = lastRoot_;
        break;
    }
    return event;
}

CrashSnapshot CrashRoundScheduler::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CrashSnapshot out;
    CrashEvent status = statusEvent();
    out.phase = phase_;
    out.roundId = roundId_;
    out.multiplier = status.multiplier;
    out.elapsedMs = status.elapsedMs;
    if (phase_ == CrashPhase::Ended) {
        out.crashPoint = crashPoint_;
    }
    out.cashouts = cashedOut_.size();
    out.enrolled = phase_ == CrashPhase::Running ? stakes_.size() : pending_.size();
    out.lastRoot = lastRoot_;
    return out;
}

BroadcastHub<CrashEvent>::Subscription CrashRoundScheduler::subscribe(std::size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto mailbox = hub_.subscribe(capacity == 0 ? config_.subscriberCapacity : capacity);
    mailbox->push(statusEvent());
    return mailbox;
}

CashoutResult CrashRoundScheduler::cashout(const CashoutRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    CashoutResult out;
    out.roundId = roundId_;

    auto reject = [&](const char* reason) {
        out.reason = reason;
        Log::debug("crash", "cashout by ", request.participantId, " at ",
                   request.claimedMultiplier.toString(2), "x rejected: ", reason);
        return out;
    };

    if (phase_ != CrashPhase::Running) {
        return reject("round is not running");
    }
    if (request.roundId != 0 && request.roundId != roundId_) {
        return reject("stake belongs to another round");
    }
    if (request.betAmount <= 0) {
        return reject("bet amount must be positive");
    }
    if (request.claimedMultiplier < Fixed64(1)) {
        return reject("claimed multiplier below 1.00");
    }
    if (request.claimedMultiplier > highest_) {
        return reject("claimed multiplier was never broadcast");
    }
    if (!cashedOut_.insert(request.participantId).second) {
        return reject("participant already cashed out this round");
    }

    stakes_.erase(request.participantId);
    out.accepted = true;
    out.payout = (request.claimedMultiplier * config_.edgeFactor).applyTo(request.betAmount);
    Log::debug("crash", request.participantId, " cashed out at ",
               request.claimedMultiplier.toString(2), "x for ", out.payout);
    return out;
}

std::optional<std::uint64_t> CrashRoundScheduler::enroll(const std::string& participantId, Amount stake) {
    if (stake <= 0) {
        throw GameError(ErrorKind::InvalidBet, "crash stake must be positive");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ == CrashPhase::Running) {
        return std::nullopt;
    }
    if (!pending_.emplace(participantId, stake).second) {
        return std::nullopt;
    }
    return roundId_ + 1;
}

std::optional<CrashStake> CrashRoundScheduler::stakeFor(const std::string& participantId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != CrashPhase::Running) {
        return std::nullopt;
    }
    auto it = stakes_.find(participantId);
    if (it == stakes_.end()) {
        return std::nullopt;
    }
    return CrashStake{ roundId_, it->second };
}

RoundTranscript CrashRoundScheduler::lastTranscript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastTranscript_;
}

} // namespace hb
