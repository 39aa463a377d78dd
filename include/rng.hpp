#pragma once

#include "commitment.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace hb {

class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double uniform01() = 0;

    // Everything drawn so far has been used up and can no longer be bet on.
    // Sources backed by a commitment reveal it here.
    virtual void settle() {}
};

// Draws bound to one commitment epoch.
//
// deriveFraction is a pure function of (epoch seed, player seed, sequence).
// The same sequence asked for before and after a rotation gives two different
// fractions because the seeds differ; a snapshot taken before the rotation
// keeps answering for the old epoch.
class RandomStream {
public:
    explicit RandomStream(std::shared_ptr<EpochState> epoch);

    // For auditors holding a revealed seed.
    static RandomStream fromRevealedSeed(const std::string& seedHex);

    // HMAC-SHA256(seed, playerSeed ":" sequence), top 52 bits / 2^52.
    double deriveFraction(const std::string& playerSeed, std::uint64_t sequence) const;

    // floor(deriveFraction * upperBoundExclusive).
    std::uint32_t drawInt(const std::string& playerSeed,
                          std::uint64_t sequence,
                          std::uint32_t upperBoundExclusive) const;

    std::uint64_t allocate(std::uint64_t span) const;
    bool claim(std::uint64_t first, std::uint64_t span) const;
    std::uint64_t issued() const;

    std::uint64_t epoch() const { return epoch_->id; }
    const std::string& commitHash() const { return epoch_->commitHash; }

private:
    std::array<unsigned char, 32> mac(const std::string& message) const;

    std::shared_ptr<EpochState> epoch_;
};

// RandomSource over consecutive sequence numbers of one stream.
class StreamCursor : public RandomSource {
public:
    StreamCursor(RandomStream stream, std::string playerSeed, std::uint64_t firstSequence);

    double uniform01() override;
    std::uint64_t position() const { return next_; }

private:
    RandomStream stream_;
    std::string playerSeed_;
    std::uint64_t next_;
};

struct DrawReceipt {
    std::uint64_t epoch = 0;
    std::string commitHash;
    std::string playerSeed;
    std::uint64_t sequence = 0;
    double fraction = 0.0;
};

// Draws from a commitment of its own, kept apart from the one bets use, so no
// outside rotation can reveal a value that is still in play. Only settle()
// rotates it: every value drawn since the previous settle() becomes auditable
// against the revealed seed, and later draws come from the fresh epoch.
class RoundCommitmentSource : public RandomSource {
public:
    explicit RoundCommitmentSource(std::string playerSeed);
    RoundCommitmentSource(const std::string& seedHex, std::string playerSeed);

    double uniform01() override;
    void settle() override;

    // The commitment the next draws are taken from.
    CommitmentInfo commitment() const { return commitments_.commitment(); }
    DrawReceipt lastDraw() const;
    std::optional<SeedReveal> lastReveal() const;

private:
    CommitmentManager commitments_;
    const std::string playerSeed_;
    mutable std::mutex mutex_;
    DrawReceipt last_;
    std::optional<SeedReveal> lastReveal_;
};

std::string hashSeed(const std::string& seed);
bool verifyCommitment(const std::string& revealedSeed, const std::string& commitHash);

} // namespace hb
