#pragma once

#include "nonce_allocator.hpp"
#include "secure_memory.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace hb {

class RandomStream;

// One commitment epoch: the secret seed (hex text, also the HMAC key), its
// published hash and the sequence numbers handed out under it.
struct EpochState {
    EpochState(std::uint64_t epochId, const std::string& seedHex);

    std::string revealSeed() const;

    const std::uint64_t id;
    const SecureBuffer<char> seed;
    const std::string commitHash;
    NonceAllocator nonces;
};

struct CommitmentInfo {
    std::string commitHash;
    std::uint64_t epoch = 0;
};

struct SeedReveal {
    std::string revealedSeed;
    std::string previousCommitHash;
    std::string newCommitHash;
    std::uint64_t revealedEpoch = 0;
    std::uint64_t newEpoch = 0;
    std::uint64_t drawsAllocated = 0;
};

// Owns the single live commitment. Draws take a snapshot of the epoch through
// stream(), so a rotation never changes the seed under a draw in flight: the
// draw completes under the epoch it started in and stays attributable to it.
class CommitmentManager {
public:
    CommitmentManager();
    explicit CommitmentManager(const std::string& seedHex);

    CommitmentManager(const CommitmentManager&) = delete;
    CommitmentManager& operator=(const CommitmentManager&) = delete;

    CommitmentInfo commitment() const;
    SeedReveal rotate();
    RandomStream stream() const;

private:
    std::shared_ptr<EpochState> current() const;

    mutable std::shared_mutex mutex_;
    std::mutex rotateMutex_;
    std::shared_ptr<EpochState> current_;
};

// 32 bytes from the OS CSPRNG rendered as 64 lowercase hex characters.
std::string generateServerSeed();

} // namespace hb
