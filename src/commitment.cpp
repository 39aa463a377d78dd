#include "commitment.hpp"

#include "hex.hpp"
#include "log.hpp"
#include "rng.hpp"
#include "secure_random.hpp"

#include <stdexcept>

namespace hb {

namespace {

constexpr std::size_t kSeedBytes = 32;

const std::string& validatedSeed(const std::string& seedHex) {
    if (seedHex.size() != kSeedBytes * 2 || !isLowerHex(seedHex)) {
        throw std::invalid_argument("server seed must be 64 lowercase hex characters");
    }
    return seedHex;
}

} // namespace

EpochState::EpochState(std::uint64_t epochId, const std::string& seedHex)
    : id(epochId)
    , seed(validatedSeed(seedHex).data(), seedHex.size())
    , commitHash(hashSeed(seedHex)) {}

std::string EpochState::revealSeed() const {
    return std::string(seed.data(), seed.size());
}

std::string generateServerSeed() {
    return secureRandomHex(kSeedBytes);
}

CommitmentManager::CommitmentManager() : CommitmentManager(generateServerSeed()) {}

CommitmentManager::CommitmentManager(const std::string& seedHex)
    : current_(std::make_shared<EpochState>(1, seedHex)) {
    Log::info("commitment", "epoch ", current_->id, " committed to ", current_->commitHash);
}

std::shared_ptr<EpochState> CommitmentManager::current() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return current_;
}

CommitmentInfo CommitmentManager::commitment() const {
    auto epoch = current();
    return CommitmentInfo{ epoch->commitHash, epoch->id };
}

RandomStream CommitmentManager::stream() const {
    return RandomStream(current());
}

SeedReveal CommitmentManager::rotate() {
    std::lock_guard<std::mutex> rotating(rotateMutex_);

    // Entropy is gathered before the swap; a failure leaves the live epoch intact.
    std::string freshSeed = generateServerSeed();

    std::shared_ptr<EpochState> retired;
    std::shared_ptr<EpochState> fresh;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        fresh = std::make_shared<EpochState>(current_->id + 1, freshSeed);
        retired = current_;
        current_ = fresh;
    }
    secureZero(&freshSeed[0], freshSeed.size());

    SeedReveal reveal;
    reveal.revealedSeed = retired->revealSeed();
    reveal.previousCommitHash = retired->commitHash;
    reveal.newCommitHash = fresh->commitHash;
    reveal.revealedEpoch = retired->id;
    reveal.newEpoch = fresh->id;
    reveal.drawsAllocated = retired->nonces.issued();

    Log::info("commitment",
              "rotated epoch ",
              retired->id,
              " (",
              reveal.drawsAllocated,
              " sequence numbers issued); epoch ",
              fresh->id,
              " committed to ",
              fresh->commitHash);
    return reveal;
}

} // namespace hb
