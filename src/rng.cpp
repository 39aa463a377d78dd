#include "rng.hpp"

#include "picosha2.h"
#include "secure_memory.hpp"
#include "secure_random.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace hb {

namespace {

constexpr int kFractionBits = 52;
constexpr double kFractionScale = static_cast<double>(1ULL << kFractionBits);

std::string drawMessage(const std::string& playerSeed, std::uint64_t sequence) {
    return playerSeed + ":" + std::to_string(sequence);
}

} // namespace

RandomStream::RandomStream(std::shared_ptr<EpochState> epoch) : epoch_(std::move(epoch)) {
    if (!epoch_) {
        throw std::invalid_argument("RandomStream requires an epoch");
    }
    ensureSodiumReady();
}

RandomStream RandomStream::fromRevealedSeed(const std::string& seedHex) {
    return RandomStream(std::make_shared<EpochState>(0, seedHex));
}

std::array<unsigned char, 32> RandomStream::mac(const std::string& message) const {
    static_assert(crypto_auth_hmacsha256_BYTES == 32, "HMAC-SHA256 digest is 32 bytes");

    crypto_auth_hmacsha256_state state;
    std::array<unsigned char, 32> digest{};
    if (crypto_auth_hmacsha256_init(&state, epoch_->seed.bytes(), epoch_->seed.byteSize()) != 0 ||
        crypto_auth_hmacsha256_update(&state,
                                      reinterpret_cast<const unsigned char*>(message.data()),
                                      message.size()) != 0 ||
        crypto_auth_hmacsha256_final(&state, digest.data()) != 0) {
        secureZero(&state, sizeof(state));
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    secureZero(&state, sizeof(state));
    return digest;
}

double RandomStream::deriveFraction(const std::string& playerSeed, std::uint64_t sequence) const {
    auto digest = mac(drawMessage(playerSeed, sequence));

    // The first 13 hex characters of the digest: 6.5 bytes, 52 bits.
    std::uint64_t val = 0;
    for (int i = 0; i < 7; ++i) {
        val = (val << 8) | digest[i];
    }
    val >>= 4;
    return static_cast<double>(val) / kFractionScale;
}

std::uint32_t RandomStream::drawInt(const std::string& playerSeed,
                                    std::uint64_t sequence,
                                    std::uint32_t upperBoundExclusive) const {
    if (upperBoundExclusive == 0) {
        throw std::invalid_argument("drawInt upper bound must be positive");
    }
    double scaled = std::floor(deriveFraction(playerSeed, sequence) * upperBoundExclusive);
    return static_cast<std::uint32_t>(scaled);
}

std::uint64_t RandomStream::allocate(std::uint64_t span) const {
    return epoch_->nonces.reserve(span);
}

bool RandomStream::claim(std::uint64_t first, std::uint64_t span) const {
    return epoch_->nonces.claim(first, span);
}

std::uint64_t RandomStream::issued() const {
    return epoch_->nonces.issued();
}

StreamCursor::StreamCursor(RandomStream stream, std::string playerSeed, std::uint64_t firstSequence)
    : stream_(std::move(stream))
    , playerSeed_(std::move(playerSeed))
    , next_(firstSequence) {}

double StreamCursor::uniform01() {
    return stream_.deriveFraction(playerSeed_, next_++);
}

RoundCommitmentSource::RoundCommitmentSource(std::string playerSeed)
    : playerSeed_(std::move(playerSeed)) {}

RoundCommitmentSource::RoundCommitmentSource(const std::string& seedHex, std::string playerSeed)
    : commitments_(seedHex)
    , playerSeed_(std::move(playerSeed)) {}

double RoundCommitmentSource::uniform01() {
    RandomStream stream = commitments_.stream();
    std::uint64_t sequence = stream.allocate(1);
    double fraction = stream.deriveFraction(playerSeed_, sequence);

    std::lock_guard<std::mutex> lock(mutex_);
    last_ = DrawReceipt{ stream.epoch(), stream.commitHash(), playerSeed_, sequence, fraction };
    return fraction;
}

void RoundCommitmentSource::settle() {
    SeedReveal reveal = commitments_.rotate();
    std::lock_guard<std::mutex> lock(mutex_);
    lastReveal_ = std::move(reveal);
}

DrawReceipt RoundCommitmentSource::lastDraw() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_;
}

std::optional<SeedReveal> RoundCommitmentSource::lastReveal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastReveal_;
}

std::string hashSeed(const std::string& seed) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(seed.begin(), seed.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

bool verifyCommitment(const std::string& revealedSeed, const std::string& commitHash) {
    return secureEquals(hashSeed(revealedSeed), commitHash);
}

} // namespace hb
