#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace hb {

// Append-only record of the events broadcast during one crash round.
// Leaves are SHA-256 of the canonical event line; odd layers duplicate their
// last node. The root goes out with the round's end event so a client holding
// the lines it saw can check them against it.
class RoundTranscript {
public:
    void append(const std::string& event);
    std::string leaf(std::size_t index) const;
    const std::vector<std::string>& leaves() const { return leaves_; }

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;

    static std::string leafHash(const std::string& event);
    static bool verifyProof(const std::string& leafHash,
                            std::size_t leafIndex,
                            const std::vector<std::string>& proof,
                            const std::string& root);

    std::size_t size() const { return leaves_.size(); }
    bool empty() const { return leaves_.empty(); }
    void clear() { leaves_.clear(); }

private:
    std::vector<std::string> leaves_;
};

} // namespace hb
