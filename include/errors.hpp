#pragma once

#include <stdexcept>
#include <string>

namespace hb {

enum class ErrorKind {
    InvalidBet,
    InvalidParameters,
    StaleBoard,
    RaceViolation
};

const char* toString(ErrorKind kind);

// Rejection at the request boundary. Nothing has been mutated when one of
// these escapes a BetDesk call.
class GameError : public std::runtime_error {
public:
    GameError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// The OS entropy source failed. Continuing would mean reusing a seed or
// issuing draws nobody can verify, so callers treat this as fatal.
class EntropyFailure : public std::runtime_error {
public:
    explicit EntropyFailure(const std::string& message) : std::runtime_error(message) {}
};

} // namespace hb
