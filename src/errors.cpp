#include "errors.hpp"

namespace hb {

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidBet:
        return "InvalidBet";
    case ErrorKind::InvalidParameters:
        return "InvalidParameters";
    case ErrorKind::StaleBoard:
        return "StaleBoard";
    case ErrorKind::RaceViolation:
        return "RaceViolation";
    }
    return "Unknown";
}

GameError::GameError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(toString(kind)) + ": " + message)
    , kind_(kind) {}

} // namespace hb
