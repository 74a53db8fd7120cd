#include "peapod/base/error_code.h"

namespace peapod {

namespace {

class PeaPodCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "PeaPod";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const PeaPodCategory& get_category() {
    static PeaPodCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InvariantViolation: return "Invariant violation";
        case ErrorCode::Incomplete: return "Incomplete frame";
        case ErrorCode::FrameTooLarge: return "Frame too large";
        case ErrorCode::UnsupportedVersion: return "Unsupported protocol version";
        case ErrorCode::Malformed: return "Malformed message";
        case ErrorCode::InvalidPeerKey: return "Invalid peer key";
        case ErrorCode::AuthFailed: return "Authentication failed";
        case ErrorCode::RngFailure: return "Random number generator failure";
        case ErrorCode::IntegrityFailure: return "Chunk integrity check failed";
        case ErrorCode::UnknownChunk: return "Unknown chunk";
        case ErrorCode::AlreadyComplete: return "Transfer already complete";
        case ErrorCode::UnknownPeer: return "Unknown peer";
        default: return "Unknown error";
    }
}

PeaPodError::PeaPodError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* PeaPodError::what() const noexcept {
    return message_.c_str();
}

} // namespace peapod
