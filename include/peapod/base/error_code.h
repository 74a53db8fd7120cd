#ifndef PEAPOD_BASE_ERROR_CODE_H
#define PEAPOD_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace peapod {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    InternalError = 1002,
    InvariantViolation = 1003,

    // Decode errors (2000-2999)
    Incomplete = 2001,
    FrameTooLarge = 2002,
    UnsupportedVersion = 2003,
    Malformed = 2004,

    // Crypto errors (3000-3999)
    InvalidPeerKey = 3001,
    AuthFailed = 3002,
    RngFailure = 3003,

    // Chunk errors (4000-4999)
    IntegrityFailure = 4001,
    UnknownChunk = 4002,
    AlreadyComplete = 4003,

    // Peer errors (5000-5999)
    UnknownPeer = 5001
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

// Thrown only for unrecoverable conditions (RNG failure, broken invariants)
class PeaPodError : public std::exception {
public:
    PeaPodError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace peapod

namespace std {
template <>
struct is_error_code_enum<peapod::ErrorCode> : true_type {};
} // namespace std

#endif // PEAPOD_BASE_ERROR_CODE_H
