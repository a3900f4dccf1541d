#pragma once

#include <cstdint>
#include <string>

namespace unicorn {

enum class ErrorCode : uint8_t {
    Ok,
    IndexOutOfBounds,   // coordinate outside [0, 16)
    InvalidRotation,    // angle not one of 0/90/180/270
    TransportError,     // sink failed; see TransportFault
};

// Underlying cause carried by ErrorCode::TransportError
enum class TransportFault : uint8_t {
    None,
    DeviceNotPresent,   // no sink available for the requested transport
    NotOpen,            // write before the sink was opened
    ShortWrite,         // bus accepted fewer bytes than the frame holds
};

// Result of a fallible driver operation. No exceptions are used anywhere in
// the driver; every failure comes back through one of these.
class Status {
public:
    constexpr Status() = default;

    static constexpr Status ok() { return Status{}; }
    static constexpr Status index_out_of_bounds() { return Status{ErrorCode::IndexOutOfBounds, TransportFault::None}; }
    static constexpr Status invalid_rotation() { return Status{ErrorCode::InvalidRotation, TransportFault::None}; }
    static constexpr Status transport(TransportFault fault) { return Status{ErrorCode::TransportError, fault}; }

    constexpr bool is_ok() const { return code_ == ErrorCode::Ok; }
    constexpr explicit operator bool() const { return is_ok(); }
    constexpr ErrorCode code() const { return code_; }
    constexpr TransportFault fault() const { return fault_; }

private:
    constexpr Status(ErrorCode code, TransportFault fault) : code_(code), fault_(fault) {}

    ErrorCode code_{ErrorCode::Ok};
    TransportFault fault_{TransportFault::None};
};

const char* to_string(ErrorCode code);
const char* to_string(TransportFault fault);
std::string to_string(const Status& status);

} // namespace unicorn
