#include "status.hpp"

namespace unicorn {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:               return "ok";
        case ErrorCode::IndexOutOfBounds: return "index out of bounds";
        case ErrorCode::InvalidRotation:  return "invalid rotation";
        case ErrorCode::TransportError:   return "transport error";
    }
    return "unknown error";
}

const char* to_string(TransportFault fault) {
    switch (fault) {
        case TransportFault::None:             return "none";
        case TransportFault::DeviceNotPresent: return "device not present";
        case TransportFault::NotOpen:          return "transport not open";
        case TransportFault::ShortWrite:       return "short write";
    }
    return "unknown fault";
}

std::string to_string(const Status& status) {
    std::string s = to_string(status.code());
    if (status.code() == ErrorCode::TransportError) {
        s += " (";
        s += to_string(status.fault());
        s += ")";
    }
    return s;
}

} // namespace unicorn
