#pragma once

#include <cstddef>
#include <cstdint>
#include "status.hpp"

namespace unicorn {

// Abstract transport for framed bytes (real SPI bus or a no-op stand-in)
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual Status open() = 0;
    // One complete, synchronous write. Anything short of len bytes is an error.
    virtual Status write(const uint8_t* data, size_t len) = 0;
};

} // namespace unicorn
