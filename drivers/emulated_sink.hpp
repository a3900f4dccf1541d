#pragma once

#include <cstddef>
#include <cstdint>
#include "byte_sink.hpp"

namespace unicorn {

// Stand-in for the HAT on machines without one. Accepts every frame, touches nothing.
class EmulatedSink : public ByteSink {
public:
    Status open() override { return Status::ok(); }
    Status write(const uint8_t* /*data*/, size_t /*len*/) override { return Status::ok(); }
};

} // namespace unicorn
