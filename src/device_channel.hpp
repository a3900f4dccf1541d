#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include "byte_sink.hpp"
#include "frame_buffer.hpp"
#include "status.hpp"

namespace unicorn {

// Frames a FrameBuffer for the HAT and pushes it through the owned sink.
// Not internally synchronized: one transmit at a time per channel.
class DeviceChannel {
public:
    static constexpr uint8_t kStartOfFrame = 0x72;
    static constexpr size_t kFrameSize = 1 + FrameBuffer::kSerializedSize; // 769

    // A null sink is allowed and reports DeviceNotPresent on every call
    explicit DeviceChannel(std::unique_ptr<ByteSink> sink) : sink_(std::move(sink)) {}

    DeviceChannel(const DeviceChannel&) = delete;
    DeviceChannel& operator=(const DeviceChannel&) = delete;
    DeviceChannel(DeviceChannel&&) = default;
    DeviceChannel& operator=(DeviceChannel&&) = default;

    Status open();
    // One synchronous write of the full 769-byte frame. No retry, no partial frames.
    Status transmit(const FrameBuffer& buffer);

    bool has_sink() const { return sink_ != nullptr; }

private:
    std::unique_ptr<ByteSink> sink_;
    uint8_t frame_[kFrameSize]{};
};

} // namespace unicorn
