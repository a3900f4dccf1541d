#pragma once

#include <memory>
#include "byte_sink.hpp"
#include "device_channel.hpp"
#include "driver_config.hpp"
#include "frame_buffer.hpp"
#include "pixel.hpp"
#include "status.hpp"

namespace unicorn {

// High-level access to a Pimoroni Unicorn HAT HD (16x16 RGB).
//
// Pixels are staged in memory and only reach the panel on display(). The
// handle owns its buffer and its transport exclusively and does no locking;
// callers that share it across threads must serialize access themselves.
class UnicornHatHd {
public:
    // Sink chosen by config.mode. Requesting TransportMode::Real in a build
    // without hardware support leaves the driver without a sink; init() and
    // display() then report DeviceNotPresent.
    explicit UnicornHatHd(const DriverConfig& config = DriverConfig{});
    // Custom transport (tests, other buses)
    explicit UnicornHatHd(std::unique_ptr<ByteSink> sink);

    UnicornHatHd(const UnicornHatHd&) = delete;
    UnicornHatHd& operator=(const UnicornHatHd&) = delete;
    UnicornHatHd(UnicornHatHd&&) = default;
    UnicornHatHd& operator=(UnicornHatHd&&) = default;

    // Brings the transport up. Call once before the first display().
    Status init() { return channel_.open(); }

    Status set_pixel(int x, int y, const Pixel& pixel) { return buffer_.set_pixel(x, y, pixel); }
    // The buffered value, not what the panel currently shows
    Status get_pixel(int x, int y, Pixel& out) const { return buffer_.get_pixel(x, y, out); }
    Status set_rotation(int degrees) { return buffer_.set_rotation(degrees); }
    Rotation rotation() const { return buffer_.rotation(); }
    void clear() { buffer_.clear(); }
    void fill(const Pixel& pixel) { buffer_.fill(pixel); }

    // Sends the whole buffer as one frame. Leaves the buffer untouched.
    Status display() { return channel_.transmit(buffer_); }

    const FrameBuffer& buffer() const { return buffer_; }

private:
    FrameBuffer buffer_;
    DeviceChannel channel_;
};

} // namespace unicorn
