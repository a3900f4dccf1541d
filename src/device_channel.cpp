#include "device_channel.hpp"

#include <algorithm>

namespace unicorn {

Status DeviceChannel::open() {
    if (!sink_) return Status::transport(TransportFault::DeviceNotPresent);
    return sink_->open();
}

Status DeviceChannel::transmit(const FrameBuffer& buffer) {
    if (!sink_) return Status::transport(TransportFault::DeviceNotPresent);

    frame_[0] = kStartOfFrame;
    SerializedView bytes = buffer.serialized();
    std::copy(bytes.begin(), bytes.end(), frame_ + 1);

    return sink_->write(frame_, kFrameSize);
}

} // namespace unicorn
