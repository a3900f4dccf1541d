#include "frame_buffer.hpp"

#include <algorithm>

namespace unicorn {

namespace {
    constexpr uint8_t kMax = FrameBuffer::kWidth - 1; // 15

    Rotation opposite(Rotation rotation) {
        switch (rotation) {
            case Rotation::Deg90:  return Rotation::Deg270;
            case Rotation::Deg270: return Rotation::Deg90;
            default:               return rotation; // 0 and 180 are their own inverse
        }
    }
}

Point rotate(Point p, Rotation rotation) {
    switch (rotation) {
        case Rotation::Deg90:  return Point{static_cast<uint8_t>(kMax - p.y), p.x};
        case Rotation::Deg180: return Point{static_cast<uint8_t>(kMax - p.x), static_cast<uint8_t>(kMax - p.y)};
        case Rotation::Deg270: return Point{p.y, static_cast<uint8_t>(kMax - p.x)};
        case Rotation::Deg0:
        default:               return p;
    }
}

Point inverse_rotate(Point p, Rotation rotation) {
    return rotate(p, opposite(rotation));
}

size_t scan_index(Point p) {
    return static_cast<size_t>(p.y) * FrameBuffer::kWidth + p.x;
}

bool rotation_from_degrees(int degrees, Rotation& out) {
    switch (degrees) {
        case 0:   out = Rotation::Deg0;   return true;
        case 90:  out = Rotation::Deg90;  return true;
        case 180: out = Rotation::Deg180; return true;
        case 270: out = Rotation::Deg270; return true;
        default:  return false;
    }
}

Status FrameBuffer::set_pixel(int x, int y, const Pixel& pixel) {
    if (!in_bounds(x, y)) return Status::index_out_of_bounds();
    cells_[scan_index(Point{static_cast<uint8_t>(x), static_cast<uint8_t>(y)})] = pixel;
    return Status::ok();
}

Status FrameBuffer::get_pixel(int x, int y, Pixel& out) const {
    if (!in_bounds(x, y)) return Status::index_out_of_bounds();
    out = cells_[scan_index(Point{static_cast<uint8_t>(x), static_cast<uint8_t>(y)})];
    return Status::ok();
}

Status FrameBuffer::set_rotation(int degrees) {
    Rotation r;
    if (!rotation_from_degrees(degrees, r)) return Status::invalid_rotation();
    rotation_ = r;
    return Status::ok();
}

void FrameBuffer::fill(const Pixel& pixel) {
    std::fill(std::begin(cells_), std::end(cells_), pixel);
}

uint8_t FrameBuffer::serialized_byte(size_t i) const {
    // Walk the wire in physical order and pull each pixel from the logical
    // cell that the current rotation lands on it.
    size_t wire_pixel = i / kBytesPerPixel;
    Point physical{static_cast<uint8_t>(wire_pixel % kWidth), static_cast<uint8_t>(wire_pixel / kWidth)};
    const Pixel& px = cells_[scan_index(inverse_rotate(physical, rotation_))];
    switch (i % kBytesPerPixel) {
        case 0:  return px.r;
        case 1:  return px.g;
        default: return px.b;
    }
}

SerializedView FrameBuffer::serialized() const {
    return SerializedView(*this);
}

} // namespace unicorn
