// 16x16 pixel store with rotation applied on the way out to the wire
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include "pixel.hpp"
#include "status.hpp"

namespace unicorn {

enum class Rotation : uint16_t { Deg0 = 0, Deg90 = 90, Deg180 = 180, Deg270 = 270 };

struct Point {
    uint8_t x{0}, y{0};
};

constexpr bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
constexpr bool operator!=(const Point& a, const Point& b) { return !(a == b); }

// Logical -> physical coordinate for the given rotation:
//   0:   (x, y) -> (x, y)
//   90:  (x, y) -> (15 - y, x)
//   180: (x, y) -> (15 - x, 15 - y)
//   270: (x, y) -> (y, 15 - x)
Point rotate(Point p, Rotation rotation);
// Physical -> logical; rotate(inverse_rotate(p, r), r) == p
Point inverse_rotate(Point p, Rotation rotation);

// Physical scan order of the HAT: row-major, origin at the top-left, so (0, 0)
// is the first pixel after the start-of-frame byte and (15, 0) the sixteenth.
// Getting this wrong mirrors or transposes the picture without any error.
size_t scan_index(Point p);

// Maps 0/90/180/270 onto Rotation. Returns false for anything else.
bool rotation_from_degrees(int degrees, Rotation& out);

class SerializedView;

class FrameBuffer {
public:
    static constexpr int kWidth = 16;
    static constexpr int kHeight = 16;
    static constexpr size_t kPixelCount = kWidth * kHeight;
    static constexpr size_t kBytesPerPixel = 3;
    static constexpr size_t kSerializedSize = kPixelCount * kBytesPerPixel; // 768

    // (0, 0) is the top-left of the display, x grows to the right and y down.
    // Out-of-range coordinates fail with IndexOutOfBounds and change nothing.
    Status set_pixel(int x, int y, const Pixel& pixel);
    Status get_pixel(int x, int y, Pixel& out) const;

    // Only 0, 90, 180 and 270 are accepted. Stored pixels are not moved; the
    // new rotation takes effect on the next serialization.
    Status set_rotation(int degrees);
    Rotation rotation() const { return rotation_; }

    // Buffer only; the panel changes on the next display()
    void clear() { fill(kBlack); }
    void fill(const Pixel& pixel);

    // Byte i of the 768-byte stream in physical scan order, R, G, B per pixel
    uint8_t serialized_byte(size_t i) const;
    SerializedView serialized() const;

private:
    static bool in_bounds(int x, int y) { return x >= 0 && x < kWidth && y >= 0 && y < kHeight; }

    // Indexed by logical coordinate, row-major
    Pixel cells_[kPixelCount]{};
    Rotation rotation_ = Rotation::Deg0;
};

// Lazy, restartable view over the serialized bytes of a FrameBuffer. Each pass
// recomputes the bytes from the current buffer contents and rotation.
class SerializedView {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = uint8_t;
        using difference_type = std::ptrdiff_t;
        using pointer = const uint8_t*;
        using reference = uint8_t;

        iterator() = default;
        iterator(const FrameBuffer* buffer, size_t pos) : buffer_(buffer), pos_(pos) {}

        uint8_t operator*() const { return buffer_->serialized_byte(pos_); }
        iterator& operator++() { ++pos_; return *this; }
        iterator operator++(int) { iterator tmp = *this; ++pos_; return tmp; }
        bool operator==(const iterator& o) const { return buffer_ == o.buffer_ && pos_ == o.pos_; }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        const FrameBuffer* buffer_ = nullptr;
        size_t pos_ = 0;
    };

    explicit SerializedView(const FrameBuffer& buffer) : buffer_(buffer) {}

    iterator begin() const { return iterator(&buffer_, 0); }
    iterator end() const { return iterator(&buffer_, FrameBuffer::kSerializedSize); }
    size_t size() const { return FrameBuffer::kSerializedSize; }

private:
    const FrameBuffer& buffer_;
};

} // namespace unicorn
