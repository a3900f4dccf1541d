#include "ansi_preview.hpp"

#include <cstdio>

namespace unicorn {

std::string ansi_preview(const FrameBuffer& buffer) {
    std::string out = "Unicorn HAT HD:\n";
    out.reserve(out.size() + FrameBuffer::kPixelCount * 24 + FrameBuffer::kHeight * 8);
    char cell[32];
    for (int y = 0; y < FrameBuffer::kHeight; ++y) {
        for (int x = 0; x < FrameBuffer::kWidth; ++x) {
            Pixel px;
            if (!buffer.get_pixel(x, y, px)) continue;
            std::snprintf(cell, sizeof(cell), "\x1b[38;2;%u;%u;%um*",
                          unsigned(px.r), unsigned(px.g), unsigned(px.b));
            out += cell;
        }
        out += "\x1b[0m\n";
    }
    return out;
}

} // namespace unicorn
