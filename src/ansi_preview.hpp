#pragma once

#include <string>
#include "frame_buffer.hpp"

namespace unicorn {

// Terminal rendering of the buffer in logical orientation: a header line,
// then 16 rows of '*' painted with 24-bit ANSI colour escapes.
std::string ansi_preview(const FrameBuffer& buffer);

} // namespace unicorn
