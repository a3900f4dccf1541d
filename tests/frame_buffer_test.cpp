#include <gtest/gtest.h>

#include <set>
#include <vector>
#include "frame_buffer.hpp"
#include "recording_sink.hpp"

namespace unicorn {
namespace {

std::vector<uint8_t> bytes_of(const FrameBuffer& fb) {
    SerializedView view = fb.serialized();
    return std::vector<uint8_t>(view.begin(), view.end());
}

const Rotation kAllRotations[] = {Rotation::Deg0, Rotation::Deg90, Rotation::Deg180, Rotation::Deg270};

TEST(FrameBuffer, StartsBlackAtZeroRotation) {
    FrameBuffer fb;
    EXPECT_EQ(fb.rotation(), Rotation::Deg0);
    for (int y = 0; y < FrameBuffer::kHeight; ++y) {
        for (int x = 0; x < FrameBuffer::kWidth; ++x) {
            Pixel px{1, 2, 3};
            ASSERT_TRUE(fb.get_pixel(x, y, px));
            EXPECT_EQ(px, kBlack) << "at " << x << "," << y;
        }
    }
}

TEST(FrameBuffer, OutOfRangeCoordinatesFailAndChangeNothing) {
    FrameBuffer fb;
    ASSERT_TRUE(fb.set_pixel(3, 4, Pixel{9, 8, 7}));
    std::vector<uint8_t> before = bytes_of(fb);

    const int bad[][2] = {{-1, 0}, {0, -1}, {16, 0}, {0, 16}, {16, 16}, {-1, -1}, {100, 5}, {5, 1000}};
    for (const auto& c : bad) {
        Status st = fb.set_pixel(c[0], c[1], Pixel{255, 255, 255});
        EXPECT_EQ(st.code(), ErrorCode::IndexOutOfBounds) << c[0] << "," << c[1];

        Pixel out{42, 42, 42};
        st = fb.get_pixel(c[0], c[1], out);
        EXPECT_EQ(st.code(), ErrorCode::IndexOutOfBounds);
        EXPECT_EQ(out, (Pixel{42, 42, 42})) << "output must be left alone on failure";
    }
    EXPECT_EQ(bytes_of(fb), before);
}

TEST(FrameBuffer, SetThenGetTouchesOnlyThatCell) {
    FrameBuffer fb;
    const Pixel colour{12, 200, 77};
    ASSERT_TRUE(fb.set_pixel(7, 11, colour));

    for (int y = 0; y < FrameBuffer::kHeight; ++y) {
        for (int x = 0; x < FrameBuffer::kWidth; ++x) {
            Pixel px;
            ASSERT_TRUE(fb.get_pixel(x, y, px));
            EXPECT_EQ(px, (x == 7 && y == 11) ? colour : kBlack);
        }
    }
}

TEST(FrameBuffer, RoundTripHoldsUnderEveryRotation) {
    for (int deg : {0, 90, 180, 270}) {
        FrameBuffer fb;
        ASSERT_TRUE(fb.set_rotation(deg));
        ASSERT_TRUE(fb.set_pixel(15, 0, Pixel{1, 2, 3}));
        Pixel px;
        ASSERT_TRUE(fb.get_pixel(15, 0, px));
        EXPECT_EQ(px, (Pixel{1, 2, 3})) << deg;
    }
}

TEST(FrameBuffer, RejectsUnsupportedRotation) {
    FrameBuffer fb;
    ASSERT_TRUE(fb.set_rotation(180));
    for (int deg : {-90, 1, 45, 89, 91, 360, 450}) {
        EXPECT_EQ(fb.set_rotation(deg).code(), ErrorCode::InvalidRotation) << deg;
        EXPECT_EQ(fb.rotation(), Rotation::Deg180);
    }
}

TEST(Rotation, MatchesDocumentedTransforms) {
    const Point p{2, 5};
    EXPECT_EQ(rotate(p, Rotation::Deg0), (Point{2, 5}));
    EXPECT_EQ(rotate(p, Rotation::Deg90), (Point{10, 2}));
    EXPECT_EQ(rotate(p, Rotation::Deg180), (Point{13, 10}));
    EXPECT_EQ(rotate(p, Rotation::Deg270), (Point{5, 13}));
}

TEST(Rotation, EveryAngleIsABijection) {
    for (Rotation r : kAllRotations) {
        std::set<size_t> seen;
        for (uint8_t y = 0; y < 16; ++y) {
            for (uint8_t x = 0; x < 16; ++x) {
                Point phys = rotate(Point{x, y}, r);
                ASSERT_LT(phys.x, 16);
                ASSERT_LT(phys.y, 16);
                seen.insert(scan_index(phys));
                EXPECT_EQ(inverse_rotate(phys, r), (Point{x, y}));
            }
        }
        EXPECT_EQ(seen.size(), FrameBuffer::kPixelCount);
    }
}

TEST(Rotation, FourQuarterTurnsAreIdentity) {
    for (uint8_t y = 0; y < 16; ++y) {
        for (uint8_t x = 0; x < 16; ++x) {
            Point p{x, y};
            Point q = p;
            for (int i = 0; i < 4; ++i) q = rotate(q, Rotation::Deg90);
            EXPECT_EQ(q, p);
            EXPECT_EQ(rotate(rotate(p, Rotation::Deg90), Rotation::Deg90), rotate(p, Rotation::Deg180));
            EXPECT_EQ(rotate(rotate(p, Rotation::Deg180), Rotation::Deg90), rotate(p, Rotation::Deg270));
        }
    }
}

TEST(Rotation, ScanOrderIsRowMajorFromTopLeft) {
    EXPECT_EQ(scan_index(Point{0, 0}), 0u);
    EXPECT_EQ(scan_index(Point{15, 0}), 15u);
    EXPECT_EQ(scan_index(Point{0, 1}), 16u);
    EXPECT_EQ(scan_index(Point{15, 15}), 255u);
}

TEST(FrameBuffer, SerializesTo768BytesForEveryRotation) {
    FrameBuffer fb;
    fb.fill(Pixel{255, 128, 1});
    for (int deg : {0, 90, 180, 270}) {
        ASSERT_TRUE(fb.set_rotation(deg));
        EXPECT_EQ(fb.serialized().size(), 768u);
        EXPECT_EQ(bytes_of(fb).size(), 768u);
    }
}

TEST(FrameBuffer, SerializedViewIsRestartable) {
    FrameBuffer fb;
    ASSERT_TRUE(fb.set_pixel(4, 4, Pixel{10, 20, 30}));
    SerializedView view = fb.serialized();
    std::vector<uint8_t> first(view.begin(), view.end());
    std::vector<uint8_t> second(view.begin(), view.end());
    EXPECT_EQ(first, second);
}

TEST(FrameBuffer, PlacesPixelAtScanIndexWithoutRotation) {
    FrameBuffer fb;
    ASSERT_TRUE(fb.set_pixel(3, 2, Pixel{1, 2, 3}));
    std::vector<uint8_t> bytes = bytes_of(fb);
    const size_t at = (2 * 16 + 3) * 3;
    EXPECT_EQ(bytes[at], 1);
    EXPECT_EQ(bytes[at + 1], 2);
    EXPECT_EQ(bytes[at + 2], 3);
}

TEST(FrameBuffer, RotationAppliesAtSerializationTime) {
    FrameBuffer fb;
    ASSERT_TRUE(fb.set_pixel(0, 0, Pixel{255, 0, 0}));

    // Rotation changed after the write still moves the pixel on the wire
    ASSERT_TRUE(fb.set_rotation(90));
    std::vector<uint8_t> bytes = bytes_of(fb);
    // 90: (0, 0) -> (15, 0)
    EXPECT_EQ(bytes[15 * 3], 255);
    EXPECT_EQ(bytes[0], 0);

    ASSERT_TRUE(fb.set_rotation(180));
    bytes = bytes_of(fb);
    EXPECT_EQ(bytes[255 * 3], 255);

    ASSERT_TRUE(fb.set_rotation(270));
    bytes = bytes_of(fb);
    // 270: (0, 0) -> (0, 15)
    EXPECT_EQ(bytes[(15 * 16) * 3], 255);

    ASSERT_TRUE(fb.set_rotation(0));
    bytes = bytes_of(fb);
    EXPECT_EQ(bytes[0], 255);
}

TEST(FrameBuffer, RotatedStreamCarriesEveryPixelOnce) {
    FrameBuffer fb;
    for (int y = 0; y < 16; ++y)
        for (int x = 0; x < 16; ++x)
            ASSERT_TRUE(fb.set_pixel(x, y, Pixel{static_cast<uint8_t>(x), static_cast<uint8_t>(y), 0}));

    for (Rotation r : kAllRotations) {
        ASSERT_TRUE(fb.set_rotation(static_cast<int>(r)));
        std::vector<uint8_t> bytes = bytes_of(fb);
        for (uint8_t y = 0; y < 16; ++y) {
            for (uint8_t x = 0; x < 16; ++x) {
                size_t at = scan_index(rotate(Point{x, y}, r)) * 3;
                EXPECT_EQ(bytes[at], x);
                EXPECT_EQ(bytes[at + 1], y);
            }
        }
    }
}

TEST(FrameBuffer, ClearResetsPixelsButKeepsRotation) {
    FrameBuffer fb;
    fb.fill(Pixel{5, 5, 5});
    ASSERT_TRUE(fb.set_rotation(270));
    fb.clear();
    EXPECT_EQ(fb.rotation(), Rotation::Deg270);
    for (uint8_t b : bytes_of(fb)) EXPECT_EQ(b, 0);
}

TEST(FrameBuffer, FillSetsEveryCell) {
    FrameBuffer fb;
    fb.fill(Pixel{7, 8, 9});
    std::vector<uint8_t> bytes = bytes_of(fb);
    for (size_t i = 0; i < bytes.size(); i += 3) {
        EXPECT_EQ(bytes[i], 7);
        EXPECT_EQ(bytes[i + 1], 8);
        EXPECT_EQ(bytes[i + 2], 9);
    }
}

} // namespace
} // namespace unicorn
