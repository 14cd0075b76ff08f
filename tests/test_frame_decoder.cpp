#include <doctest/doctest.h>
#include "dgtlink/frame_decoder.hpp"
#include "support/fake_device.hpp"

#include <vector>

using namespace dgtlink;
using dgtlink::testing::frame;

static std::vector<uint8_t> sample_payload() {
    std::vector<uint8_t> p(64);
    for (size_t i = 0; i < p.size(); ++i) p[i] = static_cast<uint8_t>(i % 13);
    return p;
}

TEST_CASE("Whole frame in one chunk decodes to one frame") {
    FrameDecoder d;
    std::vector<Frame> out;
    const auto bytes = frame(0x86, sample_payload());
    CHECK(bytes[1] == 0x00);
    CHECK(bytes[2] == 67);

    REQUIRE(d.feed(bytes.data(), bytes.size(), out) == FrameDecoder::Result::Ok);
    REQUIRE(out.size() == 1);
    CHECK(out[0].id == 0x86);
    CHECK(out[0].payload == sample_payload());
    CHECK_FALSE(d.partial());
}

TEST_CASE("Any split of a frame yields exactly one identical frame") {
    const auto bytes = frame(0x86, sample_payload());

    for (size_t cut1 = 0; cut1 <= bytes.size(); cut1 += 7) {
        for (size_t cut2 = cut1; cut2 <= bytes.size(); cut2 += 11) {
            CAPTURE(cut1);
            CAPTURE(cut2);
            FrameDecoder d;
            std::vector<Frame> out;
            d.feed(bytes.data(), cut1, out);
            d.feed(bytes.data() + cut1, cut2 - cut1, out);
            d.feed(bytes.data() + cut2, bytes.size() - cut2, out);
            REQUIRE(out.size() == 1);
            CHECK(out[0].payload == sample_payload());
        }
    }
}

TEST_CASE("Byte-at-a-time feeding emits only when the frame is complete") {
    const auto bytes = frame(0x8D, {0x0A, 0x10, 0x08, 0x0A, 0x12, 0x00, 0x00});
    FrameDecoder d;
    std::vector<Frame> out;

    for (size_t i = 0; i < bytes.size(); ++i) {
        CHECK(out.empty());
        if (i < 3) CHECK(d.wanted() == 3 - i);
        d.feed(&bytes[i], 1, out);
    }
    REQUIRE(out.size() == 1);
    CHECK(out[0].id == 0x8D);
    CHECK(out[0].payload.size() == 7);
}

TEST_CASE("wanted() never reaches past the current frame") {
    FrameDecoder d;
    std::vector<Frame> out;
    const auto bytes = frame(0x93, {0x01, 0x02});
    d.feed(bytes.data(), 2, out);
    CHECK(d.wanted() == 1);
    d.feed(bytes.data() + 2, 1, out);
    CHECK(d.partial());
    CHECK(d.wanted() == 2);
}

TEST_CASE("Several frames back to back in one chunk") {
    auto bytes = frame(0x93, {0x01, 0x02});
    const auto second = frame(0x8E, {0x1C, 0x01});
    const auto empty = frame(0x92, {});
    bytes.insert(bytes.end(), second.begin(), second.end());
    bytes.insert(bytes.end(), empty.begin(), empty.end());

    FrameDecoder d;
    std::vector<Frame> out;
    REQUIRE(d.feed(bytes.data(), bytes.size(), out) == FrameDecoder::Result::Ok);
    REQUIRE(out.size() == 3);
    CHECK(out[0].id == 0x93);
    CHECK(out[1].id == 0x8E);
    CHECK(out[1].payload == std::vector<uint8_t>{0x1C, 0x01});
    CHECK(out[2].id == 0x92);
    CHECK(out[2].payload.empty());
}

TEST_CASE("Length is seven bits high, seven bits low") {
    std::vector<uint8_t> big(200, 0x00);
    const auto bytes = frame(0x86, big);
    CHECK(bytes[1] == 1);          // 203 = 1*128 + 75
    CHECK(bytes[2] == 75);

    FrameDecoder d;
    std::vector<Frame> out;
    d.feed(bytes.data(), bytes.size(), out);
    REQUIRE(out.size() == 1);
    CHECK(out[0].payload.size() == 200);
}

TEST_CASE("Declared length below the header size is an error") {
    FrameDecoder d;
    std::vector<Frame> out;
    const uint8_t bad[] = {0x86, 0x00, 0x02, 0x55};
    CHECK(d.feed(bad, sizeof(bad), out) == FrameDecoder::Result::BadLength);
    CHECK(d.last_bad_length() == 2);
    CHECK(out.empty());
    CHECK_FALSE(d.partial());
}

TEST_CASE("reset() drops a partial frame") {
    FrameDecoder d;
    std::vector<Frame> out;
    const auto bytes = frame(0x86, sample_payload());
    d.feed(bytes.data(), 20, out);
    CHECK(d.partial());
    d.reset();
    CHECK_FALSE(d.partial());
    CHECK(d.wanted() == 3);

    const auto next = frame(0x93, {0x01, 0x02});
    d.feed(next.data(), next.size(), out);
    REQUIRE(out.size() == 1);
    CHECK(out[0].id == 0x93);
}
