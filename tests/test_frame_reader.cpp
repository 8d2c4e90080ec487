#include <doctest/doctest.h>
#include "dgtlink/frame_reader.hpp"
#include "scripted_link.hpp"

#include <string>

using namespace dgtlink;
using dgtlink_test::ScriptedLink;

TEST_CASE("encode_frame writes type with high bit and 7-bit total length") {
    auto f = encode_frame(0x13, {0x01, 0x02});
    REQUIRE(f.size() == 5);
    CHECK(f[0] == 0x93);
    CHECK(f[1] == 0x00);
    CHECK(f[2] == 0x05);
    CHECK(f[3] == 0x01);
    CHECK(f[4] == 0x02);

    // A 64-byte dump has total 67 = 0x43.
    auto d = encode_frame(0x06, std::vector<uint8_t>(64, 0));
    CHECK(d[1] == 0x00);
    CHECK(d[2] == 0x43);

    // Totals above 14 bits cannot be expressed.
    CHECK(encode_frame(0x11, std::vector<uint8_t>(FRAME_MAX_TOTAL, 0)).empty());
}

TEST_CASE("Garbage before a frame is discarded and exactly the frame is consumed") {
    ScriptedLink link;
    link.push({0x00, 0x42, 0x7F});
    link.push_frame(0x13, {0x01, 0x02});
    link.push({0x93});                     // start of a following frame

    FrameReader reader(link);
    Frame f;
    REQUIRE(reader.read(f) == ReadStatus::Ok);
    CHECK(f.type == 0x13);
    REQUIRE(f.payload.size() == 2);
    CHECK(f.payload[0] == 0x01);
    CHECK(f.payload[1] == 0x02);
    CHECK(link.consumed() == 3 + 5);
    CHECK(link.remaining() == 1);
    CHECK(reader.bytes_discarded() == 3);
    CHECK(reader.frames_read() == 1);
}

TEST_CASE("Payload bytes keep their high bit") {
    ScriptedLink link;
    link.push_frame(0x11, {0xC3, 0xA9, 0x80});
    FrameReader reader(link);
    Frame f;
    REQUIRE(reader.read(f) == ReadStatus::Ok);
    REQUIRE(f.payload.size() == 3);
    CHECK(f.payload[0] == 0xC3);
    CHECK(f.payload[2] == 0x80);
}

TEST_CASE("A header-only frame has an empty payload") {
    ScriptedLink link;
    link.push({0x92, 0x00, 0x03});
    FrameReader reader(link);
    Frame f;
    REQUIRE(reader.read(f) == ReadStatus::Ok);
    CHECK(f.type == 0x12);
    CHECK(f.payload.empty());
}

TEST_CASE("Total length below three is a frame length error") {
    ScriptedLink link;
    link.push({0x86, 0x00, 0x02});
    link.push_frame(0x13, {0x04, 0x05});

    FrameReader reader(link);
    Frame f;
    CHECK(reader.read(f) == ReadStatus::FrameLengthError);
    CHECK(reader.length_errors() == 1);

    // The stream stays usable after the error.
    REQUIRE(reader.read(f) == ReadStatus::Ok);
    CHECK(f.type == 0x13);
}

TEST_CASE("A high-bit byte in the length field starts a new header") {
    // 0x86 starts a dump header, then 0x93 arrives where a length belongs.
    ScriptedLink link;
    link.push({0x86, 0x93, 0x00, 0x05, 0x07, 0x08});
    FrameReader reader(link);
    Frame f;
    REQUIRE(reader.read(f) == ReadStatus::Ok);
    CHECK(f.type == 0x13);
    REQUIRE(f.payload.size() == 2);
    CHECK(f.payload[0] == 0x07);
    CHECK(reader.header_restarts() == 1);
}

TEST_CASE("Timeout and link errors surface as IoFailure and drop the partial frame") {
    ScriptedLink link;
    link.push({0x93, 0x00, 0x05, 0x01});   // one payload byte short
    FrameReader reader(link);
    Frame f;
    CHECK(reader.read(f) == ReadStatus::IoFailure);
    CHECK(reader.last_rx() == transport::RxResult::Timeout);

    // The next complete frame is read from its own header, not spliced.
    link.push_frame(0x13, {0x02, 0x03});
    REQUIRE(reader.read(f) == ReadStatus::Ok);
    CHECK(f.payload[0] == 0x02);

    link.fail_reads = true;
    CHECK(reader.read(f) == ReadStatus::IoFailure);
    CHECK(reader.last_rx() == transport::RxResult::Error);
    CHECK(std::string(read_status_name(ReadStatus::IoFailure)) == "io_failure");
}
