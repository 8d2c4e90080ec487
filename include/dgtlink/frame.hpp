#pragma once

/**
 * @page dgt-frame dgtlink Frame Codec
 * @file frame.hpp
 * @brief Bit-framed message boundaries for the board's serial stream.
 *
 * @details
 * OVERVIEW
 * --------
 * The board never escapes anything. Instead it marks the first byte of every
 * message with the high bit and keeps the high bit clear in the two length
 * bytes that follow. Payload bytes after the header are copied verbatim and
 * may carry any value.
 *
 * WIRE LAYOUT
 * -----------
 * @code
 *   [type   : 1ttttttt]   low 7 bits = message type code
 *   [len_hi : 0hhhhhhh]   high 7 bits of a 14-bit total length
 *   [len_lo : 0lllllll]   low 7 bits
 *   [payload: total - 3 bytes, verbatim]
 * @endcode
 * The total length counts the three header bytes, so an empty payload is
 * announced as 3.
 *
 * RESYNCHRONIZATION
 * -----------------
 * - While hunting for a header, bytes without the high bit are discarded.
 * - A high-bit byte where a length byte belongs abandons the current header
 *   and is taken as the type byte of a new one.
 * - A decoded total below 3 is a hard LengthError: there is no way to know
 *   how many bytes to skip, so the caller decides what to do next.
 *
 * DESIGN NOTES
 * ------------
 * - State lives in a decoder instance so bytes can be fed one at a time from
 *   a blocking read, a poll loop or a test vector.
 * - The decoder consumes nothing past the last payload byte: when feed()
 *   reports Complete, the next byte belongs to the next frame.
 *
 * EXAMPLE
 * -------
 * @code
 *   dgtlink::frame_decoder dec;
 *   dgtlink::Frame f;
 *   for (uint8_t b : incoming) {
 *       if (dec.feed(b, f) == dgtlink::FeedResult::Complete) handle(f);
 *   }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace dgtlink {

/// Header bytes counted in the announced total length.
static constexpr std::size_t FRAME_HEADER_LEN = 3;

/// Largest total length two 7-bit fields can announce.
static constexpr std::size_t FRAME_MAX_TOTAL = (0x7F << 7) | 0x7F;

/// One message recovered from the stream.
struct Frame {
    uint8_t              type{0};   ///< low 7 bits of the type byte
    std::vector<uint8_t> payload;   ///< total - 3 bytes, verbatim
};

enum class FeedResult : uint8_t {
    NeedMore,     ///< byte consumed, no frame yet
    Complete,     ///< a frame was written to the output argument
    LengthError   ///< header announced total < 3; decoder is reset
};

/**
 * @brief Stateful header/payload decoder fed one byte at a time.
 *
 * Counters are cumulative for the lifetime of the decoder and are meant for
 * diagnostics only.
 */
struct frame_decoder {
    enum class State : uint8_t { Hunt, LenHi, LenLo, Body };

    State                state = State::Hunt;
    uint8_t              type = 0;
    std::size_t          hi = 0;
    std::size_t          remaining = 0;
    std::vector<uint8_t> buf;

    std::size_t discarded = 0;   ///< bytes dropped while hunting
    std::size_t restarts  = 0;   ///< headers abandoned on a high-bit length byte

    /// Drop any partial frame and hunt for the next type byte.
    void reset() {
        state = State::Hunt;
        type = 0;
        hi = 0;
        remaining = 0;
        buf.clear();
    }

    /// True when no partial frame is held.
    bool idle() const { return state == State::Hunt; }

    /**
     * @brief Feed one byte from the stream.
     * @param b      Next raw byte.
     * @param frame  Receives the frame when the result is Complete.
     */
    FeedResult feed(uint8_t b, Frame& frame) {
        switch (state) {
            case State::Hunt:
                if (!(b & 0x80)) { ++discarded; return FeedResult::NeedMore; }
                begin(b);
                return FeedResult::NeedMore;

            case State::LenHi:
                if (b & 0x80) { ++restarts; begin(b); return FeedResult::NeedMore; }
                hi = b;
                state = State::LenLo;
                return FeedResult::NeedMore;

            case State::LenLo: {
                if (b & 0x80) { ++restarts; begin(b); return FeedResult::NeedMore; }
                const std::size_t total = (hi << 7) | b;
                if (total < FRAME_HEADER_LEN) {
                    reset();
                    return FeedResult::LengthError;
                }
                remaining = total - FRAME_HEADER_LEN;
                buf.clear();
                buf.reserve(remaining);
                if (remaining == 0) return finish(frame);
                state = State::Body;
                return FeedResult::NeedMore;
            }

            case State::Body:
                buf.push_back(b);              // verbatim, high bit allowed
                if (--remaining == 0) return finish(frame);
                return FeedResult::NeedMore;
        }
        return FeedResult::NeedMore;
    }

private:
    void begin(uint8_t type_byte) {
        type = static_cast<uint8_t>(type_byte & 0x7F);
        hi = 0;
        remaining = 0;
        buf.clear();
        state = State::LenHi;
    }

    FeedResult finish(Frame& frame) {
        frame.type = type;
        frame.payload.swap(buf);
        buf.clear();
        state = State::Hunt;
        return FeedResult::Complete;
    }
};

/**
 * @brief Build the wire bytes for one frame.
 *
 * @param type     Message type code; only the low 7 bits are used.
 * @param payload  Body bytes, copied verbatim.
 * @return The encoded frame, or an empty vector when header + payload would
 *         exceed FRAME_MAX_TOTAL.
 */
inline std::vector<uint8_t> encode_frame(uint8_t type, const std::vector<uint8_t>& payload) {
    const std::size_t total = payload.size() + FRAME_HEADER_LEN;
    if (total > FRAME_MAX_TOTAL) return {};

    std::vector<uint8_t> out;
    out.reserve(total);
    out.push_back(static_cast<uint8_t>(0x80 | (type & 0x7F)));
    out.push_back(static_cast<uint8_t>((total >> 7) & 0x7F));
    out.push_back(static_cast<uint8_t>(total & 0x7F));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

} // namespace dgtlink
