#pragma once
/**
 * @file frame_reader.hpp
 * @brief Pull whole frames out of a blocking ByteLink.
 *
 * @details
 * FrameReader is the pull-side companion of frame_decoder (frame.hpp): it
 * asks the link for one byte at a time and stops the moment a frame is
 * complete, so nothing belonging to the next frame is consumed.
 *
 * Failure handling:
 * - A link timeout or error ends the call with IoFailure. Nothing is retried
 *   here; the transport's timeout is the only clock in play.
 * - A header announcing fewer than three bytes ends the call with
 *   FrameLengthError. The decoder is reset; the next read() resumes hunting.
 * - Misaligned header bytes are not errors: the decoder skips them.
 *
 * @code
 *   dgtlink::FrameReader reader(link);
 *   dgtlink::Frame f;
 *   while (reader.read(f) == dgtlink::ReadStatus::Ok) {
 *       // decode_response(f.type, f.payload, err) ...
 *   }
 * @endcode
 */

#include <cstddef>
#include <cstdint>

#include "dgtlink/frame.hpp"
#include "dgtlink/transport/transport_base.hpp"

namespace dgtlink {

enum class ReadStatus : uint8_t {
    Ok,                ///< one frame written to the output argument
    IoFailure,         ///< the link reported timeout or error
    FrameLengthError   ///< header announced total length < 3
};

const char* read_status_name(ReadStatus s);

class FrameReader {
public:
    explicit FrameReader(transport::ByteLink& link) : link_(link) {}

    /**
     * @brief Block until one frame is read or the read fails.
     *
     * A partial frame interrupted by IoFailure is dropped; the next call
     * starts hunting for a fresh header.
     */
    ReadStatus read(Frame& out);

    /// Link status behind the most recent IoFailure.
    transport::RxResult last_rx() const { return last_rx_; }

    std::size_t frames_read()     const { return frames_; }
    std::size_t bytes_discarded() const { return dec_.discarded; }
    std::size_t header_restarts() const { return dec_.restarts; }
    std::size_t length_errors()   const { return length_errors_; }

    /// Forget any partial frame.
    void reset() { dec_.reset(); }

private:
    transport::ByteLink& link_;
    frame_decoder        dec_;
    transport::RxResult  last_rx_{transport::RxResult::Ok};
    std::size_t          frames_{0};
    std::size_t          length_errors_{0};
};

} // namespace dgtlink
