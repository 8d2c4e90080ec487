#pragma once
/**
 * @file session.hpp
 * @brief One conversation with one board: send commands, poll responses,
 *        keep the tracked board current.
 *
 * @details
 * PURPOSE
 * -------
 * Session is the outer loop around the core pieces. It owns, per link:
 *   - a FrameReader (bytes -> frames),
 *   - the BoardTracker, once a board dump has been seen,
 *   - the UpdateBatch of field updates not yet recognized as a move.
 * There is no global state; two sessions on two links never interact.
 *
 * RECEIVE LOOP
 * ------------
 * poll() reads exactly one frame and decodes it. Every inbound frame is
 * handled the same way, whether a request asked for it or the board sent it
 * on its own in update mode:
 *   - BoardDump   -> the tracker is (re)seeded, the batch restarts.
 *   - FieldUpdate -> applied to the tracker and appended to the batch; when
 *                    the batch names a move, last_move() reports it and the
 *                    batch restarts from the new board. A FieldUpdate that
 *                    arrives before any dump is returned but not applied.
 *   - anything else is returned untouched.
 * A frame that fails to decode never reaches the tracker. The caller decides
 * whether to log it and poll again; only IoFailure means the link is gone.
 *
 * START SEQUENCE
 * --------------
 * start() sends Reset then RequestBoard and polls until the board dump
 * arrives, skipping whatever else the board says first.
 *
 * @code
 *   dgtlink::Session s(link);
 *   std::string err;
 *   if (!s.start(err)) { ... }
 *   s.send(dgtlink::Command::RequestUpdate, err);
 *   dgtlink::Response r;
 *   while (s.poll(r, err) != dgtlink::PollStatus::IoFailure) {
 *       if (s.last_move()) { ... }
 *   }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "dgtlink/board_tracker.hpp"
#include "dgtlink/command.hpp"
#include "dgtlink/frame_reader.hpp"
#include "dgtlink/message.hpp"
#include "dgtlink/move_classifier.hpp"
#include "dgtlink/transport/transport_base.hpp"

namespace dgtlink {

enum class PollStatus : uint8_t {
    Ok,            ///< a Response was written to the output argument
    IoFailure,     ///< link timeout or error; see last_rx()
    FrameError,    ///< frame header announced a length < 3
    ParseFailure   ///< frame read but its payload did not decode
};

const char* poll_status_name(PollStatus s);

/// Frames start() will look at before giving up on the board dump.
static constexpr int START_MAX_FRAMES = 16;

class Session {
public:
    explicit Session(transport::ByteLink& link);

    /// Write one command byte. On failure @p err is "reason=write_failed command=<name>".
    bool send(Command c, std::string& err);

    /**
     * @brief Read and decode one frame.
     *
     * @param out  the decoded response when the result is Ok
     * @param err  a `reason=...` token string for every other result
     */
    PollStatus poll(Response& out, std::string& err);

    /**
     * @brief Reset, RequestBoard, then wait for the board dump.
     *
     * Other frames and parse failures are skipped, at most @p max_frames of
     * them. Fails on the first IoFailure or FrameError.
     */
    bool start(std::string& err, int max_frames = START_MAX_FRAMES);

    bool has_board() const { return tracker_.has_value(); }

    /// Tracker seeded by the last board dump; nullptr before the first one.
    const BoardTracker* tracker() const { return tracker_ ? &*tracker_ : nullptr; }

    /// Move completed by the most recent poll(); empty otherwise.
    const std::optional<MoveResult>& last_move() const { return last_move_; }

    /// Field updates collected since the last recognized move.
    const UpdateBatch& pending_updates() const { return batch_; }

    /// Raw frame behind the most recent poll() that read one.
    const Frame& last_frame() const { return frame_; }

    /// Decode failure behind the most recent ParseFailure.
    const ParseError& last_parse_error() const { return parse_error_; }

    /// Link status behind the most recent IoFailure.
    transport::RxResult last_rx() const { return reader_.last_rx(); }

    std::size_t frames_ok()       const { return frames_ok_; }
    std::size_t parse_errors()    const { return parse_errors_; }
    std::size_t resync_bytes()    const { return reader_.bytes_discarded(); }
    std::size_t frames_skipped()  const { return frames_skipped_; }
    std::size_t updates_ignored() const { return updates_ignored_; }
    std::size_t moves()           const { return moves_; }

private:
    void on_board_dump(const BoardDump& dump);
    void on_field_update(const FieldUpdate& update);
    void restart_batch();

    transport::ByteLink&         link_;
    FrameReader                  reader_;
    Frame                        frame_;
    ParseError                   parse_error_;
    std::optional<BoardTracker>  tracker_;
    BoardState                   batch_start_{};
    UpdateBatch                  batch_;
    std::optional<MoveResult>    last_move_;

    std::size_t frames_ok_{0};
    std::size_t parse_errors_{0};
    std::size_t frames_skipped_{0};
    std::size_t updates_ignored_{0};
    std::size_t moves_{0};
};

} // namespace dgtlink
