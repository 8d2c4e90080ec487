/**
 * @file session.cpp
 * @brief Receive loop and start sequence behind dgtlink::Session.
 */

#include "dgtlink/session.hpp"

namespace dgtlink {

const char* poll_status_name(PollStatus s) {
    switch (s) {
        case PollStatus::Ok:           return "ok";
        case PollStatus::IoFailure:    return "io_failure";
        case PollStatus::FrameError:   return "frame_error";
        case PollStatus::ParseFailure: return "parse_failure";
    }
    return "unknown";
}


Session::Session(transport::ByteLink& link) : link_(link), reader_(link) {}


bool Session::send(Command c, std::string& err) {
    const uint8_t b = command_to_byte(c);
    if (link_.write_bytes(&b, 1) != transport::TxResult::Ok) {
        err = std::string("reason=write_failed command=") + command_name(c);
        return false;
    }
    return true;
}


// ---------------------------------------------------------------------------
// poll: one frame in, one Response (or one reason) out.
// ---------------------------------------------------------------------------
PollStatus Session::poll(Response& out, std::string& err) {
    last_move_.reset();

    switch (reader_.read(frame_)) {
        case ReadStatus::Ok:
            break;
        case ReadStatus::IoFailure:
            err = std::string("reason=io_failure rx=") + transport::rx_result_name(reader_.last_rx());
            return PollStatus::IoFailure;
        case ReadStatus::FrameLengthError:
            err = "reason=frame_length_error";
            return PollStatus::FrameError;
    }

    std::optional<Response> resp = decode_response(frame_.type, frame_.payload, parse_error_);
    if (!resp) {
        ++parse_errors_;
        err = describe(parse_error_);
        return PollStatus::ParseFailure;
    }

    ++frames_ok_;
    if (const auto* dump = std::get_if<BoardDump>(&*resp)) {
        on_board_dump(*dump);
    } else if (const auto* upd = std::get_if<FieldUpdate>(&*resp)) {
        on_field_update(*upd);
    }
    out = std::move(*resp);
    return PollStatus::Ok;
}


void Session::on_board_dump(const BoardDump& dump) {
    if (tracker_) tracker_->reset(dump.board);
    else          tracker_.emplace(dump.board);
    restart_batch();
}


void Session::on_field_update(const FieldUpdate& update) {
    if (!tracker_) {
        ++updates_ignored_;
        return;
    }

    // A batch this long is not one move; start over from here.
    if (batch_.full()) restart_batch();

    if (!tracker_->apply(update.update)) {
        ++updates_ignored_;
        return;
    }
    batch_.push_back(update.update);

    const MoveResult m = classify_move(batch_start_, batch_);
    if (m.kind != MoveKind::NotClassified) {
        last_move_ = m;
        ++moves_;
        restart_batch();
    } else if (tracker_->board() == batch_start_) {
        // Piece lifted and put back: nothing pending.
        restart_batch();
    }
}


void Session::restart_batch() {
    batch_.clear();
    if (tracker_) batch_start_ = tracker_->board();
}


// ---------------------------------------------------------------------------
// start: Reset, RequestBoard, wait for the dump.
// ---------------------------------------------------------------------------
bool Session::start(std::string& err, int max_frames) {
    if (!send(Command::Reset, err)) return false;
    if (!send(Command::RequestBoard, err)) return false;

    Response r;
    for (int i = 0; i < max_frames; ++i) {
        std::string why;
        switch (poll(r, why)) {
            case PollStatus::Ok:
                if (std::holds_alternative<BoardDump>(r)) return true;
                ++frames_skipped_;
                break;
            case PollStatus::ParseFailure:
                ++frames_skipped_;
                break;
            case PollStatus::IoFailure:
            case PollStatus::FrameError:
                err = why + " during=start";
                return false;
        }
    }
    err = "reason=no_board_dump frames=" + std::to_string(max_frames);
    return false;
}

} // namespace dgtlink
