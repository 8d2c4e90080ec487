#include "dgtlink/frame_reader.hpp"

namespace dgtlink {

const char* read_status_name(ReadStatus s) {
    switch (s) {
        case ReadStatus::Ok:               return "ok";
        case ReadStatus::IoFailure:        return "io_failure";
        case ReadStatus::FrameLengthError: return "frame_length_error";
    }
    return "unknown";
}


ReadStatus FrameReader::read(Frame& out) {
    uint8_t b = 0;
    while (true) {
        const transport::RxResult rx = link_.read_byte(b);
        if (rx != transport::RxResult::Ok) {
            last_rx_ = rx;
            dec_.reset();
            return ReadStatus::IoFailure;
        }

        switch (dec_.feed(b, out)) {
            case FeedResult::NeedMore:
                break;
            case FeedResult::Complete:
                ++frames_;
                return ReadStatus::Ok;
            case FeedResult::LengthError:
                ++length_errors_;
                return ReadStatus::FrameLengthError;
        }
    }
}

} // namespace dgtlink
