#pragma once
// tests/scripted_link.hpp
// In-memory ByteLink for tests: serves a fixed byte script, then times out.
// Everything written is captured in `written`.

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "dgtlink/board.hpp"
#include "dgtlink/frame.hpp"
#include "dgtlink/transport/transport_base.hpp"

namespace dgtlink_test {

class ScriptedLink : public dgtlink::transport::ByteLink {
public:
    ScriptedLink() = default;
    explicit ScriptedLink(std::vector<uint8_t> script) : script_(std::move(script)) {}

    /// Append raw bytes to the read script.
    void push(const std::vector<uint8_t>& bytes) {
        script_.insert(script_.end(), bytes.begin(), bytes.end());
    }

    /// Append one encoded frame to the read script.
    void push_frame(uint8_t type, const std::vector<uint8_t>& payload) {
        push(dgtlink::encode_frame(type, payload));
    }

    dgtlink::transport::RxResult read_byte(uint8_t& out) override {
        if (fail_reads) return dgtlink::transport::RxResult::Error;
        if (pos_ >= script_.size()) return dgtlink::transport::RxResult::Timeout;
        out = script_[pos_++];
        return dgtlink::transport::RxResult::Ok;
    }

    dgtlink::transport::TxResult write_bytes(const uint8_t* data, std::size_t len) override {
        if (fail_writes) return dgtlink::transport::TxResult::Error;
        written.insert(written.end(), data, data + len);
        return dgtlink::transport::TxResult::Ok;
    }

    const char* name() const override { return "scripted"; }

    std::size_t consumed()  const { return pos_; }
    std::size_t remaining() const { return script_.size() - pos_; }

    std::vector<uint8_t> written;
    bool fail_reads  = false;
    bool fail_writes = false;

private:
    std::vector<uint8_t> script_;
    std::size_t pos_ = 0;
};

/// Board layout from eight 8-character rows, square 0 first; '.' is empty.
inline dgtlink::BoardState board_from_rows(const char* const rows[8]) {
    dgtlink::BoardState b = dgtlink::empty_board();
    for (int r = 0; r < 8; ++r)
        for (int f = 0; f < 8; ++f) {
            auto p = dgtlink::piece_from_char(rows[r][f]);
            b[r * 8 + f] = p ? *p : dgtlink::Piece::Empty;
        }
    return b;
}

/// 64-byte board dump payload for a board.
inline std::vector<uint8_t> dump_payload(const dgtlink::BoardState& b) {
    std::vector<uint8_t> out;
    out.reserve(b.size());
    for (auto p : b) out.push_back(dgtlink::piece_to_byte(p));
    return out;
}

} // namespace dgtlink_test
