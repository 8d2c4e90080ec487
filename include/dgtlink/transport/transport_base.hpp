#pragma once
/**
 * @file transport_base.hpp
 * @brief Byte-level link interface the decoding pipeline reads from and writes to.
 *
 * Header-only on purpose. The frame reader and session only ever see this
 * interface, so tests can replay captured byte streams without a device.
 */

#include <cstddef>
#include <cstdint>

namespace dgtlink::transport {

// Return codes kept simple; the caller decides on retries.
enum class TxResult : uint8_t { Ok=0, Error=1 };
enum class RxResult : uint8_t { Ok=0, Timeout=1, Error=2 };

/**
 * @brief Blocking byte link.
 *
 * Contract:
 *  - read_byte(out) blocks until exactly one byte arrives (Ok), the link's
 *    timeout elapses (Timeout) or the link fails (Error). It never reports Ok
 *    without a byte.
 *  - write_bytes(data,len) writes all of @p len bytes or reports Error.
 *  - name() is a short identifier for logs/diagnostics.
 */
class ByteLink {
public:
  virtual ~ByteLink() = default;
  virtual RxResult    read_byte(uint8_t& out) = 0;
  virtual TxResult    write_bytes(const uint8_t* data, std::size_t len) = 0;
  virtual const char* name() const = 0;
};

inline const char* rx_result_name(RxResult r) {
  switch (r) {
    case RxResult::Ok:      return "ok";
    case RxResult::Timeout: return "timeout";
    case RxResult::Error:   return "error";
  }
  return "unknown";
}

} // namespace dgtlink::transport
