/**
 * @page dgt-serial-io-hdr dgtlink Serial I/O API (Header)
 * @file serial_io.hpp
 * @brief Open a Linux TTY for the board and move single bytes across it.
 *
 * @details
 * PURPOSE
 * -------
 * This header declares the minimal POSIX surface needed to talk to the
 * chessboard from a Linux host. It pairs with serial_io.cpp for the syscalls
 * and with dgtlink/transport/transport_linux_serial.hpp, which wraps these
 * functions behind the ByteLink interface the decoding pipeline uses.
 *
 * ROLE IN DGTLINK
 * ---------------
 * - dgtlink::open_serial: acquire a descriptor, set raw 8N1 with optional
 *   RTS/CTS flow control, flush boot chatter.
 * - dgtlink::read_byte: wait up to a timeout for exactly one byte.
 * - dgtlink::write_all: write a whole buffer, looping over partial writes.
 * - dgtlink::close_serial: close the descriptor.
 *
 * LINK SETTINGS
 * -------------
 * The board speaks 9600 baud, 8 data bits, no parity, one stop bit, with
 * hardware flow control. Other baud values from the table in serial_io.cpp
 * are accepted for adapters and bridges that differ.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device selection: prefer /dev/serial/by-id/... for stable paths.
 * - Permissions: the runtime user needs access to the TTY (dialout group).
 * - Timeouts: read_byte reports a timeout separately from an error; neither
 *   is retried here. Upper layers decide.
 * - Concurrency: do not share one fd between threads.
 *
 * EXAMPLE
 * -------
 * @code
 *   int fd = dgtlink::open_serial("/dev/ttyUSB0", 9600, true, 200);
 *   if (fd < 0) { // handle open failure }
 *   const uint8_t req = 0x42;                    // request board
 *   dgtlink::write_all(fd, &req, 1);
 *   uint8_t b;
 *   while (dgtlink::read_byte(fd, b, 1000) == 1) { // feed the frame decoder }
 *   dgtlink::close_serial(fd);
 * @endcode
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace dgtlink {

/// Board default: 9600 baud.
static constexpr int SERIAL_DEFAULT_BAUD = 9600;

/// True for the baud values open_serial() maps exactly (no 9600 fallback).
bool is_supported_baud(int baud);

/**
 * @brief Open a Linux TTY device and configure it for raw board I/O.
 *
 * What it does:
 *   - Opens the path with O_RDWR | O_NOCTTY | O_NONBLOCK.
 *   - Raw mode, 8N1, receiver on, modem control lines ignored.
 *   - RTS/CTS on when @p hw_flow is true.
 *   - Sleeps @p boot_delay_ms, then flushes both directions.
 *
 * @param dev            Device path, e.g. "/dev/ttyUSB0".
 * @param baud           9600 (default), 19200, 38400, 57600, 115200 or 230400.
 *                       Unknown values fall back to 9600.
 * @param hw_flow        Enable RTS/CTS hardware flow control.
 * @param boot_delay_ms  Delay after open before the first I/O.
 *
 * @return File descriptor (non-negative) on success, or -1 on failure
 *         (errno is left as the failing call set it).
 */
int open_serial(const std::string& dev, int baud = SERIAL_DEFAULT_BAUD,
                bool hw_flow = true, int boot_delay_ms = 200);


/**
 * @brief Wait for and read exactly one byte.
 *
 * @param fd          Descriptor from open_serial().
 * @param out         Receives the byte when the return value is 1.
 * @param timeout_ms  Maximum wait; negative waits forever.
 *
 * @return 1 when a byte was read, 0 on timeout, -1 on error or hang-up.
 */
int read_byte(int fd, uint8_t& out, int timeout_ms);


/**
 * @brief Write @p len bytes, retrying on EINTR, EAGAIN and partial writes.
 *
 * @return true once every byte is written; false on any other error.
 */
bool write_all(int fd, const uint8_t* data, std::size_t len);


/**
 * @brief Close a descriptor from open_serial(). Negative fds are ignored.
 */
void close_serial(int fd);

} // namespace dgtlink
