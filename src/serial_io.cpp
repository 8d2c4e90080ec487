// ============================================================================
// serial_io.cpp : implementation for serial_io.hpp
// For API/overview see the matching .hpp. The ByteLink wrapper lives in
// dgtlink/transport/transport_linux_serial.hpp.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "serial_io.hpp"   // declarations for open_serial(), read_byte(), write_all(), close_serial()

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for the per-byte timeout
#include <cerrno>          // EINTR / EAGAIN handling

namespace dgtlink {

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Configure a file descriptor for raw serial I/O at the given baud.
// - 8N1, no echo, no line processing.
// - RTS/CTS on or off as requested; the board expects it on.
// - VMIN=0, VTIME=0 (non-blocking reads; poll() handles timing).
//
// Returns: true on success, false if tcgetattr/tcsetattr fails.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud, bool hw_flow) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;   // fetch current settings

    cfmakeraw(&tio);                              // raw 8N1
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CSTOPB;                       // one stop bit
    tio.c_cflag &= ~PARENB;                       // no parity
    if (hw_flow) tio.c_cflag |= CRTSCTS;
    else         tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}


static speed_t speed_for(int baud) {
    switch (baud) {
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        default:     return B9600;                // board default
    }
}


bool is_supported_baud(int baud) {
    switch (baud) {
        case 9600: case 19200: case 38400: case 57600: case 115200: case 230400:
            return true;
        default:
            return false;
    }
}

int open_serial(const std::string& dev, int baud, bool hw_flow, int boot_delay_ms) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;                        // open failed (perm, missing, etc.)

    if (!set_raw(fd, speed_for(baud), hw_flow)) {
        const int saved = errno;
        ::close(fd);
        errno = saved;
        return -1;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
    tcflush(fd, TCIOFLUSH);                       // drop anything sent while settling
    return fd;
}


// ---------------------------------------------------------------------------
// read_byte()
// -----------
// poll() for readability, then read(2) a single byte.
// - EINTR restarts the wait with the full timeout (good enough at 9600 baud).
// - A spurious wakeup with nothing to read (EAGAIN) loops.
// - POLLHUP/POLLERR without data is a link failure.
// ---------------------------------------------------------------------------
int read_byte(int fd, uint8_t& out, int timeout_ms) {
    if (fd < 0) return -1;
    pollfd pfd{fd, POLLIN, 0};

    while (true) {
        int pr = ::poll(&pfd, 1, timeout_ms);
        if (pr == 0) return 0;                    // timeout expired
        if (pr < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (pfd.revents & POLLIN) {
            ssize_t n = ::read(fd, &out, 1);
            if (n == 1) return 1;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
            return -1;                            // EOF or read error
        }
        if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) return -1;
    }
}


bool write_all(int fd, const uint8_t* data, std::size_t len) {
    if (fd < 0) return false;
    std::size_t total = 0;
    while (total < len) {
        ssize_t n = ::write(fd, data + total, len - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd{fd, POLLOUT, 0};       // wait for room, then retry
                if (::poll(&pfd, 1, 1000) <= 0) return false;
                continue;
            }
            return false;
        }
        total += static_cast<std::size_t>(n);
    }
    return true;
}


void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace dgtlink
