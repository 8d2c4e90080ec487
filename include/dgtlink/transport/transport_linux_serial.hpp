#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty ByteLink (header-only) over the functions in serial_io.hpp.
 *
 * Owns the descriptor: the destructor closes it. Not copyable.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "dgtlink/transport/transport_base.hpp"
#include "serial_io.hpp"
#include <string>

namespace dgtlink::transport {

struct SerialConfig {
  std::string path;                  // e.g. /dev/serial/by-id/usb-...
  int  baud{SERIAL_DEFAULT_BAUD};
  bool hw_flow{true};                // RTS/CTS, the board expects it
  int  read_timeout_ms{1000};        // per byte
  int  boot_delay_ms{200};
};

class LinuxSerial : public ByteLink {
public:
  LinuxSerial() = default;
  ~LinuxSerial() override { end(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  bool begin(const SerialConfig& cfg) {
    end();
    cfg_ = cfg;
    if (cfg_.path.empty()) return false;
    fd_ = open_serial(cfg_.path, cfg_.baud, cfg_.hw_flow, cfg_.boot_delay_ms);
    return fd_ >= 0;
  }

  void end() {
    if (fd_ >= 0) { close_serial(fd_); fd_ = -1; }
  }

  bool is_open() const { return fd_ >= 0; }

  RxResult read_byte(uint8_t& out) override {
    switch (dgtlink::read_byte(fd_, out, cfg_.read_timeout_ms)) {
      case 1:  return RxResult::Ok;
      case 0:  return RxResult::Timeout;
      default: return RxResult::Error;
    }
  }

  TxResult write_bytes(const uint8_t* data, std::size_t len) override {
    if (!data || !len) return TxResult::Error;
    return write_all(fd_, data, len) ? TxResult::Ok : TxResult::Error;
  }

  const char* name() const override { return "linux-serial"; }
  const std::string& path() const { return cfg_.path; }

private:
  int fd_{-1};
  SerialConfig cfg_;
};

} // namespace dgtlink::transport
