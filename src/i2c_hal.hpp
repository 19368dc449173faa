/*
* I2C HARDWARE ABSTRACTION LAYER FOR LINUX (i2c-dev)
methods required:
* I2CBus(dev path) -> open, setSlave(addr) -> bind 7-bit address
* read_reg8 / write_reg8 / read_s16le (reg_bus_i)
* readBurst(start reg, dest*, len)
notes:
- LIS3DH address is 0x18 (SDO/SA0 low) or 0x19 (SDO/SA0 high)
- multi-byte reads need bit 7 of the sub-address set or the chip re-reads the same register
- EINTR/EAGAIN are retried here (3 tries); anything else goes straight back to the caller as -errno
*/

#pragma once
#include <fcntl.h>        // ::open, O_RDWR, O_CLOEXEC
#include <unistd.h>       // ::close, ::read, ::write
#include <sys/ioctl.h>    // ::ioctl
#include <linux/i2c-dev.h>// I2C_SLAVE
#include <sys/types.h>    // ssize_t

#include <cstddef>
#include <cstdint>
#include "reg_bus.hpp"

static constexpr uint8_t I2C_AUTO_INCREMENT = 0x80;

class I2CBus : public reg_bus_i {
public:
    explicit I2CBus(const char* dev); // open; fd_ stays -1 on failure
    ~I2CBus() override; // close if open
    I2CBus(const I2CBus&) = delete;
    I2CBus& operator=(const I2CBus&) = delete;

    bool I2Cok() const noexcept; // if fd_ >= 0

    int setSlave(uint8_t addr) noexcept;
    int readBurst(uint8_t startReg, uint8_t* dest, size_t len) noexcept;

    int read_reg8(uint8_t reg, uint8_t* dest) noexcept override;
    int write_reg8(uint8_t reg, uint8_t val) noexcept override;
    int read_s16le(uint8_t reg, int16_t* dest) noexcept override;

private:
    int writeAll(const uint8_t* buf, size_t len) noexcept;
    int readAll(uint8_t* dest, size_t len) noexcept;

    int fd_{-1};
};
