/*
* COLLABORATOR INTERFACES FOR THE LIS3DH DRIVER
* reg_bus_i   -> register read/write over I2C or SPI (i2c_hal, spi_hal)
* irq_line_i  -> wait for an edge on the INT1 pin (gpio_irq)
* delay_fn_t  -> blocking sleep used for power-up / settle delays
notes:
- all bus calls return 0 on success or -errno, never throw
- the transport owns the auto-increment flag for multi-byte reads (differs between I2C and SPI)
*/

#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

class reg_bus_i {
public:
    virtual ~reg_bus_i() = default;

    virtual int read_reg8(uint8_t reg, uint8_t* dest) noexcept = 0;
    virtual int write_reg8(uint8_t reg, uint8_t val) noexcept = 0;
    // [reg] = low byte, [reg+1] = high byte, one auto-incrementing transfer
    virtual int read_s16le(uint8_t reg, int16_t* dest) noexcept = 0;
};

class irq_line_i {
public:
    virtual ~irq_line_i() = default;

    // 1 = edge seen, 0 = timeout, <0 = -errno
    virtual int wait_edge(std::chrono::milliseconds timeout) noexcept = 0;
};

using delay_fn_t = std::function<void(std::chrono::milliseconds)>;

inline void default_delay(std::chrono::milliseconds d) {
    std::this_thread::sleep_for(d);
}

// little Endian pair -> signed count
inline int16_t s16_from_le(uint8_t lo, uint8_t hi) {
    return int16_t(uint16_t(lo) | uint16_t(uint16_t(hi) << 8));
}
