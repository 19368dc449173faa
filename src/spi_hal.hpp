/*
* SPI HARDWARE ABSTRACTION LAYER FOR LINUX (spidev)
methods required:
* SPIBus(dev path, clock) -> open + mode 3 / 8 bit / speed
* read_reg8 / write_reg8 / read_s16le (reg_bus_i)
notes:
- first byte on the wire is the sub-address: bit 7 = read, bit 6 = auto-increment (MS)
- LIS3DH samples on the rising edge with SPC idle high -> SPI_MODE_3
*/

#pragma once
#include <cstddef>
#include <cstdint>
#include "reg_bus.hpp"

static constexpr uint8_t SPI_READ_FLAG = 0x80;
static constexpr uint8_t SPI_MULTI_FLAG = 0x40;
static constexpr uint8_t SPI_ADDR_MASK = 0x3F;

class SPIBus : public reg_bus_i {
public:
    SPIBus(const char* dev, uint32_t speed_hz);
    ~SPIBus() override;
    SPIBus(const SPIBus&) = delete;
    SPIBus& operator=(const SPIBus&) = delete;

    bool SPIok() const noexcept { return fd_ >= 0; }

    int read_reg8(uint8_t reg, uint8_t* dest) noexcept override;
    int write_reg8(uint8_t reg, uint8_t val) noexcept override;
    int read_s16le(uint8_t reg, int16_t* dest) noexcept override;

private:
    // full-duplex transfer of len bytes; rx may be nullptr
    int transfer(const uint8_t* tx, uint8_t* rx, size_t len) noexcept;

    int fd_{-1};
    uint32_t speed_hz_;
};
