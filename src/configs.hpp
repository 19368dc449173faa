#pragma once
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string>
#include "types.hpp"

// central place for defaults used across headers
inline constexpr const char* DEFAULT_I2C_DEV      = "/dev/i2c-1";
inline constexpr const char* DEFAULT_SPI_DEV      = "/dev/spidev0.0";
inline constexpr const char* DEFAULT_GPIO_CHIP    = "/dev/gpiochip0";
inline constexpr uint32_t DEFAULT_SPI_SPEED_HZ    = 5'000'000;  // datasheet max 10 MHz

// AN3308 section 4: ~5 ms boot after power-up; 7 ms covers the first sample after enable
inline constexpr std::chrono::milliseconds POWER_UP_DELAY{5};
inline constexpr std::chrono::milliseconds SETTLE_DELAY{7};

inline constexpr uint16_t DEFAULT_FREE_FALL_THRESHOLD_MG = 372;
inline constexpr uint16_t DEFAULT_WAKE_UP_THRESHOLD_MG   = 64;
inline constexpr std::chrono::milliseconds DEFAULT_FREE_FALL_DURATION{100};

// Where the sensor lives on this host; overridable from the environment.
struct lis3dh_env_config_t {
    std::string i2c_dev = DEFAULT_I2C_DEV;
    uint8_t i2c_addr = LIS3DH_SLAVE_I2C_ADDRESS;
    std::string spi_dev = DEFAULT_SPI_DEV;
    std::string gpio_chip = DEFAULT_GPIO_CHIP;
    int gpio_line = -1; // -1: no interrupt line wired, poll instead
};

// Overlay LIS3DH_I2C_DEV, LIS3DH_I2C_ADDR, LIS3DH_SPI_DEV, LIS3DH_GPIO_CHIP and
// LIS3DH_GPIO_LINE on top of the defaults. Bad values are logged and skipped.
// Returns the number of variables that were rejected (-1 for a null dest).
int lis3dh_load_env_config(lis3dh_env_config_t* dest);

// Human units -> enums; LIS3DH_ERR_INVALID_PARAMETER for anything the chip can't do
int lis3dh_rate_from_hz(int hz, data_rate_e* dest);
int lis3dh_range_from_g(int g, range_e* dest);
