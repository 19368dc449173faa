#pragma once
#include <cstdint>
#include <cstddef>

constexpr uint8_t LIS3DH_SLAVE_I2C_ADDRESS     = 0x18; // SDO/SA0 to GND
constexpr uint8_t LIS3DH_SLAVE_I2C_ADDRESS_ALT = 0x19; // SDO/SA0 to VDD
constexpr uint8_t LIS3DH_WHO_AM_I_VALUE        = 0x33;

// Result codes returned by the driver and codec (0 = success).
// Transports return 0 or -errno instead; the driver maps those to LIS3DH_ERR_BUS.
enum lis3dh_status_e : int {
    LIS3DH_OK = 0,
    LIS3DH_ERR_BUS,
    LIS3DH_ERR_UNEXPECTED_DEVICE,
    LIS3DH_ERR_INVALID_PARAMETER,
    LIS3DH_ERR_CONFLICTING_OPTIONS,
    LIS3DH_ERR_INCOMPATIBLE_RATE_DURATION,
    LIS3DH_ERR_NOT_ENABLED,
    LIS3DH_ERR_TIMEOUT,
};

const char* lis3dh_strerror(int status) noexcept;

// Output data rate. Enumerator values are the ODR[3:0] field codes.
enum data_rate_e : uint8_t {
    ODR_1HZ = 1,
    ODR_10HZ,
    ODR_25HZ,
    ODR_50HZ,
    ODR_100HZ,
    ODR_200HZ,
    ODR_400HZ,
};

// Full-scale range. Enumerator values are the FS[1:0] field codes.
enum range_e : uint8_t {
    RANGE_2G = 0,
    RANGE_4G,
    RANGE_8G,
    RANGE_16G,
};

enum lis3dh_state_e {
    LIS3DH_UNINITIALIZED,
    LIS3DH_DISABLED,
    LIS3DH_ENABLED,
};

// signed counts straight from OUT_X_L..OUT_Z_H
struct accel_raw_t {
    int16_t x;
    int16_t y;
    int16_t z;
};

// m/s^2
struct accel_sample_t {
    float x;
    float y;
    float z;
};

// INT1_SRC decoded; reading the register on the chip clears the latch
struct int1_cause_t {
    bool x_low;
    bool x_high;
    bool y_low;
    bool y_high;
    bool z_low;
    bool z_high;

    bool any() const noexcept { return x_low || x_high || y_low || y_high || z_low || z_high; }
    uint8_t bits() const noexcept;
};
