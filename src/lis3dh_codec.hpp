/*
* LIS3DH REGISTER CODEC
methods required:
* lis3dh_encode_enable(config, dest*) -> register image for an enable sequence
* lis3dh_decode_accel(raw, range, dest*) -> m/s^2
* lis3dh_decode_int1_src(byte) -> which axis crossed which side of the threshold
notes:
- pure functions, no bus access and no logging; the driver owns the I/O
- everything here returns LIS3DH_OK or a lis3dh_status_e, nothing is written to dest on failure
*/

#pragma once
#include <chrono>
#include <cstdint>
#include "types.hpp"
#include "configs.hpp"

struct lis3dh_config_t {
    data_rate_e rate = ODR_100HZ;
    range_e range = RANGE_2G;
    bool detect_free_fall = false;
    bool detect_wake_up = false;   // mutually exclusive with detect_free_fall
    std::chrono::milliseconds free_fall_duration = DEFAULT_FREE_FALL_DURATION;
    uint16_t threshold_mg = 0;     // 0 selects 372 mg (free-fall) or 64 mg (otherwise)
    bool latch_int1 = false;       // keep INT1 asserted until INT1_SRC is read
};

// Register values for one enable sequence, in write order.
struct enable_regs_t {
    uint8_t ctrl1 = 0;
    uint8_t ctrl2 = 0;
    uint8_t ctrl3 = 0;
    uint8_t ctrl4 = 0;
    uint8_t ctrl5 = 0;
    uint8_t int1_ths = 0;
    uint8_t int1_duration = 0;
    uint8_t int1_cfg = 0;
    bool needs_reference_read = false; // read REFERENCE once after writing (wake-up mode)
};

int lis3dh_encode_enable(const lis3dh_config_t& cfg, enable_regs_t* dest);

// Field helpers used by lis3dh_encode_enable, exposed for diagnostics and tests
int lis3dh_rate_code(data_rate_e rate, uint8_t* dest);
int lis3dh_range_code(range_e range, uint8_t* dest);
int lis3dh_encode_threshold(uint16_t threshold_mg, range_e range, uint8_t* dest);
int lis3dh_encode_duration(std::chrono::milliseconds duration, data_rate_e rate, uint8_t* dest);

// milli-g per LSB of the left-justified 12-bit reading (before the /16)
int lis3dh_sensitivity(range_e range, int* dest);

int lis3dh_decode_accel(const accel_raw_t& raw, range_e range, accel_sample_t* dest);
int1_cause_t lis3dh_decode_int1_src(uint8_t raw) noexcept;
