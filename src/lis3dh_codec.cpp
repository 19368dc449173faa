#include "lis3dh_codec.hpp"
#include "lis3dh_regs.hpp"

namespace {

// standard gravity, mg -> g, and /16 for the 12-bit reading left-justified in 16 bits
constexpr double ACCEL_FACTOR = 9.80665 / 1000.0 / 16.0;

} // namespace

const char* lis3dh_strerror(int status) noexcept {
    switch (status) {
        case LIS3DH_OK:                             return "ok";
        case LIS3DH_ERR_BUS:                        return "bus transfer failed";
        case LIS3DH_ERR_UNEXPECTED_DEVICE:          return "unexpected WHO_AM_I";
        case LIS3DH_ERR_INVALID_PARAMETER:          return "invalid parameter";
        case LIS3DH_ERR_CONFLICTING_OPTIONS:        return "free-fall and wake-up are mutually exclusive";
        case LIS3DH_ERR_INCOMPATIBLE_RATE_DURATION: return "free-fall duration shorter than one sample at this rate";
        case LIS3DH_ERR_NOT_ENABLED:                return "sensor not enabled";
        case LIS3DH_ERR_TIMEOUT:                    return "timed out waiting for interrupt";
        default:                                    return "unknown error";
    }
}

uint8_t int1_cause_t::bits() const noexcept {
    uint8_t b = 0;
    if (x_low)  b |= INT1_SRC_XL;
    if (x_high) b |= INT1_SRC_XH;
    if (y_low)  b |= INT1_SRC_YL;
    if (y_high) b |= INT1_SRC_YH;
    if (z_low)  b |= INT1_SRC_ZL;
    if (z_high) b |= INT1_SRC_ZH;
    return b;
}

int lis3dh_rate_code(data_rate_e rate, uint8_t* dest) {
    if (dest == nullptr) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    switch (rate) {
        case ODR_1HZ:
        case ODR_10HZ:
        case ODR_25HZ:
        case ODR_50HZ:
        case ODR_100HZ:
        case ODR_200HZ:
        case ODR_400HZ:
            *dest = static_cast<uint8_t>(rate);
            return LIS3DH_OK;
    }
    return LIS3DH_ERR_INVALID_PARAMETER;
}

int lis3dh_range_code(range_e range, uint8_t* dest) {
    if (dest == nullptr) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    switch (range) {
        case RANGE_2G:
        case RANGE_4G:
        case RANGE_8G:
        case RANGE_16G:
            *dest = static_cast<uint8_t>(range);
            return LIS3DH_OK;
    }
    return LIS3DH_ERR_INVALID_PARAMETER;
}

int lis3dh_sensitivity(range_e range, int* dest) {
    if (dest == nullptr) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    // 16g is 12 and not 8: datasheet table 4, not a typo
    switch (range) {
        case RANGE_2G:  *dest = 1;  return LIS3DH_OK;
        case RANGE_4G:  *dest = 2;  return LIS3DH_OK;
        case RANGE_8G:  *dest = 4;  return LIS3DH_OK;
        case RANGE_16G: *dest = 12; return LIS3DH_OK;
    }
    return LIS3DH_ERR_INVALID_PARAMETER;
}

int lis3dh_encode_threshold(uint16_t threshold_mg, range_e range, uint8_t* dest) {
    if (dest == nullptr) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    // INT1_THS LSB: 16 / 32 / 62 / 186 mg
    unsigned ths = 0;
    switch (range) {
        case RANGE_2G:  ths = threshold_mg >> 4;  break;
        case RANGE_4G:  ths = threshold_mg >> 3;  break;
        case RANGE_8G:  ths = threshold_mg / 62;  break;
        case RANGE_16G: ths = threshold_mg / 186; break;
        default:        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    if (ths > INT1_FIELD_MAX) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    *dest = static_cast<uint8_t>(ths);
    return LIS3DH_OK;
}

int lis3dh_encode_duration(std::chrono::milliseconds duration, data_rate_e rate, uint8_t* dest) {
    if (dest == nullptr || duration.count() <= 0) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    // INT1_DURATION counts samples: floor(duration / (1 / ODR))
    const int64_t ms = duration.count();
    int64_t samples = 0;
    switch (rate) {
        case ODR_1HZ:   samples = ms / 1000;      break;
        case ODR_10HZ:  samples = ms / 100;       break;
        case ODR_25HZ:  samples = ms * 25 / 1000; break;
        case ODR_50HZ:  samples = ms * 50 / 1000; break;
        case ODR_100HZ: samples = ms / 10;        break;
        case ODR_200HZ: samples = ms / 5;         break;
        case ODR_400HZ: samples = ms * 4 / 10;    break;
        default:        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    if (samples == 0) {
        return LIS3DH_ERR_INCOMPATIBLE_RATE_DURATION;
    }
    if (samples > INT1_FIELD_MAX) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    *dest = static_cast<uint8_t>(samples);
    return LIS3DH_OK;
}

int lis3dh_encode_enable(const lis3dh_config_t& cfg, enable_regs_t* dest) {
    if (dest == nullptr) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }

    uint8_t rate_code = 0;
    uint8_t range_code = 0;
    if (int rc = lis3dh_rate_code(cfg.rate, &rate_code); rc != LIS3DH_OK) {
        return rc;
    }
    if (int rc = lis3dh_range_code(cfg.range, &range_code); rc != LIS3DH_OK) {
        return rc;
    }
    if (cfg.detect_free_fall && cfg.detect_wake_up) {
        return LIS3DH_ERR_CONFLICTING_OPTIONS;
    }

    enable_regs_t regs{};
    regs.ctrl1 = static_cast<uint8_t>((rate_code << CTRL1_ODR_SHIFT) | CTRL1_XYZ_EN);
    regs.ctrl4 = static_cast<uint8_t>((range_code << CTRL4_FS_SHIFT) | CTRL4_HR);

    if (cfg.detect_free_fall) {
        regs.ctrl3 |= CTRL3_I1_IA1;
        if (int rc = lis3dh_encode_duration(cfg.free_fall_duration, cfg.rate, &regs.int1_duration); rc != LIS3DH_OK) {
            return rc;
        }
        // all three axes below threshold at the same time
        regs.int1_cfg |= INT1_CFG_AOI | INT1_CFG_LOW_XYZ;
    }

    if (cfg.detect_wake_up) {
        // high-pass so gravity on Z doesn't hold the interrupt
        regs.ctrl2 |= CTRL2_HP_IA1;
        regs.ctrl3 |= CTRL3_I1_IA1;
        regs.int1_cfg = INT1_CFG_WAKE_UP;
        regs.needs_reference_read = true;
    }

    const bool detecting = cfg.detect_free_fall || cfg.detect_wake_up;
    if (detecting) {
        uint16_t threshold = cfg.threshold_mg;
        if (threshold == 0) {
            threshold = cfg.detect_free_fall ? DEFAULT_FREE_FALL_THRESHOLD_MG : DEFAULT_WAKE_UP_THRESHOLD_MG;
        }
        if (int rc = lis3dh_encode_threshold(threshold, cfg.range, &regs.int1_ths); rc != LIS3DH_OK) {
            return rc;
        }
        if (cfg.latch_int1) {
            regs.ctrl5 |= CTRL5_LIR_INT1;
        }
    }

    *dest = regs;
    return LIS3DH_OK;
}

int lis3dh_decode_accel(const accel_raw_t& raw, range_e range, accel_sample_t* dest) {
    if (dest == nullptr) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    int sens = 0;
    if (int rc = lis3dh_sensitivity(range, &sens); rc != LIS3DH_OK) {
        return rc;
    }
    dest->x = static_cast<float>(int32_t(raw.x) * sens * ACCEL_FACTOR);
    dest->y = static_cast<float>(int32_t(raw.y) * sens * ACCEL_FACTOR);
    dest->z = static_cast<float>(int32_t(raw.z) * sens * ACCEL_FACTOR);
    return LIS3DH_OK;
}

int1_cause_t lis3dh_decode_int1_src(uint8_t raw) noexcept {
    int1_cause_t cause{};
    cause.x_low  = (raw & INT1_SRC_XL) != 0;
    cause.x_high = (raw & INT1_SRC_XH) != 0;
    cause.y_low  = (raw & INT1_SRC_YL) != 0;
    cause.y_high = (raw & INT1_SRC_YH) != 0;
    cause.z_low  = (raw & INT1_SRC_ZL) != 0;
    cause.z_high = (raw & INT1_SRC_ZH) != 0;
    return cause;
}
