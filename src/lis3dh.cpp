#include "lis3dh.hpp"
#include "lis3dh_regs.hpp"
#include "logger.hpp"

#include <cstring>
#include <utility>

namespace {

int rate_hz(data_rate_e rate) {
    switch (rate) {
        case ODR_1HZ:   return 1;
        case ODR_10HZ:  return 10;
        case ODR_25HZ:  return 25;
        case ODR_50HZ:  return 50;
        case ODR_100HZ: return 100;
        case ODR_200HZ: return 200;
        case ODR_400HZ: return 400;
    }
    return 0;
}

int range_g(range_e range) {
    return 2 << static_cast<int>(range); // 2, 4, 8, 16
}

} // namespace

lis3dh_driver::lis3dh_driver(reg_bus_i& bus, delay_fn_t delay)
: bus_(bus), delay_(std::move(delay)) {}

int lis3dh_driver::bus_failed(int rc, const char* what, uint8_t reg) {
    last_bus_error_ = rc;
    LOG_ERR("lis3dh: " << what << " reg 0x" << std::hex << int(reg) << std::dec
            << " failed: " << std::strerror(-rc));
    return LIS3DH_ERR_BUS;
}

int lis3dh_driver::read_reg(uint8_t reg, uint8_t* dest) {
    int rc = bus_.read_reg8(reg, dest);
    if (rc != 0) {
        return bus_failed(rc, "read", reg);
    }
    return LIS3DH_OK;
}

int lis3dh_driver::write_reg(uint8_t reg, uint8_t val) {
    LOG_DBG("lis3dh: write 0x" << std::hex << int(reg) << " <- 0x" << int(val) << std::dec);
    int rc = bus_.write_reg8(reg, val);
    if (rc != 0) {
        return bus_failed(rc, "write", reg);
    }
    return LIS3DH_OK;
}

int lis3dh_driver::lis3dh_init() {
    // ~5ms boot from power-on (AN3308 section 4) before the chip answers reliably
    if (delay_) {
        delay_(POWER_UP_DELAY);
    }

    // WHO_AM_I check on reg 0x0F -> expect 0x33 (0x3F would be a LIS3DSH)
    uint8_t who = 0;
    if (int rc = read_reg(LIS3DH_WHO_AM_I, &who); rc != LIS3DH_OK) {
        LOG_ERR("lis3dh: WHO_AM_I read failed");
        return rc;
    }
    if (who != LIS3DH_WHO_AM_I_VALUE) {
        LOG_ERR("lis3dh: unexpected WHO_AM_I 0x" << std::hex << int(who)
                << " (expected 0x" << int(LIS3DH_WHO_AM_I_VALUE) << ")" << std::dec);
        state_ = LIS3DH_UNINITIALIZED;
        return LIS3DH_ERR_UNEXPECTED_DEVICE;
    }
    LOG_ALWAYS("lis3dh: WHO_AM_I = 0x" << std::hex << int(who) << std::dec << " (OK)");

    state_ = LIS3DH_DISABLED;
    return LIS3DH_OK;
}

int lis3dh_driver::lis3dh_enable(const lis3dh_config_t& cfg) {
    if (state_ == LIS3DH_UNINITIALIZED) {
        LOG_ERR("lis3dh: enable before a successful init");
        return LIS3DH_ERR_NOT_ENABLED;
    }

    enable_regs_t regs;
    if (int rc = lis3dh_encode_enable(cfg, &regs); rc != LIS3DH_OK) {
        LOG_ERR("lis3dh: enable rejected: " << lis3dh_strerror(rc));
        return rc;
    }

    // register order matters: INT1_CFG last so the generator starts with its threshold/duration in place
    const std::pair<uint8_t, uint8_t> writes[] = {
        {LIS3DH_CTRL_REG1, regs.ctrl1},
        {LIS3DH_CTRL_REG2, regs.ctrl2},
        {LIS3DH_CTRL_REG3, regs.ctrl3},
        {LIS3DH_CTRL_REG4, regs.ctrl4},
        {LIS3DH_CTRL_REG5, regs.ctrl5},
        {LIS3DH_INT1_THS, regs.int1_ths},
        {LIS3DH_INT1_DURATION, regs.int1_duration},
        {LIS3DH_INT1_CFG, regs.int1_cfg},
    };
    for (const auto& [reg, val] : writes) {
        if (int rc = write_reg(reg, val); rc != LIS3DH_OK) {
            return rc;
        }
    }

    if (regs.needs_reference_read) {
        // the value is irrelevant, the read itself resets the high-pass reference
        uint8_t ref = 0;
        if (int rc = read_reg(LIS3DH_REFERENCE, &ref); rc != LIS3DH_OK) {
            return rc;
        }
    }

    if (delay_) {
        delay_(SETTLE_DELAY);
    }

    current_range_ = cfg.range;
    state_ = LIS3DH_ENABLED;
    LOG_ALWAYS("lis3dh: enabled " << rate_hz(cfg.rate) << " Hz, +/-" << range_g(cfg.range) << "g"
               << (cfg.detect_free_fall ? ", free-fall on INT1" : "")
               << (cfg.detect_wake_up ? ", wake-up on INT1" : "")
               << (regs.ctrl5 & CTRL5_LIR_INT1 ? " (latched)" : ""));
    return LIS3DH_OK;
}

int lis3dh_driver::lis3dh_enable(data_rate_e rate, range_e range, bool free_fall, bool wake_up,
                                 std::chrono::milliseconds free_fall_duration, uint16_t threshold_mg,
                                 bool latch_int1) {
    lis3dh_config_t cfg;
    cfg.rate = rate;
    cfg.range = range;
    cfg.detect_free_fall = free_fall;
    cfg.detect_wake_up = wake_up;
    cfg.free_fall_duration = free_fall_duration;
    cfg.threshold_mg = threshold_mg;
    cfg.latch_int1 = latch_int1;
    return lis3dh_enable(cfg);
}

int lis3dh_driver::lis3dh_disable() {
    if (state_ == LIS3DH_UNINITIALIZED) {
        return LIS3DH_ERR_NOT_ENABLED;
    }
    // ODR = 0000 is power-down; unroute INT1 so a latched pin doesn't linger
    if (int rc = write_reg(LIS3DH_CTRL_REG1, CTRL1_POWER_DOWN); rc != LIS3DH_OK) {
        return rc;
    }
    if (int rc = write_reg(LIS3DH_CTRL_REG3, 0x00); rc != LIS3DH_OK) {
        return rc;
    }
    state_ = LIS3DH_DISABLED;
    LOG_ALWAYS("lis3dh: disabled");
    return LIS3DH_OK;
}

int lis3dh_driver::lis3dh_read_raw(accel_raw_t* dest) {
    if (dest == nullptr) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    if (state_ != LIS3DH_ENABLED) {
        return LIS3DH_ERR_NOT_ENABLED;
    }
    accel_raw_t raw{};
    const std::pair<uint8_t, int16_t*> axes[] = {
        {LIS3DH_OUT_X_L, &raw.x},
        {LIS3DH_OUT_Y_L, &raw.y},
        {LIS3DH_OUT_Z_L, &raw.z},
    };
    for (const auto& [reg, out] : axes) {
        if (int rc = bus_.read_s16le(reg, out); rc != 0) {
            return bus_failed(rc, "burst read", reg);
        }
    }
    *dest = raw;
    return LIS3DH_OK;
}

int lis3dh_driver::lis3dh_read_accel(accel_sample_t* dest) {
    if (dest == nullptr) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    accel_raw_t raw{};
    if (int rc = lis3dh_read_raw(&raw); rc != LIS3DH_OK) {
        return rc;
    }
    return lis3dh_decode_accel(raw, current_range_, dest);
}

int lis3dh_driver::lis3dh_data_ready(bool* ready) {
    if (ready == nullptr) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    if (state_ != LIS3DH_ENABLED) {
        return LIS3DH_ERR_NOT_ENABLED;
    }
    uint8_t status = 0;
    if (int rc = read_reg(LIS3DH_STATUS_REG, &status); rc != LIS3DH_OK) {
        return rc;
    }
    *ready = (status & STATUS_ZYXDA) != 0;
    return LIS3DH_OK;
}

int lis3dh_driver::lis3dh_read_interrupt_cause(int1_cause_t* dest) {
    if (dest == nullptr) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    if (state_ != LIS3DH_ENABLED) {
        return LIS3DH_ERR_NOT_ENABLED;
    }
    uint8_t src = 0;
    if (int rc = read_reg(LIS3DH_INT1_SRC, &src); rc != LIS3DH_OK) {
        return rc;
    }
    *dest = lis3dh_decode_int1_src(src);
    LOG_DBG("lis3dh: INT1_SRC = 0x" << std::hex << int(src) << std::dec);
    return LIS3DH_OK;
}

int lis3dh_driver::lis3dh_wait_for_interrupt(irq_line_i& line, std::chrono::milliseconds timeout,
                                             int1_cause_t* dest) {
    if (dest == nullptr) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    if (state_ != LIS3DH_ENABLED) {
        return LIS3DH_ERR_NOT_ENABLED;
    }
    int rc = line.wait_edge(timeout);
    if (rc == 0) {
        return LIS3DH_ERR_TIMEOUT;
    }
    if (rc < 0) {
        last_bus_error_ = rc;
        LOG_ERR("lis3dh: waiting for INT1 failed: " << std::strerror(-rc));
        return LIS3DH_ERR_BUS;
    }
    return lis3dh_read_interrupt_cause(dest);
}
