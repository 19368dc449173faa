/*
* DRIVER FOR LIS3DH 3-AXIS ACCELEROMETER
methods required:
* lis3dh_init()             -> power-up wait + WHO_AM_I check
* lis3dh_enable(config)     -> rate / range / optional free-fall or wake-up on INT1
* lis3dh_disable()          -> power-down
* lis3dh_read_accel()       -> m/s^2 scaled with the range of the last enable
* lis3dh_read_interrupt_cause() / lis3dh_wait_for_interrupt()
dependencies:
* reg_bus.hpp (any reg_bus_i: I2CBus, SPIBus, a mock)
* lis3dh_codec.hpp
notes:
- one caller context at a time; nothing here locks
- no retries: the first failing transfer is returned as LIS3DH_ERR_BUS, errno kept in last_bus_error()
- a bus failure in the middle of enable leaves the chip partially configured; call enable again
*/

#pragma once
#include <chrono>
#include <cstdint>
#include "reg_bus.hpp"
#include "lis3dh_codec.hpp"
#include "types.hpp"

class lis3dh_driver {
public:
    // bus must outlive the driver
    explicit lis3dh_driver(reg_bus_i& bus, delay_fn_t delay = default_delay);

    // Init: waits out the boot time, checks WHO_AM_I; no register is written if the id doesn't match
    int lis3dh_init();

    // Enable: validates the whole config before the first write, then CTRL_REG1..5, INT1_THS,
    // INT1_DURATION, INT1_CFG, optional REFERENCE read, settle delay
    int lis3dh_enable(const lis3dh_config_t& cfg);
    // Legacy positional form, same path as above
    int lis3dh_enable(data_rate_e rate, range_e range, bool free_fall, bool wake_up,
                      std::chrono::milliseconds free_fall_duration, uint16_t threshold_mg, bool latch_int1);
    int lis3dh_disable();

    // Operations: only valid while enabled
    int lis3dh_read_raw(accel_raw_t* dest);
    int lis3dh_read_accel(accel_sample_t* dest);
    int lis3dh_data_ready(bool* ready);
    // reading INT1_SRC clears a latched interrupt on the chip
    int lis3dh_read_interrupt_cause(int1_cause_t* dest);
    int lis3dh_wait_for_interrupt(irq_line_i& line, std::chrono::milliseconds timeout, int1_cause_t* dest);

    lis3dh_state_e state() const noexcept { return state_; }
    range_e current_range() const noexcept { return current_range_; }
    int last_bus_error() const noexcept { return last_bus_error_; }

private:
    int read_reg(uint8_t reg, uint8_t* dest);
    int write_reg(uint8_t reg, uint8_t val);
    int bus_failed(int rc, const char* what, uint8_t reg);

    reg_bus_i& bus_;
    delay_fn_t delay_;
    lis3dh_state_e state_ = LIS3DH_UNINITIALIZED;
    range_e current_range_ = RANGE_2G;
    int last_bus_error_ = 0;
};
