/*
* LIS3DH REGISTER MAP
notes:
- only the registers this driver touches are listed
- multi-byte reads need the auto-increment flag on the sub-address:
  I2C -> bit 7 (0x80), SPI -> bit 6 (0x40) with bit 7 as the read flag
*/

#pragma once
#include <cstdint>

static constexpr uint8_t LIS3DH_WHO_AM_I     = 0x0F;   // read-only, expect 0x33
static constexpr uint8_t LIS3DH_CTRL_REG1    = 0x20;   // ODR[7:4], LPen, Zen Yen Xen
static constexpr uint8_t LIS3DH_CTRL_REG2    = 0x21;   // high-pass filter
static constexpr uint8_t LIS3DH_CTRL_REG3    = 0x22;   // INT1 pin routing
static constexpr uint8_t LIS3DH_CTRL_REG4    = 0x23;   // BDU, BLE, FS[5:4], HR
static constexpr uint8_t LIS3DH_CTRL_REG5    = 0x24;   // BOOT, FIFO_EN, LIR_INT1, D4D_INT1
static constexpr uint8_t LIS3DH_REFERENCE    = 0x26;   // reading resets the HP filter reference
static constexpr uint8_t LIS3DH_STATUS_REG   = 0x27;   // ZYXDA in bit 3
static constexpr uint8_t LIS3DH_OUT_X_L      = 0x28;
static constexpr uint8_t LIS3DH_OUT_Y_L      = 0x2A;
static constexpr uint8_t LIS3DH_OUT_Z_L      = 0x2C;
static constexpr uint8_t LIS3DH_INT1_CFG     = 0x30;
static constexpr uint8_t LIS3DH_INT1_SRC     = 0x31;   // read clears latched interrupt
static constexpr uint8_t LIS3DH_INT1_THS     = 0x32;
static constexpr uint8_t LIS3DH_INT1_DURATION = 0x33;  // in samples at the current ODR

// CTRL_REG1
static constexpr uint8_t CTRL1_XYZ_EN        = 0b0000'0111;
static constexpr uint8_t CTRL1_ODR_SHIFT     = 4;
static constexpr uint8_t CTRL1_POWER_DOWN    = 0x00;

// CTRL_REG2: FDS (filtered data to output) | HPIS1 (filter on interrupt 1)
static constexpr uint8_t CTRL2_HP_IA1        = 0b0000'1001;

// CTRL_REG3: I1_IA1
static constexpr uint8_t CTRL3_I1_IA1        = 0b0100'0000;

// CTRL_REG4
static constexpr uint8_t CTRL4_HR            = 0b0000'1000;
static constexpr uint8_t CTRL4_FS_SHIFT      = 4;

// CTRL_REG5: LIR_INT1
static constexpr uint8_t CTRL5_LIR_INT1      = 0b0000'1000;

// STATUS_REG
static constexpr uint8_t STATUS_ZYXDA        = 0b0000'1000;

// INT1_CFG
static constexpr uint8_t INT1_CFG_AOI        = 0b1000'0000; // AND combination
static constexpr uint8_t INT1_CFG_LOW_XYZ    = 0b0001'0101; // XLIE YLIE ZLIE
static constexpr uint8_t INT1_CFG_WAKE_UP    = 0b0010'1010; // XHIE YHIE ZHIE, OR combination

// INT1_SRC bits
static constexpr uint8_t INT1_SRC_XL         = 1 << 0;
static constexpr uint8_t INT1_SRC_XH         = 1 << 1;
static constexpr uint8_t INT1_SRC_YL         = 1 << 2;
static constexpr uint8_t INT1_SRC_YH         = 1 << 3;
static constexpr uint8_t INT1_SRC_ZL         = 1 << 4;
static constexpr uint8_t INT1_SRC_ZH         = 1 << 5;

// INT1_THS and INT1_DURATION are 7-bit fields
static constexpr uint8_t INT1_FIELD_MAX      = 0x7F;
