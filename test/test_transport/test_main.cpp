#include "i2c_hal.hpp"
#include "spi_hal.hpp"
#include "lis3dh.hpp"
#include "configs.hpp"
#include <unity.h>
#include <cerrno>
#include <chrono>

// No sensor is attached on the test host: these cover the failure paths a
// missing or unreadable device node has to take.
static const char* MISSING_NODE = "/dev/lis3dh-test-does-not-exist";

void setUp(void) {}

void tearDown(void) {}

void test_s16_from_le() {
    TEST_ASSERT_EQUAL_INT16(0, s16_from_le(0x00, 0x00));
    TEST_ASSERT_EQUAL_INT16(16, s16_from_le(0x10, 0x00));
    TEST_ASSERT_EQUAL_INT16(-16, s16_from_le(0xF0, 0xFF));
    TEST_ASSERT_EQUAL_INT16(16384, s16_from_le(0x00, 0x40));
    TEST_ASSERT_EQUAL_INT16(-32768, s16_from_le(0x00, 0x80));
    TEST_ASSERT_EQUAL_INT16(32767, s16_from_le(0xFF, 0x7F));
}

void test_i2c_missing_node() {
    I2CBus bus(MISSING_NODE);
    TEST_ASSERT_FALSE(bus.I2Cok());

    uint8_t v = 0xAA;
    int16_t s = 0;
    uint8_t burst[6] = {};
    TEST_ASSERT_EQUAL_INT(-ENODEV, bus.setSlave(LIS3DH_SLAVE_I2C_ADDRESS));
    TEST_ASSERT_EQUAL_INT(-ENODEV, bus.read_reg8(0x0F, &v));
    TEST_ASSERT_EQUAL_INT(-ENODEV, bus.write_reg8(0x20, 0x57));
    TEST_ASSERT_EQUAL_INT(-ENODEV, bus.read_s16le(0x28, &s));
    TEST_ASSERT_EQUAL_INT(-ENODEV, bus.readBurst(0x28, burst, sizeof(burst)));
    TEST_ASSERT_EQUAL_HEX8(0xAA, v);
}

void test_i2c_empty_path() {
    I2CBus bus("");
    TEST_ASSERT_FALSE(bus.I2Cok());
    I2CBus null_bus(nullptr);
    TEST_ASSERT_FALSE(null_bus.I2Cok());
}

void test_spi_missing_node() {
    SPIBus bus(MISSING_NODE, DEFAULT_SPI_SPEED_HZ);
    TEST_ASSERT_FALSE(bus.SPIok());

    uint8_t v = 0;
    int16_t s = 0;
    TEST_ASSERT_EQUAL_INT(-ENODEV, bus.read_reg8(0x0F, &v));
    TEST_ASSERT_EQUAL_INT(-ENODEV, bus.write_reg8(0x20, 0x57));
    TEST_ASSERT_EQUAL_INT(-ENODEV, bus.read_s16le(0x28, &s));
    TEST_ASSERT_EQUAL_INT(-EINVAL, bus.read_s16le(0x28, nullptr));
}

void test_driver_over_dead_transport_reports_bus_error() {
    I2CBus bus(MISSING_NODE);
    lis3dh_driver drv(bus, [](std::chrono::milliseconds) {});
    TEST_ASSERT_EQUAL_INT(LIS3DH_ERR_BUS, drv.lis3dh_init());
    TEST_ASSERT_EQUAL_INT(-ENODEV, drv.last_bus_error());
    TEST_ASSERT_EQUAL_INT(LIS3DH_UNINITIALIZED, drv.state());
}

int main(int, char**) {
    UNITY_BEGIN();

    RUN_TEST(test_s16_from_le);
    RUN_TEST(test_i2c_missing_node);
    RUN_TEST(test_i2c_empty_path);
    RUN_TEST(test_spi_missing_node);
    RUN_TEST(test_driver_over_dead_transport_reports_bus_error);

    return UNITY_END();
}
