#include "configs.hpp"
#include <unity.h>
#include <cstdlib>

static const char* const ENV_VARS[] = {
    "LIS3DH_I2C_DEV", "LIS3DH_I2C_ADDR", "LIS3DH_SPI_DEV", "LIS3DH_GPIO_CHIP", "LIS3DH_GPIO_LINE",
};

void setUp(void) {
    for (const char* name : ENV_VARS) {
        unsetenv(name);
    }
}

void tearDown(void) {
    for (const char* name : ENV_VARS) {
        unsetenv(name);
    }
}

void test_defaults_without_environment() {
    lis3dh_env_config_t cfg;
    TEST_ASSERT_EQUAL_INT(0, lis3dh_load_env_config(&cfg));
    TEST_ASSERT_EQUAL_STRING("/dev/i2c-1", cfg.i2c_dev.c_str());
    TEST_ASSERT_EQUAL_HEX8(0x18, cfg.i2c_addr);
    TEST_ASSERT_EQUAL_STRING("/dev/spidev0.0", cfg.spi_dev.c_str());
    TEST_ASSERT_EQUAL_STRING("/dev/gpiochip0", cfg.gpio_chip.c_str());
    TEST_ASSERT_EQUAL_INT(-1, cfg.gpio_line);
}

void test_environment_overrides() {
    setenv("LIS3DH_I2C_DEV", "/dev/i2c-3", 1);
    setenv("LIS3DH_I2C_ADDR", "0x19", 1);
    setenv("LIS3DH_SPI_DEV", "/dev/spidev1.1", 1);
    setenv("LIS3DH_GPIO_CHIP", "/dev/gpiochip4", 1);
    setenv("LIS3DH_GPIO_LINE", "17", 1);

    lis3dh_env_config_t cfg;
    TEST_ASSERT_EQUAL_INT(0, lis3dh_load_env_config(&cfg));
    TEST_ASSERT_EQUAL_STRING("/dev/i2c-3", cfg.i2c_dev.c_str());
    TEST_ASSERT_EQUAL_HEX8(0x19, cfg.i2c_addr);
    TEST_ASSERT_EQUAL_STRING("/dev/spidev1.1", cfg.spi_dev.c_str());
    TEST_ASSERT_EQUAL_STRING("/dev/gpiochip4", cfg.gpio_chip.c_str());
    TEST_ASSERT_EQUAL_INT(17, cfg.gpio_line);
}

void test_decimal_address_accepted() {
    setenv("LIS3DH_I2C_ADDR", "25", 1);
    lis3dh_env_config_t cfg;
    TEST_ASSERT_EQUAL_INT(0, lis3dh_load_env_config(&cfg));
    TEST_ASSERT_EQUAL_HEX8(0x19, cfg.i2c_addr);
}

void test_bad_values_rejected_and_defaults_kept() {
    setenv("LIS3DH_I2C_ADDR", "0x1D", 1);  // a LIS3DSH address
    setenv("LIS3DH_GPIO_LINE", "-3", 1);
    lis3dh_env_config_t cfg;
    TEST_ASSERT_EQUAL_INT(2, lis3dh_load_env_config(&cfg));
    TEST_ASSERT_EQUAL_HEX8(0x18, cfg.i2c_addr);
    TEST_ASSERT_EQUAL_INT(-1, cfg.gpio_line);

    setenv("LIS3DH_I2C_ADDR", "0x18junk", 1);
    setenv("LIS3DH_GPIO_LINE", "", 1);
    TEST_ASSERT_EQUAL_INT(2, lis3dh_load_env_config(&cfg));
}

void test_empty_paths_ignored() {
    setenv("LIS3DH_I2C_DEV", "", 1);
    lis3dh_env_config_t cfg;
    TEST_ASSERT_EQUAL_INT(0, lis3dh_load_env_config(&cfg));
    TEST_ASSERT_EQUAL_STRING("/dev/i2c-1", cfg.i2c_dev.c_str());
}

void test_null_dest() {
    TEST_ASSERT_EQUAL_INT(-1, lis3dh_load_env_config(nullptr));
}

void test_rate_from_hz() {
    const int hz[] = {1, 10, 25, 50, 100, 200, 400};
    const data_rate_e expected[] = {ODR_1HZ, ODR_10HZ, ODR_25HZ, ODR_50HZ, ODR_100HZ, ODR_200HZ, ODR_400HZ};
    for (size_t i = 0; i < 7; i++) {
        data_rate_e rate = ODR_1HZ;
        TEST_ASSERT_EQUAL_INT(LIS3DH_OK, lis3dh_rate_from_hz(hz[i], &rate));
        TEST_ASSERT_EQUAL_INT(expected[i], rate);
    }

    data_rate_e rate = ODR_50HZ;
    TEST_ASSERT_EQUAL_INT(LIS3DH_ERR_INVALID_PARAMETER, lis3dh_rate_from_hz(0, &rate));
    TEST_ASSERT_EQUAL_INT(LIS3DH_ERR_INVALID_PARAMETER, lis3dh_rate_from_hz(1344, &rate));
    TEST_ASSERT_EQUAL_INT(LIS3DH_ERR_INVALID_PARAMETER, lis3dh_rate_from_hz(60, &rate));
    TEST_ASSERT_EQUAL_INT(ODR_50HZ, rate);
    TEST_ASSERT_EQUAL_INT(LIS3DH_ERR_INVALID_PARAMETER, lis3dh_rate_from_hz(100, nullptr));
}

void test_range_from_g() {
    range_e range = RANGE_2G;
    TEST_ASSERT_EQUAL_INT(LIS3DH_OK, lis3dh_range_from_g(16, &range));
    TEST_ASSERT_EQUAL_INT(RANGE_16G, range);
    TEST_ASSERT_EQUAL_INT(LIS3DH_OK, lis3dh_range_from_g(4, &range));
    TEST_ASSERT_EQUAL_INT(RANGE_4G, range);
    TEST_ASSERT_EQUAL_INT(LIS3DH_ERR_INVALID_PARAMETER, lis3dh_range_from_g(6, &range));
    TEST_ASSERT_EQUAL_INT(LIS3DH_ERR_INVALID_PARAMETER, lis3dh_range_from_g(-2, &range));
    TEST_ASSERT_EQUAL_INT(RANGE_4G, range);
}

int main(int, char**) {
    UNITY_BEGIN();

    RUN_TEST(test_defaults_without_environment);
    RUN_TEST(test_environment_overrides);
    RUN_TEST(test_decimal_address_accepted);
    RUN_TEST(test_bad_values_rejected_and_defaults_kept);
    RUN_TEST(test_empty_paths_ignored);
    RUN_TEST(test_null_dest);
    RUN_TEST(test_rate_from_hz);
    RUN_TEST(test_range_from_g);

    return UNITY_END();
}
