#include "configs.hpp"
#include "logger.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace {

// strtol with full-string check; accepts decimal or 0x-prefixed hex
bool parse_int(const char* text, long* dest) {
    if (!text || !*text) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(text, &end, 0);
    if (errno != 0 || end == text || *end != '\0') {
        return false;
    }
    *dest = v;
    return true;
}

} // namespace

int lis3dh_load_env_config(lis3dh_env_config_t* dest) {
    if (dest == nullptr) {
        return -1;
    }
    int rejected = 0;

    if (const char* v = std::getenv("LIS3DH_I2C_DEV"); v && *v) {
        dest->i2c_dev = v;
    }
    if (const char* v = std::getenv("LIS3DH_SPI_DEV"); v && *v) {
        dest->spi_dev = v;
    }
    if (const char* v = std::getenv("LIS3DH_GPIO_CHIP"); v && *v) {
        dest->gpio_chip = v;
    }

    if (const char* v = std::getenv("LIS3DH_I2C_ADDR")) {
        long addr = 0;
        if (parse_int(v, &addr) && (addr == LIS3DH_SLAVE_I2C_ADDRESS || addr == LIS3DH_SLAVE_I2C_ADDRESS_ALT)) {
            dest->i2c_addr = static_cast<uint8_t>(addr);
        } else {
            LOG_ERR("config: LIS3DH_I2C_ADDR=" << v << " invalid; must be 0x18 or 0x19");
            rejected++;
        }
    }

    if (const char* v = std::getenv("LIS3DH_GPIO_LINE")) {
        long line = 0;
        if (parse_int(v, &line) && line >= 0 && line <= INT_MAX) {
            dest->gpio_line = static_cast<int>(line);
        } else {
            LOG_ERR("config: LIS3DH_GPIO_LINE=" << v << " invalid; must be a line offset >= 0");
            rejected++;
        }
    }

    LOG_DBG("config: i2c=" << dest->i2c_dev << " addr=0x" << std::hex << int(dest->i2c_addr) << std::dec
            << " spi=" << dest->spi_dev << " gpio=" << dest->gpio_chip << ":" << dest->gpio_line);
    return rejected;
}

int lis3dh_rate_from_hz(int hz, data_rate_e* dest) {
    if (dest == nullptr) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    switch (hz) {
        case 1:   *dest = ODR_1HZ;   return LIS3DH_OK;
        case 10:  *dest = ODR_10HZ;  return LIS3DH_OK;
        case 25:  *dest = ODR_25HZ;  return LIS3DH_OK;
        case 50:  *dest = ODR_50HZ;  return LIS3DH_OK;
        case 100: *dest = ODR_100HZ; return LIS3DH_OK;
        case 200: *dest = ODR_200HZ; return LIS3DH_OK;
        case 400: *dest = ODR_400HZ; return LIS3DH_OK;
        default:  return LIS3DH_ERR_INVALID_PARAMETER;
    }
}

int lis3dh_range_from_g(int g, range_e* dest) {
    if (dest == nullptr) {
        return LIS3DH_ERR_INVALID_PARAMETER;
    }
    switch (g) {
        case 2:  *dest = RANGE_2G;  return LIS3DH_OK;
        case 4:  *dest = RANGE_4G;  return LIS3DH_OK;
        case 8:  *dest = RANGE_8G;  return LIS3DH_OK;
        case 16: *dest = RANGE_16G; return LIS3DH_OK;
        default: return LIS3DH_ERR_INVALID_PARAMETER;
    }
}
