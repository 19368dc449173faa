#include "spi_hal.hpp"
#include "logger.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/spi/spidev.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <string_view>

SPIBus::SPIBus(const char* dev, uint32_t speed_hz) : speed_hz_(speed_hz) {
    if (!dev || std::string_view(dev).empty()) {
        LOG_ERR("SPIBus: empty device path");
        return;
    }

    fd_ = ::open(dev, O_RDWR | O_CLOEXEC);
    if (fd_ < 0) {
        LOG_ERR(std::string("SPIBus: open(") + dev + ") failed: " + std::strerror(errno));
        return;
    }

    uint8_t mode = SPI_MODE_3;
    uint8_t bits = 8;
    if (::ioctl(fd_, SPI_IOC_WR_MODE, &mode) < 0
        || ::ioctl(fd_, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0
        || ::ioctl(fd_, SPI_IOC_WR_MAX_SPEED_HZ, &speed_hz_) < 0) {
        LOG_ERR(std::string("SPIBus: configuring ") + dev + " failed: " + std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return;
    }
    LOG_ALWAYS(std::string("SPIBus: opened ") + dev + " fd=" + std::to_string(fd_)
               + " speed=" + std::to_string(speed_hz_));
}

SPIBus::~SPIBus() {
    if (fd_ >= 0) {
        ::close(fd_);
        LOG_DBG("SPIBus: closed fd");
        fd_ = -1;
    }
}

int SPIBus::transfer(const uint8_t* tx, uint8_t* rx, size_t len) noexcept {
    if (!SPIok()) {
        return -ENODEV;
    }
    spi_ioc_transfer xfer{};
    xfer.tx_buf = reinterpret_cast<uintptr_t>(tx);
    xfer.rx_buf = reinterpret_cast<uintptr_t>(rx);
    xfer.len = static_cast<uint32_t>(len);
    xfer.speed_hz = speed_hz_;
    xfer.bits_per_word = 8;

    for (int tries = 0; tries < 3; ++tries) {
        int n = ::ioctl(fd_, SPI_IOC_MESSAGE(1), &xfer);
        if (n == static_cast<int>(len)) return 0;
        if (n < 0 && errno == EINTR) continue;
        return (n < 0) ? -errno : -EIO;
    }
    return -EIO;
}

int SPIBus::write_reg8(uint8_t reg, uint8_t val) noexcept {
    uint8_t tx[2] = {uint8_t(reg & SPI_ADDR_MASK), val};
    return transfer(tx, nullptr, sizeof(tx));
}

int SPIBus::read_reg8(uint8_t reg, uint8_t* dest) noexcept {
    if (dest == nullptr) {
        return -EINVAL;
    }
    uint8_t tx[2] = {uint8_t((reg & SPI_ADDR_MASK) | SPI_READ_FLAG), 0};
    uint8_t rx[2] = {0, 0};
    if (int rc = transfer(tx, rx, sizeof(tx)); rc != 0) {
        return rc;
    }
    *dest = rx[1];
    return 0;
}

int SPIBus::read_s16le(uint8_t reg, int16_t* dest) noexcept {
    if (dest == nullptr) {
        return -EINVAL;
    }
    uint8_t tx[3] = {uint8_t((reg & SPI_ADDR_MASK) | SPI_READ_FLAG | SPI_MULTI_FLAG), 0, 0};
    uint8_t rx[3] = {0, 0, 0};
    if (int rc = transfer(tx, rx, sizeof(tx)); rc != 0) {
        return rc;
    }
    // rx[0] clocked in while the address went out
    *dest = s16_from_le(rx[1], rx[2]);
    return 0;
}
