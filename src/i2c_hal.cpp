#include "i2c_hal.hpp"
#include "logger.hpp"

#include <cerrno>      // errno
#include <cstring>     // strerror
#include <string>
#include <string_view>

I2CBus::I2CBus(const char* dev) {
    if(!dev || std::string_view(dev).empty()){
        LOG_ERR("I2CBus: empty device path");
        fd_ = -1;
        return;
    }

    // try to open fd_ (handle for I2C device file on linux, most likely /dev/i2c-1)
    fd_ = ::open(dev, O_RDWR | O_CLOEXEC);
    if (fd_ < 0) {
        LOG_ERR(std::string("I2CBus: open(") + dev + ") failed: " + std::strerror(errno));
    } else {
        LOG_ALWAYS(std::string("I2CBus: opened ") + dev + " fd=" + std::to_string(fd_));
    }
}

I2CBus::~I2CBus() {
    if(fd_ >= 0){
        ::close(fd_);
        LOG_DBG("I2CBus: closed fd");
        fd_ = -1;
    }
}

bool I2CBus::I2Cok() const noexcept {
    return fd_ >= 0;
}

int I2CBus::setSlave(uint8_t addr) noexcept {
    if(!I2Cok()) {
        return -ENODEV;
    }

    // ioctl tells linux kernel which SLAVE ADDRESS (addr) on that bus you want to talk to
    if (::ioctl(fd_, I2C_SLAVE, addr) == 0) {
        return 0;
    }
    return -errno;
}

int I2CBus::writeAll(const uint8_t* buf, size_t len) noexcept {
    for (int tries = 0; tries < 3; ++tries) {
        // ssize_t allows negative numbers to indicate failures
        ssize_t n = ::write(fd_, buf, len);
        if (n == static_cast<ssize_t>(len)) return 0;               // success
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue; // retry
        // Short write or other error
        return (n < 0) ? -errno : -EIO;
    }
    return -EIO; // too many retries
}

int I2CBus::readAll(uint8_t* dest, size_t len) noexcept {
    for (int tries = 0; tries < 3; ++tries) {
        ssize_t n = ::read(fd_, dest, len);
        if (n == static_cast<ssize_t>(len)) return 0;
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
        return (n < 0) ? -errno : -EIO;
    }
    return -EIO;
}

int I2CBus::write_reg8(uint8_t reg, uint8_t val) noexcept {
    if(!I2Cok()){
        return -ENODEV;
    }
    // payload = 2 bytes [reg, val]
    uint8_t buf[2] = {reg, val};
    return writeAll(buf, sizeof(buf));
}

int I2CBus::read_reg8(uint8_t reg, uint8_t* dest) noexcept {
    if (!I2Cok() || dest == nullptr) {
        return -ENODEV;
    }
    // Step 1: write the register address (pointer set)
    if (int rc = writeAll(&reg, 1); rc != 0) {
        return rc;
    }
    // Step 2: read one byte from that register
    return readAll(dest, 1);
}

int I2CBus::readBurst(uint8_t startReg, uint8_t* dest, size_t len) noexcept {
    if (!I2Cok() || dest == nullptr || len == 0) {
        return -ENODEV;
    }
    uint8_t sub = (len > 1) ? uint8_t(startReg | I2C_AUTO_INCREMENT) : startReg;
    if (int rc = writeAll(&sub, 1); rc != 0) {
        return rc;
    }
    return readAll(dest, len);
}

int I2CBus::read_s16le(uint8_t reg, int16_t* dest) noexcept {
    if (dest == nullptr) {
        return -EINVAL;
    }
    uint8_t raw[2] = {0, 0};
    if (int rc = readBurst(reg, raw, sizeof(raw)); rc != 0) {
        return rc;
    }
    *dest = s16_from_le(raw[0], raw[1]);
    return 0;
}
