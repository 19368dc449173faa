#include "gpio_irq.hpp"
#include "logger.hpp"

#include <gpiod.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <string>

gpio_irq_line::gpio_irq_line(const char* chip_path, unsigned int offset, const char* consumer)
: offset_(offset) {
    chip_ = ::gpiod_chip_open(chip_path);
    if (chip_ == nullptr) {
        LOG_ERR("gpio: open(" << (chip_path ? chip_path : "(null)") << ") failed: " << std::strerror(errno));
        return;
    }

    gpiod_line* line = ::gpiod_chip_get_line(chip_, offset_);
    if (line == nullptr) {
        LOG_ERR("gpio: line " << offset_ << " not found: " << std::strerror(errno));
        ::gpiod_chip_close(chip_);
        chip_ = nullptr;
        return;
    }

    if (::gpiod_line_request_rising_edge_events(line, consumer) < 0) {
        LOG_ERR("gpio: edge request on line " << offset_ << " failed: " << std::strerror(errno));
        ::gpiod_chip_close(chip_);
        chip_ = nullptr;
        return;
    }
    line_ = line;
    LOG_ALWAYS("gpio: watching " << chip_path << " line " << offset_ << " (rising edge)");
}

gpio_irq_line::~gpio_irq_line() {
    if (line_ != nullptr) {
        ::gpiod_line_release(line_);
        line_ = nullptr;
    }
    if (chip_ != nullptr) {
        ::gpiod_chip_close(chip_);
        chip_ = nullptr;
    }
}

int gpio_irq_line::wait_edge(std::chrono::milliseconds timeout) noexcept {
    if (!GPIOok()) {
        return -ENODEV;
    }

    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    timespec ts{};
    ts.tv_sec = static_cast<time_t>(secs.count());
    ts.tv_nsec = static_cast<long>(std::chrono::duration_cast<std::chrono::nanoseconds>(timeout - secs).count());

    while (true) {
        // 1 = event pending, 0 = timeout, -1 = error
        int rc = ::gpiod_line_event_wait(line_, &ts);
        if (rc == 0) {
            return 0;
        }
        if (rc < 0) {
            if (errno == EINTR) continue; // interrupted by signal: try again
            return -errno;
        }

        // drain the event so the next wait blocks again
        gpiod_line_event ev{};
        if (::gpiod_line_event_read(line_, &ev) < 0) {
            return -errno;
        }
        LOG_DBG("gpio: line " << offset_ << " event type=" << ev.event_type);
        return 1;
    }
}
