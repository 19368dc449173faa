/*
* GPIO INTERRUPT LINE (libgpiod v1)
methods required:
* gpio_irq_line(chip path, line offset, consumer) -> request rising-edge events
* wait_edge(timeout) (irq_line_i)
notes:
- LIS3DH INT1 is push-pull, active high by default (CTRL_REG6 INT_POLARITY = 0)
- with a latched interrupt the pin stays high until INT1_SRC is read, so only the first edge is seen
*/

#pragma once
#include <chrono>
#include "reg_bus.hpp"

struct gpiod_chip;
struct gpiod_line;

class gpio_irq_line : public irq_line_i {
public:
    gpio_irq_line(const char* chip_path, unsigned int offset, const char* consumer = "lis3dh");
    ~gpio_irq_line() override;
    gpio_irq_line(const gpio_irq_line&) = delete;
    gpio_irq_line& operator=(const gpio_irq_line&) = delete;

    bool GPIOok() const noexcept { return line_ != nullptr; }

    int wait_edge(std::chrono::milliseconds timeout) noexcept override;

private:
    gpiod_chip* chip_ = nullptr;
    gpiod_line* line_ = nullptr;
    unsigned int offset_;
};
