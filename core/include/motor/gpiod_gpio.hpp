#pragma once

#include <motor/gpio.hpp>

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>

struct gpiod_chip;
struct gpiod_line;

namespace rd {
    // libgpiod character-device lines with a software PWM thread for the enable pins.
    class GpiodGpio : public IGpio {
    public:
        explicit GpiodGpio(std::string chip_path = "/dev/gpiochip0",
                           std::string consumer = "roverdeck");
        ~GpiodGpio() override;

        GpiodGpio(const GpiodGpio&) = delete;
        GpiodGpio& operator=(const GpiodGpio&) = delete;

        bool setup_output(int pin) override;
        bool write(int pin, bool high) override;

        bool start_pwm(int pin, int hz, int duty_percent) override;
        bool set_duty(int pin, int duty_percent) override;
        void stop_pwm(int pin) override;

        void release_all() override;

    private:
        struct PwmChannel {
            int hz = 1000;
            int duty = 0;
        };

        bool open_chip_locked_();
        void pwm_loop_();
        void stop_pwm_thread_();

        std::string chip_path_;
        std::string consumer_;

        mutable std::mutex lines_mtx_;
        gpiod_chip* chip_ = nullptr;
        std::map<int, gpiod_line*> lines_; // BCM offset -> requested output line

        std::mutex pwm_mtx_;
        std::condition_variable pwm_cv_;
        std::map<int, PwmChannel> pwm_;
        std::atomic<bool> pwm_running_{false};
        std::thread pwm_thr_;
    };
}
