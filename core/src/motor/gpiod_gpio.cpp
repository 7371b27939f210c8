#include <motor/gpiod_gpio.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <utility>
#include <vector>

#include <gpiod.h>

namespace rd {
    GpiodGpio::GpiodGpio(std::string chip_path, std::string consumer)
        : chip_path_(std::move(chip_path)),
          consumer_(std::move(consumer)) {}

    GpiodGpio::~GpiodGpio() {
        release_all();
    }

    bool GpiodGpio::open_chip_locked_() {
        if (chip_) return true;
        chip_ = gpiod_chip_open(chip_path_.c_str());
        if (!chip_) {
            std::cerr << "[GPIO](open) " << chip_path_ << ": " << std::strerror(errno) << "\n";
            return false;
        }
        return true;
    }

    bool GpiodGpio::setup_output(int pin) {
        std::lock_guard lk(lines_mtx_);
        if (lines_.count(pin)) return true;
        if (!open_chip_locked_()) return false;

        gpiod_line* line = gpiod_chip_get_line(chip_, static_cast<unsigned int>(pin));
        if (!line) {
            std::cerr << "[GPIO](setup_output) no line " << pin << " on " << chip_path_ << "\n";
            return false;
        }
        if (gpiod_line_request_output(line, consumer_.c_str(), 0) < 0) {
            std::cerr << "[GPIO](setup_output) request line " << pin << ": " << std::strerror(errno) << "\n";
            return false;
        }
        lines_[pin] = line;
        return true;
    }

    bool GpiodGpio::write(int pin, bool high) {
        std::lock_guard lk(lines_mtx_);
        auto it = lines_.find(pin);
        if (it == lines_.end()) return false;
        return gpiod_line_set_value(it->second, high ? 1 : 0) == 0;
    }

    bool GpiodGpio::start_pwm(int pin, int hz, int duty_percent) {
        if (hz <= 0) return false;
        if (!setup_output(pin)) return false;
        {
            std::lock_guard lk(pwm_mtx_);
            pwm_[pin] = PwmChannel{hz, std::clamp(duty_percent, 0, 100)};
        }
        if (!pwm_running_.exchange(true)) {
            pwm_thr_ = std::thread([this] { pwm_loop_(); });
        }
        pwm_cv_.notify_all();
        return true;
    }

    bool GpiodGpio::set_duty(int pin, int duty_percent) {
        std::lock_guard lk(pwm_mtx_);
        auto it = pwm_.find(pin);
        if (it == pwm_.end()) return false;
        it->second.duty = std::clamp(duty_percent, 0, 100);
        return true;
    }

    void GpiodGpio::stop_pwm(int pin) {
        {
            std::lock_guard lk(pwm_mtx_);
            pwm_.erase(pin);
        }
        if (!write(pin, false)) {
            std::cerr << "[GPIO](stop_pwm) failed to drive pin " << pin << " low\n";
        }
    }

    void GpiodGpio::pwm_loop_() {
        using clock = std::chrono::steady_clock;

        while (pwm_running_.load(std::memory_order_relaxed)) {
            std::vector<std::pair<int, PwmChannel>> chans;
            {
                std::unique_lock lk(pwm_mtx_);
                pwm_cv_.wait(lk, [&] { return !pwm_.empty() || !pwm_running_; });
                if (!pwm_running_) break;
                chans.assign(pwm_.begin(), pwm_.end());
            }

            const int hz = chans.front().second.hz;
            const auto period = std::chrono::nanoseconds(1000000000LL / hz);
            const auto start = clock::now();

            for (const auto& c : chans) write(c.first, c.second.duty > 0);

            // drop each channel at its own duty point, shortest first
            std::sort(chans.begin(), chans.end(),
                      [](const auto& a, const auto& b) { return a.second.duty < b.second.duty; });
            for (const auto& c : chans) {
                if (c.second.duty <= 0 || c.second.duty >= 100) continue;
                std::this_thread::sleep_until(start + period * c.second.duty / 100);
                write(c.first, false);
            }
            std::this_thread::sleep_until(start + period);
        }
    }

    void GpiodGpio::stop_pwm_thread_() {
        {
            std::lock_guard lk(pwm_mtx_);
            pwm_running_ = false;
            pwm_.clear();
        }
        pwm_cv_.notify_all();
        if (pwm_thr_.joinable()) pwm_thr_.join();
    }

    void GpiodGpio::release_all() {
        stop_pwm_thread_();

        std::lock_guard lk(lines_mtx_);
        for (const auto& kv : lines_) {
            if (gpiod_line_set_value(kv.second, 0) < 0) {
                std::cerr << "[GPIO](release) failed to drive pin " << kv.first << " low\n";
            }
            gpiod_line_release(kv.second);
        }
        lines_.clear();
        if (chip_) {
            gpiod_chip_close(chip_);
            chip_ = nullptr;
        }
    }
}
