#include <motor/motor_driver.hpp>

#include <iostream>
#include <utility>

namespace rd {
    namespace {
        bool valid_speed(int percent) {
            return percent >= 0 && percent <= 100;
        }
    } // namespace

    MotorDriver::MotorDriver(IGpio& gpio, MotorConfig pins)
        : gpio_(gpio),
          pins_(std::move(pins)),
          left_speed_(pins_.default_speed),
          right_speed_(pins_.default_speed),
          speed_(pins_.default_speed) {}

    bool MotorDriver::setup() {
        std::lock_guard lk(mtx_);
        bool ok = true;
        for (int pin : {pins_.left_forward, pins_.left_backward, pins_.right_forward, pins_.right_backward}) {
            ok = gpio_.setup_output(pin) && ok;
        }
        ok = gpio_.start_pwm(pins_.left_enable, pins_.pwm_hz, left_speed_) && ok;
        ok = gpio_.start_pwm(pins_.right_enable, pins_.pwm_hz, right_speed_) && ok;
        ok = stop_all_locked_() && ok;
        ready_ = ok;
        if (!ok) std::cerr << "[Motor](setup) GPIO initialisation incomplete\n";
        return ok;
    }

    bool MotorDriver::stop_all_locked_() {
        bool ok = true;
        for (int pin : {pins_.left_forward, pins_.left_backward, pins_.right_forward, pins_.right_backward}) {
            ok = gpio_.write(pin, false) && ok;
        }
        return ok;
    }

    bool MotorDriver::set_direction_locked_(Side side, Direction dir) {
        const int fwd = side == Side::Left ? pins_.left_forward : pins_.right_forward;
        const int back = side == Side::Left ? pins_.left_backward : pins_.right_backward;

        // never drive both inputs high
        bool ok = gpio_.write(fwd, false) && gpio_.write(back, false);
        if (dir == Direction::Forward) ok = gpio_.write(fwd, true) && ok;
        if (dir == Direction::Backward) ok = gpio_.write(back, true) && ok;
        return ok;
    }

    bool MotorDriver::apply_speed_locked_(Side side, int percent) {
        const int pin = side == Side::Left ? pins_.left_enable : pins_.right_enable;
        if (!gpio_.set_duty(pin, percent)) return false;
        (side == Side::Left ? left_speed_ : right_speed_) = percent;
        return true;
    }

    bool MotorDriver::set_direction(Side side, Direction dir) {
        std::lock_guard lk(mtx_);
        return set_direction_locked_(side, dir);
    }

    bool MotorDriver::set_speed(Side side, int percent) {
        if (!valid_speed(percent)) return false;
        std::lock_guard lk(mtx_);
        return apply_speed_locked_(side, percent);
    }

    bool MotorDriver::set_speed_all(int percent) {
        if (!valid_speed(percent)) return false;
        std::lock_guard lk(mtx_);
        const int prev_left = left_speed_;
        if (!apply_speed_locked_(Side::Left, percent)) return false;
        if (!apply_speed_locked_(Side::Right, percent)) {
            // both sides or neither
            if (!apply_speed_locked_(Side::Left, prev_left)) {
                std::cerr << "[Motors](set_speed_all) failed to restore left duty " << prev_left << "\n";
            }
            return false;
        }
        speed_ = percent;
        return true;
    }

    int MotorDriver::speed(Side side) const {
        std::lock_guard lk(mtx_);
        return side == Side::Left ? left_speed_ : right_speed_;
    }

    int MotorDriver::speed() const {
        std::lock_guard lk(mtx_);
        return speed_;
    }

    bool MotorDriver::forward() {
        std::lock_guard lk(mtx_);
        return stop_all_locked_()
            && set_direction_locked_(Side::Left, Direction::Forward)
            && set_direction_locked_(Side::Right, Direction::Forward);
    }

    bool MotorDriver::backward() {
        std::lock_guard lk(mtx_);
        return stop_all_locked_()
            && set_direction_locked_(Side::Left, Direction::Backward)
            && set_direction_locked_(Side::Right, Direction::Backward);
    }

    bool MotorDriver::rotate_clockwise() {
        std::lock_guard lk(mtx_);
        return stop_all_locked_()
            && set_direction_locked_(Side::Left, Direction::Forward)
            && set_direction_locked_(Side::Right, Direction::Backward);
    }

    bool MotorDriver::rotate_anticlockwise() {
        std::lock_guard lk(mtx_);
        return stop_all_locked_()
            && set_direction_locked_(Side::Left, Direction::Backward)
            && set_direction_locked_(Side::Right, Direction::Forward);
    }

    bool MotorDriver::stop_all() {
        std::lock_guard lk(mtx_);
        return stop_all_locked_();
    }

    void MotorDriver::shutdown() {
        std::lock_guard lk(mtx_);
        if (!ready_) {
            gpio_.release_all();
            return;
        }
        if (!stop_all_locked_()) std::cerr << "[Motor](shutdown) failed to drive direction pins low\n";
        gpio_.stop_pwm(pins_.left_enable);
        gpio_.stop_pwm(pins_.right_enable);
        gpio_.release_all();
        ready_ = false;
        std::cout << "[Motor] released\n";
    }
}
