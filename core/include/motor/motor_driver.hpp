#pragma once

#include <mutex>

#include <common/config.hpp>
#include <motor/gpio.hpp>

namespace rd {
    enum class Side {
        Left,
        Right
    };

    enum class Direction {
        Forward,
        Backward,
        Stop
    };

    // Two-channel L298N: IN1..IN4 select direction, ENA/ENB carry PWM speed.
    class MotorDriver {
    public:
        MotorDriver(IGpio& gpio, MotorConfig pins);

        MotorDriver(const MotorDriver&) = delete;
        MotorDriver& operator=(const MotorDriver&) = delete;

        // Direction pins low, PWM running at the default speed.
        bool setup();

        bool set_direction(Side side, Direction dir);

        // Rejects values outside 0..100 and keeps the previous one.
        bool set_speed(Side side, int percent);
        bool set_speed_all(int percent);

        int speed(Side side) const;
        // Last speed applied to both motors.
        int speed() const;

        bool forward();
        bool backward();
        bool rotate_clockwise();
        bool rotate_anticlockwise();
        bool stop_all();

        void shutdown();

    private:
        bool stop_all_locked_();
        bool set_direction_locked_(Side side, Direction dir);
        bool apply_speed_locked_(Side side, int percent);

        IGpio& gpio_;
        MotorConfig pins_;

        mutable std::mutex mtx_;
        int left_speed_;
        int right_speed_;
        int speed_;
        bool ready_ = false;
    };
}
