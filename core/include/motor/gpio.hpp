#pragma once

namespace rd {
    // Output-only digital pins with duty-cycle PWM, BCM numbering.
    class IGpio {
    public:
        virtual ~IGpio() = default;

        virtual bool setup_output(int pin) = 0;
        virtual bool write(int pin, bool high) = 0;

        virtual bool start_pwm(int pin, int hz, int duty_percent) = 0;
        virtual bool set_duty(int pin, int duty_percent) = 0;
        virtual void stop_pwm(int pin) = 0;

        // Stops PWM, drives every pin low and unexports it.
        virtual void release_all() = 0;
    };
}
