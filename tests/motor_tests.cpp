#include <motor/motor_driver.hpp>

#include "fakes.hpp"

using rd_test::check;

namespace {
    rd::MotorConfig pins() {
        rd::MotorConfig c;
        c.default_speed = 100;
        return c;
    }

    void test_setup_starts_pwm_with_pins_low() {
        rd_test::FakeGpio gpio;
        rd::MotorDriver motors(gpio, pins());
        check(motors.setup(), "setup should succeed on a working GPIO");

        const auto c = pins();
        check(gpio.duty(c.left_enable) == 100, "left PWM should start at the default speed");
        check(gpio.duty(c.right_enable) == 100, "right PWM should start at the default speed");
        for (int pin : {c.left_forward, c.left_backward, c.right_forward, c.right_backward}) {
            check(!gpio.level(pin), "direction pin should start low: " + std::to_string(pin));
        }
    }

    void test_speed_reads_back_across_range() {
        rd_test::FakeGpio gpio;
        rd::MotorDriver motors(gpio, pins());
        motors.setup();

        for (int v : {0, 1, 50, 99, 100}) {
            check(motors.set_speed_all(v), "speed should be accepted: " + std::to_string(v));
            check(motors.speed() == v, "speed should read back: " + std::to_string(v));
            check(gpio.duty(pins().left_enable) == v, "left duty should follow the speed");
            check(gpio.duty(pins().right_enable) == v, "right duty should follow the speed");
        }
    }

    void test_out_of_range_speed_keeps_previous() {
        rd_test::FakeGpio gpio;
        rd::MotorDriver motors(gpio, pins());
        motors.setup();
        motors.set_speed_all(40);

        check(!motors.set_speed_all(150), "150 should be rejected");
        check(!motors.set_speed_all(-1), "-1 should be rejected");
        check(motors.speed() == 40, "rejected speed must leave the previous value");
        check(gpio.duty(pins().left_enable) == 40, "rejected speed must not reach the PWM");

        check(!motors.set_speed(rd::Side::Right, 101), "per-side 101 should be rejected");
        check(motors.speed(rd::Side::Right) == 40, "per-side rejection keeps the previous value");
    }

    void test_per_side_speed() {
        rd_test::FakeGpio gpio;
        rd::MotorDriver motors(gpio, pins());
        motors.setup();

        check(motors.set_speed(rd::Side::Left, 30), "left speed should be accepted");
        check(motors.speed(rd::Side::Left) == 30, "left speed should read back");
        check(motors.speed(rd::Side::Right) == 100, "right speed should be untouched");
        check(gpio.duty(pins().left_enable) == 30, "left duty should follow");
    }

    void test_speed_all_rolls_back_when_one_side_fails() {
        rd_test::FakeGpio gpio;
        rd::MotorDriver motors(gpio, pins());
        motors.setup();
        gpio.stop_pwm(pins().right_enable);

        check(!motors.set_speed_all(30), "speed change should fail when the right PWM is gone");
        check(motors.speed() == 100, "global speed should be unchanged");
        check(motors.speed(rd::Side::Left) == 100, "left speed should be restored");
        check(gpio.duty(pins().left_enable) == 100, "left duty should be restored");
    }

    void test_direction_commands_drive_pins() {
        rd_test::FakeGpio gpio;
        const auto c = pins();
        rd::MotorDriver motors(gpio, c);
        motors.setup();

        check(motors.forward(), "forward should succeed");
        check(gpio.level(c.left_forward) && gpio.level(c.right_forward), "forward raises both forward pins");
        check(!gpio.level(c.left_backward) && !gpio.level(c.right_backward), "forward keeps backward pins low");

        check(motors.backward(), "backward should succeed");
        check(!gpio.level(c.left_forward) && !gpio.level(c.right_forward), "backward drops forward pins");
        check(gpio.level(c.left_backward) && gpio.level(c.right_backward), "backward raises backward pins");

        check(motors.rotate_clockwise(), "clockwise should succeed");
        check(gpio.level(c.left_forward) && gpio.level(c.right_backward), "clockwise: left fwd, right back");
        check(!gpio.level(c.left_backward) && !gpio.level(c.right_forward), "clockwise: other pins low");

        check(motors.rotate_anticlockwise(), "anticlockwise should succeed");
        check(gpio.level(c.left_backward) && gpio.level(c.right_forward), "anticlockwise: left back, right fwd");
        check(!gpio.level(c.left_forward) && !gpio.level(c.right_backward), "anticlockwise: other pins low");

        check(motors.stop_all(), "stop should succeed");
        for (int pin : {c.left_forward, c.left_backward, c.right_forward, c.right_backward}) {
            check(!gpio.level(pin), "stop should drive every direction pin low");
        }
    }

    void test_direction_fails_before_setup() {
        rd_test::FakeGpio gpio;
        rd::MotorDriver motors(gpio, pins());
        check(!motors.forward(), "writes to unconfigured pins should fail");
    }

    void test_shutdown_releases_gpio() {
        rd_test::FakeGpio gpio;
        rd::MotorDriver motors(gpio, pins());
        motors.setup();
        motors.forward();
        motors.shutdown();
        check(gpio.released(), "shutdown should release the GPIO");
        check(gpio.duty(pins().left_enable) == -1, "shutdown should stop PWM");
    }
}

int main() {
    test_setup_starts_pwm_with_pins_low();
    test_speed_reads_back_across_range();
    test_out_of_range_speed_keeps_previous();
    test_per_side_speed();
    test_speed_all_rolls_back_when_one_side_fails();
    test_direction_commands_drive_pins();
    test_direction_fails_before_setup();
    test_shutdown_releases_gpio();
    return rd_test::finish("motor");
}
