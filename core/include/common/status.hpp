#pragma once

#include <string>
#include <utility>

namespace rd {
    enum class Failure {
        None,
        NotFound,     // missing source file
        Invalid,      // rejected input
        Unavailable   // resource could not be opened or stopped in time
    };

    // Outcome of a command handed to a worker or driver.
    struct CommandStatus {
        bool ok = false;
        std::string message;
        Failure failure = Failure::None;

        static CommandStatus success(std::string msg) { return {true, std::move(msg), Failure::None}; }
        static CommandStatus failure_of(Failure f, std::string msg) { return {false, std::move(msg), f}; }
    };
}
