#pragma once
#include <stdexcept>
#include <string>

namespace colprof {

// Whole-run failure: nothing (or nothing valid) to profile. No partial result
// is returned when this is thrown.
struct input_error : std::runtime_error {
    explicit input_error(const std::string& what) : std::runtime_error(what) {}
};

// Rejected option value.
struct config_error : std::invalid_argument {
    explicit config_error(const std::string& what) : std::invalid_argument(what) {}
};

}
