#ifndef DRIVERERROR_H
#define DRIVERERROR_H
#pragma once
#include <stdexcept>
#include <string>

namespace nhireader {

// Carries the vendor code the C ABI returns for this failure.
struct DriverError : public std::runtime_error {
    DriverError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {}
    int code() const { return code_; }
private:
    int code_;
};

} // namespace nhireader
#endif // DRIVERERROR_H
