#pragma once

#include <chrono>
#include <cstdint>

namespace devauth {
namespace common {

// Wall-clock source for OTP time steps and record timestamps.
// Interface exists so tests can pin time.
class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;

    int64_t now_epoch_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now().time_since_epoch()).count();
    }

    int64_t now_epoch_seconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(now().time_since_epoch()).count();
    }
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override { return std::chrono::system_clock::now(); }
};

}  // namespace common
}  // namespace devauth
