#pragma once

#include <chrono>
#include <optional>

namespace superbox {

// ---------------------------------------------------------------------------
// Deadline: an optional wall-clock horizon for blocking operations.
//
// Deadline::Never() never expires; persistent sessions use it for relays.
// Single-shot calls create one deadline and pass it through provisioning,
// spawn, handshake and the response read.
// ---------------------------------------------------------------------------
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    static Deadline Never() { return Deadline(std::nullopt); }

    static Deadline After(std::chrono::milliseconds timeout) {
        return Deadline(Clock::now() + timeout);
    }

    [[nodiscard]] bool IsNever() const noexcept { return !at_.has_value(); }

    [[nodiscard]] bool Expired() const {
        return at_.has_value() && Clock::now() >= *at_;
    }

    // Remaining time, clamped at zero. Returns `cap` for Never().
    [[nodiscard]] std::chrono::milliseconds Remaining(
        std::chrono::milliseconds cap = std::chrono::hours(24)) const {
        if (!at_.has_value()) {
            return cap;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*at_ - Clock::now());
        if (left.count() < 0) {
            return std::chrono::milliseconds{0};
        }
        return left < cap ? left : cap;
    }

    // Timeout argument for poll(2): -1 blocks indefinitely.
    [[nodiscard]] int PollTimeoutMs() const {
        if (!at_.has_value()) {
            return -1;
        }
        return static_cast<int>(Remaining(std::chrono::milliseconds{60000}).count());
    }

    // The earlier of this deadline and now + timeout.
    [[nodiscard]] Deadline Cap(std::chrono::milliseconds timeout) const {
        auto capped = Clock::now() + timeout;
        if (at_.has_value() && *at_ < capped) {
            return *this;
        }
        return Deadline(capped);
    }

private:
    explicit Deadline(std::optional<Clock::time_point> at) : at_(at) {}

    std::optional<Clock::time_point> at_;
};

} // namespace superbox
