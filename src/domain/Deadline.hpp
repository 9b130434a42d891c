/**
 * @file Deadline.hpp
 * @brief Absolute deadline of one inbound request.
 */

#pragma once
#include <chrono>
#include <optional>

namespace agentrouter::domain {

/**
 * @class Deadline
 * @brief Wraps an optional steady-clock expiry. An unset deadline never expires.
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    Deadline() = default;
    explicit Deadline(Clock::time_point expiry) : m_expiry(expiry) {}

    static Deadline After(std::chrono::milliseconds budget, Clock::time_point now = Clock::now()) {
        return Deadline(now + budget);
    }

    static Deadline Never() { return Deadline(); }

    bool isSet() const { return m_expiry.has_value(); }

    bool expired(Clock::time_point now = Clock::now()) const {
        return m_expiry && now >= *m_expiry;
    }

    /** @brief Time left, clamped at zero. Only meaningful when isSet(). */
    std::chrono::milliseconds remaining(Clock::time_point now = Clock::now()) const {
        if (!m_expiry || now >= *m_expiry) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(*m_expiry - now);
    }

    /** @brief `budget`, shortened to the time left when a deadline is set. */
    std::chrono::milliseconds cap(std::chrono::milliseconds budget, Clock::time_point now = Clock::now()) const {
        if (!m_expiry) return budget;
        auto left = remaining(now);
        return left < budget ? left : budget;
    }

private:
    std::optional<Clock::time_point> m_expiry;
};

} // namespace agentrouter::domain
