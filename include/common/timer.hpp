// File: common/timer.hpp

#ifndef TIMER_HPP
#define TIMER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "common/logging/logger.hpp"

/* Destroys itself without requiring a manual call to stop() - via the destructor. */
class Timer {
public:
    explicit Timer(std::string name) :
        name_(std::move(name)), start_time_(std::chrono::steady_clock::now()), stopped_(false) {
        LOG_DEBUG("Started timer for [{}].", name_);
    }

    ~Timer() {
        if (!stopped_) {
            stop();
        }
    }

    // Stop the timer and log the duration, returns the elapsed microseconds
    std::int64_t stop() noexcept {
        const auto duration = elapsed();
        if (!stopped_.exchange(true)) {
            LOG_INFO("Execution time of {}: {} ({} µs).", name_, toHumanReadable(duration), duration);
        }
        return duration;
    }

    [[nodiscard]] std::int64_t elapsed() const noexcept {
        return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_time_)
                .count();
    }

    Timer(Timer &&other) noexcept :
        name_(std::move(other.name_)), start_time_(other.start_time_), stopped_(other.stopped_.exchange(true)) {}

    Timer &operator=(Timer &&other) noexcept {
        if (this != &other) {
            if (!stopped_) {
                stop();
            }
            name_ = std::move(other.name_);
            start_time_ = other.start_time_;
            stopped_ = other.stopped_.exchange(true);
        }
        return *this;
    }

    Timer(const Timer &) = delete;
    Timer &operator=(const Timer &) = delete;

private:
    std::string name_;
    std::chrono::steady_clock::time_point start_time_;
    std::atomic<bool> stopped_;

    static std::string toHumanReadable(const std::int64_t micros) {
        using namespace std::chrono;

        auto duration = microseconds(micros);
        const auto h = duration_cast<hours>(duration);
        duration -= h;
        const auto m = duration_cast<minutes>(duration);
        duration -= m;
        const auto s = duration_cast<seconds>(duration);
        duration -= s;
        const auto ms = duration_cast<milliseconds>(duration);
        duration -= ms;

        return fmt::format("{}{}{}{}{}µs", h.count() > 0 ? fmt::format("{}h ", h.count()) : "",
                           m.count() > 0 || h.count() > 0 ? fmt::format("{}m ", m.count()) : "",
                           s.count() > 0 || m.count() > 0 || h.count() > 0 ? fmt::format("{}s ", s.count()) : "",
                           ms.count() > 0 || s.count() > 0 || m.count() > 0 || h.count() > 0
                                   ? fmt::format("{}ms ", ms.count())
                                   : "",
                           duration.count());
    }
};

#endif // TIMER_HPP
