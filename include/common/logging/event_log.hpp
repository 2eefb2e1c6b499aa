// File: common/logging/event_log.hpp

#ifndef EVENT_LOG_HPP
#define EVENT_LOG_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "common/logging/logger.hpp"

namespace common::logging {

    enum class EventLevel { Info, Warn, Error };

    struct Event {
        EventLevel level;
        std::string stage;
        std::string message;
    };

    std::string_view toString(EventLevel level) noexcept;

    // Leveled events collected by a stage and handed back with its result. Every event is mirrored to the logger.
    class EventLog {
    public:
        EventLog() = default;

        template<typename... Args>
        void info(std::string_view stage, fmt::format_string<Args...> format, Args &&...args) {
            emit(EventLevel::Info, stage, fmt::format(format, std::forward<Args>(args)...));
        }

        template<typename... Args>
        void warn(std::string_view stage, fmt::format_string<Args...> format, Args &&...args) {
            emit(EventLevel::Warn, stage, fmt::format(format, std::forward<Args>(args)...));
        }

        template<typename... Args>
        void error(std::string_view stage, fmt::format_string<Args...> format, Args &&...args) {
            emit(EventLevel::Error, stage, fmt::format(format, std::forward<Args>(args)...));
        }

        void emit(EventLevel level, std::string_view stage, std::string message);

        // Appends another log, preserving order. Events are not re-logged.
        void append(const EventLog &other);

        [[nodiscard]] const std::vector<Event> &events() const noexcept { return events_; }
        [[nodiscard]] std::size_t count(EventLevel level) const noexcept;
        [[nodiscard]] bool empty() const noexcept { return events_.empty(); }

    private:
        std::vector<Event> events_;
    };

} // namespace common::logging

#endif // EVENT_LOG_HPP
