// File: common/logging/event_log.cpp

#include "common/logging/event_log.hpp"

#include <algorithm>

namespace common::logging {

    std::string_view toString(const EventLevel level) noexcept {
        switch (level) {
            case EventLevel::Info:
                return "info";
            case EventLevel::Warn:
                return "warn";
            case EventLevel::Error:
                return "error";
        }
        return "unknown";
    }

    void EventLog::emit(const EventLevel level, const std::string_view stage, std::string message) {
        switch (level) {
            case EventLevel::Info:
                LOG_INFO("[{}] {}", stage, message);
                break;
            case EventLevel::Warn:
                LOG_WARN("[{}] {}", stage, message);
                break;
            case EventLevel::Error:
                LOG_ERROR("[{}] {}", stage, message);
                break;
        }
        events_.push_back({level, std::string(stage), std::move(message)});
    }

    void EventLog::append(const EventLog &other) {
        events_.insert(events_.end(), other.events_.begin(), other.events_.end());
    }

    std::size_t EventLog::count(const EventLevel level) const noexcept {
        return static_cast<std::size_t>(
                std::ranges::count_if(events_, [level](const Event &event) { return event.level == level; }));
    }

} // namespace common::logging
