/**
 * @file event_log_tap.hpp
 * @brief Logs daemon monitor events; has no other effect.
 */

#pragma once

#include "core/logger.hpp"
#include "transport/service_daemon.hpp"

#include <cstddef>

namespace server_browser {

class EventLogTap {
public:
    explicit EventLogTap(Logger* logger = nullptr) : logger_(logger) {}

    /**
     * @brief Drain @p stream, writing each event at debug level.
     *
     * A null stream (no monitor open) is skipped.
     * @return number of events drained.
     */
    std::size_t drain(const DaemonEventStream& stream);

    [[nodiscard]] std::size_t total_drained() const noexcept { return total_; }

private:
    Logger* logger_;
    std::size_t total_ = 0;
};

}  // namespace server_browser
