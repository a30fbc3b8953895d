/**
 * @file event_log_tap.cpp
 * @brief EventLogTap implementation.
 */

#include "discovery/event_log_tap.hpp"

namespace server_browser {

std::size_t EventLogTap::drain(const DaemonEventStream& stream) {
    if (!stream) return 0;

    auto events = stream->drain();
    for (const auto& event : events) {
        if (logger_) logger_->debug("daemon", describe(event));
    }
    total_ += events.size();
    return events.size();
}

}  // namespace server_browser
