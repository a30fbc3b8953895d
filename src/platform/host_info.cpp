/**
 * @file host_info.cpp
 * @brief POSIX implementations of host lookups.
 */

#include "platform/host_info.hpp"

#include <climits>
#include <cstring>
#include <unistd.h>

#ifndef HOST_NAME_MAX
#define HOST_NAME_MAX 255
#endif

namespace server_browser {

std::string local_hostname() {
    char buf[HOST_NAME_MAX + 1];
    std::memset(buf, 0, sizeof(buf));
    if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "localhost";
    }
    return std::string(buf);
}

uint32_t process_id() noexcept {
    return static_cast<uint32_t>(::getpid());
}

}  // namespace server_browser
