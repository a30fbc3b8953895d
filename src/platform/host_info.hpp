/**
 * @file host_info.hpp
 * @brief Local hostname and process id lookups.
 */

#pragma once

#include <cstdint>
#include <string>

namespace server_browser {

/// gethostname(2), or "localhost" if it fails.
[[nodiscard]] std::string local_hostname();

[[nodiscard]] uint32_t process_id() noexcept;

}  // namespace server_browser
