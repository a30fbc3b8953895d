/**
 * @file server_metadata.hpp
 * @brief String key/value attributes advertised by servers (DNS-SD TXT data).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace server_browser {

/**
 * @brief Ordered string map of server attributes.
 *
 * Used for both directions: what a server advertises (user-facing name,
 * loaded level, player count, ...) and what a client received. Iteration
 * order is by key, so two maps holding the same pairs iterate identically
 * and compare equal no matter how they were built.
 */
class ServerMetadata {
public:
    using Storage = std::map<std::string, std::string, std::less<>>;
    using const_iterator = Storage::const_iterator;

    ServerMetadata() = default;
    ServerMetadata(std::initializer_list<std::pair<const std::string, std::string>> pairs)
        : entries_(pairs) {}

    [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const;

    /// Value for @p key, or @p fallback when it is absent.
    [[nodiscard]] std::string get_or(std::string_view key, std::string_view fallback) const;

    [[nodiscard]] bool contains(std::string_view key) const;

    void set(std::string_view key, std::string_view value);
    void set(std::string_view key, int64_t value);

    /// Returns true when the key was present.
    bool erase(std::string_view key);

    /**
     * @brief Chainable setter:
     * @code
     *   auto metadata = ServerMetadata{}
     *       .with("name", "Test Server")
     *       .with("players", 3);
     * @endcode
     */
    [[nodiscard]] ServerMetadata with(std::string_view key, std::string_view value) &&;
    [[nodiscard]] ServerMetadata with(std::string_view key, int64_t value) &&;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    /// Debug form: {"key": "value", ...}
    [[nodiscard]] std::string to_string() const;

    bool operator==(const ServerMetadata&) const = default;

private:
    Storage entries_;
};

}  // namespace server_browser
