/**
 * @file service_namespace.hpp
 * @brief Validated application identifier used as the DNS-SD service label.
 */

#pragma once

#include "core/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace server_browser {

/**
 * @brief Application namespace shared by servers and clients.
 *
 * Servers and clients only see each other when they were created with the
 * same namespace. A namespace is a legal DNS-SD service label:
 *   - 1 to 15 bytes of a-z, A-Z, 0-9 and '-'
 *   - does not start or end with '-'
 *   - has no "--"
 *   - has at least one letter
 *
 * Underscores in the raw input are rewritten to hyphens first so package
 * names such as "my_game" can be used directly.
 */
class ServiceNamespace {
public:
    static constexpr std::size_t MAX_LENGTH = 15;

    /**
     * @brief Normalize and validate @p raw.
     *
     * The error message names the first rule that was violated. Callers treat
     * an error as fatal configuration: nothing is registered or browsed.
     */
    [[nodiscard]] static Result<ServiceNamespace> parse(std::string_view raw);

    [[nodiscard]] const std::string& label() const noexcept { return label_; }

    /// "_{label}._udp.local."
    [[nodiscard]] std::string service_type() const;

    bool operator==(const ServiceNamespace&) const = default;

private:
    explicit ServiceNamespace(std::string label) : label_(std::move(label)) {}

    std::string label_;
};

}  // namespace server_browser
