/**
 * @file service_namespace.cpp
 * @brief Namespace normalization and validation rules.
 */

#include "discovery/service_namespace.hpp"

#include <algorithm>

namespace server_browser {

namespace {

bool is_ascii_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_ascii_alnum(char c) {
    return is_ascii_alpha(c) || (c >= '0' && c <= '9');
}

}  // anonymous namespace

Result<ServiceNamespace> ServiceNamespace::parse(std::string_view raw) {
    std::string name{raw};
    std::replace(name.begin(), name.end(), '_', '-');

    if (name.empty()) {
        return Error{"namespace cannot be empty"};
    }
    if (name.size() > MAX_LENGTH) {
        return Error{"namespace '" + name + "' is longer than "
                     + std::to_string(MAX_LENGTH) + " bytes"};
    }
    if (name.front() == '-') {
        return Error{"namespace '" + name + "' cannot start with hyphen or underscore"};
    }
    if (name.back() == '-') {
        return Error{"namespace '" + name + "' cannot end with hyphen or underscore"};
    }
    if (name.find("--") != std::string::npos) {
        return Error{"namespace '" + name
                     + "' cannot contain double hyphens or double underscores"};
    }
    if (!std::all_of(name.begin(), name.end(),
                     [](char c) { return is_ascii_alnum(c) || c == '-'; })) {
        return Error{"namespace '" + name
                     + "' can only contain a-z, A-Z, 0-9, hyphens and underscores"};
    }
    if (std::none_of(name.begin(), name.end(), is_ascii_alpha)) {
        return Error{"namespace '" + name + "' must contain at least one letter"};
    }

    return ServiceNamespace{std::move(name)};
}

std::string ServiceNamespace::service_type() const {
    return "_" + label_ + "._udp.local.";
}

}  // namespace server_browser
