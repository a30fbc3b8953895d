/**
 * @file server_metadata.cpp
 * @brief ServerMetadata implementation.
 */

#include "discovery/server_metadata.hpp"

namespace server_browser {

std::optional<std::string_view> ServerMetadata::get(std::string_view key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return std::string_view{it->second};
}

std::string ServerMetadata::get_or(std::string_view key, std::string_view fallback) const {
    auto value = get(key);
    return std::string{value ? *value : fallback};
}

bool ServerMetadata::contains(std::string_view key) const {
    return entries_.find(key) != entries_.end();
}

void ServerMetadata::set(std::string_view key, std::string_view value) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second = std::string{value};
    } else {
        entries_.emplace(std::string{key}, std::string{value});
    }
}

void ServerMetadata::set(std::string_view key, int64_t value) {
    set(key, std::to_string(value));
}

bool ServerMetadata::erase(std::string_view key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

ServerMetadata ServerMetadata::with(std::string_view key, std::string_view value) && {
    set(key, value);
    return std::move(*this);
}

ServerMetadata ServerMetadata::with(std::string_view key, int64_t value) && {
    set(key, value);
    return std::move(*this);
}

std::string ServerMetadata::to_string() const {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : entries_) {
        if (!first) out += ", ";
        first = false;
        out += '"';
        out += key;
        out += "\": \"";
        out += value;
        out += '"';
    }
    out += '}';
    return out;
}

}  // namespace server_browser
