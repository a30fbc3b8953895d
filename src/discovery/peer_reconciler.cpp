/**
 * @file peer_reconciler.cpp
 * @brief Upsert/remove logic for discovered servers.
 */

#include "discovery/peer_reconciler.hpp"

#include <type_traits>
#include <utility>

namespace server_browser {

namespace {

constexpr std::string_view COMPONENT = "reconciler";

}  // anonymous namespace

// ─────────────────────────────────────────────
// Metadata Extractors
// ─────────────────────────────────────────────

MetadataExtractor full_metadata() {
    return [](const ServiceDescriptor& info) { return info.properties; };
}

MetadataExtractor name_only(std::string key, std::string fallback) {
    return [key = std::move(key), fallback = std::move(fallback)](const ServiceDescriptor& info) {
        ServerMetadata metadata;
        metadata.set(key, info.properties.get_or(key, fallback));
        return metadata;
    };
}

// ─────────────────────────────────────────────
// PeerReconciler
// ─────────────────────────────────────────────

PeerReconciler::PeerReconciler(MetadataExtractor extractor, MergePolicy policy, Logger* logger)
    : extractor_(extractor ? std::move(extractor) : full_metadata())
    , policy_(policy)
    , logger_(logger) {}

bool PeerReconciler::reconcile(EventQueue<ServiceEvent>& stream) {
    bool changed = false;
    for (const auto& event : stream.drain()) {
        if (logger_ && logger_->enabled(LogLevel::Debug)) {
            logger_->debug(COMPONENT, describe(event));
        }
        changed |= apply(event);
    }
    return changed;
}

bool PeerReconciler::apply(const ServiceEvent& event) {
    if (const auto* resolved = std::get_if<ServiceResolved>(&event)) {
        return on_resolved(resolved->info);
    }
    if (const auto* removed = std::get_if<ServiceRemoved>(&event)) {
        return on_removed(removed->fullname);
    }
    return false;
}

bool PeerReconciler::clear() {
    if (servers_.servers_.empty()) return false;
    servers_.servers_.clear();
    return true;
}

DiscoveredServer PeerReconciler::derive(const ServiceDescriptor& info) const {
    DiscoveredServer server;
    server.hostname = strip_local_suffix(info.hostname);
    server.port = info.port;
    server.addresses = info.addresses;
    server.metadata = extractor_(info);
    return server;
}

bool PeerReconciler::on_resolved(const ServiceDescriptor& info) {
    auto server = derive(info);
    auto fullname = info.fullname();

    auto [it, inserted] = servers_.servers_.try_emplace(fullname, server);
    if (inserted) {
        if (logger_) logger_->info(COMPONENT, "Server discovered: " + fullname);
        return true;
    }

    if (policy_ == MergePolicy::AddressUnion) {
        return merge_union(it->second, std::move(server));
    }

    if (it->second == server) return false;
    it->second = std::move(server);
    return true;
}

bool PeerReconciler::on_removed(const ServiceFullname& fullname) {
    if (servers_.servers_.erase(fullname) == 0) return false;
    if (logger_) logger_->info(COMPONENT, "Server removed: " + fullname);
    return true;
}

bool PeerReconciler::merge_union(DiscoveredServer& stored, DiscoveredServer incoming) {
    bool changed = false;

    for (auto& address : incoming.addresses) {
        changed |= stored.addresses.insert(address).second;
    }
    if (stored.hostname != incoming.hostname) {
        stored.hostname = std::move(incoming.hostname);
        changed = true;
    }
    if (stored.port != incoming.port) {
        stored.port = incoming.port;
        changed = true;
    }
    if (stored.metadata != incoming.metadata) {
        stored.metadata = std::move(incoming.metadata);
        changed = true;
    }
    return changed;
}

}  // namespace server_browser
