/**
 * @file peer_reconciler.hpp
 * @brief Folds browse events into the deduplicated ServerList.
 *
 * The daemon re-resolves the same service many times while a browse is
 * running, mostly with nothing new in it. PeerReconciler only touches the
 * list when an event actually changes it, and reports a single changed
 * flag for a whole drain so the host can notify consumers once per cycle.
 */

#pragma once

#include "core/logger.hpp"
#include "discovery/server_list.hpp"
#include "transport/service_daemon.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace server_browser {

/**
 * @brief Turns the TXT properties of a resolved service into metadata.
 */
using MetadataExtractor = std::function<ServerMetadata(const ServiceDescriptor&)>;

/// Copy every TXT property.
[[nodiscard]] MetadataExtractor full_metadata();

/// Keep only @p key, substituting @p fallback when the server did not send it.
[[nodiscard]] MetadataExtractor name_only(std::string key = "name",
                                          std::string fallback = "Unknown Server");

/**
 * @brief What happens when a known key is resolved again.
 */
enum class MergePolicy : uint8_t {
    Overwrite,       ///< Replace the stored server if any field differs
    AddressUnion     ///< Add newly reported addresses; keep ones not re-reported
};

[[nodiscard]] constexpr std::string_view to_string(MergePolicy policy) noexcept {
    switch (policy) {
        case MergePolicy::Overwrite:    return "overwrite";
        case MergePolicy::AddressUnion: return "union";
    }
    return "unknown";
}

class PeerReconciler {
public:
    explicit PeerReconciler(MetadataExtractor extractor = full_metadata(),
                            MergePolicy policy = MergePolicy::Overwrite,
                            Logger* logger = nullptr);

    /**
     * @brief Drain everything currently queued in @p stream and apply it in
     *        arrival order. Never blocks.
     * @return true if at least one event changed the list.
     */
    bool reconcile(EventQueue<ServiceEvent>& stream);

    /// Apply a single event. Returns true if the list changed.
    bool apply(const ServiceEvent& event);

    /// Forget every server. Returns true if the list was non-empty.
    bool clear();

    /// Build the list entry for a resolved service.
    [[nodiscard]] DiscoveredServer derive(const ServiceDescriptor& info) const;

    [[nodiscard]] const ServerList& servers() const noexcept { return servers_; }
    [[nodiscard]] MergePolicy policy() const noexcept { return policy_; }

private:
    bool on_resolved(const ServiceDescriptor& info);
    bool on_removed(const ServiceFullname& fullname);
    static bool merge_union(DiscoveredServer& stored, DiscoveredServer incoming);

    MetadataExtractor extractor_;
    MergePolicy policy_;
    Logger* logger_;
    ServerList servers_;
};

}  // namespace server_browser
