#pragma once

#include "core/types.hpp"
#include "routing/connection_selector.hpp"
#include "routing/routing_table.hpp"
#include "routing/url_rebuilder.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace graphroute {

class IClient;
class IClientFactory;
class ISession;

/**
 * @brief Table, pool and selector derived from one discovery response
 *
 * Published as a unit; holders keep a consistent view even after a newer
 * snapshot replaces it.
 */
struct RoutingSnapshot {
    RoutingTable table;
    std::shared_ptr<IClient> client;
    ConnectionSelector selector;
};

enum class TopologyState {
    UNINITIALIZED,
    READY,
    STALE_REFRESH_FAILED    // last refresh failed, older snapshot still held
};

/**
 * @brief Owns the cached routing table and the connection pool built from it
 *
 * The table is fetched lazily through a reference session and refreshed once
 * it expires. A refresh builds the new table and pool off to the side and
 * publishes both in one step, so no caller can see a table without its pool.
 *
 * Thread-safe: refresh_mutex_ serialises check -> discover -> publish;
 * snapshot_mutex_ (shared) guards the published pointer.
 */
class TopologyManager {
public:
    using Clock = std::function<TimePoint()>;

    static constexpr const char* kDiscoveryQuery =
        "CALL dbms.routing.getRoutingTable($context, $database)";

    /**
     * @param reference_session Non-routed session used only for discovery
     * @param client_factory Builds the aliased pool after each discovery
     * @param config Settings for pool connections (auto-routing is forced off)
     * @param base_url Seed URL whose scheme/credentials discovered nodes inherit
     * @param clock Time source for expiry checks
     */
    TopologyManager(std::shared_ptr<ISession> reference_session,
                    std::shared_ptr<IClientFactory> client_factory,
                    ConnectionConfig config,
                    UrlComponents base_url,
                    Clock clock = nullptr);

    /**
     * @brief Return an unexpired snapshot, refreshing first if needed
     * @throws RoutingDiscoveryError if a required refresh fails; the
     *         previously published snapshot is left untouched
     */
    [[nodiscard]] std::shared_ptr<const RoutingSnapshot> ensure_fresh();

    /// Currently published snapshot (may be expired), nullptr before first refresh
    [[nodiscard]] std::shared_ptr<const RoutingSnapshot> snapshot() const;

    [[nodiscard]] TopologyState state() const;

    struct Stats {
        uint64_t refreshes;
        uint64_t failed_refreshes;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] std::shared_ptr<const RoutingSnapshot> refresh(TimePoint now);
    [[nodiscard]] RoutingTable discover(TimePoint now);
    [[nodiscard]] std::shared_ptr<IClient> build_client(const RoutingTable& table);

    std::shared_ptr<ISession> reference_session_;
    std::shared_ptr<IClientFactory> client_factory_;
    ConnectionConfig config_;
    UrlRebuilder url_rebuilder_;
    Clock clock_;

    std::shared_ptr<const RoutingSnapshot> snapshot_;
    mutable std::shared_mutex snapshot_mutex_;
    std::mutex refresh_mutex_;

    std::atomic<bool> last_refresh_failed_{false};
    std::atomic<uint64_t> refreshes_{0};
    std::atomic<uint64_t> failed_refreshes_{0};
};

} // namespace graphroute
