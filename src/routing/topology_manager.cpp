#include "routing/topology_manager.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "session/iclient.hpp"
#include "session/iclient_factory.hpp"
#include "session/isession.hpp"

#include <format>
#include <stdexcept>

namespace graphroute {

TopologyManager::TopologyManager(std::shared_ptr<ISession> reference_session,
                                 std::shared_ptr<IClientFactory> client_factory,
                                 ConnectionConfig config,
                                 UrlComponents base_url,
                                 Clock clock)
    : reference_session_(std::move(reference_session)),
      client_factory_(std::move(client_factory)),
      config_(std::move(config)),
      url_rebuilder_(std::move(base_url)),
      clock_(clock ? std::move(clock) : Clock(utils::now)) {
    if (!reference_session_) {
        throw std::invalid_argument("TopologyManager requires a reference session");
    }
    if (!client_factory_) {
        throw std::invalid_argument("TopologyManager requires a client factory");
    }
}

std::shared_ptr<const RoutingSnapshot> TopologyManager::ensure_fresh() {
    // Fast path: shared lock, no refresh needed
    {
        std::shared_lock lock(snapshot_mutex_);
        if (snapshot_ && !snapshot_->table.is_expired(clock_())) {
            return snapshot_;
        }
    }

    // Slow path: one refresher at a time
    std::lock_guard refresh_lock(refresh_mutex_);
    const TimePoint now = clock_();

    // Double-check: another caller may have refreshed while we waited
    {
        std::shared_lock lock(snapshot_mutex_);
        if (snapshot_ && !snapshot_->table.is_expired(now)) {
            return snapshot_;
        }
    }

    auto fresh = refresh(now);
    {
        std::unique_lock lock(snapshot_mutex_);
        snapshot_ = fresh;
    }
    return fresh;
}

std::shared_ptr<const RoutingSnapshot> TopologyManager::snapshot() const {
    std::shared_lock lock(snapshot_mutex_);
    return snapshot_;
}

TopologyState TopologyManager::state() const {
    std::shared_lock lock(snapshot_mutex_);
    if (!snapshot_) return TopologyState::UNINITIALIZED;
    return last_refresh_failed_.load(std::memory_order_relaxed)
        ? TopologyState::STALE_REFRESH_FAILED
        : TopologyState::READY;
}

TopologyManager::Stats TopologyManager::get_stats() const {
    return {
        .refreshes = refreshes_.load(std::memory_order_relaxed),
        .failed_refreshes = failed_refreshes_.load(std::memory_order_relaxed),
    };
}

std::shared_ptr<const RoutingSnapshot> TopologyManager::refresh(TimePoint now) {
    utils::Timer timer;
    try {
        auto table = discover(now);
        auto client = build_client(table);
        auto selector = ConnectionSelector::from_table(table);

        auto fresh = std::make_shared<const RoutingSnapshot>(RoutingSnapshot{
            .table = std::move(table),
            .client = std::move(client),
            .selector = selector,
        });

        refreshes_.fetch_add(1, std::memory_order_relaxed);
        last_refresh_failed_.store(false, std::memory_order_relaxed);

        utils::log::info(std::format(
            "Routing table refreshed for database '{}': {} leader(s), {} follower(s), ttl {}s",
            config_.database,
            fresh->table.count(RoutingRole::LEADER),
            fresh->table.count(RoutingRole::FOLLOWER),
            std::chrono::duration_cast<std::chrono::seconds>(
                fresh->table.expires_at() - now).count()));
        utils::log::debug(std::format("Routing refresh took {}ms", timer.elapsed_ms().count()));
        return fresh;
    } catch (const RoutingDiscoveryError& e) {
        failed_refreshes_.fetch_add(1, std::memory_order_relaxed);
        last_refresh_failed_.store(true, std::memory_order_relaxed);
        utils::log::warn(std::format("Routing table refresh failed: {}", e.what()));
        throw;
    }
}

RoutingTable TopologyManager::discover(TimePoint now) {
    const Statement discovery(kDiscoveryQuery, {
        {"context", Parameters::object()},
        {"database", config_.database},
    });

    ResultSet response;
    try {
        response = reference_session_->run({discovery});
    } catch (const std::exception& e) {
        throw RoutingDiscoveryError(std::format("Discovery query failed: {}", e.what()));
    }

    if (response.empty() || response.front().empty()) {
        throw RoutingDiscoveryError("Discovery query returned no records");
    }

    auto table = RoutingTable::from_discovery_record(response.front().front(), now);
    if (table.is_error()) {
        throw RoutingDiscoveryError(
            std::format("Malformed discovery response: {}", table.error_message()));
    }
    return std::move(table.value());
}

std::shared_ptr<IClient> TopologyManager::build_client(const RoutingTable& table) {
    // Pool members are leaf connections: routing them again would recurse
    const ConnectionConfig leaf_config = config_.with_auto_routing(false);

    std::vector<ConnectionSpec> specs;
    specs.reserve(table.count(RoutingRole::LEADER) + table.count(RoutingRole::FOLLOWER));

    for (const auto role : {RoutingRole::LEADER, RoutingRole::FOLLOWER}) {
        const auto& servers = table.servers(role);
        for (size_t i = 0; i < servers.size(); ++i) {
            auto url = url_rebuilder_.rebuild(servers[i]);
            if (!url) {
                throw RoutingDiscoveryError(
                    std::format("Discovered address '{}' is not a valid address", servers[i]));
            }
            utils::log::debug(std::format("Registering {} -> {}", connection_alias(role, i), servers[i]));
            specs.push_back({connection_alias(role, i), std::move(*url), leaf_config});
        }
    }

    std::shared_ptr<IClient> client;
    try {
        client = client_factory_->build(specs);
    } catch (const std::exception& e) {
        throw RoutingDiscoveryError(std::format("Failed to build connection pool: {}", e.what()));
    }
    if (!client) {
        throw RoutingDiscoveryError("Client factory returned no client");
    }
    return client;
}

} // namespace graphroute
