#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace graphroute {

enum class RoutingRole {
    LEADER,
    FOLLOWER
};

[[nodiscard]] const char* routing_role_name(RoutingRole role);

/**
 * @brief Map a discovery role string to a routing role
 *
 * WRITE/LEADER -> LEADER, READ/FOLLOWER -> FOLLOWER. Anything else
 * (ROUTE, read replicas) yields nullopt and is not routed to.
 */
[[nodiscard]] std::optional<RoutingRole> parse_routing_role(std::string_view role);

/**
 * @brief Immutable snapshot of cluster topology
 *
 * Addresses per role plus the absolute instant the snapshot stops being
 * valid. Never mutated; an expired table is replaced wholesale.
 */
class RoutingTable {
public:
    struct ServerEntry {
        std::vector<std::string> addresses;
        std::string role;
    };

    RoutingTable(const std::vector<ServerEntry>& servers, TimePoint expires_at);

    /**
     * @brief Build a table from the first record of a discovery response
     *
     * The record must hold `servers` (array of {addresses, role}) and
     * `ttl` (integer seconds).
     * @param record Discovery record
     * @param now Time the response was received
     */
    [[nodiscard]] static Result<RoutingTable> from_discovery_record(
        const Record& record, TimePoint now);

    [[nodiscard]] const std::vector<std::string>& servers(RoutingRole role) const;

    [[nodiscard]] size_t count(RoutingRole role) const { return servers(role).size(); }

    [[nodiscard]] TimePoint expires_at() const { return expires_at_; }

    [[nodiscard]] bool is_expired(TimePoint now) const { return now >= expires_at_; }

private:
    std::vector<std::string> leaders_;
    std::vector<std::string> followers_;
    TimePoint expires_at_;
};

} // namespace graphroute
