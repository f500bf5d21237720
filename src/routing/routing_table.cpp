#include "routing/routing_table.hpp"

#include <cstdint>
#include <format>
#include <limits>

namespace graphroute {

// Discovery record keys
static constexpr const char* kServers   = "servers";
static constexpr const char* kTtl       = "ttl";
static constexpr const char* kAddresses = "addresses";
static constexpr const char* kRole      = "role";

namespace {

// now + ttl seconds, saturating at TimePoint::max(); ttl <= 0 expires immediately
TimePoint expiry_after(TimePoint now, int64_t ttl_seconds) {
    if (ttl_seconds <= 0) return now;
    const auto headroom =
        std::chrono::duration_cast<std::chrono::seconds>(TimePoint::max() - now).count();
    if (ttl_seconds > headroom) return TimePoint::max();
    return now + std::chrono::seconds(ttl_seconds);
}

} // anonymous namespace

const char* routing_role_name(RoutingRole role) {
    switch (role) {
        case RoutingRole::LEADER:   return "leader";
        case RoutingRole::FOLLOWER: return "follower";
    }
    return "unknown";
}

std::optional<RoutingRole> parse_routing_role(std::string_view role) {
    if (role == "WRITE" || role == "LEADER") return RoutingRole::LEADER;
    if (role == "READ" || role == "FOLLOWER") return RoutingRole::FOLLOWER;
    return std::nullopt;
}

RoutingTable::RoutingTable(const std::vector<ServerEntry>& servers, TimePoint expires_at)
    : expires_at_(expires_at) {
    for (const auto& entry : servers) {
        const auto role = parse_routing_role(entry.role);
        if (!role) continue;

        auto& target = (*role == RoutingRole::LEADER) ? leaders_ : followers_;
        target.insert(target.end(), entry.addresses.begin(), entry.addresses.end());
    }
}

const std::vector<std::string>& RoutingTable::servers(RoutingRole role) const {
    return role == RoutingRole::LEADER ? leaders_ : followers_;
}

Result<RoutingTable> RoutingTable::from_discovery_record(const Record& record, TimePoint now) {
    if (!record.is_object()) {
        return Result<RoutingTable>::error(ErrorCategory::DISCOVERY_ERROR,
            "discovery record is not an object");
    }

    const auto servers_it = record.find(kServers);
    if (servers_it == record.end() || !servers_it->is_array()) {
        return Result<RoutingTable>::error(ErrorCategory::DISCOVERY_ERROR,
            std::format("discovery record is missing array field '{}'", kServers));
    }

    const auto ttl_it = record.find(kTtl);
    if (ttl_it == record.end() || !ttl_it->is_number_integer()) {
        return Result<RoutingTable>::error(ErrorCategory::DISCOVERY_ERROR,
            std::format("discovery record is missing integer field '{}'", kTtl));
    }
    if (ttl_it->is_number_unsigned()
        && ttl_it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return Result<RoutingTable>::error(ErrorCategory::DISCOVERY_ERROR,
            std::format("discovery record field '{}' is out of range", kTtl));
    }
    const auto ttl = ttl_it->get<int64_t>();

    std::vector<ServerEntry> entries;
    entries.reserve(servers_it->size());

    for (size_t i = 0; i < servers_it->size(); ++i) {
        const auto& server = (*servers_it)[i];
        const auto role_it = server.is_object() ? server.find(kRole) : server.end();
        const auto addr_it = server.is_object() ? server.find(kAddresses) : server.end();

        if (!server.is_object() || role_it == server.end() || !role_it->is_string()
            || addr_it == server.end() || !addr_it->is_array()) {
            return Result<RoutingTable>::error(ErrorCategory::DISCOVERY_ERROR,
                std::format("servers[{}] must hold '{}' (string) and '{}' (array)",
                    i, kRole, kAddresses));
        }

        ServerEntry entry;
        entry.role = role_it->get<std::string>();
        entry.addresses.reserve(addr_it->size());
        for (const auto& address : *addr_it) {
            if (!address.is_string()) {
                return Result<RoutingTable>::error(ErrorCategory::DISCOVERY_ERROR,
                    std::format("servers[{}].{} must contain only strings", i, kAddresses));
            }
            entry.addresses.push_back(address.get<std::string>());
        }
        entries.push_back(std::move(entry));
    }

    return Result<RoutingTable>::ok(RoutingTable(entries, expiry_after(now, ttl)));
}

} // namespace graphroute
