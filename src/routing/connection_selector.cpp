#include "routing/connection_selector.hpp"
#include "core/error.hpp"

#include <format>
#include <random>

namespace graphroute {

namespace {

size_t random_index(size_t max_inclusive) {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    std::uniform_int_distribution<size_t> dis(0, max_inclusive);
    return dis(gen);
}

std::optional<size_t> max_index_of(const RoutingTable& table, RoutingRole role) {
    const size_t n = table.count(role);
    if (n == 0) return std::nullopt;
    return n - 1;
}

} // anonymous namespace

std::string connection_alias(RoutingRole role, size_t index) {
    return std::format("{}-{}", routing_role_name(role), index);
}

ConnectionSelector ConnectionSelector::from_table(const RoutingTable& table) {
    return ConnectionSelector(max_index_of(table, RoutingRole::LEADER),
                              max_index_of(table, RoutingRole::FOLLOWER));
}

std::string ConnectionSelector::pick_alias(RoutingRole role) const {
    const auto max = max_index(role);
    if (!max) {
        const std::string name = routing_role_name(role);
        throw NoAvailableRoleError(name,
            std::format("No {} available in the current routing table", name));
    }
    return connection_alias(role, random_index(*max));
}

std::string ConnectionSelector::pick_write_alias() const {
    return pick_alias(RoutingRole::LEADER);
}

std::string ConnectionSelector::pick_read_alias() const {
    return pick_alias(RoutingRole::FOLLOWER);
}

} // namespace graphroute
