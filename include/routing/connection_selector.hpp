#pragma once

#include "routing/routing_table.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace graphroute {

/**
 * @brief Alias under which the i-th server of a role is registered
 * @return "leader-{i}" or "follower-{i}"
 */
[[nodiscard]] std::string connection_alias(RoutingRole role, size_t index);

/**
 * @brief Picks a connection alias uniformly at random within a role
 *
 * Holds only the highest valid index per role, so it is immutable once
 * built and safe to share between threads. A role absent from the last
 * discovery has no index and cannot be selected.
 */
class ConnectionSelector {
public:
    ConnectionSelector() = default;
    ConnectionSelector(std::optional<size_t> max_leader_index,
                       std::optional<size_t> max_follower_index)
        : max_leader_index_(max_leader_index),
          max_follower_index_(max_follower_index) {}

    [[nodiscard]] static ConnectionSelector from_table(const RoutingTable& table);

    /// @throws NoAvailableRoleError if there is no leader
    [[nodiscard]] std::string pick_write_alias() const;

    /// @throws NoAvailableRoleError if there is no follower
    [[nodiscard]] std::string pick_read_alias() const;

    [[nodiscard]] std::string pick_alias(RoutingRole role) const;

    [[nodiscard]] std::optional<size_t> max_index(RoutingRole role) const {
        return role == RoutingRole::LEADER ? max_leader_index_ : max_follower_index_;
    }

private:
    std::optional<size_t> max_leader_index_;
    std::optional<size_t> max_follower_index_;
};

} // namespace graphroute
