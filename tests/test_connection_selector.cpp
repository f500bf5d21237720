#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "routing/connection_selector.hpp"

#include <set>

using namespace graphroute;

static RoutingTable make_table(size_t leaders, size_t followers) {
    std::vector<RoutingTable::ServerEntry> entries(2);
    entries[0].role = "WRITE";
    entries[1].role = "READ";
    for (size_t i = 0; i < leaders; ++i) entries[0].addresses.push_back("l" + std::to_string(i) + ":7687");
    for (size_t i = 0; i < followers; ++i) entries[1].addresses.push_back("f" + std::to_string(i) + ":7687");
    return RoutingTable(entries, std::chrono::system_clock::now() + std::chrono::seconds(60));
}

TEST_CASE("ConnectionSelector: alias format", "[selector]") {
    CHECK(connection_alias(RoutingRole::LEADER, 0) == "leader-0");
    CHECK(connection_alias(RoutingRole::FOLLOWER, 12) == "follower-12");
}

TEST_CASE("ConnectionSelector: max index is count minus one", "[selector]") {
    const auto selector = ConnectionSelector::from_table(make_table(2, 3));
    CHECK(selector.max_index(RoutingRole::LEADER) == 1u);
    CHECK(selector.max_index(RoutingRole::FOLLOWER) == 2u);
}

TEST_CASE("ConnectionSelector: single member always selected", "[selector]") {
    const auto selector = ConnectionSelector::from_table(make_table(1, 1));
    for (int i = 0; i < 20; ++i) {
        CHECK(selector.pick_write_alias() == "leader-0");
        CHECK(selector.pick_read_alias() == "follower-0");
    }
}

TEST_CASE("ConnectionSelector: picks stay in range and cover every member", "[selector]") {
    const auto selector = ConnectionSelector::from_table(make_table(3, 4));

    std::set<std::string> leaders;
    std::set<std::string> followers;
    for (int i = 0; i < 1000; ++i) {
        leaders.insert(selector.pick_write_alias());
        followers.insert(selector.pick_read_alias());
    }

    CHECK(leaders == std::set<std::string>{"leader-0", "leader-1", "leader-2"});
    CHECK(followers == std::set<std::string>{"follower-0", "follower-1", "follower-2", "follower-3"});
}

TEST_CASE("ConnectionSelector: role with no members throws NoAvailableRoleError", "[selector]") {
    const auto no_followers = ConnectionSelector::from_table(make_table(2, 0));
    CHECK_FALSE(no_followers.max_index(RoutingRole::FOLLOWER).has_value());
    CHECK_THROWS_AS(no_followers.pick_read_alias(), NoAvailableRoleError);
    CHECK(no_followers.pick_write_alias().starts_with("leader-"));

    const auto no_leaders = ConnectionSelector::from_table(make_table(0, 2));
    CHECK_THROWS_AS(no_leaders.pick_write_alias(), NoAvailableRoleError);

    try {
        (void)no_leaders.pick_write_alias();
        FAIL("expected NoAvailableRoleError");
    } catch (const NoAvailableRoleError& e) {
        CHECK(e.role() == "leader");
        CHECK(e.category() == ErrorCategory::NO_AVAILABLE_ROLE);
    }
}

TEST_CASE("ConnectionSelector: default-constructed selector selects nothing", "[selector]") {
    const ConnectionSelector selector;
    CHECK_THROWS_AS(selector.pick_write_alias(), NoAvailableRoleError);
    CHECK_THROWS_AS(selector.pick_read_alias(), NoAvailableRoleError);
}
