/**
 * @file membership_graph_test.cpp
 * @brief Unit tests for membership_graph
 */

#include <app_access/graph/membership_graph.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace app_access;
using namespace app_access::graph;

namespace {

using string_graph = membership_graph<std::string, std::string>;

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

std::vector<std::string> reachable_groups(const string_graph& graph, node_id start) {
    std::vector<std::string> visited;
    (void)graph.for_each_reachable(start, [&](node_id id) {
        if (graph.kind(id) == node_kind::group) {
            visited.push_back(graph.group_key(id));
        }
        return traversal_action::proceed;
    });
    return visited;
}

}  // namespace

// ─────────────────────────────────────────────────────
// Nodes
// ─────────────────────────────────────────────────────

TEST_CASE("membership_graph node management", "[graph]") {
    string_graph graph;

    SECTION("add and look up users and groups") {
        REQUIRE(graph.add_user("Mae").is_ok());
        REQUIRE(graph.add_group("Sales").is_ok());

        REQUIRE(graph.contains_user("Mae"));
        REQUIRE(graph.contains_group("Sales"));
        REQUIRE(graph.user_count() == 1);
        REQUIRE(graph.group_count() == 1);
    }

    SECTION("user and group key spaces are independent") {
        REQUIRE(graph.add_user("Admin").is_ok());
        REQUIRE(graph.add_group("Admin").is_ok());

        REQUIRE(graph.contains_user("Admin"));
        REQUIRE(graph.contains_group("Admin"));
        REQUIRE(graph.find_user("Admin") != graph.find_group("Admin"));
    }

    SECTION("duplicate node is rejected") {
        REQUIRE(graph.add_user("Mae").is_ok());
        auto result = graph.add_user("Mae");

        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::duplicate_element);
        REQUIRE(result.error().message == "User 'Mae' in argument 'user' already exists.");
    }

    SECTION("removing a missing node fails") {
        auto result = graph.remove_group("Nobody");

        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::not_found);
    }

    SECTION("removing an isolated node succeeds with no edges") {
        REQUIRE(graph.add_group("Sales").is_ok());
        auto result = graph.remove_group("Sales");

        REQUIRE(result.is_ok());
        REQUIRE(result.value() == 0);
        REQUIRE_FALSE(graph.contains_group("Sales"));
    }

    SECTION("freed slots are reused") {
        REQUIRE(graph.add_group("Sales").is_ok());
        auto first = graph.find_group("Sales");
        REQUIRE(graph.remove_group("Sales").is_ok());
        REQUIRE(graph.add_group("Marketing").is_ok());

        REQUIRE(graph.find_group("Marketing") == first);
        REQUIRE(graph.group_key(*first) == "Marketing");
    }
}

// ─────────────────────────────────────────────────────
// Edges
// ─────────────────────────────────────────────────────

TEST_CASE("membership_graph edges", "[graph]") {
    string_graph graph;
    REQUIRE(graph.add_user("Mae").is_ok());
    REQUIRE(graph.add_group("SalesManagers").is_ok());
    REQUIRE(graph.add_group("AllStaff").is_ok());

    SECTION("user to group edge") {
        REQUIRE(graph.add_user_to_group_edge("Mae", "SalesManagers").is_ok());

        auto groups = graph.user_to_group_edges("Mae");
        REQUIRE(groups.is_ok());
        REQUIRE(groups.value() == std::vector<std::string>{"SalesManagers"});
        REQUIRE(graph.edge_count() == 1);
    }

    SECTION("edge to a missing endpoint names the argument") {
        auto result = graph.add_group_to_group_edge("SalesManagers", "Nobody");

        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::not_found);
        REQUIRE(result.error().message ==
                "Group 'Nobody' in argument 'to_group' does not exist.");
    }

    SECTION("duplicate edge is rejected") {
        REQUIRE(graph.add_user_to_group_edge("Mae", "SalesManagers").is_ok());
        auto result = graph.add_user_to_group_edge("Mae", "SalesManagers");

        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::duplicate_element);
        REQUIRE(graph.edge_count() == 1);
    }

    SECTION("self reference is rejected") {
        auto result = graph.add_group_to_group_edge("AllStaff", "AllStaff");

        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::self_reference);
    }

    SECTION("removing an edge twice fails the second time") {
        REQUIRE(graph.add_group_to_group_edge("SalesManagers", "AllStaff").is_ok());
        REQUIRE(graph.remove_group_to_group_edge("SalesManagers", "AllStaff").is_ok());

        auto again = graph.remove_group_to_group_edge("SalesManagers", "AllStaff");
        REQUIRE(again.is_err());
        REQUIRE(again.error().code == error_codes::not_found);
        REQUIRE(graph.edge_count() == 0);
    }

    SECTION("group members lists direct members only") {
        REQUIRE(graph.add_user_to_group_edge("Mae", "SalesManagers").is_ok());
        REQUIRE(graph.add_group_to_group_edge("SalesManagers", "AllStaff").is_ok());

        auto members = graph.group_members("AllStaff");
        REQUIRE(members.is_ok());
        REQUIRE(members.value().users.empty());
        REQUIRE(members.value().groups == std::vector<std::string>{"SalesManagers"});
    }
}

TEST_CASE("membership_graph circular references", "[graph][cycle]") {
    SECTION("cycle-forming edge is rejected by default") {
        string_graph graph;
        REQUIRE(graph.add_group("A").is_ok());
        REQUIRE(graph.add_group("B").is_ok());
        REQUIRE(graph.add_group("C").is_ok());
        REQUIRE(graph.add_group_to_group_edge("A", "B").is_ok());
        REQUIRE(graph.add_group_to_group_edge("B", "C").is_ok());

        auto result = graph.add_group_to_group_edge("C", "A");

        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::circular_reference);
        REQUIRE(graph.edge_count() == 2);
    }

    SECTION("cycles are admitted when rejection is off and traversal terminates") {
        string_graph graph(false);
        REQUIRE_FALSE(graph.rejects_circular_references());
        REQUIRE(graph.add_group("A").is_ok());
        REQUIRE(graph.add_group("B").is_ok());
        REQUIRE(graph.add_group_to_group_edge("A", "B").is_ok());
        REQUIRE(graph.add_group_to_group_edge("B", "A").is_ok());

        auto visited = reachable_groups(graph, *graph.find_group("A"));

        REQUIRE(visited.size() == 2);
        REQUIRE(visited.front() == "A");
        REQUIRE(contains(visited, "B"));
    }
}

// ─────────────────────────────────────────────────────
// Traversal
// ─────────────────────────────────────────────────────

TEST_CASE("membership_graph traversal", "[graph][traversal]") {
    string_graph graph;
    REQUIRE(graph.add_user("Mae").is_ok());
    for (const auto* name : {"Left", "Right", "Top", "Unrelated"}) {
        REQUIRE(graph.add_group(name).is_ok());
    }
    REQUIRE(graph.add_user_to_group_edge("Mae", "Left").is_ok());
    REQUIRE(graph.add_user_to_group_edge("Mae", "Right").is_ok());
    REQUIRE(graph.add_group_to_group_edge("Left", "Top").is_ok());
    REQUIRE(graph.add_group_to_group_edge("Right", "Top").is_ok());

    SECTION("diamond visits the shared ancestor once") {
        auto visited = reachable_groups(graph, *graph.find_user("Mae"));

        REQUIRE(visited.size() == 3);
        REQUIRE(std::count(visited.begin(), visited.end(), "Top") == 1);
        REQUIRE_FALSE(contains(visited, "Unrelated"));
    }

    SECTION("start node is visited first") {
        std::vector<node_id> order;
        auto start = *graph.find_user("Mae");
        (void)graph.for_each_reachable(start, [&](node_id id) {
            order.push_back(id);
            return traversal_action::proceed;
        });

        REQUIRE(order.size() == 4);
        REQUIRE(order.front() == start);
    }

    SECTION("stop ends the walk early") {
        std::size_t calls = 0;
        bool stopped = graph.for_each_reachable(*graph.find_user("Mae"), [&](node_id) {
            ++calls;
            return traversal_action::stop;
        });

        REQUIRE(stopped);
        REQUIRE(calls == 1);
    }

    SECTION("reachability follows membership direction") {
        REQUIRE(graph.is_reachable(*graph.find_user("Mae"), *graph.find_group("Top")));
        REQUIRE_FALSE(graph.is_reachable(*graph.find_group("Top"), *graph.find_group("Left")));
    }

    SECTION("removing a group drops edges in both directions") {
        auto removed = graph.remove_group("Left");

        REQUIRE(removed.is_ok());
        REQUIRE(removed.value() == 2);
        REQUIRE(graph.edge_count() == 2);
        REQUIRE(graph.user_to_group_edges("Mae").value() == std::vector<std::string>{"Right"});

        auto members = graph.group_members("Top");
        REQUIRE(members.value().groups == std::vector<std::string>{"Right"});
    }

    SECTION("removing a user drops its memberships") {
        auto removed = graph.remove_user("Mae");

        REQUIRE(removed.is_ok());
        REQUIRE(removed.value() == 2);
        REQUIRE(graph.group_members("Left").value().users.empty());
        REQUIRE(graph.edge_count() == 2);
    }
}
