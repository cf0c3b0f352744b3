/**
 * @file membership_graph.hpp
 * @brief Directed graph of users and groups joined by membership edges
 *
 * Nodes live in an index-based arena owned by the graph. Users and groups
 * are looked up through separate key indices, so the user and group key
 * spaces stay independent even when TUser and TGroup are the same type.
 * Every node keeps both its outgoing groups and its incoming members, which
 * lets node removal drop all incident edges without scanning the arena.
 */

#pragma once

#include <app_access/core/access_key.hpp>
#include <app_access/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace app_access::graph {

/// Index of a node slot in the arena
using node_id = std::size_t;

enum class node_kind : std::uint8_t { user, group };

/**
 * @brief Returned by traversal visitors to continue or end a walk
 */
enum class traversal_action { proceed, stop };

/**
 * @brief Direct members of a group
 */
template <typename TUser, typename TGroup>
struct group_membership {
    std::vector<TUser> users;
    std::vector<TGroup> groups;
};

/**
 * @class membership_graph
 * @brief User/group membership graph with cycle-safe traversal
 *
 * An edge A -> B means "A is a member of B". Users only have outgoing
 * edges; groups may have both.
 *
 * Thread Safety: Not thread-safe. access_manager serializes access.
 *
 * @tparam TUser User key type
 * @tparam TGroup Group key type
 */
template <access_key TUser, access_key TGroup>
class membership_graph {
public:
    using user_type = TUser;
    using group_type = TGroup;

    explicit membership_graph(bool reject_circular_references = true)
        : reject_circular_references_(reject_circular_references) {}

    membership_graph(const membership_graph&) = delete;
    membership_graph& operator=(const membership_graph&) = delete;
    ~membership_graph() = default;

    // =========================================================================
    // Nodes
    // =========================================================================

    [[nodiscard]] VoidResult add_user(const TUser& user) {
        if (user_index_.contains(user)) {
            return access_void_error(
                error_codes::duplicate_element,
                "User '" + describe_key(user) + "' in argument 'user' already exists.");
        }
        auto id = allocate(node_kind::user, std::in_place_index<0>, user);
        user_index_.emplace(user, id);
        return ok();
    }

    [[nodiscard]] VoidResult add_group(const TGroup& group) {
        if (group_index_.contains(group)) {
            return access_void_error(
                error_codes::duplicate_element,
                "Group '" + describe_key(group) + "' in argument 'group' already exists.");
        }
        auto id = allocate(node_kind::group, std::in_place_index<1>, group);
        group_index_.emplace(group, id);
        return ok();
    }

    /**
     * @brief Remove a user together with all of its membership edges
     * @return Number of edges removed
     */
    [[nodiscard]] Result<std::size_t> remove_user(const TUser& user) {
        auto it = user_index_.find(user);
        if (it == user_index_.end()) {
            return user_not_found<std::size_t>(user, "user");
        }
        auto removed = release(it->second);
        user_index_.erase(it);
        return ok(removed);
    }

    /**
     * @brief Remove a group together with every edge into or out of it
     * @return Number of edges removed
     */
    [[nodiscard]] Result<std::size_t> remove_group(const TGroup& group) {
        auto it = group_index_.find(group);
        if (it == group_index_.end()) {
            return group_not_found<std::size_t>(group, "group");
        }
        auto removed = release(it->second);
        group_index_.erase(it);
        return ok(removed);
    }

    [[nodiscard]] bool contains_user(const TUser& user) const {
        return user_index_.contains(user);
    }

    [[nodiscard]] bool contains_group(const TGroup& group) const {
        return group_index_.contains(group);
    }

    [[nodiscard]] std::optional<node_id> find_user(const TUser& user) const {
        auto it = user_index_.find(user);
        if (it == user_index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::optional<node_id> find_group(const TGroup& group) const {
        auto it = group_index_.find(group);
        if (it == group_index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::vector<TUser> users() const {
        std::vector<TUser> result;
        result.reserve(user_index_.size());
        for (const auto& [user, id] : user_index_) {
            result.push_back(user);
        }
        return result;
    }

    [[nodiscard]] std::vector<TGroup> groups() const {
        std::vector<TGroup> result;
        result.reserve(group_index_.size());
        for (const auto& [group, id] : group_index_) {
            result.push_back(group);
        }
        return result;
    }

    [[nodiscard]] std::size_t user_count() const noexcept { return user_index_.size(); }
    [[nodiscard]] std::size_t group_count() const noexcept { return group_index_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edge_count_; }

    // =========================================================================
    // Edges
    // =========================================================================

    [[nodiscard]] VoidResult add_user_to_group_edge(const TUser& user, const TGroup& group) {
        auto from = find_user(user);
        if (!from) {
            return user_not_found<std::monostate>(user, "user");
        }
        auto to = find_group(group);
        if (!to) {
            return group_not_found<std::monostate>(group, "group");
        }
        if (slot(*from).outgoing.contains(*to)) {
            return access_void_error(
                error_codes::duplicate_element,
                "A mapping between user '" + describe_key(user) + "' and group '" +
                    describe_key(group) + "' already exists.");
        }
        link(*from, *to);
        return ok();
    }

    [[nodiscard]] VoidResult remove_user_to_group_edge(const TUser& user, const TGroup& group) {
        auto from = find_user(user);
        if (!from) {
            return user_not_found<std::monostate>(user, "user");
        }
        auto to = find_group(group);
        if (!to) {
            return group_not_found<std::monostate>(group, "group");
        }
        if (!unlink(*from, *to)) {
            return access_void_error(
                error_codes::not_found,
                "A mapping between user '" + describe_key(user) + "' and group '" +
                    describe_key(group) + "' does not exist.");
        }
        return ok();
    }

    /**
     * @brief Make one group a member of another
     *
     * Fails with self_reference when both groups are the same, and with
     * circular_reference when @p to_group already reaches @p from_group and
     * circular references are rejected.
     */
    [[nodiscard]] VoidResult add_group_to_group_edge(const TGroup& from_group,
                                                     const TGroup& to_group) {
        auto from = find_group(from_group);
        if (!from) {
            return group_not_found<std::monostate>(from_group, "from_group");
        }
        auto to = find_group(to_group);
        if (!to) {
            return group_not_found<std::monostate>(to_group, "to_group");
        }
        if (*from == *to) {
            return access_void_error(
                error_codes::self_reference,
                "Arguments 'from_group' and 'to_group' cannot contain the same group.");
        }
        if (slot(*from).outgoing.contains(*to)) {
            return access_void_error(
                error_codes::duplicate_element,
                "A mapping between group '" + describe_key(from_group) + "' and group '" +
                    describe_key(to_group) + "' already exists.");
        }
        if (reject_circular_references_ && is_reachable(*to, *from)) {
            return access_void_error(
                error_codes::circular_reference,
                "A mapping between groups '" + describe_key(from_group) + "' and '" +
                    describe_key(to_group) +
                    "' cannot be created as it would cause a circular reference.");
        }
        link(*from, *to);
        return ok();
    }

    [[nodiscard]] VoidResult remove_group_to_group_edge(const TGroup& from_group,
                                                        const TGroup& to_group) {
        auto from = find_group(from_group);
        if (!from) {
            return group_not_found<std::monostate>(from_group, "from_group");
        }
        auto to = find_group(to_group);
        if (!to) {
            return group_not_found<std::monostate>(to_group, "to_group");
        }
        if (!unlink(*from, *to)) {
            return access_void_error(
                error_codes::not_found,
                "A mapping between groups '" + describe_key(from_group) + "' and '" +
                    describe_key(to_group) + "' does not exist.");
        }
        return ok();
    }

    /**
     * @brief Groups the user is a direct member of
     */
    [[nodiscard]] Result<std::vector<TGroup>> user_to_group_edges(const TUser& user) const {
        auto id = find_user(user);
        if (!id) {
            return user_not_found<std::vector<TGroup>>(user, "user");
        }
        return ok(outgoing_groups(*id));
    }

    /**
     * @brief Groups the group is a direct member of
     */
    [[nodiscard]] Result<std::vector<TGroup>> group_to_group_edges(const TGroup& group) const {
        auto id = find_group(group);
        if (!id) {
            return group_not_found<std::vector<TGroup>>(group, "group");
        }
        return ok(outgoing_groups(*id));
    }

    /**
     * @brief Users and groups that are direct members of the group
     */
    [[nodiscard]] Result<group_membership<TUser, TGroup>> group_members(
        const TGroup& group) const {
        auto id = find_group(group);
        if (!id) {
            return group_not_found<group_membership<TUser, TGroup>>(group, "group");
        }
        group_membership<TUser, TGroup> members;
        for (auto member : slot(*id).incoming) {
            if (kind(member) == node_kind::user) {
                members.users.push_back(user_key(member));
            } else {
                members.groups.push_back(group_key(member));
            }
        }
        return ok(std::move(members));
    }

    // =========================================================================
    // Node Access
    // =========================================================================

    [[nodiscard]] node_kind kind(node_id id) const { return slot(id).kind; }

    [[nodiscard]] const TUser& user_key(node_id id) const {
        return std::get<0>(slot(id).key);
    }

    [[nodiscard]] const TGroup& group_key(node_id id) const {
        return std::get<1>(slot(id).key);
    }

    // =========================================================================
    // Traversal
    // =========================================================================

    /**
     * @brief Depth-first walk over every node reachable from @p start
     *
     * The start node is visited first, then each group reachable along
     * membership edges. Each node is visited at most once per walk, so
     * diamonds and cycles neither duplicate visits nor loop.
     *
     * @tparam Visitor Callable taking node_id and returning traversal_action
     * @return true if the visitor stopped the walk early
     */
    template <typename Visitor>
    bool for_each_reachable(node_id start, Visitor&& visit) const {
        std::unordered_set<node_id> visited{start};
        std::vector<node_id> pending{start};

        while (!pending.empty()) {
            auto current = pending.back();
            pending.pop_back();

            if (visit(current) == traversal_action::stop) {
                return true;
            }
            for (auto next : slot(current).outgoing) {
                if (visited.insert(next).second) {
                    pending.push_back(next);
                }
            }
        }
        return false;
    }

    [[nodiscard]] bool is_reachable(node_id from, node_id to) const {
        return for_each_reachable(from, [to](node_id current) {
            return current == to ? traversal_action::stop : traversal_action::proceed;
        });
    }

    [[nodiscard]] bool rejects_circular_references() const noexcept {
        return reject_circular_references_;
    }

private:
    struct node {
        node_kind kind;
        std::variant<TUser, TGroup> key;
        std::unordered_set<node_id> outgoing;
        std::unordered_set<node_id> incoming;
    };

    template <std::size_t I, typename Key>
    node_id allocate(node_kind type, std::in_place_index_t<I> index, const Key& key) {
        node created{type, std::variant<TUser, TGroup>(index, key), {}, {}};
        if (!free_slots_.empty()) {
            auto id = free_slots_.back();
            nodes_[id].emplace(std::move(created));
            free_slots_.pop_back();
            return id;
        }
        nodes_.emplace_back(std::move(created));
        return nodes_.size() - 1;
    }

    // Drops every edge incident to the node and frees its slot.
    std::size_t release(node_id id) {
        auto& released = slot(id);
        std::size_t removed = 0;
        for (auto member : released.incoming) {
            slot(member).outgoing.erase(id);
            ++removed;
        }
        for (auto target : released.outgoing) {
            slot(target).incoming.erase(id);
            ++removed;
        }
        edge_count_ -= removed;
        nodes_[id].reset();
        free_slots_.push_back(id);
        return removed;
    }

    void link(node_id from, node_id to) {
        auto& source = slot(from);
        source.outgoing.insert(to);
        try {
            slot(to).incoming.insert(from);
        } catch (...) {
            source.outgoing.erase(to);
            throw;
        }
        ++edge_count_;
    }

    bool unlink(node_id from, node_id to) {
        if (slot(from).outgoing.erase(to) == 0) {
            return false;
        }
        slot(to).incoming.erase(from);
        --edge_count_;
        return true;
    }

    [[nodiscard]] std::vector<TGroup> outgoing_groups(node_id id) const {
        std::vector<TGroup> result;
        result.reserve(slot(id).outgoing.size());
        for (auto target : slot(id).outgoing) {
            result.push_back(group_key(target));
        }
        return result;
    }

    [[nodiscard]] node& slot(node_id id) { return *nodes_[id]; }
    [[nodiscard]] const node& slot(node_id id) const { return *nodes_[id]; }

    template <typename T>
    static Result<T> user_not_found(const TUser& user, const char* argument) {
        return access_error<T>(error_codes::not_found,
                               "User '" + describe_key(user) + "' in argument '" +
                                   argument + "' does not exist.");
    }

    template <typename T>
    static Result<T> group_not_found(const TGroup& group, const char* argument) {
        return access_error<T>(error_codes::not_found,
                               "Group '" + describe_key(group) + "' in argument '" +
                                   argument + "' does not exist.");
    }

    bool reject_circular_references_;
    std::vector<std::optional<node>> nodes_;
    std::vector<node_id> free_slots_;
    std::unordered_map<TUser, node_id> user_index_;
    std::unordered_map<TGroup, node_id> group_index_;
    std::size_t edge_count_{0};
};

} // namespace app_access::graph
