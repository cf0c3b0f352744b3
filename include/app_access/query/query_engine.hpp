/**
 * @file query_engine.hpp
 * @brief Read-only permission and entity visibility queries
 *
 * Every query walks the membership graph depth-first from the queried
 * subject and probes the mapping store at each node it reaches: the subject
 * itself first, then each ancestor group once. Checks stop at the first
 * node that grants the permission; enumerations visit every reachable node.
 */

#pragma once

#include <app_access/core/access_key.hpp>
#include <app_access/core/result.hpp>
#include <app_access/graph/membership_graph.hpp>
#include <app_access/mapping/mapping_store.hpp>

#include <string>
#include <unordered_set>

namespace app_access::query {

/**
 * @class query_engine
 * @brief Answers access questions against a graph and a mapping store
 *
 * The engine holds const references only and never mutates either.
 * Unknown subjects fail with error_codes::not_found. Unknown entity types
 * or entities are not errors: nothing can grant access to them, so checks
 * return false and enumerations return an empty set.
 */
template <access_key TUser, access_key TGroup, access_key TComponent, access_key TAccess>
class query_engine {
public:
    using graph_type = graph::membership_graph<TUser, TGroup>;
    using store_type = mapping::mapping_store<TUser, TGroup, TComponent, TAccess>;
    using component_pair = mapping::component_access<TComponent, TAccess>;
    using component_pair_set =
        std::unordered_set<component_pair, mapping::component_access_hash<TComponent, TAccess>>;
    using entity_name_set = std::unordered_set<std::string>;

    query_engine(const graph_type& graph, const store_type& store) noexcept
        : graph_(graph), store_(store) {}

    // =========================================================================
    // Component Access
    // =========================================================================

    /**
     * @brief Check whether a user, or any group it belongs to, holds a
     *        component at an access level
     */
    [[nodiscard]] Result<bool> has_access_to_component(const TUser& user,
                                                       const TComponent& component,
                                                       const TAccess& access_level) const {
        auto start = graph_.find_user(user);
        if (!start) {
            return user_not_found<bool>(user);
        }
        return ok(reaches_component(*start, component_pair{component, access_level}));
    }

    [[nodiscard]] Result<bool> group_has_access_to_component(const TGroup& group,
                                                             const TComponent& component,
                                                             const TAccess& access_level) const {
        auto start = graph_.find_group(group);
        if (!start) {
            return group_not_found<bool>(group);
        }
        return ok(reaches_component(*start, component_pair{component, access_level}));
    }

    /**
     * @brief Every component and access level a user holds directly or
     *        through its groups
     */
    [[nodiscard]] Result<component_pair_set> accessible_components(const TUser& user) const {
        auto start = graph_.find_user(user);
        if (!start) {
            return user_not_found<component_pair_set>(user);
        }
        return ok(collect_components(*start));
    }

    [[nodiscard]] Result<component_pair_set> group_accessible_components(
        const TGroup& group) const {
        auto start = graph_.find_group(group);
        if (!start) {
            return group_not_found<component_pair_set>(group);
        }
        return ok(collect_components(*start));
    }

    // =========================================================================
    // Entity Access
    // =========================================================================

    [[nodiscard]] Result<bool> has_access_to_entity(const TUser& user,
                                                    const std::string& entity_type,
                                                    const std::string& entity) const {
        auto start = graph_.find_user(user);
        if (!start) {
            return user_not_found<bool>(user);
        }
        return ok(reaches_entity(*start, entity_type, entity));
    }

    [[nodiscard]] Result<bool> group_has_access_to_entity(const TGroup& group,
                                                          const std::string& entity_type,
                                                          const std::string& entity) const {
        auto start = graph_.find_group(group);
        if (!start) {
            return group_not_found<bool>(group);
        }
        return ok(reaches_entity(*start, entity_type, entity));
    }

    /**
     * @brief Union of the entities of a type mapped to a user or to any
     *        group it belongs to
     */
    [[nodiscard]] Result<entity_name_set> accessible_entities(
        const TUser& user, const std::string& entity_type) const {
        auto start = graph_.find_user(user);
        if (!start) {
            return user_not_found<entity_name_set>(user);
        }
        return ok(collect_entities(*start, entity_type));
    }

    [[nodiscard]] Result<entity_name_set> group_accessible_entities(
        const TGroup& group, const std::string& entity_type) const {
        auto start = graph_.find_group(group);
        if (!start) {
            return group_not_found<entity_name_set>(group);
        }
        return ok(collect_entities(*start, entity_type));
    }

private:
    bool reaches_component(graph::node_id start, const component_pair& pair) const {
        return graph_.for_each_reachable(start, [&](graph::node_id id) {
            bool granted = graph_.kind(id) == graph::node_kind::user
                               ? store_.users().has_component(graph_.user_key(id), pair)
                               : store_.groups().has_component(graph_.group_key(id), pair);
            return granted ? graph::traversal_action::stop : graph::traversal_action::proceed;
        });
    }

    bool reaches_entity(graph::node_id start, const std::string& entity_type,
                        const std::string& entity) const {
        return graph_.for_each_reachable(start, [&](graph::node_id id) {
            bool granted =
                graph_.kind(id) == graph::node_kind::user
                    ? store_.users().has_entity(graph_.user_key(id), entity_type, entity)
                    : store_.groups().has_entity(graph_.group_key(id), entity_type, entity);
            return granted ? graph::traversal_action::stop : graph::traversal_action::proceed;
        });
    }

    component_pair_set collect_components(graph::node_id start) const {
        component_pair_set result;
        graph_.for_each_reachable(start, [&](graph::node_id id) {
            const auto* pairs = graph_.kind(id) == graph::node_kind::user
                                    ? store_.users().components(graph_.user_key(id))
                                    : store_.groups().components(graph_.group_key(id));
            if (pairs != nullptr) {
                result.insert(pairs->begin(), pairs->end());
            }
            return graph::traversal_action::proceed;
        });
        return result;
    }

    entity_name_set collect_entities(graph::node_id start, const std::string& entity_type) const {
        entity_name_set result;
        graph_.for_each_reachable(start, [&](graph::node_id id) {
            const auto* names =
                graph_.kind(id) == graph::node_kind::user
                    ? store_.users().entities(graph_.user_key(id), entity_type)
                    : store_.groups().entities(graph_.group_key(id), entity_type);
            if (names != nullptr) {
                result.insert(names->begin(), names->end());
            }
            return graph::traversal_action::proceed;
        });
        return result;
    }

    template <typename T>
    static Result<T> user_not_found(const TUser& user) {
        return access_error<T>(error_codes::not_found,
                               "User '" + describe_key(user) +
                                   "' in argument 'user' does not exist.");
    }

    template <typename T>
    static Result<T> group_not_found(const TGroup& group) {
        return access_error<T>(error_codes::not_found,
                               "Group '" + describe_key(group) +
                                   "' in argument 'group' does not exist.");
    }

    const graph_type& graph_;
    const store_type& store_;
};

} // namespace app_access::query
