/**
 * @file mutation_engine.hpp
 * @brief All writes to the authorization model, including cascading removal
 *
 * Each operation validates every reference before it changes anything, so a
 * failed call leaves the graph and the store untouched. Removal of a user,
 * group, entity or entity type then purges every edge and mapping that
 * refers to it; the purge steps only erase and cannot fail part way.
 */

#pragma once

#include <app_access/core/access_key.hpp>
#include <app_access/core/access_manager_config.hpp>
#include <app_access/core/result.hpp>
#include <app_access/di/ilogger.hpp>
#include <app_access/graph/membership_graph.hpp>
#include <app_access/integration/logger_adapter.hpp>
#include <app_access/mapping/mapping_store.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace app_access::mutation {

/**
 * @class mutation_engine
 * @brief The only writer of the membership graph and the mapping store
 *
 * Thread Safety: Not thread-safe. access_manager holds its exclusive lock
 * for the whole of every call.
 */
template <access_key TUser, access_key TGroup, access_key TComponent, access_key TAccess>
class mutation_engine {
public:
    using graph_type = graph::membership_graph<TUser, TGroup>;
    using store_type = mapping::mapping_store<TUser, TGroup, TComponent, TAccess>;

    mutation_engine(graph_type& graph, store_type& store, std::shared_ptr<di::ILogger> logger,
                    const access_manager_config& config)
        : graph_(graph),
          store_(store),
          logger_(logger ? std::move(logger) : di::null_logger()),
          config_(config) {}

    // =========================================================================
    // Users and Groups
    // =========================================================================

    [[nodiscard]] VoidResult add_user(const TUser& user) {
        auto result = graph_.add_user(user);
        if (result.is_ok()) {
            record(integration::model_change_type::element_added,
                   "user '" + describe_key(user) + "'");
        }
        return result;
    }

    /**
     * @brief Remove a user, its group memberships and its mappings
     */
    [[nodiscard]] VoidResult remove_user(const TUser& user) {
        auto edges = graph_.remove_user(user);
        if (edges.is_err()) {
            return access_void_error(edges.error().code, edges.error().message);
        }
        auto mappings = store_.erase_user(user);
        record(integration::model_change_type::element_removed,
               "user '" + describe_key(user) + "'", edges.value() + mappings);
        return ok();
    }

    [[nodiscard]] VoidResult add_group(const TGroup& group) {
        auto result = graph_.add_group(group);
        if (result.is_ok()) {
            record(integration::model_change_type::element_added,
                   "group '" + describe_key(group) + "'");
        }
        return result;
    }

    /**
     * @brief Remove a group, every edge into or out of it and its mappings
     */
    [[nodiscard]] VoidResult remove_group(const TGroup& group) {
        auto edges = graph_.remove_group(group);
        if (edges.is_err()) {
            return access_void_error(edges.error().code, edges.error().message);
        }
        auto mappings = store_.erase_group(group);
        record(integration::model_change_type::element_removed,
               "group '" + describe_key(group) + "'", edges.value() + mappings);
        return ok();
    }

    // =========================================================================
    // Membership Edges
    // =========================================================================

    [[nodiscard]] VoidResult add_user_to_group_mapping(const TUser& user, const TGroup& group) {
        auto result = graph_.add_user_to_group_edge(user, group);
        if (result.is_ok()) {
            record(integration::model_change_type::mapping_added,
                   "user '" + describe_key(user) + "' -> group '" + describe_key(group) + "'");
        }
        return result;
    }

    [[nodiscard]] VoidResult remove_user_to_group_mapping(const TUser& user,
                                                          const TGroup& group) {
        auto result = graph_.remove_user_to_group_edge(user, group);
        if (result.is_ok()) {
            record(integration::model_change_type::mapping_removed,
                   "user '" + describe_key(user) + "' -> group '" + describe_key(group) + "'");
        }
        return result;
    }

    [[nodiscard]] VoidResult add_group_to_group_mapping(const TGroup& from_group,
                                                        const TGroup& to_group) {
        auto result = graph_.add_group_to_group_edge(from_group, to_group);
        if (result.is_ok()) {
            record(integration::model_change_type::mapping_added,
                   "group '" + describe_key(from_group) + "' -> group '" +
                       describe_key(to_group) + "'");
        } else if (result.error().code == error_codes::circular_reference) {
            logger_->warn_fmt("[{}] {}", config_.name, result.error().message);
        }
        return result;
    }

    [[nodiscard]] VoidResult remove_group_to_group_mapping(const TGroup& from_group,
                                                           const TGroup& to_group) {
        auto result = graph_.remove_group_to_group_edge(from_group, to_group);
        if (result.is_ok()) {
            record(integration::model_change_type::mapping_removed,
                   "group '" + describe_key(from_group) + "' -> group '" +
                       describe_key(to_group) + "'");
        }
        return result;
    }

    // =========================================================================
    // Component Mappings
    // =========================================================================

    [[nodiscard]] VoidResult add_user_to_component_mapping(const TUser& user,
                                                           const TComponent& component,
                                                           const TAccess& access_level) {
        if (!graph_.contains_user(user)) {
            return user_not_found(user);
        }
        auto result = store_.add_user_component_mapping(user, component, access_level);
        if (result.is_ok()) {
            record(integration::model_change_type::mapping_added,
                   "user '" + describe_key(user) + "' -> " +
                       describe_component(component, access_level));
        }
        return result;
    }

    [[nodiscard]] VoidResult remove_user_to_component_mapping(const TUser& user,
                                                              const TComponent& component,
                                                              const TAccess& access_level) {
        if (!graph_.contains_user(user)) {
            return user_not_found(user);
        }
        auto result = store_.remove_user_component_mapping(user, component, access_level);
        if (result.is_ok()) {
            record(integration::model_change_type::mapping_removed,
                   "user '" + describe_key(user) + "' -> " +
                       describe_component(component, access_level));
        }
        return result;
    }

    [[nodiscard]] VoidResult add_group_to_component_mapping(const TGroup& group,
                                                            const TComponent& component,
                                                            const TAccess& access_level) {
        if (!graph_.contains_group(group)) {
            return group_not_found(group);
        }
        auto result = store_.add_group_component_mapping(group, component, access_level);
        if (result.is_ok()) {
            record(integration::model_change_type::mapping_added,
                   "group '" + describe_key(group) + "' -> " +
                       describe_component(component, access_level));
        }
        return result;
    }

    [[nodiscard]] VoidResult remove_group_to_component_mapping(const TGroup& group,
                                                               const TComponent& component,
                                                               const TAccess& access_level) {
        if (!graph_.contains_group(group)) {
            return group_not_found(group);
        }
        auto result = store_.remove_group_component_mapping(group, component, access_level);
        if (result.is_ok()) {
            record(integration::model_change_type::mapping_removed,
                   "group '" + describe_key(group) + "' -> " +
                       describe_component(component, access_level));
        }
        return result;
    }

    // =========================================================================
    // Entity Types and Entities
    // =========================================================================

    [[nodiscard]] VoidResult add_entity_type(const std::string& entity_type) {
        auto result = store_.add_entity_type(entity_type);
        if (result.is_ok()) {
            record(integration::model_change_type::element_added,
                   "entity type '" + entity_type + "'");
        }
        return result;
    }

    /**
     * @brief Remove an entity type, all of its entities and every mapping
     *        to any of them
     */
    [[nodiscard]] VoidResult remove_entity_type(const std::string& entity_type) {
        auto purged = store_.remove_entity_type(entity_type);
        if (purged.is_err()) {
            return access_void_error(purged.error().code, purged.error().message);
        }
        record(integration::model_change_type::element_removed,
               "entity type '" + entity_type + "'", purged.value());
        return ok();
    }

    [[nodiscard]] VoidResult add_entity(const std::string& entity_type,
                                        const std::string& entity) {
        auto result = store_.add_entity(entity_type, entity);
        if (result.is_ok()) {
            record(integration::model_change_type::element_added,
                   "entity '" + entity_type + "/" + entity + "'");
        }
        return result;
    }

    /**
     * @brief Remove an entity and every user or group mapping to it
     */
    [[nodiscard]] VoidResult remove_entity(const std::string& entity_type,
                                           const std::string& entity) {
        auto purged = store_.remove_entity(entity_type, entity);
        if (purged.is_err()) {
            return access_void_error(purged.error().code, purged.error().message);
        }
        record(integration::model_change_type::element_removed,
               "entity '" + entity_type + "/" + entity + "'", purged.value());
        return ok();
    }

    // =========================================================================
    // Entity Mappings
    // =========================================================================

    [[nodiscard]] VoidResult add_user_to_entity_mapping(const TUser& user,
                                                        const std::string& entity_type,
                                                        const std::string& entity) {
        if (!graph_.contains_user(user)) {
            return user_not_found(user);
        }
        auto result = store_.add_user_entity_mapping(user, entity_type, entity);
        if (result.is_ok()) {
            record(integration::model_change_type::mapping_added,
                   "user '" + describe_key(user) + "' -> entity '" + entity_type + "/" +
                       entity + "'");
        }
        return result;
    }

    [[nodiscard]] VoidResult remove_user_to_entity_mapping(const TUser& user,
                                                           const std::string& entity_type,
                                                           const std::string& entity) {
        if (!graph_.contains_user(user)) {
            return user_not_found(user);
        }
        auto result = store_.remove_user_entity_mapping(user, entity_type, entity);
        if (result.is_ok()) {
            record(integration::model_change_type::mapping_removed,
                   "user '" + describe_key(user) + "' -> entity '" + entity_type + "/" +
                       entity + "'");
        }
        return result;
    }

    [[nodiscard]] VoidResult add_group_to_entity_mapping(const TGroup& group,
                                                         const std::string& entity_type,
                                                         const std::string& entity) {
        if (!graph_.contains_group(group)) {
            return group_not_found(group);
        }
        auto result = store_.add_group_entity_mapping(group, entity_type, entity);
        if (result.is_ok()) {
            record(integration::model_change_type::mapping_added,
                   "group '" + describe_key(group) + "' -> entity '" + entity_type + "/" +
                       entity + "'");
        }
        return result;
    }

    [[nodiscard]] VoidResult remove_group_to_entity_mapping(const TGroup& group,
                                                            const std::string& entity_type,
                                                            const std::string& entity) {
        if (!graph_.contains_group(group)) {
            return group_not_found(group);
        }
        auto result = store_.remove_group_entity_mapping(group, entity_type, entity);
        if (result.is_ok()) {
            record(integration::model_change_type::mapping_removed,
                   "group '" + describe_key(group) + "' -> entity '" + entity_type + "/" +
                       entity + "'");
        }
        return result;
    }

private:
    void record(integration::model_change_type type, const std::string& description,
                std::size_t cascaded = 0) {
        switch (type) {
            case integration::model_change_type::element_removed:
                logger_->info_fmt("[{}] Removed {} ({} dependent references)", config_.name,
                                  description, cascaded);
                break;
            case integration::model_change_type::element_added:
                logger_->debug_fmt("[{}] Added {}", config_.name, description);
                break;
            case integration::model_change_type::mapping_added:
                logger_->debug_fmt("[{}] Added mapping {}", config_.name, description);
                break;
            case integration::model_change_type::mapping_removed:
                logger_->debug_fmt("[{}] Removed mapping {}", config_.name, description);
                break;
        }

        if (config_.audit_model_changes) {
            integration::logger_adapter::log_model_change(type, description, cascaded);
        }
    }

    static std::string describe_component(const TComponent& component,
                                          const TAccess& access_level) {
        return "component '" + describe_key(component) + "' at '" +
               describe_key(access_level) + "'";
    }

    static VoidResult user_not_found(const TUser& user) {
        return access_void_error(error_codes::not_found,
                                 "User '" + describe_key(user) +
                                     "' in argument 'user' does not exist.");
    }

    static VoidResult group_not_found(const TGroup& group) {
        return access_void_error(error_codes::not_found,
                                 "Group '" + describe_key(group) +
                                     "' in argument 'group' does not exist.");
    }

    graph_type& graph_;
    store_type& store_;
    std::shared_ptr<di::ILogger> logger_;
    const access_manager_config& config_;
};

} // namespace app_access::mutation
