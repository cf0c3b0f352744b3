/**
 * @file access_manager.hpp
 * @brief Thread-safe authorization engine facade
 *
 * access_manager ties the membership graph, the mapping store and the two
 * engines together behind a single reader/writer lock. Permission checks may
 * run in parallel; administrative changes run one at a time and exclude all
 * checks until their cascade completes.
 *
 * @example
 * @code
 * enum class screen { order_summary, products_setup };
 * enum class access_level { view, create, modify, remove };
 *
 * app_access::security::access_manager<std::string, std::string, screen, access_level> acl;
 * (void)acl.add_user("Mae");
 * (void)acl.add_group("SalesManagers");
 * (void)acl.add_user_to_group_mapping("Mae", "SalesManagers");
 * (void)acl.add_group_to_component_mapping("SalesManagers", screen::products_setup,
 *                                          access_level::modify);
 *
 * auto granted = acl.has_access_to_component("Mae", screen::products_setup,
 *                                            access_level::modify);
 * if (granted.is_ok() && granted.value()) {
 *     // show the screen
 * }
 * @endcode
 */

#pragma once

#include <app_access/core/access_key.hpp>
#include <app_access/core/access_manager_config.hpp>
#include <app_access/core/result.hpp>
#include <app_access/di/ilogger.hpp>
#include <app_access/graph/membership_graph.hpp>
#include <app_access/integration/logger_adapter.hpp>
#include <app_access/mapping/mapping_store.hpp>
#include <app_access/mutation/mutation_engine.hpp>
#include <app_access/query/query_engine.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace app_access::security {

/**
 * @brief Outcome of one permission check, passed to the audit callback
 */
struct access_decision {
    std::string query;
    std::string subject;
    std::string target;
    bool granted{false};
};

/**
 * @brief Callback for observing permission checks
 */
using access_audit_callback = std::function<void(const access_decision&)>;

/**
 * @class access_manager
 * @brief Authorization engine over caller-chosen user, group, component and
 *        access level types
 *
 * Thread Safety: All public methods are thread-safe. Queries take a shared
 * lock, mutations take an exclusive lock for their whole cascade. The audit
 * callback is invoked after the lock has been released.
 *
 * @tparam TUser User key type
 * @tparam TGroup Group key type (may be the same type as TUser)
 * @tparam TComponent Application component type
 * @tparam TAccess Access level type
 */
template <access_key TUser, access_key TGroup, access_key TComponent, access_key TAccess>
class access_manager {
public:
    using graph_type = graph::membership_graph<TUser, TGroup>;
    using store_type = mapping::mapping_store<TUser, TGroup, TComponent, TAccess>;
    using query_type = query::query_engine<TUser, TGroup, TComponent, TAccess>;
    using mutation_type = mutation::mutation_engine<TUser, TGroup, TComponent, TAccess>;
    using component_pair = mapping::component_access<TComponent, TAccess>;
    using component_pair_set = typename query_type::component_pair_set;
    using entity_name_set = typename query_type::entity_name_set;
    using entity_reference = typename store_type::entity_reference;
    using membership = graph::group_membership<TUser, TGroup>;

    explicit access_manager(access_manager_config config = {},
                            std::shared_ptr<di::ILogger> logger = nullptr)
        : config_(std::move(config)),
          logger_(logger ? std::move(logger) : di::null_logger()),
          graph_(config_.reject_circular_references),
          queries_(graph_, store_),
          mutations_(graph_, store_, logger_, config_) {}

    access_manager(const access_manager&) = delete;
    access_manager& operator=(const access_manager&) = delete;
    access_manager(access_manager&&) = delete;
    access_manager& operator=(access_manager&&) = delete;

    // =========================================================================
    // Users
    // =========================================================================

    [[nodiscard]] VoidResult add_user(const TUser& user) {
        std::unique_lock lock(mutex_);
        return mutations_.add_user(user);
    }

    /**
     * @brief Remove a user with its memberships and mappings
     * @return error_codes::not_found if the user does not exist
     */
    [[nodiscard]] VoidResult remove_user(const TUser& user) {
        std::unique_lock lock(mutex_);
        return mutations_.remove_user(user);
    }

    [[nodiscard]] bool contains_user(const TUser& user) const {
        std::shared_lock lock(mutex_);
        return graph_.contains_user(user);
    }

    [[nodiscard]] std::vector<TUser> users() const {
        std::shared_lock lock(mutex_);
        return graph_.users();
    }

    // =========================================================================
    // Groups
    // =========================================================================

    [[nodiscard]] VoidResult add_group(const TGroup& group) {
        std::unique_lock lock(mutex_);
        return mutations_.add_group(group);
    }

    /**
     * @brief Remove a group, every membership edge touching it and its
     *        mappings
     *
     * Former members lose whatever the group granted them unless another
     * path still grants it.
     */
    [[nodiscard]] VoidResult remove_group(const TGroup& group) {
        std::unique_lock lock(mutex_);
        return mutations_.remove_group(group);
    }

    [[nodiscard]] bool contains_group(const TGroup& group) const {
        std::shared_lock lock(mutex_);
        return graph_.contains_group(group);
    }

    [[nodiscard]] std::vector<TGroup> groups() const {
        std::shared_lock lock(mutex_);
        return graph_.groups();
    }

    /**
     * @brief Direct members of a group, users and groups separately
     */
    [[nodiscard]] Result<membership> group_members(const TGroup& group) const {
        std::shared_lock lock(mutex_);
        return graph_.group_members(group);
    }

    // =========================================================================
    // Membership Edges
    // =========================================================================

    [[nodiscard]] VoidResult add_user_to_group_mapping(const TUser& user, const TGroup& group) {
        std::unique_lock lock(mutex_);
        return mutations_.add_user_to_group_mapping(user, group);
    }

    [[nodiscard]] VoidResult remove_user_to_group_mapping(const TUser& user,
                                                          const TGroup& group) {
        std::unique_lock lock(mutex_);
        return mutations_.remove_user_to_group_mapping(user, group);
    }

    [[nodiscard]] Result<std::vector<TGroup>> get_user_to_group_mappings(
        const TUser& user) const {
        std::shared_lock lock(mutex_);
        return graph_.user_to_group_edges(user);
    }

    /**
     * @brief Make from_group a member of to_group
     *
     * Fails with self_reference when both are the same group, and with
     * circular_reference when to_group already reaches from_group and
     * circular references are rejected.
     */
    [[nodiscard]] VoidResult add_group_to_group_mapping(const TGroup& from_group,
                                                        const TGroup& to_group) {
        std::unique_lock lock(mutex_);
        return mutations_.add_group_to_group_mapping(from_group, to_group);
    }

    [[nodiscard]] VoidResult remove_group_to_group_mapping(const TGroup& from_group,
                                                           const TGroup& to_group) {
        std::unique_lock lock(mutex_);
        return mutations_.remove_group_to_group_mapping(from_group, to_group);
    }

    [[nodiscard]] Result<std::vector<TGroup>> get_group_to_group_mappings(
        const TGroup& group) const {
        std::shared_lock lock(mutex_);
        return graph_.group_to_group_edges(group);
    }

    // =========================================================================
    // Component Mappings
    // =========================================================================

    [[nodiscard]] VoidResult add_user_to_component_mapping(const TUser& user,
                                                           const TComponent& component,
                                                           const TAccess& access_level) {
        std::unique_lock lock(mutex_);
        return mutations_.add_user_to_component_mapping(user, component, access_level);
    }

    [[nodiscard]] VoidResult remove_user_to_component_mapping(const TUser& user,
                                                              const TComponent& component,
                                                              const TAccess& access_level) {
        std::unique_lock lock(mutex_);
        return mutations_.remove_user_to_component_mapping(user, component, access_level);
    }

    [[nodiscard]] Result<std::vector<component_pair>> get_user_to_component_mappings(
        const TUser& user) const {
        std::shared_lock lock(mutex_);
        if (!graph_.contains_user(user)) {
            return user_not_found<std::vector<component_pair>>(user);
        }
        return ok(store_.user_component_mappings(user));
    }

    [[nodiscard]] VoidResult add_group_to_component_mapping(const TGroup& group,
                                                            const TComponent& component,
                                                            const TAccess& access_level) {
        std::unique_lock lock(mutex_);
        return mutations_.add_group_to_component_mapping(group, component, access_level);
    }

    [[nodiscard]] VoidResult remove_group_to_component_mapping(const TGroup& group,
                                                               const TComponent& component,
                                                               const TAccess& access_level) {
        std::unique_lock lock(mutex_);
        return mutations_.remove_group_to_component_mapping(group, component, access_level);
    }

    [[nodiscard]] Result<std::vector<component_pair>> get_group_to_component_mappings(
        const TGroup& group) const {
        std::shared_lock lock(mutex_);
        if (!graph_.contains_group(group)) {
            return group_not_found<std::vector<component_pair>>(group);
        }
        return ok(store_.group_component_mappings(group));
    }

    // =========================================================================
    // Entity Types and Entities
    // =========================================================================

    [[nodiscard]] VoidResult add_entity_type(const std::string& entity_type) {
        std::unique_lock lock(mutex_);
        return mutations_.add_entity_type(entity_type);
    }

    /**
     * @brief Remove an entity type together with its entities and every
     *        mapping to them
     */
    [[nodiscard]] VoidResult remove_entity_type(const std::string& entity_type) {
        std::unique_lock lock(mutex_);
        return mutations_.remove_entity_type(entity_type);
    }

    [[nodiscard]] bool contains_entity_type(const std::string& entity_type) const {
        std::shared_lock lock(mutex_);
        return store_.contains_entity_type(entity_type);
    }

    [[nodiscard]] std::vector<std::string> entity_types() const {
        std::shared_lock lock(mutex_);
        return store_.entity_types();
    }

    [[nodiscard]] VoidResult add_entity(const std::string& entity_type,
                                        const std::string& entity) {
        std::unique_lock lock(mutex_);
        return mutations_.add_entity(entity_type, entity);
    }

    [[nodiscard]] VoidResult remove_entity(const std::string& entity_type,
                                           const std::string& entity) {
        std::unique_lock lock(mutex_);
        return mutations_.remove_entity(entity_type, entity);
    }

    [[nodiscard]] bool contains_entity(const std::string& entity_type,
                                       const std::string& entity) const {
        std::shared_lock lock(mutex_);
        return store_.contains_entity(entity_type, entity);
    }

    [[nodiscard]] Result<std::vector<std::string>> get_entities(
        const std::string& entity_type) const {
        std::shared_lock lock(mutex_);
        return store_.entities(entity_type);
    }

    // =========================================================================
    // Entity Mappings
    // =========================================================================

    [[nodiscard]] VoidResult add_user_to_entity_mapping(const TUser& user,
                                                        const std::string& entity_type,
                                                        const std::string& entity) {
        std::unique_lock lock(mutex_);
        return mutations_.add_user_to_entity_mapping(user, entity_type, entity);
    }

    [[nodiscard]] VoidResult remove_user_to_entity_mapping(const TUser& user,
                                                           const std::string& entity_type,
                                                           const std::string& entity) {
        std::unique_lock lock(mutex_);
        return mutations_.remove_user_to_entity_mapping(user, entity_type, entity);
    }

    /**
     * @brief Every (entity type, entity) pair mapped directly to a user
     */
    [[nodiscard]] Result<std::vector<entity_reference>> get_user_to_entity_mappings(
        const TUser& user) const {
        std::shared_lock lock(mutex_);
        if (!graph_.contains_user(user)) {
            return user_not_found<std::vector<entity_reference>>(user);
        }
        return ok(store_.user_entity_mappings(user));
    }

    [[nodiscard]] Result<std::vector<std::string>> get_user_to_entity_mappings(
        const TUser& user, const std::string& entity_type) const {
        std::shared_lock lock(mutex_);
        if (!graph_.contains_user(user)) {
            return user_not_found<std::vector<std::string>>(user);
        }
        return store_.user_entity_mappings(user, entity_type);
    }

    [[nodiscard]] VoidResult add_group_to_entity_mapping(const TGroup& group,
                                                         const std::string& entity_type,
                                                         const std::string& entity) {
        std::unique_lock lock(mutex_);
        return mutations_.add_group_to_entity_mapping(group, entity_type, entity);
    }

    [[nodiscard]] VoidResult remove_group_to_entity_mapping(const TGroup& group,
                                                            const std::string& entity_type,
                                                            const std::string& entity) {
        std::unique_lock lock(mutex_);
        return mutations_.remove_group_to_entity_mapping(group, entity_type, entity);
    }

    [[nodiscard]] Result<std::vector<entity_reference>> get_group_to_entity_mappings(
        const TGroup& group) const {
        std::shared_lock lock(mutex_);
        if (!graph_.contains_group(group)) {
            return group_not_found<std::vector<entity_reference>>(group);
        }
        return ok(store_.group_entity_mappings(group));
    }

    [[nodiscard]] Result<std::vector<std::string>> get_group_to_entity_mappings(
        const TGroup& group, const std::string& entity_type) const {
        std::shared_lock lock(mutex_);
        if (!graph_.contains_group(group)) {
            return group_not_found<std::vector<std::string>>(group);
        }
        return store_.group_entity_mappings(group, entity_type);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /**
     * @brief Check whether a user holds a component at an access level,
     *        directly or through any group it transitively belongs to
     * @return true/false, or error_codes::not_found for an unknown user
     */
    [[nodiscard]] Result<bool> has_access_to_component(const TUser& user,
                                                       const TComponent& component,
                                                       const TAccess& access_level) const {
        auto result = read([&] {
            return queries_.has_access_to_component(user, component, access_level);
        });
        audit(result, "has_access_to_component", "user '" + describe_key(user) + "'",
              describe_component(component, access_level));
        return result;
    }

    [[nodiscard]] Result<bool> group_has_access_to_component(const TGroup& group,
                                                             const TComponent& component,
                                                             const TAccess& access_level) const {
        auto result = read([&] {
            return queries_.group_has_access_to_component(group, component, access_level);
        });
        audit(result, "group_has_access_to_component",
              "group '" + describe_key(group) + "'", describe_component(component, access_level));
        return result;
    }

    [[nodiscard]] Result<component_pair_set> accessible_components(const TUser& user) const {
        std::shared_lock lock(mutex_);
        return queries_.accessible_components(user);
    }

    [[nodiscard]] Result<component_pair_set> group_accessible_components(
        const TGroup& group) const {
        std::shared_lock lock(mutex_);
        return queries_.group_accessible_components(group);
    }

    [[nodiscard]] Result<bool> has_access_to_entity(const TUser& user,
                                                    const std::string& entity_type,
                                                    const std::string& entity) const {
        auto result = read([&] {
            return queries_.has_access_to_entity(user, entity_type, entity);
        });
        audit(result, "has_access_to_entity", "user '" + describe_key(user) + "'",
              "entity '" + entity_type + "/" + entity + "'");
        return result;
    }

    [[nodiscard]] Result<bool> group_has_access_to_entity(const TGroup& group,
                                                          const std::string& entity_type,
                                                          const std::string& entity) const {
        auto result = read([&] {
            return queries_.group_has_access_to_entity(group, entity_type, entity);
        });
        audit(result, "group_has_access_to_entity",
              "group '" + describe_key(group) + "'",
              "entity '" + entity_type + "/" + entity + "'");
        return result;
    }

    /**
     * @brief Entities of a type visible to a user through direct mappings
     *        and every group it transitively belongs to
     * @return Set of entity names (empty for an unknown type), or
     *         error_codes::not_found for an unknown user
     */
    [[nodiscard]] Result<entity_name_set> accessible_entities(
        const TUser& user, const std::string& entity_type) const {
        std::shared_lock lock(mutex_);
        return queries_.accessible_entities(user, entity_type);
    }

    [[nodiscard]] Result<entity_name_set> group_accessible_entities(
        const TGroup& group, const std::string& entity_type) const {
        std::shared_lock lock(mutex_);
        return queries_.group_accessible_entities(group, entity_type);
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    /**
     * @brief Observe every successful permission check
     * @param callback Invoked outside the engine lock; pass nullptr to clear
     */
    void set_audit_callback(access_audit_callback callback) {
        std::unique_lock lock(mutex_);
        audit_callback_ = callback
                              ? std::make_shared<const access_audit_callback>(std::move(callback))
                              : nullptr;
    }

    [[nodiscard]] const access_manager_config& config() const noexcept { return config_; }

private:
    template <typename Query>
    auto read(Query&& query) const {
        std::shared_lock lock(mutex_);
        return query();
    }

    void audit(const Result<bool>& result, const char* query, std::string subject,
               std::string target) const {
        if (result.is_err()) {
            logger_->debug_fmt("[{}] {} failed: {}", config_.name, query,
                               result.error().message);
            return;
        }

        if (config_.audit_queries) {
            integration::logger_adapter::log_access_decision(query, subject, target,
                                                             result.value());
        }
        auto callback = read([this] { return audit_callback_; });
        if (callback) {
            (*callback)(access_decision{query, std::move(subject), std::move(target),
                                        result.value()});
        }
    }

    static std::string describe_component(const TComponent& component,
                                          const TAccess& access_level) {
        return "component '" + describe_key(component) + "' at '" +
               describe_key(access_level) + "'";
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

    // Declaration order matters: the engines hold references to the members
    // above them.
    access_manager_config config_;
    std::shared_ptr<di::ILogger> logger_;
    graph_type graph_;
    store_type store_;
    query_type queries_;
    mutation_type mutations_;
    std::shared_ptr<const access_audit_callback> audit_callback_;
    mutable std::shared_mutex mutex_;
};

} // namespace app_access::security
