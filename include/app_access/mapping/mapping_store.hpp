/**
 * @file mapping_store.hpp
 * @brief Entity registry and subject-to-permission mappings
 *
 * The store holds three relations:
 * - the registry of entity types and the entities within each type
 * - subject -> (component, access level) mappings
 * - subject -> (entity type, entity) mappings
 *
 * Users and groups have separate mapping tables. The store checks entity
 * type and entity references; subject existence belongs to the membership
 * graph and is checked by mutation_engine before the store is called.
 */

#pragma once

#include <app_access/core/access_key.hpp>
#include <app_access/core/result.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace app_access::mapping {

/**
 * @brief A component paired with a level of access to it
 */
template <access_key TComponent, access_key TAccess>
struct component_access {
    TComponent component;
    TAccess access_level;

    bool operator==(const component_access& other) const = default;
};

template <access_key TComponent, access_key TAccess>
struct component_access_hash {
    std::size_t operator()(const component_access<TComponent, TAccess>& value) const noexcept {
        auto seed = std::hash<TComponent>{}(value.component);
        seed ^= std::hash<TAccess>{}(value.access_level) + 0x9e3779b97f4a7c15ULL +
                (seed << 6) + (seed >> 2);
        return seed;
    }
};

/// Names of entities mapped to a subject, grouped by entity type
using entity_set = std::unordered_set<std::string>;
using entities_by_type = std::unordered_map<std::string, entity_set>;

/**
 * @class subject_mapping_table
 * @brief Component and entity mappings for one kind of subject
 *
 * Inner containers are erased as soon as they become empty, so a subject
 * without mappings has no entry at all.
 */
template <access_key TSubject, access_key TComponent, access_key TAccess>
class subject_mapping_table {
public:
    using component_pair = component_access<TComponent, TAccess>;
    using component_set =
        std::unordered_set<component_pair, component_access_hash<TComponent, TAccess>>;

    /// @return false if the mapping already existed
    bool add_component(const TSubject& subject, const component_pair& pair) {
        return components_[subject].insert(pair).second;
    }

    /// @return false if the mapping did not exist
    bool remove_component(const TSubject& subject, const component_pair& pair) {
        auto it = components_.find(subject);
        if (it == components_.end() || it->second.erase(pair) == 0) {
            return false;
        }
        if (it->second.empty()) {
            components_.erase(it);
        }
        return true;
    }

    [[nodiscard]] bool has_component(const TSubject& subject, const component_pair& pair) const {
        auto it = components_.find(subject);
        return it != components_.end() && it->second.contains(pair);
    }

    [[nodiscard]] const component_set* components(const TSubject& subject) const {
        auto it = components_.find(subject);
        return it == components_.end() ? nullptr : &it->second;
    }

    bool add_entity(const TSubject& subject, const std::string& entity_type,
                    const std::string& entity) {
        return entities_[subject][entity_type].insert(entity).second;
    }

    bool remove_entity(const TSubject& subject, const std::string& entity_type,
                       const std::string& entity) {
        auto subject_it = entities_.find(subject);
        if (subject_it == entities_.end()) {
            return false;
        }
        auto type_it = subject_it->second.find(entity_type);
        if (type_it == subject_it->second.end() || type_it->second.erase(entity) == 0) {
            return false;
        }
        if (type_it->second.empty()) {
            subject_it->second.erase(type_it);
        }
        if (subject_it->second.empty()) {
            entities_.erase(subject_it);
        }
        return true;
    }

    [[nodiscard]] bool has_entity(const TSubject& subject, const std::string& entity_type,
                                  const std::string& entity) const {
        auto found = entities(subject, entity_type);
        return found != nullptr && found->contains(entity);
    }

    [[nodiscard]] const entity_set* entities(const TSubject& subject,
                                             const std::string& entity_type) const {
        auto subject_it = entities_.find(subject);
        if (subject_it == entities_.end()) {
            return nullptr;
        }
        auto type_it = subject_it->second.find(entity_type);
        return type_it == subject_it->second.end() ? nullptr : &type_it->second;
    }

    [[nodiscard]] const entities_by_type* entities(const TSubject& subject) const {
        auto it = entities_.find(subject);
        return it == entities_.end() ? nullptr : &it->second;
    }

    /**
     * @brief Drop every mapping of a subject
     * @return Number of mappings removed
     */
    std::size_t erase_subject(const TSubject& subject) {
        std::size_t removed = 0;
        if (auto it = components_.find(subject); it != components_.end()) {
            removed += it->second.size();
            components_.erase(it);
        }
        if (auto it = entities_.find(subject); it != entities_.end()) {
            for (const auto& [type, names] : it->second) {
                removed += names.size();
            }
            entities_.erase(it);
        }
        return removed;
    }

    /**
     * @brief Drop every mapping to one entity, across all subjects
     * @return Number of mappings removed
     */
    std::size_t purge_entity(const std::string& entity_type, const std::string& entity) {
        std::size_t removed = 0;
        for (auto subject_it = entities_.begin(); subject_it != entities_.end();) {
            auto& by_type = subject_it->second;
            if (auto type_it = by_type.find(entity_type); type_it != by_type.end()) {
                removed += type_it->second.erase(entity);
                if (type_it->second.empty()) {
                    by_type.erase(type_it);
                }
            }
            subject_it = by_type.empty() ? entities_.erase(subject_it) : std::next(subject_it);
        }
        return removed;
    }

    /**
     * @brief Drop every mapping to any entity of a type, across all subjects
     * @return Number of mappings removed
     */
    std::size_t purge_entity_type(const std::string& entity_type) {
        std::size_t removed = 0;
        for (auto subject_it = entities_.begin(); subject_it != entities_.end();) {
            auto& by_type = subject_it->second;
            if (auto type_it = by_type.find(entity_type); type_it != by_type.end()) {
                removed += type_it->second.size();
                by_type.erase(type_it);
            }
            subject_it = by_type.empty() ? entities_.erase(subject_it) : std::next(subject_it);
        }
        return removed;
    }

    [[nodiscard]] std::size_t component_mapping_count() const {
        std::size_t count = 0;
        for (const auto& [subject, pairs] : components_) {
            count += pairs.size();
        }
        return count;
    }

    [[nodiscard]] std::size_t entity_mapping_count() const {
        std::size_t count = 0;
        for (const auto& [subject, by_type] : entities_) {
            for (const auto& [type, names] : by_type) {
                count += names.size();
            }
        }
        return count;
    }

private:
    std::unordered_map<TSubject, component_set> components_;
    std::unordered_map<TSubject, entities_by_type> entities_;
};

/**
 * @class mapping_store
 * @brief Entity registry plus user and group mapping tables
 *
 * Thread Safety: Not thread-safe. access_manager serializes access.
 */
template <access_key TUser, access_key TGroup, access_key TComponent, access_key TAccess>
class mapping_store {
public:
    using component_pair = component_access<TComponent, TAccess>;
    using user_table = subject_mapping_table<TUser, TComponent, TAccess>;
    using group_table = subject_mapping_table<TGroup, TComponent, TAccess>;

    /// (entity type, entity) pair as returned by the per-subject listings
    using entity_reference = std::pair<std::string, std::string>;

    mapping_store() = default;
    mapping_store(const mapping_store&) = delete;
    mapping_store& operator=(const mapping_store&) = delete;
    ~mapping_store() = default;

    // =========================================================================
    // Entity Registry
    // =========================================================================

    [[nodiscard]] VoidResult add_entity_type(const std::string& entity_type) {
        if (entities_.contains(entity_type)) {
            return access_void_error(error_codes::duplicate_element,
                                     "Entity type '" + entity_type +
                                         "' in argument 'entity_type' already exists.");
        }
        if (is_blank(entity_type)) {
            return access_void_error(error_codes::invalid_name,
                                     "Entity type '" + entity_type +
                                         "' in argument 'entity_type' must contain a valid character.");
        }
        entities_.emplace(entity_type, entity_set{});
        return ok();
    }

    /**
     * @brief Remove an entity type, its entities and every mapping to them
     * @return Number of mappings removed
     */
    [[nodiscard]] Result<std::size_t> remove_entity_type(const std::string& entity_type) {
        auto it = entities_.find(entity_type);
        if (it == entities_.end()) {
            return entity_type_not_found<std::size_t>(entity_type);
        }
        auto removed = users_.purge_entity_type(entity_type) +
                       groups_.purge_entity_type(entity_type);
        entities_.erase(it);
        return ok(removed);
    }

    [[nodiscard]] bool contains_entity_type(const std::string& entity_type) const {
        return entities_.contains(entity_type);
    }

    [[nodiscard]] std::vector<std::string> entity_types() const {
        std::vector<std::string> result;
        result.reserve(entities_.size());
        for (const auto& [type, names] : entities_) {
            result.push_back(type);
        }
        return result;
    }

    [[nodiscard]] VoidResult add_entity(const std::string& entity_type,
                                        const std::string& entity) {
        auto it = entities_.find(entity_type);
        if (it == entities_.end()) {
            return entity_type_not_found<std::monostate>(entity_type);
        }
        if (it->second.contains(entity)) {
            return access_void_error(error_codes::duplicate_element,
                                     "Entity '" + entity + "' in argument 'entity' already exists.");
        }
        if (is_blank(entity)) {
            return access_void_error(error_codes::invalid_name,
                                     "Entity '" + entity +
                                         "' in argument 'entity' must contain a valid character.");
        }
        it->second.insert(entity);
        return ok();
    }

    /**
     * @brief Remove an entity and every mapping to it
     * @return Number of mappings removed
     */
    [[nodiscard]] Result<std::size_t> remove_entity(const std::string& entity_type,
                                                    const std::string& entity) {
        auto it = entities_.find(entity_type);
        if (it == entities_.end()) {
            return entity_type_not_found<std::size_t>(entity_type);
        }
        if (!it->second.contains(entity)) {
            return entity_not_found<std::size_t>(entity);
        }
        auto removed = users_.purge_entity(entity_type, entity) +
                       groups_.purge_entity(entity_type, entity);
        it->second.erase(entity);
        return ok(removed);
    }

    [[nodiscard]] bool contains_entity(const std::string& entity_type,
                                       const std::string& entity) const {
        auto it = entities_.find(entity_type);
        return it != entities_.end() && it->second.contains(entity);
    }

    [[nodiscard]] Result<std::vector<std::string>> entities(const std::string& entity_type) const {
        auto it = entities_.find(entity_type);
        if (it == entities_.end()) {
            return entity_type_not_found<std::vector<std::string>>(entity_type);
        }
        return ok(std::vector<std::string>(it->second.begin(), it->second.end()));
    }

    // =========================================================================
    // Component Mappings
    // =========================================================================

    [[nodiscard]] VoidResult add_user_component_mapping(const TUser& user,
                                                        const TComponent& component,
                                                        const TAccess& access_level) {
        return add_component_mapping(users_, "user", user, component, access_level);
    }

    [[nodiscard]] VoidResult remove_user_component_mapping(const TUser& user,
                                                           const TComponent& component,
                                                           const TAccess& access_level) {
        return remove_component_mapping(users_, "user", user, component, access_level);
    }

    [[nodiscard]] VoidResult add_group_component_mapping(const TGroup& group,
                                                         const TComponent& component,
                                                         const TAccess& access_level) {
        return add_component_mapping(groups_, "group", group, component, access_level);
    }

    [[nodiscard]] VoidResult remove_group_component_mapping(const TGroup& group,
                                                            const TComponent& component,
                                                            const TAccess& access_level) {
        return remove_component_mapping(groups_, "group", group, component, access_level);
    }

    [[nodiscard]] std::vector<component_pair> user_component_mappings(const TUser& user) const {
        return list_components(users_, user);
    }

    [[nodiscard]] std::vector<component_pair> group_component_mappings(const TGroup& group) const {
        return list_components(groups_, group);
    }

    // =========================================================================
    // Entity Mappings
    // =========================================================================

    [[nodiscard]] VoidResult add_user_entity_mapping(const TUser& user,
                                                     const std::string& entity_type,
                                                     const std::string& entity) {
        return add_entity_mapping(users_, "user", user, entity_type, entity);
    }

    [[nodiscard]] VoidResult remove_user_entity_mapping(const TUser& user,
                                                        const std::string& entity_type,
                                                        const std::string& entity) {
        return remove_entity_mapping(users_, "user", user, entity_type, entity);
    }

    [[nodiscard]] VoidResult add_group_entity_mapping(const TGroup& group,
                                                      const std::string& entity_type,
                                                      const std::string& entity) {
        return add_entity_mapping(groups_, "group", group, entity_type, entity);
    }

    [[nodiscard]] VoidResult remove_group_entity_mapping(const TGroup& group,
                                                         const std::string& entity_type,
                                                         const std::string& entity) {
        return remove_entity_mapping(groups_, "group", group, entity_type, entity);
    }

    [[nodiscard]] std::vector<entity_reference> user_entity_mappings(const TUser& user) const {
        return list_entities(users_, user);
    }

    [[nodiscard]] std::vector<entity_reference> group_entity_mappings(const TGroup& group) const {
        return list_entities(groups_, group);
    }

    [[nodiscard]] Result<std::vector<std::string>> user_entity_mappings(
        const TUser& user, const std::string& entity_type) const {
        return list_entities(users_, user, entity_type);
    }

    [[nodiscard]] Result<std::vector<std::string>> group_entity_mappings(
        const TGroup& group, const std::string& entity_type) const {
        return list_entities(groups_, group, entity_type);
    }

    // =========================================================================
    // Subject Cascades
    // =========================================================================

    /// @return Number of mappings removed
    std::size_t erase_user(const TUser& user) { return users_.erase_subject(user); }

    /// @return Number of mappings removed
    std::size_t erase_group(const TGroup& group) { return groups_.erase_subject(group); }

    // =========================================================================
    // Table Access
    // =========================================================================

    [[nodiscard]] const user_table& users() const noexcept { return users_; }
    [[nodiscard]] const group_table& groups() const noexcept { return groups_; }

private:
    template <typename TSubject>
    VoidResult add_component_mapping(subject_mapping_table<TSubject, TComponent, TAccess>& table,
                                     std::string_view kind, const TSubject& subject,
                                     const TComponent& component, const TAccess& access_level) {
        if (!table.add_component(subject, component_pair{component, access_level})) {
            return access_void_error(error_codes::duplicate_element,
                                     component_mapping_text(kind, subject, component, access_level) +
                                         " already exists.");
        }
        return ok();
    }

    template <typename TSubject>
    VoidResult remove_component_mapping(
        subject_mapping_table<TSubject, TComponent, TAccess>& table, std::string_view kind,
        const TSubject& subject, const TComponent& component, const TAccess& access_level) {
        if (!table.remove_component(subject, component_pair{component, access_level})) {
            return access_void_error(error_codes::not_found,
                                     component_mapping_text(kind, subject, component, access_level) +
                                         " doesn't exist.");
        }
        return ok();
    }

    template <typename TSubject>
    VoidResult add_entity_mapping(subject_mapping_table<TSubject, TComponent, TAccess>& table,
                                  std::string_view kind, const TSubject& subject,
                                  const std::string& entity_type, const std::string& entity) {
        if (auto check = check_entity_reference(entity_type, entity); check.is_err()) {
            return check;
        }
        if (!table.add_entity(subject, entity_type, entity)) {
            return access_void_error(error_codes::duplicate_element,
                                     entity_mapping_text(kind, subject, entity_type, entity) +
                                         " already exists.");
        }
        return ok();
    }

    template <typename TSubject>
    VoidResult remove_entity_mapping(subject_mapping_table<TSubject, TComponent, TAccess>& table,
                                     std::string_view kind, const TSubject& subject,
                                     const std::string& entity_type, const std::string& entity) {
        if (auto check = check_entity_reference(entity_type, entity); check.is_err()) {
            return check;
        }
        if (!table.remove_entity(subject, entity_type, entity)) {
            return access_void_error(error_codes::not_found,
                                     entity_mapping_text(kind, subject, entity_type, entity) +
                                         " doesn't exist.");
        }
        return ok();
    }

    template <typename TSubject>
    static std::vector<component_pair> list_components(
        const subject_mapping_table<TSubject, TComponent, TAccess>& table,
        const TSubject& subject) {
        std::vector<component_pair> result;
        if (auto pairs = table.components(subject)) {
            result.assign(pairs->begin(), pairs->end());
        }
        return result;
    }

    template <typename TSubject>
    static std::vector<entity_reference> list_entities(
        const subject_mapping_table<TSubject, TComponent, TAccess>& table,
        const TSubject& subject) {
        std::vector<entity_reference> result;
        if (auto by_type = table.entities(subject)) {
            for (const auto& [type, names] : *by_type) {
                for (const auto& name : names) {
                    result.emplace_back(type, name);
                }
            }
        }
        return result;
    }

    template <typename TSubject>
    Result<std::vector<std::string>> list_entities(
        const subject_mapping_table<TSubject, TComponent, TAccess>& table,
        const TSubject& subject, const std::string& entity_type) const {
        if (!entities_.contains(entity_type)) {
            return entity_type_not_found<std::vector<std::string>>(entity_type);
        }
        std::vector<std::string> result;
        if (auto names = table.entities(subject, entity_type)) {
            result.assign(names->begin(), names->end());
        }
        return ok(std::move(result));
    }

    [[nodiscard]] VoidResult check_entity_reference(const std::string& entity_type,
                                                    const std::string& entity) const {
        auto it = entities_.find(entity_type);
        if (it == entities_.end()) {
            return entity_type_not_found<std::monostate>(entity_type);
        }
        if (!it->second.contains(entity)) {
            return entity_not_found<std::monostate>(entity);
        }
        return ok();
    }

    template <typename TSubject>
    static std::string component_mapping_text(std::string_view kind, const TSubject& subject,
                                              const TComponent& component,
                                              const TAccess& access_level) {
        return "A mapping between " + std::string(kind) + " '" + describe_key(subject) +
               "' application component '" + describe_key(component) +
               "' and access level '" + describe_key(access_level) + "'";
    }

    template <typename TSubject>
    static std::string entity_mapping_text(std::string_view kind, const TSubject& subject,
                                           const std::string& entity_type,
                                           const std::string& entity) {
        return "A mapping between " + std::string(kind) + " '" + describe_key(subject) +
               "' and entity '" + entity + "' with type '" + entity_type + "'";
    }

    static bool is_blank(const std::string& name) {
        return std::all_of(name.begin(), name.end(), [](unsigned char c) {
            return std::isspace(c) != 0;
        });
    }

    template <typename T>
    static Result<T> entity_type_not_found(const std::string& entity_type) {
        return access_error<T>(error_codes::not_found,
                               "Entity type '" + entity_type +
                                   "' in argument 'entity_type' does not exist.");
    }

    template <typename T>
    static Result<T> entity_not_found(const std::string& entity) {
        return access_error<T>(error_codes::not_found,
                               "Entity '" + entity + "' in argument 'entity' does not exist.");
    }

    std::unordered_map<std::string, entity_set> entities_;
    user_table users_;
    group_table groups_;
};

} // namespace app_access::mapping
