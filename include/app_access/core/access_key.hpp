/**
 * @file access_key.hpp
 * @brief Key type requirements for users, groups, components and access levels
 *
 * Every caller-supplied key type must be equality comparable and hashable
 * with std::hash, so it can be stored in unordered containers.
 */

#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>

namespace app_access {

/**
 * @brief Requirements for a user, group, component or access level key
 */
template <typename T>
concept access_key = std::equality_comparable<T> && std::copy_constructible<T> &&
                     requires(const T& key) {
                         { std::hash<T>{}(key) } -> std::convertible_to<std::size_t>;
                     };

template <typename T>
concept streamable_key = requires(std::ostream& os, const T& key) {
    { os << key } -> std::convertible_to<std::ostream&>;
};

/**
 * @brief Render a key for use in error and log messages
 *
 * Streamable keys are written with operator<<, enumerations print their
 * underlying value, anything else prints a placeholder.
 */
template <typename T>
[[nodiscard]] std::string describe_key(const T& key) {
    if constexpr (std::is_convertible_v<const T&, std::string>) {
        return std::string(key);
    } else if constexpr (streamable_key<T>) {
        std::ostringstream oss;
        oss << key;
        return oss.str();
    } else if constexpr (std::is_enum_v<T>) {
        return std::to_string(static_cast<long long>(key));
    } else {
        return "<unprintable>";
    }
}

} // namespace app_access
