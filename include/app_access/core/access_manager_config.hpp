/**
 * @file access_manager_config.hpp
 * @brief Configuration for an access_manager instance
 */

#pragma once

#include <string>

namespace app_access {

/**
 * @struct access_manager_config
 * @brief Behavioural switches for the authorization engine
 */
struct access_manager_config {
    /// Reject group-to-group mappings that would create a cycle
    bool reject_circular_references{true};

    /// Write every query decision to the logger_adapter audit trail
    bool audit_queries{false};

    /// Write every successful model change to the logger_adapter audit trail
    bool audit_model_changes{false};

    /// Label used in log lines (e.g., "billing_acl", "admin_acl")
    std::string name{"access_manager"};
};

} // namespace app_access
