/**
 * @file main.cpp
 * @brief Access Demo - builds a small sales organisation and runs checks
 *
 * Shows the engine wired to logger_system: model changes and access
 * decisions go to the console and to the audit trail in ./logs.
 *
 * Usage:
 *   access_demo
 */

#include <app_access/di/ilogger.hpp>
#include <app_access/integration/logger_adapter.hpp>
#include <app_access/security/access_manager.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

enum class screen { order_summary, products_setup };
enum class access_level { view, create, modify, remove };

using manager =
    app_access::security::access_manager<std::string, std::string, screen, access_level>;

/**
 * @brief Print the outcome of a check, or the reason it failed
 */
void report(const std::string& label, const app_access::Result<bool>& result) {
    if (result.is_err()) {
        std::cout << label << ": error " << result.error().code << " ("
                  << result.error().message << ")\n";
        return;
    }
    std::cout << label << ": " << (result.value() ? "granted" : "denied") << "\n";
}

/**
 * @brief Print a failed mutation; the demo keeps going
 */
void check(const app_access::VoidResult& result) {
    if (result.is_err()) {
        std::cerr << "error: " << result.error().message << "\n";
    }
}

}  // namespace

int main() {
    using namespace app_access;

    integration::logger_config log_config;
    log_config.enable_file = false;
    log_config.min_level = integration::log_level::debug;
    integration::logger_adapter::initialize(log_config);

    access_manager_config config;
    config.name = "sales_acl";
    config.audit_queries = true;
    config.audit_model_changes = true;
    manager acl(config, std::make_shared<di::LoggerService>());

    for (const auto* user : {"Mae", "Livia"}) {
        check(acl.add_user(user));
    }
    for (const auto* group : {"SalesManagers", "Sales", "AllStaff"}) {
        check(acl.add_group(group));
    }
    check(acl.add_user_to_group_mapping("Mae", "SalesManagers"));
    check(acl.add_user_to_group_mapping("Livia", "Sales"));
    check(acl.add_group_to_group_mapping("SalesManagers", "AllStaff"));
    check(acl.add_group_to_group_mapping("Sales", "AllStaff"));
    check(acl.add_group_to_component_mapping("SalesManagers", screen::products_setup,
                                             access_level::modify));
    check(acl.add_group_to_component_mapping("AllStaff", screen::order_summary,
                                             access_level::view));

    report("Mae modify products_setup",
           acl.has_access_to_component("Mae", screen::products_setup, access_level::modify));
    report("Livia modify products_setup",
           acl.has_access_to_component("Livia", screen::products_setup, access_level::modify));
    report("Livia view order_summary",
           acl.has_access_to_component("Livia", screen::order_summary, access_level::view));

    check(acl.remove_group("AllStaff"));
    report("Livia view order_summary after removing AllStaff",
           acl.has_access_to_component("Livia", screen::order_summary, access_level::view));

    integration::logger_adapter::shutdown();
    return 0;
}
