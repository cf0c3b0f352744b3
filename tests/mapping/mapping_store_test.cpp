/**
 * @file mapping_store_test.cpp
 * @brief Unit tests for mapping_store and subject_mapping_table
 */

#include <app_access/mapping/mapping_store.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace app_access;
using namespace app_access::mapping;

namespace {

enum class screen { order_summary, products_setup, settings };
enum class access_level { view, create, modify, remove };

using store = mapping_store<std::string, std::string, screen, access_level>;

std::vector<std::string> sorted(std::vector<std::string> values) {
    std::sort(values.begin(), values.end());
    return values;
}

}  // namespace

// ─────────────────────────────────────────────────────
// Entity Registry
// ─────────────────────────────────────────────────────

TEST_CASE("mapping_store entity registry", "[mapping][entity]") {
    store mappings;

    SECTION("entity types and entities are registered") {
        REQUIRE(mappings.add_entity_type("Clients").is_ok());
        REQUIRE(mappings.add_entity("Clients", "CompanyA").is_ok());
        REQUIRE(mappings.add_entity("Clients", "CompanyB").is_ok());

        REQUIRE(mappings.contains_entity_type("Clients"));
        REQUIRE(mappings.contains_entity("Clients", "CompanyA"));
        REQUIRE(sorted(mappings.entities("Clients").value()) ==
                std::vector<std::string>{"CompanyA", "CompanyB"});
        REQUIRE(mappings.entity_types() == std::vector<std::string>{"Clients"});
    }

    SECTION("duplicates are rejected") {
        REQUIRE(mappings.add_entity_type("Clients").is_ok());
        REQUIRE(mappings.add_entity("Clients", "CompanyA").is_ok());

        auto type_result = mappings.add_entity_type("Clients");
        REQUIRE(type_result.is_err());
        REQUIRE(type_result.error().code == error_codes::duplicate_element);

        auto entity_result = mappings.add_entity("Clients", "CompanyA");
        REQUIRE(entity_result.is_err());
        REQUIRE(entity_result.error().code == error_codes::duplicate_element);
    }

    SECTION("blank names are rejected") {
        auto empty_type = mappings.add_entity_type("");
        REQUIRE(empty_type.is_err());
        REQUIRE(empty_type.error().code == error_codes::invalid_name);

        auto blank_type = mappings.add_entity_type("   ");
        REQUIRE(blank_type.is_err());
        REQUIRE(blank_type.error().code == error_codes::invalid_name);

        REQUIRE(mappings.add_entity_type("Clients").is_ok());
        auto blank_entity = mappings.add_entity("Clients", "\t");
        REQUIRE(blank_entity.is_err());
        REQUIRE(blank_entity.error().code == error_codes::invalid_name);
        REQUIRE(mappings.entities("Clients").value().empty());
    }

    SECTION("entity requires an existing type") {
        auto result = mappings.add_entity("Clients", "CompanyA");

        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::not_found);
        REQUIRE(result.error().message ==
                "Entity type 'Clients' in argument 'entity_type' does not exist.");
    }

    SECTION("entities of an unknown type is an error") {
        auto result = mappings.entities("Clients");

        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::not_found);
    }

    SECTION("removing twice fails the second time") {
        REQUIRE(mappings.add_entity_type("Clients").is_ok());
        REQUIRE(mappings.add_entity("Clients", "CompanyA").is_ok());

        REQUIRE(mappings.remove_entity("Clients", "CompanyA").is_ok());
        auto entity_again = mappings.remove_entity("Clients", "CompanyA");
        REQUIRE(entity_again.is_err());
        REQUIRE(entity_again.error().code == error_codes::not_found);

        REQUIRE(mappings.remove_entity_type("Clients").is_ok());
        auto type_again = mappings.remove_entity_type("Clients");
        REQUIRE(type_again.is_err());
        REQUIRE(type_again.error().code == error_codes::not_found);
    }
}

// ─────────────────────────────────────────────────────
// Component Mappings
// ─────────────────────────────────────────────────────

TEST_CASE("mapping_store component mappings", "[mapping][component]") {
    store mappings;

    SECTION("add, list and remove") {
        REQUIRE(mappings.add_user_component_mapping("Mae", screen::settings, access_level::view)
                    .is_ok());
        REQUIRE(mappings.add_user_component_mapping("Mae", screen::settings, access_level::modify)
                    .is_ok());

        auto listed = mappings.user_component_mappings("Mae");
        REQUIRE(listed.size() == 2);
        REQUIRE(mappings.users().has_component(
            "Mae", component_access<screen, access_level>{screen::settings, access_level::view}));

        REQUIRE(mappings.remove_user_component_mapping("Mae", screen::settings, access_level::view)
                    .is_ok());
        REQUIRE(mappings.user_component_mappings("Mae").size() == 1);
    }

    SECTION("duplicate mapping is rejected with a descriptive message") {
        REQUIRE(mappings.add_group_component_mapping("Sales", screen::order_summary,
                                                     access_level::view)
                    .is_ok());
        auto result =
            mappings.add_group_component_mapping("Sales", screen::order_summary, access_level::view);

        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::duplicate_element);
        REQUIRE(result.error().message ==
                "A mapping between group 'Sales' application component '0' and access level '0' "
                "already exists.");
    }

    SECTION("removing a missing mapping fails") {
        auto result =
            mappings.remove_group_component_mapping("Sales", screen::settings, access_level::remove);

        REQUIRE(result.is_err());
        REQUIRE(result.error().code == error_codes::not_found);
    }

    SECTION("subject without mappings lists nothing") {
        REQUIRE(mappings.user_component_mappings("Nobody").empty());
        REQUIRE(mappings.users().components("Nobody") == nullptr);
    }

    SECTION("user and group tables are separate") {
        REQUIRE(mappings.add_user_component_mapping("Admin", screen::settings, access_level::modify)
                    .is_ok());

        REQUIRE(mappings.group_component_mappings("Admin").empty());
    }
}

// ─────────────────────────────────────────────────────
// Entity Mappings
// ─────────────────────────────────────────────────────

TEST_CASE("mapping_store entity mappings", "[mapping][entity]") {
    store mappings;
    REQUIRE(mappings.add_entity_type("Clients").is_ok());
    REQUIRE(mappings.add_entity_type("Products").is_ok());
    for (const auto* company : {"CompanyA", "CompanyB", "CompanyC"}) {
        REQUIRE(mappings.add_entity("Clients", company).is_ok());
    }
    REQUIRE(mappings.add_entity("Products", "WeavingMachines").is_ok());

    SECTION("mapping requires existing type and entity") {
        auto missing_type = mappings.add_user_entity_mapping("Kishan", "Suppliers", "Acme");
        REQUIRE(missing_type.is_err());
        REQUIRE(missing_type.error().code == error_codes::not_found);

        auto missing_entity = mappings.add_user_entity_mapping("Kishan", "Clients", "CompanyZ");
        REQUIRE(missing_entity.is_err());
        REQUIRE(missing_entity.error().message ==
                "Entity 'CompanyZ' in argument 'entity' does not exist.");

        REQUIRE(mappings.user_entity_mappings("Kishan").empty());
    }

    SECTION("per-type and full listings") {
        REQUIRE(mappings.add_user_entity_mapping("Kishan", "Clients", "CompanyA").is_ok());
        REQUIRE(mappings.add_user_entity_mapping("Kishan", "Clients", "CompanyB").is_ok());
        REQUIRE(mappings.add_user_entity_mapping("Kishan", "Products", "WeavingMachines").is_ok());

        REQUIRE(sorted(mappings.user_entity_mappings("Kishan", "Clients").value()) ==
                std::vector<std::string>{"CompanyA", "CompanyB"});
        REQUIRE(mappings.user_entity_mappings("Kishan").size() == 3);

        auto unknown_type = mappings.user_entity_mappings("Kishan", "Suppliers");
        REQUIRE(unknown_type.is_err());
        REQUIRE(unknown_type.error().code == error_codes::not_found);
    }

    SECTION("duplicate and missing mappings") {
        REQUIRE(mappings.add_group_entity_mapping("Sales", "Clients", "CompanyA").is_ok());

        auto duplicate = mappings.add_group_entity_mapping("Sales", "Clients", "CompanyA");
        REQUIRE(duplicate.is_err());
        REQUIRE(duplicate.error().code == error_codes::duplicate_element);
        REQUIRE(duplicate.error().message ==
                "A mapping between group 'Sales' and entity 'CompanyA' with type 'Clients' "
                "already exists.");

        REQUIRE(mappings.remove_group_entity_mapping("Sales", "Clients", "CompanyA").is_ok());
        auto again = mappings.remove_group_entity_mapping("Sales", "Clients", "CompanyA");
        REQUIRE(again.is_err());
        REQUIRE(again.error().code == error_codes::not_found);
    }

    SECTION("removing an entity purges its mappings for every subject") {
        REQUIRE(mappings.add_user_entity_mapping("Kishan", "Clients", "CompanyA").is_ok());
        REQUIRE(mappings.add_user_entity_mapping("Kishan", "Clients", "CompanyB").is_ok());
        REQUIRE(mappings.add_group_entity_mapping("Sales", "Clients", "CompanyA").is_ok());

        auto removed = mappings.remove_entity("Clients", "CompanyA");

        REQUIRE(removed.is_ok());
        REQUIRE(removed.value() == 2);
        REQUIRE(mappings.user_entity_mappings("Kishan", "Clients").value() ==
                std::vector<std::string>{"CompanyB"});
        REQUIRE(mappings.group_entity_mappings("Sales").empty());
        REQUIRE_FALSE(mappings.contains_entity("Clients", "CompanyA"));
    }

    SECTION("removing an entity type purges every mapping of that type") {
        REQUIRE(mappings.add_user_entity_mapping("Kishan", "Clients", "CompanyA").is_ok());
        REQUIRE(mappings.add_user_entity_mapping("Kishan", "Products", "WeavingMachines").is_ok());
        REQUIRE(mappings.add_group_entity_mapping("Sales", "Clients", "CompanyC").is_ok());

        auto removed = mappings.remove_entity_type("Clients");

        REQUIRE(removed.is_ok());
        REQUIRE(removed.value() == 2);
        REQUIRE_FALSE(mappings.contains_entity_type("Clients"));
        REQUIRE(mappings.users().entities("Kishan", "Clients") == nullptr);
        REQUIRE(mappings.user_entity_mappings("Kishan").size() == 1);
        REQUIRE(mappings.groups().entity_mapping_count() == 0);
    }

    SECTION("erasing a subject drops all of its mappings") {
        REQUIRE(mappings.add_user_entity_mapping("Kishan", "Clients", "CompanyA").is_ok());
        REQUIRE(mappings.add_user_component_mapping("Kishan", screen::settings, access_level::view)
                    .is_ok());

        REQUIRE(mappings.erase_user("Kishan") == 2);
        REQUIRE(mappings.users().component_mapping_count() == 0);
        REQUIRE(mappings.users().entity_mapping_count() == 0);
        REQUIRE(mappings.erase_user("Kishan") == 0);
    }
}
