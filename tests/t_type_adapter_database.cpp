#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "catch2/catch_all.hpp"

#include "layoutof/adapters/type_adapter_composite.hpp"
#include "layoutof/adapters/type_adapter_database.hpp"
#include "layoutof/parsers/type_parser_json.hpp"

namespace layoutof::detail
{
    std::string get_types_file()
    {
        constexpr std::source_location source_location = std::source_location::current();
        const std::filesystem::path current_file = source_location.file_name();
        const std::filesystem::path current_dir = current_file.parent_path();
        const std::filesystem::path input_file = current_dir / "t_type_adapter_database_data.yml";
        return input_file.string();
    }

    std::shared_ptr<const type_database> load_database()
    {
        auto database = std::make_shared<type_database>();

        type_parser_json parser;
        REQUIRE(parser.parse_types({get_types_file()}, *database));

        return database;
    }
}

TEST_CASE("layoutof::type_adapter_database", "[layoutof][layoutof::type_adapter_database]")
{
    using namespace layoutof;

    const type_adapter_database adapter {detail::load_database()};

    SECTION("resolve struct is feature complete")
    {
        const type_descriptor_ptr type = resolve(adapter, "Particle");

        REQUIRE(type->name == "Particle");
        REQUIRE(type->kind == type_kind::struct_);
        REQUIRE(type->size == 40);
        REQUIRE(type->alignment == 8);
        REQUIRE(type->fields.size() == 5);

        const field_descriptor& position = type->fields[1];
        REQUIRE(position.name == "position");
        REQUIRE(position.offset == 4);
        REQUIRE(position.size == 12);
        REQUIRE(position.type_name == "Vec3");
        REQUIRE_FALSE(position.type.resolved());
        REQUIRE(position.type->kind == type_kind::struct_);
        REQUIRE(position.type.resolved());

        const field_descriptor& count = type->fields[4];
        REQUIRE(count.is_static());
    }

    SECTION("unknown field types are opaque leaves")
    {
        const type_descriptor_ptr type = resolve(adapter, "Particle");

        const field_descriptor& next = type->fields[2];
        REQUIRE(next.type->kind == type_kind::pointer);
        REQUIRE(next.type->size == 8);

        const field_descriptor& id = type->fields[3];
        REQUIRE(id.type->kind == type_kind::primitive);
        REQUIRE(id.type->name == "unsigned long");
    }

    SECTION("resolve tagged union")
    {
        const type_descriptor_ptr type = resolve(adapter, "Shape");

        REQUIRE(type->kind == type_kind::tagged_union);
        REQUIRE(type->variants.size() == 2);
        REQUIRE(type->variants[0].tag_name == "Empty");
        REQUIRE(type->variants[0].fields.empty());
        REQUIRE(type->variants[1].tag_name == "Circle");
        REQUIRE(type->variants[1].fields.size() == 1);
        REQUIRE(type->variants[1].fields[0].size == 4);
    }

    SECTION("resolve through aliases and variables")
    {
        REQUIRE(resolve(adapter, "vec3_t")->name == "Vec3");
        REQUIRE(resolve(adapter, "point_t")->name == "Vec3");
        REQUIRE(resolve(adapter, "g_origin")->name == "Vec3");
    }

    SECTION("field types never resolve through variable names")
    {
        type_database database;
        database.add_type(type_record {.name = "Big", .kind = type_kind::struct_, .size = 64});
        database.add_type(type_record {
            .name = "Holder",
            .kind = type_kind::struct_,
            .size = 8,
            .fields = {field_record {.name = "value", .offset = 0, .size = 8, .type = "cfg"}},
        });
        database.variables.emplace("cfg", "Big");

        const type_adapter_database variable_adapter {std::make_shared<const type_database>(std::move(database))};

        REQUIRE(resolve(variable_adapter, "cfg")->name == "Big");

        type_descriptor_ptr type;
        REQUIRE_FALSE(variable_adapter.try_resolve_type("cfg", type));

        const type_descriptor_ptr holder = resolve(variable_adapter, "Holder");
        const field_descriptor& value = holder->fields[0];
        REQUIRE(value.type->name == "cfg");
        REQUIRE(value.type->kind == type_kind::primitive);
        REQUIRE(value.type->size == 8);
    }

    SECTION("unknown names are unresolved")
    {
        type_descriptor_ptr type;
        REQUIRE_FALSE(adapter.try_resolve("no::such::Type", type));

        try
        {
            std::ignore = resolve(adapter, "no::such::Type");
            FAIL("expected unresolved type error");
        }
        catch (const layout_error& e)
        {
            REQUIRE(e.error_code == layout_error_code::unresolved_type);
        }
    }

    SECTION("composite returns the first adapter that resolves")
    {
        type_database override_database;
        override_database.add_type(type_record {.name = "Vec3", .kind = type_kind::struct_, .size = 16});

        const type_adapter_composite composite {
            std::make_unique<type_adapter_database>(std::make_shared<const type_database>(std::move(override_database))),
            std::make_unique<type_adapter_database>(detail::load_database()),
        };

        REQUIRE(resolve(composite, "Vec3")->size == 16);
        REQUIRE(resolve(composite, "Particle")->size == 40);
    }
}

TEST_CASE("layoutof::type_parser_json", "[layoutof][layoutof::type_parser_json]")
{
    using namespace layoutof;

    SECTION("missing files fail to parse")
    {
        type_database database;
        type_parser_json parser;

        REQUIRE_FALSE(parser.parse_types({"does_not_exist.json"}, database));
        REQUIRE(database.empty());
    }

    SECTION("unknown kinds are rejected")
    {
        const nlohmann::json json = nlohmann::json::parse(R"({"types": [{"name": "T", "kind": "class", "size": 4}]})");

        type_database database;
        REQUIRE_THROWS_AS(json.get_to(database), layout_error);
    }

    SECTION("negative sizes and offsets are rejected")
    {
        const auto parse = [](const std::string_view text) {
            type_database database;
            nlohmann::json::parse(text).get_to(database);
        };

        REQUIRE_THROWS_AS(parse(R"({"types": [{"name": "T", "kind": "struct", "size": -4}]})"), layout_error);
        REQUIRE_THROWS_AS(parse(R"({"types": [{"name": "T", "kind": "struct", "size": 4, "alignment": -1}]})"), layout_error);
        REQUIRE_THROWS_AS(parse(R"({"types": [{"name": "T", "kind": "struct", "size": 4, "fields": [{"name": "f", "type": "int", "offset": -8}]}]})"), layout_error);
        REQUIRE_THROWS_AS(parse(R"({"types": [{"name": "T", "kind": "struct", "size": 4, "fields": [{"name": "f", "type": "int", "size": -1}]}]})"), layout_error);
        REQUIRE_THROWS_AS(parse(R"({"types": [{"name": "T", "kind": "tagged_union", "size": 4, "variants": [{"tag": "A", "size": -4}]}]})"), layout_error);
        REQUIRE_NOTHROW(parse(R"({"types": [{"name": "T", "kind": "struct", "size": 4, "fields": [{"name": "f", "type": "int", "offset": 0, "size": 4}]}]})"));
    }

    SECTION("variants are only allowed on tagged unions")
    {
        const nlohmann::json json = nlohmann::json::parse(R"({"types": [{"name": "T", "kind": "struct", "size": 4, "variants": [{"tag": "A", "size": 4}]}]})");

        type_database database;
        REQUIRE_THROWS_AS(json.get_to(database), layout_error);
    }
}
