/**
 * @file test_property.cpp
 * @brief Unit tests for property descriptors and the declaration scanner.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <propmap/property/class_registry.h>
#include <propmap/property/property.h>
#include <propmap/property/scanner.h>

using namespace propmap;
using Catch::Matchers::ContainsSubstring;

namespace property_test {

    struct ScannedArgs : PropertyObject {
        static void declare(ClassBuilder<ScannedArgs> &cls) {
            cls.field<std::string>("bucket", property("bucketName"))
               .field<Optional<bool>>("versioning", false)
               .field<Optional<int64_t>>("retention")
               .field<std::string>("acl", property("cannedAcl", "private"))
               .field<Optional<std::string>>("note", Value{});
        }
    };

    struct RedeclaredArgs : PropertyObject {
        static void declare(ClassBuilder<RedeclaredArgs> &cls) {
            cls.field<std::string>("name", "first")
               .field<int64_t>("count")
               .field<Optional<std::string>>("name", property("displayName"));
        }
    };

    struct BaseArgs : PropertyObject {
        static void declare(ClassBuilder<BaseArgs> &cls) { cls.field<std::string>("inherited"); }
    };

    struct DerivedArgs : BaseArgs {
        static void declare(ClassBuilder<DerivedArgs> &cls) { cls.field<std::string>("own"); }
    };

    struct SilentDerivedArgs : BaseArgs {};

}  // namespace property_test

using namespace property_test;

// ============================================================================
// Property Descriptor
// ============================================================================

TEST_CASE("property - carries the wire name and default", "[property]") {
    auto p = property("bucketName", "b1");

    REQUIRE(p.name() == "bucketName");
    REQUIRE(p.has_default());
    REQUIRE(*p.default_value() == Value{"b1"});
    REQUIRE(p.type() == nullptr);
}

TEST_CASE("property - without a default is MISSING", "[property]") {
    auto p = property("bucketName");

    REQUIRE_FALSE(p.has_default());
    REQUIRE(p == property("bucketName", MISSING));
}

TEST_CASE("property - a null default is not MISSING", "[property]") {
    auto p = property("bucketName", Value{});

    REQUIRE(p.has_default());
    REQUIRE(p.default_value()->is_null());
    REQUIRE_FALSE(p == property("bucketName"));
}

TEST_CASE("property - empty name is rejected", "[property]") {
    REQUIRE_THROWS_AS(property(""), invalid_argument_error);
    REQUIRE_THROWS_WITH(property(""), ContainsSubstring("Missing name argument"));
}

TEST_CASE("property - with_type leaves the original untouched", "[property]") {
    auto p = property("bucketName", "b1");
    auto typed = p.with_type(type_of<std::string>());

    REQUIRE(p.type() == nullptr);
    REQUIRE(typed.type() == type_of<std::string>());
    REQUIRE(typed.name() == "bucketName");
    REQUIRE(*typed.default_value() == Value{"b1"});
}

// ============================================================================
// Declaration Scanner
// ============================================================================

TEST_CASE("properties_from_declarations - one descriptor per field in order", "[scanner]") {
    const auto &definition = ClassRegistry::instance().define<ScannedArgs>();
    auto properties = properties_from_declarations(definition);

    REQUIRE(properties.size() == 5);
    REQUIRE(properties[0].first == "bucket");
    REQUIRE(properties[1].first == "versioning");
    REQUIRE(properties[2].first == "retention");
    REQUIRE(properties[3].first == "acl");
    REQUIRE(properties[4].first == "note");
}

TEST_CASE("properties_from_declarations - explicit descriptors are reused with the type attached", "[scanner]") {
    auto properties = properties_from_declarations(ClassRegistry::instance().define<ScannedArgs>());

    const auto &bucket = properties[0].second;
    REQUIRE(bucket.name() == "bucketName");
    REQUIRE_FALSE(bucket.has_default());
    REQUIRE(bucket.type() == type_of<std::string>());

    const auto &acl = properties[3].second;
    REQUIRE(acl.name() == "cannedAcl");
    REQUIRE(*acl.default_value() == Value{"private"});
}

TEST_CASE("properties_from_declarations - plain defaults are wrapped under the field name", "[scanner]") {
    auto properties = properties_from_declarations(ClassRegistry::instance().define<ScannedArgs>());

    const auto &versioning = properties[1].second;
    REQUIRE(versioning.name() == "versioning");
    REQUIRE(*versioning.default_value() == Value{false});
    REQUIRE(versioning.type() == type_of<Optional<bool>>());

    const auto &retention = properties[2].second;
    REQUIRE(retention.name() == "retention");
    REQUIRE_FALSE(retention.has_default());

    const auto &note = properties[4].second;
    REQUIRE(note.has_default());
    REQUIRE(note.default_value()->is_null());
}

TEST_CASE("properties_from_declarations - a redeclared field keeps its position and the last declaration", "[scanner]") {
    auto properties = properties_from_declarations(ClassRegistry::instance().define<RedeclaredArgs>());

    REQUIRE(properties.size() == 2);
    REQUIRE(properties[0].first == "name");
    REQUIRE(properties[0].second.name() == "displayName");
    REQUIRE(properties[0].second.type() == type_of<Optional<std::string>>());
    REQUIRE(properties[1].first == "count");
}

TEST_CASE("properties_from_declarations - only the class's own declarations", "[scanner]") {
    auto &registry = ClassRegistry::instance();

    auto derived = properties_from_declarations(registry.define<DerivedArgs>());
    REQUIRE(derived.size() == 1);
    REQUIRE(derived[0].first == "own");

    auto silent = properties_from_declarations(registry.define<SilentDerivedArgs>());
    REQUIRE(silent.empty());

    REQUIRE(properties_from_declarations(registry.define<BaseArgs>()).size() == 1);
}

TEST_CASE("ClassRegistry - a class without declarations inherits from the declaring class", "[class_registry]") {
    auto &registry = ClassRegistry::instance();

    REQUIRE(registry.define<SilentDerivedArgs>().base == std::type_index(typeid(BaseArgs)));
    // a class with declarations of its own names its base explicitly
    REQUIRE_FALSE(registry.define<DerivedArgs>().base.has_value());
    REQUIRE_FALSE(registry.define<BaseArgs>().base.has_value());
}

TEST_CASE("ClassRegistry - defining a class records what it supports", "[class_registry]") {
    auto &registry = ClassRegistry::instance();
    const auto &definition = registry.define<ScannedArgs>();

    REQUIRE(&registry.define<ScannedArgs>() == &definition);
    REQUIRE(registry.find(typeid(ScannedArgs)) == &definition);
    REQUIRE(definition.name == "property_test::ScannedArgs");
    REQUIRE_FALSE(definition.is_decorated());
    REQUIRE_FALSE(definition.is_mapping);
    REQUIRE_FALSE(definition.has_own_equality);
    REQUIRE_FALSE(definition.has_explicit_initializer);
    REQUIRE(definition.find_attribute("bucket") != nullptr);

    // both the qualified and the short name resolve forward references
    REQUIRE(TypeRegistry::instance().named("property_test::ScannedArgs") == type_of<ScannedArgs>());
    REQUIRE(TypeRegistry::instance().named("ScannedArgs") == type_of<ScannedArgs>());
}

TEST_CASE("ClassRegistry - undefined classes", "[class_registry]") {
    struct NeverDefined : PropertyObject {};
    auto &registry = ClassRegistry::instance();

    REQUIRE(registry.find(typeid(NeverDefined)) == nullptr);
    REQUIRE_THROWS_AS(registry.get(typeid(NeverDefined)), usage_error);
    REQUIRE_THROWS_AS(registry.construct(typeid(NeverDefined), Value{}), usage_error);
}
