/**
 * @file test_output_type.cpp
 * @brief Unit tests for output type decoration, construction from payloads and the access protocol on output types.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <propmap/property/access.h>
#include <propmap/property/decorator.h>

using namespace propmap;
using Catch::Matchers::ContainsSubstring;

namespace output_test {

    struct BucketResult : PropertyObject {
        static void declare(ClassBuilder<BucketResult> &cls) {
            cls.field<std::string>("bucket", property("bucketName"))
               .field<Optional<int64_t>>("size", property("sizeGb", 1))
               .accessor("arn", getter<Deferred<std::string>>(empty_body))
               .accessor("policy", getter<std::string>(empty_body, "policyName"), setter(empty_body));
        }
    };

    // Constructed from a payload by its own constructor
    struct RegionResult : PropertyObject {
        std::string region;

        explicit RegionResult(const Value &payload) : region{payload.as<std::string>()} {}

        static void declare(ClassBuilder<RegionResult> &cls) {
            cls.accessor("region", getter<std::string>([](const RegionResult &self) { return self.region; }));
        }
    };

    // A native mapping whose keys are snake_case versions of the wire names
    struct TagsResult : MappingObject {
        using MappingObject::MappingObject;

        static void declare(ClassBuilder<TagsResult> &cls) {
            cls.field<std::string>("owner", property("ownerName"))
               .field<Optional<std::string>>("cost_center", property("costCenter"))
               .translate_property([](const TagsResult &, std::string_view name) -> std::string {
                   if (name == "ownerName") return "owner_name";
                   if (name == "costCenter") return "cost_center";
                   return std::string(name);
               });
        }
    };

    struct TranslatedResult : PropertyObject {
        static void declare(ClassBuilder<TranslatedResult> &cls) {
            cls.field<std::string>("id", property("resourceId"))
               .translate_property([](const TranslatedResult &, std::string_view name) {
                   return fmt::format("{}_v2", name);
               });
        }
    };

    struct Undecorated : PropertyObject {};

    const ClassDefinition &bucket_result() {
        static const ClassDefinition &definition = mark_as_output_type<BucketResult>();
        return definition;
    }

    const ClassDefinition &region_result() {
        static const ClassDefinition &definition = mark_as_output_type<RegionResult>();
        return definition;
    }

    const ClassDefinition &tags_result() {
        static const ClassDefinition &definition = mark_as_output_type<TagsResult>();
        return definition;
    }

    const ClassDefinition &translated_result() {
        static const ClassDefinition &definition = mark_as_output_type<TranslatedResult>();
        return definition;
    }

}  // namespace output_test

using namespace output_test;

// ============================================================================
// Decoration
// ============================================================================

TEST_CASE("mark_as_output_type - tags the class", "[output_type]") {
    const auto &definition = bucket_result();

    REQUIRE(is_output_type<BucketResult>());
    REQUIRE_FALSE(is_input_type<BucketResult>());
    REQUIRE(definition.metadata->properties.size() == 2);
    REQUIRE(definition.attributes.empty());
}

TEST_CASE("mark_as_output_type - field accessors are read only", "[output_type]") {
    const auto &definition = bucket_result();

    REQUIRE(definition.find_accessor("bucket")->read_only());
    REQUIRE(definition.find_accessor("size")->read_only());
    REQUIRE(definition.find_accessor("bucket")->getter.tagged);
}

TEST_CASE("mark_as_output_type - initializer synthesis", "[output_type]") {
    REQUIRE(bucket_result().initializer);
    REQUIRE_FALSE(region_result().initializer);
    REQUIRE(region_result().has_explicit_initializer);
    REQUIRE_FALSE(tags_result().initializer);
    REQUIRE(tags_result().is_mapping);
}

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("make_output - the payload becomes the store", "[output_type][construction]") {
    bucket_result();
    auto result = make_output<BucketResult>(ValueMap{{"bucketName", "b1"}, {"arn", "arn:b1"}});

    REQUIRE(get_attr(result, "bucket") == Value{"b1"});
    REQUIRE(get(result, "bucketName") == Value{"b1"});
    REQUIRE(get_attr(result, "arn") == Value{"arn:b1"});
    REQUIRE(get_attr(result, "size").is_null());
}

TEST_CASE("make_output - a non mapping payload throws", "[output_type][construction]") {
    bucket_result();

    REQUIRE_THROWS_AS(make_output<BucketResult>(Value{"b1"}), type_mismatch_error);
    REQUIRE_THROWS_AS(make_output<BucketResult>(Value{}), type_mismatch_error);
    REQUIRE_THROWS_WITH(make_output<BucketResult>(Value{5}), ContainsSubstring("Expected value to be a mapping"));
}

TEST_CASE("make_output - an explicit initializer is used as is", "[output_type][construction]") {
    region_result();
    auto result = make_output<RegionResult>(Value{"eu-west-1"});

    REQUIRE(result.region == "eu-west-1");
    REQUIRE(get_attr(result, "region") == Value{"eu-west-1"});
}

TEST_CASE("make_output - mapping types are built from the payload mapping", "[output_type][construction]") {
    tags_result();
    auto tags = make_output<TagsResult>(ValueMap{{"owner_name", "ann"}});

    REQUIRE(tags.size() == 1);
    REQUIRE(tags.lookup("owner_name") == Value{"ann"});
    REQUIRE_THROWS_AS(make_output<TagsResult>(Value{"ann"}), type_mismatch_error);
}

TEST_CASE("ClassRegistry - construct builds output instances type-erased", "[output_type][construction]") {
    bucket_result();
    auto &registry = ClassRegistry::instance();

    auto instance = registry.construct(typeid(BucketResult), ValueMap{{"bucketName", "b9"}});
    REQUIRE(instance != nullptr);
    REQUIRE(instance->class_id() == std::type_index(typeid(BucketResult)));
    REQUIRE(get(*instance, "bucketName") == Value{"b9"});

    REQUIRE_THROWS_AS(registry.construct(typeid(BucketResult), Value{1}), type_mismatch_error);
}

TEST_CASE("initialize_output - requires a synthesized initializer", "[output_type][construction]") {
    region_result();
    RegionResult region{Value{"us"}};
    Undecorated undecorated;

    REQUIRE_THROWS_AS(initialize_output(region, ValueMap{}), usage_error);
    REQUIRE_THROWS_AS(initialize_output(undecorated, ValueMap{}), usage_error);
}

// ============================================================================
// Access Protocol
// ============================================================================

TEST_CASE("output type - set is rejected", "[output_type][access]") {
    bucket_result();
    auto result = make_output<BucketResult>(ValueMap{{"bucketName", "b1"}});

    REQUIRE_THROWS_AS(set(result, "bucketName", Value{"b2"}), usage_error);
    REQUIRE_THROWS_WITH(set(result, "bucketName", Value{"b2"}), ContainsSubstring("mark_as_input_type"));
    REQUIRE_THROWS_AS(set_attr(result, "bucket", Value{"b2"}), attribute_error);
    REQUIRE_THROWS_AS(input_type_to_dict(result), usage_error);
    REQUIRE(get_attr(result, "bucket") == Value{"b1"});
}

TEST_CASE("output type - placeholder setters stay no-ops", "[output_type][access]") {
    bucket_result();
    auto result = make_output<BucketResult>(ValueMap{{"policyName", "p1"}});

    set_attr(result, "policy", Value{"p2"});
    REQUIRE(get_attr(result, "policy") == Value{"p1"});
}

TEST_CASE("output type - mapping types read their own items through the translation hook", "[output_type][access]") {
    tags_result();
    auto tags = make_output<TagsResult>(ValueMap{{"owner_name", "ann"}, {"cost_center", "cc1"}});

    REQUIRE(get(tags, "ownerName") == Value{"ann"});
    REQUIRE(get_attr(tags, "owner") == Value{"ann"});
    REQUIRE(get_attr(tags, "cost_center") == Value{"cc1"});
    REQUIRE(get(tags, "unmapped").is_null());
}

TEST_CASE("output type - the translation hook applies to store backed types", "[output_type][access]") {
    translated_result();
    auto result = make_output<TranslatedResult>(ValueMap{{"resourceId_v2", "r2"}, {"resourceId", "r1"}});

    REQUIRE(get(result, "resourceId") == Value{"r2"});
    REQUIRE(get_attr(result, "id") == Value{"r2"});
}

TEST_CASE("output type - empty names are rejected", "[output_type][errors]") {
    bucket_result();
    auto result = make_output<BucketResult>(ValueMap{});

    REQUIRE_THROWS_AS(get(result, ""), invalid_argument_error);
}
